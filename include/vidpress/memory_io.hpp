/**
 * @file memory_io.hpp
 * @brief Memory-mapped input for libavformat
 *
 * @details Provides:
 *          - MappedFile: read-only mapping of a whole file
 *
 *          - MemoryReader: AVIO read/seek cursor over a byte range
 *
 * @note Used by the container check so the demuxer reads the staged copy
 *       through the mapping and never opens a path of its own.
 */

#ifndef VIDPRESS_MEMORY_IO_HPP
#define VIDPRESS_MEMORY_IO_HPP

#include <cstddef>
#include <cstdint>
#include <string>

#include "error.hpp"

namespace vidpress {

constexpr std::size_t AVIO_BUFFER_SIZE = 64 * 1024; //< 64KB

/**
 * @class MappedFile
 * @brief RAII owner of a PROT_READ mapping.
 * @note The descriptor is closed as soon as the mapping exists; only the
 *       mapping is held. Supports move semantics but not copy.
 */
class MappedFile {
public:
  /**
   * @brief Map path read-only.
   * @return The mapping, or a FileValidation error (missing, empty,
   *         unreadable or unmappable file)
   */
  static Result<MappedFile> open_readonly(const std::string &path);

  MappedFile() = default;
  ~MappedFile();

  /// Disable copy
  MappedFile(const MappedFile &) = delete;
  MappedFile &operator=(const MappedFile &) = delete;

  /// Enable move
  MappedFile(MappedFile &&other) noexcept;
  MappedFile &operator=(MappedFile &&other) noexcept;

  const uint8_t *data() const { return data_; }
  std::size_t size() const { return size_; }
  bool is_valid() const { return data_ != nullptr; }

private:
  MappedFile(uint8_t *data, std::size_t size) : data_(data), size_(size) {}
  void unmap();

  uint8_t *data_ = nullptr;
  std::size_t size_ = 0;
};

/**
 * @class MemoryReader
 * @brief Read cursor handed to avio_alloc_context as its opaque pointer.
 */
class MemoryReader {
public:
  MemoryReader(const uint8_t *data, std::size_t size)
      : data_(data), size_(size) {}

  std::size_t position() const { return pos_; }

  /**
   * @brief AVIO read_packet callback.
   * @return Bytes copied, or AVERROR_EOF at the end
   */
  static int read_packet(void *opaque, uint8_t *buf, int buf_size);

  /**
   * @brief AVIO seek callback.
   * @note Answers AVSEEK_SIZE; out-of-range targets give AVERROR(EINVAL)
   */
  static int64_t seek(void *opaque, int64_t offset, int whence);

private:
  const uint8_t *data_;
  std::size_t size_;
  std::size_t pos_ = 0;
};

} // namespace vidpress

#endif // VIDPRESS_MEMORY_IO_HPP
