/**
 * @file temp_file.hpp
 * @brief Request identifiers and scoped temporary files
 *
 * @details Provides:
 *          - make_request_id: collision-resistant opaque identifier
 *
 *          - ScopedTempFile: RAII owner that removes a file on destruction
 */

#ifndef VIDPRESS_TEMP_FILE_HPP
#define VIDPRESS_TEMP_FILE_HPP

#include <string>
#include <utility>

namespace vidpress {

/**
 * @brief 128 random bits as 32 lowercase hex characters.
 * @note Uses a thread-local generator; safe to call from any thread.
 */
std::string make_request_id();

/**
 * @class ScopedTempFile
 * @brief Removes the owned path on destruction unless released.
 * @note Supports move semantics but not copy. The file itself need not
 *       exist yet; removal of a missing file is a no-op.
 */
class ScopedTempFile {
public:
  ScopedTempFile() = default;
  explicit ScopedTempFile(std::string path) : path_(std::move(path)) {}
  ~ScopedTempFile();

  /// Disable copy
  ScopedTempFile(const ScopedTempFile &) = delete;
  ScopedTempFile &operator=(const ScopedTempFile &) = delete;

  /// Enable move
  ScopedTempFile(ScopedTempFile &&other) noexcept;
  ScopedTempFile &operator=(ScopedTempFile &&other) noexcept;

  const std::string &path() const { return path_; }
  bool owns() const { return !path_.empty(); }

  /**
   * @brief Give up ownership; the file survives this object.
   * @return The path that was owned
   */
  std::string release();

  /**
   * @brief Remove the file now.
   */
  void remove();

private:
  std::string path_;
};

} // namespace vidpress

#endif // VIDPRESS_TEMP_FILE_HPP
