/**
 * @file memory_io.cpp
 * @brief Memory-mapped input for libavformat implementation
 */

#include "vidpress/memory_io.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fmt/core.h>

extern "C" {
#include <libavformat/avio.h>
#include <libavutil/error.h>
}

namespace vidpress {

// **---- MappedFile ----**

Result<MappedFile> MappedFile::open_readonly(const std::string &path) {
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd == -1) {
    return Error::file_validation(
        fmt::format("Cannot open {}: {}", path, std::strerror(errno)));
  }

  struct stat sb;
  if (::fstat(fd, &sb) == -1 || !S_ISREG(sb.st_mode)) {
    ::close(fd);
    return Error::file_validation(fmt::format("Not a regular file: {}", path));
  }
  if (sb.st_size <= 0) {
    ::close(fd);
    return Error::file_validation(fmt::format("File is empty: {}", path));
  }

  const auto size = static_cast<std::size_t>(sb.st_size);
  void *addr = ::mmap(nullptr, size, PROT_READ, MAP_PRIVATE, fd, 0);
  int map_errno = errno;
  ::close(fd); //< the mapping keeps the file referenced

  if (addr == MAP_FAILED) {
    return Error::file_validation(
        fmt::format("Cannot map {}: {}", path, std::strerror(map_errno)));
  }

  /// Header first, then forward reads while streams are detected
  ::madvise(addr, size, MADV_SEQUENTIAL);
  return MappedFile(static_cast<uint8_t *>(addr), size);
}

MappedFile::~MappedFile() { unmap(); }

MappedFile::MappedFile(MappedFile &&other) noexcept
    : data_(other.data_), size_(other.size_) {
  other.data_ = nullptr;
  other.size_ = 0;
}

MappedFile &MappedFile::operator=(MappedFile &&other) noexcept {
  if (this != &other) {
    unmap();
    std::swap(data_, other.data_);
    std::swap(size_, other.size_);
  }
  return *this;
}

void MappedFile::unmap() {
  if (data_) {
    ::munmap(data_, size_);
    data_ = nullptr;
    size_ = 0;
  }
}

// **---- MemoryReader ----**

int MemoryReader::read_packet(void *opaque, uint8_t *buf, int buf_size) {
  auto *r = static_cast<MemoryReader *>(opaque);
  if (buf_size <= 0)
    return 0;
  if (r->pos_ >= r->size_)
    return AVERROR_EOF;

  std::size_t n =
      std::min(r->size_ - r->pos_, static_cast<std::size_t>(buf_size));
  std::memcpy(buf, r->data_ + r->pos_, n);
  r->pos_ += n;
  return static_cast<int>(n);
}

int64_t MemoryReader::seek(void *opaque, int64_t offset, int whence) {
  auto *r = static_cast<MemoryReader *>(opaque);
  const auto size = static_cast<int64_t>(r->size_);

  if (whence & AVSEEK_SIZE)
    return size;

  int64_t base;
  switch (whence & ~AVSEEK_FORCE) {
  case SEEK_SET:
    base = 0;
    break;
  case SEEK_CUR:
    base = static_cast<int64_t>(r->pos_);
    break;
  case SEEK_END:
    base = size;
    break;
  default:
    return AVERROR(EINVAL);
  }

  int64_t target = base + offset;
  if (target < 0 || target > size)
    return AVERROR(EINVAL);

  r->pos_ = static_cast<std::size_t>(target);
  return target;
}

} // namespace vidpress
