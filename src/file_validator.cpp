/**
 * @file file_validator.cpp
 * @brief Input file checks implementation
 *
 * @details The container check maps the file and feeds libavformat from the
 *          mapping through a custom AVIOContext, so the demuxer never opens
 *          the path itself.
 */

#include "vidpress/file_validator.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

#include <fmt/core.h>
#include <fmt/ranges.h>

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/mem.h>
}

#include "vidpress/logging.hpp"
#include "vidpress/memory_io.hpp"

namespace vidpress {

namespace {

/**
 * @class ContainerProbe
 * @brief Owns the demuxer state for one container check.
 */
class ContainerProbe {
public:
  explicit ContainerProbe(const MappedFile &file)
      : reader(file.data(), file.size()) {}

  ~ContainerProbe() {
    if (fmt_ctx) {
      avformat_close_input(&fmt_ctx);
    }
    /// Custom I/O is never closed by libavformat; the buffer may have been
    /// reallocated so free whatever the context holds now
    if (avio_ctx) {
      av_freep(&avio_ctx->buffer);
      avio_context_free(&avio_ctx);
    } else if (avio_buffer) {
      av_free(avio_buffer);
    }
  }

  ContainerProbe(const ContainerProbe &) = delete;
  ContainerProbe &operator=(const ContainerProbe &) = delete;

  /**
   * @brief Open the mapped bytes and look for a video stream.
   * @return Empty string on success, otherwise the rejection reason
   */
  std::string open() {
    fmt_ctx = avformat_alloc_context();
    if (!fmt_ctx) {
      return "Failed to allocate AVFormatContext";
    }

    avio_buffer = static_cast<uint8_t *>(av_malloc(AVIO_BUFFER_SIZE));
    if (!avio_buffer) {
      return "Failed to allocate AVIO buffer";
    }

    avio_ctx = avio_alloc_context(avio_buffer, AVIO_BUFFER_SIZE, 0, &reader,
                                  MemoryReader::read_packet, nullptr,
                                  MemoryReader::seek);
    if (!avio_ctx) {
      return "Failed to allocate AVIOContext";
    }
    avio_buffer = nullptr; //< now owned by avio_ctx

    fmt_ctx->pb = avio_ctx;
    fmt_ctx->flags |= AVFMT_FLAG_CUSTOM_IO;

    /// On failure avformat_open_input frees fmt_ctx and nulls it
    if (avformat_open_input(&fmt_ctx, "RAM", nullptr, nullptr) < 0) {
      return "Unrecognised media container";
    }

    if (avformat_find_stream_info(fmt_ctx, nullptr) < 0) {
      return "Could not read stream information";
    }

    int video_idx =
        av_find_best_stream(fmt_ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (video_idx < 0) {
      return "No video stream found";
    }

    return {};
  }

  const char *format_name() const {
    return (fmt_ctx && fmt_ctx->iformat) ? fmt_ctx->iformat->name : "?";
  }

private:
  MemoryReader reader;
  AVFormatContext *fmt_ctx = nullptr;
  AVIOContext *avio_ctx = nullptr;
  uint8_t *avio_buffer = nullptr;
};

} // anonymous namespace

FileValidator::FileValidator(const Settings &settings) : settings_(settings) {}

std::string FileValidator::extension_of(const std::string &filename) {
  std::string ext = std::filesystem::path(filename).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return ext;
}

std::optional<Error>
FileValidator::validate_extension(const std::string &filename) const {
  const std::string ext = extension_of(filename);
  const auto &allowed = settings_.allowed_extensions;
  if (ext.empty() ||
      std::find(allowed.begin(), allowed.end(), ext) == allowed.end()) {
    return Error::file_validation(
        fmt::format("Unsupported file type '{}'. Supported: {}",
                    ext.empty() ? filename : ext, fmt::join(allowed, ", ")));
  }
  return std::nullopt;
}

std::optional<Error> FileValidator::validate_size(std::uint64_t bytes) const {
  if (bytes == 0) {
    return Error::file_validation("File is empty");
  }
  if (bytes > settings_.max_file_size) {
    return Error::file_validation(
        fmt::format("File too large ({} bytes). Maximum size: {}MB", bytes,
                    settings_.max_file_size / (1024 * 1024)));
  }
  return std::nullopt;
}

std::optional<Error>
FileValidator::validate_container(const std::string &path) const {
  auto mapped = MappedFile::open_readonly(path);
  if (is_error(mapped)) {
    LOG_WARN("Container check could not read {}: {}", path,
             error_of(mapped).message);
    return error_of(mapped);
  }

  ContainerProbe probe(std::get<MappedFile>(mapped));
  std::string reason = probe.open();
  if (!reason.empty()) {
    LOG_WARN("Container check failed for {}: {}", path, reason);
    return Error::file_validation(
        fmt::format("Invalid video file: {}", reason));
  }

  LOG_INFO("Container check passed for {} ({})", path, probe.format_name());
  return std::nullopt;
}

} // namespace vidpress
