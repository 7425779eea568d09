/**
 * @file error.cpp
 * @brief Error factories and code/status mapping
 */

#include "vidpress/error.hpp"

#include <utility>

#include <fmt/core.h>

namespace vidpress {

Error Error::invalid_options(std::string message,
                             std::optional<std::string> token) {
  Error e{ErrorKind::InvalidOptions, std::move(message), {}, {}, {}};
  e.token = std::move(token);
  return e;
}

Error Error::file_validation(std::string message) {
  return Error{ErrorKind::FileValidation, std::move(message), {}, {}, {}};
}

Error Error::timeout(double seconds) {
  return Error{ErrorKind::Timeout,
               fmt::format("Processing timeout after {:g} seconds", seconds),
               {},
               {},
               {}};
}

Error Error::execution(int exit_code, std::string stderr_text) {
  Error e{ErrorKind::Execution,
          fmt::format("FFmpeg failed with exit code {}", exit_code),
          exit_code,
          {},
          {}};
  e.stderr_text = std::move(stderr_text);
  return e;
}

Error Error::tool_not_found(const std::string &tool) {
  return Error{ErrorKind::ToolNotFound,
               fmt::format("{} not found. Please install ffmpeg.", tool),
               {},
               {},
               {}};
}

Error Error::storage(std::string message) {
  return Error{ErrorKind::Storage, std::move(message), {}, {}, {}};
}

Error Error::system(std::string message) {
  return Error{ErrorKind::System, std::move(message), {}, {}, {}};
}

const char *error_code(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::InvalidOptions:
    return "INVALID_OPTIONS_ERROR";
  case ErrorKind::FileValidation:
    return "FILE_VALIDATION_ERROR";
  case ErrorKind::Timeout:
    return "PROCESSING_TIMEOUT";
  case ErrorKind::Execution:
    return "FFMPEG_ERROR";
  case ErrorKind::ToolNotFound:
    return "FFMPEG_NOT_FOUND";
  case ErrorKind::Storage:
    return "STORAGE_ERROR";
  case ErrorKind::System:
    return "COMPRESSION_ERROR";
  }
  return "COMPRESSION_ERROR";
}

int http_status(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::InvalidOptions:
  case ErrorKind::FileValidation:
    return 400;
  case ErrorKind::Timeout:
    return 408;
  case ErrorKind::Execution:
    return 422;
  case ErrorKind::ToolNotFound:
  case ErrorKind::Storage:
  case ErrorKind::System:
    return 500;
  }
  return 500;
}

} // namespace vidpress
