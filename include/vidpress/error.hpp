/**
 * @file error.hpp
 * @brief Error kinds and the Result type used across component boundaries
 *
 * @details Every fallible operation returns Result<T>, a variant holding
 *          either the value or an Error. Error kinds form a closed set; each
 *          maps to one caller-visible code and one HTTP-style status.
 *
 * @note Probe failures are not errors. They surface as an absent field plus
 *       a warning string on MediaMetadata.
 */

#ifndef VIDPRESS_ERROR_HPP
#define VIDPRESS_ERROR_HPP

#include <optional>
#include <string>
#include <variant>

namespace vidpress {

enum class ErrorKind {
  InvalidOptions, //< Rejected caller arguments or options document
  FileValidation, //< Input file failed extension/size/container checks
  Timeout,        //< Wall-clock limit exceeded; process force-terminated
  Execution,      //< Transcoder exited non-zero
  ToolNotFound,   //< Executable missing (environment fault)
  Storage,        //< Artifact store failure
  System          //< OS-level failure (pipe, fork, filesystem)
};

/**
 * @struct Error
 * @brief Structured payload describing one failure.
 */
struct Error {
  ErrorKind kind;
  std::string message;
  std::optional<int> exit_code;           //< Execution errors only
  std::optional<std::string> token;       //< Offending argument, if any
  std::optional<std::string> stderr_text; //< Captured tool output, untrusted

  static Error invalid_options(std::string message,
                               std::optional<std::string> token = {});
  static Error file_validation(std::string message);
  static Error timeout(double seconds);
  static Error execution(int exit_code, std::string stderr_text);
  static Error tool_not_found(const std::string &tool);
  static Error storage(std::string message);
  static Error system(std::string message);
};

/// Value-or-error return type
template <typename T> using Result = std::variant<T, Error>;

template <typename T> bool is_error(const Result<T> &r) {
  return std::holds_alternative<Error>(r);
}

template <typename T> const Error &error_of(const Result<T> &r) {
  return std::get<Error>(r);
}

/**
 * @brief Stable machine-readable code for an error kind.
 */
const char *error_code(ErrorKind kind);

/**
 * @brief HTTP-style status an outer service layer should answer with.
 */
int http_status(ErrorKind kind);

} // namespace vidpress

#endif // VIDPRESS_ERROR_HPP
