/**
 * @file file_validator.hpp
 * @brief Checks applied to an uploaded media file before compression
 *
 * @details Three independent checks, each returning std::nullopt on pass:
 *          - validate_extension: supported media file name suffix
 *
 *          - validate_size: non-empty and within max_file_size
 *
 *          - validate_container: libavformat recognises the bytes and finds
 *            a video stream
 */

#ifndef VIDPRESS_FILE_VALIDATOR_HPP
#define VIDPRESS_FILE_VALIDATOR_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "config.hpp"
#include "error.hpp"

namespace vidpress {

/**
 * @class FileValidator
 * @brief Input file checks; every failure is a FileValidation error.
 */
class FileValidator {
public:
  explicit FileValidator(const Settings &settings);

  std::optional<Error> validate_extension(const std::string &filename) const;
  std::optional<Error> validate_size(std::uint64_t bytes) const;

  /**
   * @brief Open the file with libavformat through memory-mapped custom I/O.
   * @note Reads only the container header and the packets needed to detect
   *       streams. No decoder is opened.
   */
  std::optional<Error> validate_container(const std::string &path) const;

  /**
   * @brief Lower-cased extension including the dot, or "" if none.
   */
  static std::string extension_of(const std::string &filename);

private:
  const Settings &settings_;
};

} // namespace vidpress

#endif // VIDPRESS_FILE_VALIDATOR_HPP
