/**
 * @file command_builder.hpp
 * @brief Deterministic assembly of the transcoder argument vector
 *
 * @details Layout:
 *
 *          <ffmpeg> -i <input> [validated tokens...]
 *                   [-c:v <default codec>] [-crf <default quality>]
 *                   -y <output>
 *
 *          The default codec pair is added only when neither "-c:v" nor
 *          "-vcodec" is present as a flag token; the default quality only
 *          when "-crf" is absent. Presence is an exact flag-name match.
 */

#ifndef VIDPRESS_COMMAND_BUILDER_HPP
#define VIDPRESS_COMMAND_BUILDER_HPP

#include <string>

#include "config.hpp"
#include "types.hpp"

namespace vidpress {

class CommandBuilder {
public:
  explicit CommandBuilder(const Settings &settings);

  /**
   * @brief Merge validated tokens with the mandatory parts of the command.
   * @note Identical inputs always produce an identical argument vector.
   */
  Command build(const std::string &input_path, const std::string &output_path,
                const ValidatedArguments &args) const;

  /**
   * @brief Render a filesystem path so the tool cannot read it as an option.
   * @note Relative paths starting with '-' get a "./" prefix.
   */
  static std::string path_operand(const std::string &path);

private:
  std::string executable_;
  std::string default_codec_;
  std::string default_crf_;
};

} // namespace vidpress

#endif // VIDPRESS_COMMAND_BUILDER_HPP
