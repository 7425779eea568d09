/**
 * @file command_builder.cpp
 * @brief Transcoder command assembly
 */

#include "vidpress/command_builder.hpp"

namespace vidpress {

CommandBuilder::CommandBuilder(const Settings &settings)
    : executable_(settings.ffmpeg_bin),
      default_codec_(settings.default_video_codec),
      default_crf_(settings.default_crf) {}

std::string CommandBuilder::path_operand(const std::string &path) {
  if (!path.empty() && path[0] == '-')
    return "./" + path;
  return path;
}

Command CommandBuilder::build(const std::string &input_path,
                              const std::string &output_path,
                              const ValidatedArguments &args) const {
  Command cmd;
  cmd.input_path = input_path;
  cmd.output_path = output_path;

  auto &argv = cmd.argv;
  argv.reserve(args.size() + 8);

  argv.push_back(executable_);
  argv.push_back("-i");
  argv.push_back(path_operand(input_path));

  for (const auto &token : args.tokens()) {
    argv.push_back(token);
  }

  /// Defaults only for flags the caller did not set
  if (!args.has_flag("-c:v") && !args.has_flag("-vcodec")) {
    argv.push_back("-c:v");
    argv.push_back(default_codec_);
  }
  if (!args.has_flag("-crf")) {
    argv.push_back("-crf");
    argv.push_back(default_crf_);
  }

  argv.push_back("-y");
  argv.push_back(path_operand(output_path));

  return cmd;
}

} // namespace vidpress
