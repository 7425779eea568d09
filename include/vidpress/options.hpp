/**
 * @file options.hpp
 * @brief Caller options document for one compression request
 *
 * @details The document is a JSON object:
 *
 *            {"ffmpeg_args": ["-crf", "28"], "output_format": "mp4",
 *             "metadata": {...}}
 *
 *          Every key is optional. An empty or missing document yields the
 *          defaults.
 */

#ifndef VIDPRESS_OPTIONS_HPP
#define VIDPRESS_OPTIONS_HPP

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "config.hpp"
#include "error.hpp"
#include "types.hpp"

namespace vidpress {

struct CompressionOptions {
  RawArgumentList ffmpeg_args;
  std::string output_format = "mp4";
  std::optional<nlohmann::json> metadata; //< Opaque caller data, echoed only

  /**
   * @brief Parse and check an options document.
   * @return Options, or an InvalidOptions error
   */
  static Result<CompressionOptions> parse(const std::string &json_text,
                                          const Settings &settings);
};

} // namespace vidpress

#endif // VIDPRESS_OPTIONS_HPP
