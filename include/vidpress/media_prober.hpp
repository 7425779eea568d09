/**
 * @file media_prober.hpp
 * @brief Read-only media inspection through ffprobe
 *
 * @details Runs `ffprobe -v quiet -print_format json -show_format
 *          -show_streams <file>` with a short fixed timeout and extracts
 *          duration, container format name and stream count.
 *
 * @note Probing never fails the caller. Any failure (missing tool, non-zero
 *       exit, timeout, unparsable output) yields a MediaMetadata with absent
 *       fields and a warning string.
 */

#ifndef VIDPRESS_MEDIA_PROBER_HPP
#define VIDPRESS_MEDIA_PROBER_HPP

#include <chrono>
#include <string>
#include <vector>

#include "config.hpp"
#include "process_runner.hpp"
#include "types.hpp"

namespace vidpress {

class MediaProber {
public:
  MediaProber(const Settings &settings, const ProcessRunner &runner);

  /**
   * @brief Inspect a media file.
   * @note file_size is filled from the filesystem even when the tool fails.
   */
  MediaMetadata probe(const std::string &file_path) const;

  /**
   * @brief Argument vector used for a probe (fixed, not configurable).
   */
  std::vector<std::string> probe_command(const std::string &file_path) const;

  /**
   * @brief Tolerant parse of ffprobe's JSON document.
   * @note Unknown or malformed fields are skipped, never thrown.
   */
  static MediaMetadata parse_probe_output(const std::string &json_text);

private:
  std::string executable_;
  std::chrono::milliseconds timeout_;
  const ProcessRunner &runner_;
};

} // namespace vidpress

#endif // VIDPRESS_MEDIA_PROBER_HPP
