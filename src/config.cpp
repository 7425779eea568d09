/**
 * @file config.cpp
 * @brief Settings construction from the environment
 */

#include "vidpress/config.hpp"

#include <algorithm>

namespace vidpress {

Settings Settings::from_env() {
  Settings s;

  s.ffmpeg_bin = Config::get_env_string("FFMPEG_BIN", s.ffmpeg_bin);
  s.ffprobe_bin = Config::get_env_string("FFPROBE_BIN", s.ffprobe_bin);
  s.temp_dir = Config::get_env_string("TEMP_DIR", s.temp_dir);

  s.max_processing_time_sec =
      std::max(1, Config::get_env_int("MAX_PROCESSING_TIME",
                                      s.max_processing_time_sec));
  s.probe_timeout_sec =
      std::max(1, Config::get_env_int("PROBE_TIMEOUT", s.probe_timeout_sec));

  /// Probing must never outlive the main processing bound
  s.probe_timeout_sec =
      std::min(s.probe_timeout_sec, s.max_processing_time_sec);

  int max_args = Config::get_env_int("MAX_FFMPEG_ARGS",
                                     static_cast<int>(s.max_args));
  s.max_args = static_cast<std::size_t>(std::max(0, max_args));

  s.max_file_size = Config::get_env_u64("MAX_FILE_SIZE", s.max_file_size);
  s.temp_file_ttl_sec =
      std::max(1, Config::get_env_int("TEMP_FILE_TTL", s.temp_file_ttl_sec));
  s.parallel_streams =
      std::max(0, Config::get_env_int("PARALLEL_STREAMS", s.parallel_streams));
  s.verify_container =
      Config::get_env_int("VERIFY_CONTAINER", s.verify_container ? 1 : 0) != 0;

  return s;
}

bool Settings::is_allowed_output_format(const std::string &format) const {
  return std::find(allowed_output_formats.begin(),
                   allowed_output_formats.end(),
                   format) != allowed_output_formats.end();
}

} // namespace vidpress
