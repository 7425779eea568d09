/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides the immutable Settings value shared (by const reference)
 *          by every component, plus the small get_env_* helpers used to
 *          overlay environment variables onto the compiled-in defaults.
 *
 * @note Settings is built once at start-up by Settings::from_env() and never
 *       mutated afterwards. Components copy the parts they need.
 */

#ifndef VIDPRESS_CONFIG_HPP
#define VIDPRESS_CONFIG_HPP

#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>

namespace vidpress {
namespace Config {

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 * @throws std::invalid_argument if the value is not a number
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return val ? std::stoi(val) : default_val;
}

/**
 * @brief Get an unsigned 64-bit value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed value or default
 */
inline std::uint64_t get_env_u64(const char *name, std::uint64_t default_val) {
  const char *val = std::getenv(name);
  return val ? std::stoull(val) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 */
inline std::string get_env_string(const char *name,
                                  const std::string &default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : default_val;
}

} // namespace Config

/**
 * @struct Settings
 * @brief Immutable configuration value for one vidpress process.
 *
 * @attention ENVIRONMENT OVERRIDES (see from_env):
 *
 *   - FFMPEG_BIN, FFPROBE_BIN: external tool names or paths
 *
 *   - TEMP_DIR: directory for per-request artifacts
 *
 *   - MAX_PROCESSING_TIME, PROBE_TIMEOUT: wall-clock limits in seconds
 *
 *   - MAX_FFMPEG_ARGS, MAX_FILE_SIZE, TEMP_FILE_TTL
 *
 *   - PARALLEL_STREAMS (0 = auto), VERIFY_CONTAINER (0/1)
 */
struct Settings {
  // **---- External tools ----**
  std::string ffmpeg_bin = "ffmpeg";
  std::string ffprobe_bin = "ffprobe";

  // **---- Limits ----**
  std::string temp_dir = "/tmp";
  int max_processing_time_sec = 60;
  int probe_timeout_sec = 10;
  std::size_t max_args = 20;
  std::uint64_t max_file_size = 200ULL * 1024 * 1024; //< 200MB
  int temp_file_ttl_sec = 3600;
  std::size_t max_capture_bytes = 1024 * 1024; //< per captured stream

  // **---- Batch ----**
  int parallel_streams = 0;
  bool verify_container = true;

  // **---- Transcoder defaults ----**
  std::string default_video_codec = "libx264";
  std::string default_crf = "23";

  // **---- Argument policy ----**
  std::vector<std::string> allowed_flags = {
      "-c:v", "-vcodec", "-c:a",    "-acodec", "-b:v",       "-b:a", "-crf",
      "-s",   "-r",      "-vf",     "-preset", "-tune",      "-profile:v",
      "-f"};

  std::vector<std::string> forbidden_patterns = {
      "-i",   "/dev/",  "file://", "http://", "https://",
      "exec", "system", "pipe",    "$(",      "`"};

  std::vector<std::string> allowed_output_formats = {"mp4", "avi", "mov",
                                                     "mkv", "webm"};

  std::vector<std::string> allowed_extensions = {
      ".mp4", ".avi", ".mov", ".mkv", ".wmv",
      ".flv", ".webm", ".m4v", ".3gp", ".ogv"};

  /**
   * @brief Build settings from defaults overlaid with environment variables.
   * @note The probe timeout is clamped to the processing timeout.
   * @throws std::invalid_argument / std::out_of_range on malformed numbers
   */
  static Settings from_env();

  /**
   * @brief Check whether an output container is in the allowed set.
   */
  bool is_allowed_output_format(const std::string &format) const;
};

} // namespace vidpress

#endif // VIDPRESS_CONFIG_HPP
