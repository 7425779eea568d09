/**
 * @file types.hpp
 * @brief Core data types for the vidpress pipeline
 *
 * @details Contains the records that flow between components:
 *          - ValidatedArguments: caller tokens proven safe by the validator
 *
 *          - Command: the full transcoder argument vector
 *
 *          - MediaMetadata: tolerant probe output
 *
 *          - ExecutionResult: outcome of one external process run
 *
 *          - CompressionResult: everything compress() hands to its caller
 */

#ifndef VIDPRESS_TYPES_HPP
#define VIDPRESS_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace vidpress {

class ArgumentValidator;

/// Untrusted caller-supplied flag/value tokens
using RawArgumentList = std::vector<std::string>;

/**
 * @class ValidatedArguments
 * @brief Ordered tokens that passed ArgumentValidator.
 * @note Only ArgumentValidator can construct one. Immutable afterwards.
 */
class ValidatedArguments {
public:
  const std::vector<std::string> &tokens() const { return tokens_; }
  bool empty() const { return tokens_.empty(); }
  std::size_t size() const { return tokens_.size(); }

  /**
   * @brief Exact match of a flag name among the flag tokens.
   */
  bool has_flag(const std::string &flag) const;

private:
  friend class ArgumentValidator;
  explicit ValidatedArguments(std::vector<std::string> tokens)
      : tokens_(std::move(tokens)) {}

  std::vector<std::string> tokens_;
};

/**
 * @struct Command
 * @brief Argument vector for the external transcoder.
 * @note argv[0] is the executable. input_path and output_path are the
 *       orchestrator-chosen operands that appear exactly once in argv.
 */
struct Command {
  std::vector<std::string> argv;
  std::string input_path;
  std::string output_path;

  /// Space-joined rendering for logs and result echo (never executed)
  std::string to_string() const;
};

/**
 * @struct MediaMetadata
 * @brief Descriptive metadata from one probe call.
 * @note Absent fields mean the probe failed or the tool did not report them;
 *       warning then carries the reason. Never an error.
 */
struct MediaMetadata {
  std::optional<double> duration;         //< Seconds
  std::optional<std::string> format_name; //< e.g. "mov,mp4,m4a,3gp,3g2,mj2"
  int stream_count = 0;
  std::optional<std::uint64_t> file_size; //< Bytes
  std::optional<std::string> warning;     //< Probe warning, informational
};

/**
 * @struct ExecutionResult
 * @brief Outcome of a process that finished within its deadline.
 */
struct ExecutionResult {
  int exit_code = 0;        //< 128 + signal when killed by a signal
  std::string stdout_text;  //< Tail-capped capture
  std::string stderr_text;  //< Tail-capped capture
  double elapsed_sec = 0.0; //< Wall-clock time from spawn to reap
};

/**
 * @struct TimingEntry
 * @brief A single timing measurement.
 */
struct TimingEntry {
  std::string name;  //< Stage name
  long microseconds; //< Duration in microseconds
};

/**
 * @struct CompressionResult
 * @brief Result of one successful compress() call.
 * @note The caller owns output_path once this is returned.
 */
struct CompressionResult {
  std::string request_id;
  std::string output_path;
  MediaMetadata input_info;
  MediaMetadata output_info;
  double processing_time_sec = 0.0; //< Execution step only
  Command command;
  std::vector<TimingEntry> timings;
};

} // namespace vidpress

#endif // VIDPRESS_TYPES_HPP
