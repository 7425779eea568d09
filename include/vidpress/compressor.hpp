/**
 * @file compressor.hpp
 * @brief End-to-end orchestration of one transcode request
 *
 * @details The CompressionOrchestrator sequences the pipeline:
 *
 *          1. Validating: output format, argument count, argument safety
 *
 *          2. Building: request id, output path, command vector
 *
 *          3. ProbingInput: best-effort metadata of the source
 *
 *          4. Executing: transcoder under the processing timeout
 *
 *          5. ProbingOutput: best-effort metadata of the artifact
 *
 *          6. Done
 *
 *          Any failing step moves to the terminal Failed state.
 *
 * @note Validation failures return before any process is spawned. On every
 *       failure after Building the partially written output is removed. On
 *       success the caller owns the output file.
 */

#ifndef VIDPRESS_COMPRESSOR_HPP
#define VIDPRESS_COMPRESSOR_HPP

#include <string>

#include "argument_validator.hpp"
#include "command_builder.hpp"
#include "config.hpp"
#include "error.hpp"
#include "media_prober.hpp"
#include "process_runner.hpp"
#include "types.hpp"

namespace vidpress {

enum class Stage {
  Validating,
  Building,
  ProbingInput,
  Executing,
  ProbingOutput,
  Done,
  Failed
};

const char *stage_name(Stage stage);

/**
 * @class CompressionOrchestrator
 * @brief Runs compress() requests; holds no per-request state.
 * @note Concurrent compress() calls are independent. They share only the
 *       temp directory, where every request uses a unique name.
 */
class CompressionOrchestrator {
public:
  explicit CompressionOrchestrator(const Settings &settings);

  /// Disable copy (prober holds a reference to runner_)
  CompressionOrchestrator(const CompressionOrchestrator &) = delete;
  CompressionOrchestrator &operator=(const CompressionOrchestrator &) = delete;

  /**
   * @brief Transcode input_path with caller flags into output_format.
   * @param input_path Source media file
   * @param raw_args Untrusted caller tokens (at most max_args)
   * @param output_format One of the allowed container extensions
   * @return CompressionResult, or an Error of kind InvalidOptions, Timeout,
   *         Execution, ToolNotFound or System
   */
  Result<CompressionResult> compress(const std::string &input_path,
                                     const RawArgumentList &raw_args,
                                     const std::string &output_format) const;

  /**
   * @brief Output path for a request: <temp_dir>/compressed_<id>.<format>
   */
  std::string output_path_for(const std::string &request_id,
                              const std::string &output_format) const;

  const Settings &settings() const { return settings_; }

private:
  const Settings settings_;
  ArgumentValidator validator_;
  CommandBuilder builder_;
  ProcessRunner runner_;
  MediaProber prober_;
};

} // namespace vidpress

#endif // VIDPRESS_COMPRESSOR_HPP
