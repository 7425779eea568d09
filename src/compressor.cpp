/**
 * @file compressor.cpp
 * @brief Compression orchestration implementation
 *
 * @details Each compress() call is a self-contained pipeline. All of its log
 *          lines carry a [Request <id>] prefix; the id is the same opaque
 *          value embedded in the output file name.
 */

#include "vidpress/compressor.hpp"

#include <chrono>
#include <filesystem>
#include <system_error>
#include <utility>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include "vidpress/logging.hpp"
#include "vidpress/temp_file.hpp"

namespace vidpress {

namespace fs = std::filesystem;

namespace {

/// Keep error payloads readable; ffmpeg reports the cause at the end
constexpr std::size_t STDERR_TAIL_BYTES = 4096;

std::string describe(const MediaMetadata &m) {
  return fmt::format("format={} duration={} streams={} size={}",
                     m.format_name.value_or("?"),
                     m.duration ? fmt::format("{:.2f}s", *m.duration) : "?",
                     m.stream_count,
                     m.file_size ? std::to_string(*m.file_size) : "?");
}

} // anonymous namespace

const char *stage_name(Stage stage) {
  switch (stage) {
  case Stage::Validating:
    return "Validating";
  case Stage::Building:
    return "Building";
  case Stage::ProbingInput:
    return "ProbingInput";
  case Stage::Executing:
    return "Executing";
  case Stage::ProbingOutput:
    return "ProbingOutput";
  case Stage::Done:
    return "Done";
  case Stage::Failed:
    return "Failed";
  }
  return "Unknown";
}

CompressionOrchestrator::CompressionOrchestrator(const Settings &settings)
    : settings_(settings), validator_(settings_), builder_(settings_),
      runner_(settings_.max_capture_bytes), prober_(settings_, runner_) {}

std::string
CompressionOrchestrator::output_path_for(const std::string &request_id,
                                         const std::string &output_format) const {
  return (fs::path(settings_.temp_dir) /
          fmt::format("compressed_{}.{}", request_id, output_format))
      .string();
}

Result<CompressionResult>
CompressionOrchestrator::compress(const std::string &input_path,
                                  const RawArgumentList &raw_args,
                                  const std::string &output_format) const {
  const std::string request_id = make_request_id();
  const std::string rid = request_id.substr(0, 8);
  TimingCollector timings;
  TIMER_START(total);

  Stage stage = Stage::Validating;
  auto enter = [&](Stage next) {
    stage = next;
    LOG_PHASE("[Request {}] {}", rid, stage_name(stage));
  };
  auto fail = [&](Error err) -> Result<CompressionResult> {
    LOG_ERROR("[Request {}] {} -> {}: {} ({})", rid, stage_name(stage),
              stage_name(Stage::Failed), err.message, error_code(err.kind));
    return err;
  };

  // **----- VALIDATING -----**

  enter(Stage::Validating);
  TIMER_START(validate);

  if (!settings_.is_allowed_output_format(output_format)) {
    return fail(Error::invalid_options(
        fmt::format("Output format must be one of: {}",
                    fmt::join(settings_.allowed_output_formats, ", ")),
        output_format));
  }
  if (raw_args.size() > settings_.max_args) {
    return fail(Error::invalid_options(
        fmt::format("Too many ffmpeg arguments ({} > {})", raw_args.size(),
                    settings_.max_args)));
  }

  auto validated = validator_.validate(raw_args);
  if (is_error(validated)) {
    return fail(error_of(validated));
  }
  const auto &args = std::get<ValidatedArguments>(validated);
  TIMER_END(timings, validate);

  // **----- BUILDING -----**

  enter(Stage::Building);

  std::error_code ec;
  fs::create_directories(settings_.temp_dir, ec);
  if (ec) {
    return fail(Error::system(fmt::format(
        "Cannot create temp dir {}: {}", settings_.temp_dir, ec.message())));
  }

  /// Owned until handed to the caller; removed on every failure below
  ScopedTempFile output(output_path_for(request_id, output_format));
  Command command = builder_.build(input_path, output.path(), args);
  LOG_INFO("[Request {}] Command: {}", rid, command.to_string());

  // **----- PROBING INPUT -----**

  enter(Stage::ProbingInput);
  TIMER_START(probe_input);
  MediaMetadata input_info = prober_.probe(input_path);
  TIMER_END(timings, probe_input);
  LOG_INFO("[Request {}] Input: {}", rid, describe(input_info));

  // **----- EXECUTING -----**

  enter(Stage::Executing);
  TIMER_START(execute);
  auto exec_start = std::chrono::steady_clock::now();

  auto outcome = runner_.run(
      command, std::chrono::seconds(settings_.max_processing_time_sec));

  double processing_time =
      std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                    exec_start)
          .count();
  TIMER_END(timings, execute);

  if (is_error(outcome)) {
    return fail(error_of(outcome));
  }

  const auto &exec = std::get<ExecutionResult>(outcome);
  std::string stderr_tail = utf8_tail(exec.stderr_text, STDERR_TAIL_BYTES);
  if (exec.exit_code != 0) {
    return fail(Error::execution(exec.exit_code, std::move(stderr_tail)));
  }
  if (!fs::exists(output.path(), ec)) {
    Error err = Error::execution(exec.exit_code, std::move(stderr_tail));
    err.message = "FFmpeg exited successfully but produced no output file";
    return fail(err);
  }

  // **----- PROBING OUTPUT -----**

  enter(Stage::ProbingOutput);
  TIMER_START(probe_output);
  MediaMetadata output_info = prober_.probe(output.path());
  TIMER_END(timings, probe_output);
  LOG_INFO("[Request {}] Output: {}", rid, describe(output_info));

  // **----- DONE -----**

  TIMER_END(timings, total);
  enter(Stage::Done);

  CompressionResult result;
  result.request_id = request_id;
  result.output_path = output.release();
  result.input_info = std::move(input_info);
  result.output_info = std::move(output_info);
  result.processing_time_sec = processing_time;
  result.command = std::move(command);
  result.timings = timings.extract();

  LOG_SUCCESS("[Request {}] Output saved to: {} ({:.2f}s)", rid,
              result.output_path, processing_time);
  return result;
}

} // namespace vidpress
