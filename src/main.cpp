/**
 * @file main.cpp
 * @brief Entry point for the vidpress command-line tool
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing
 *
 *          - Single file mode: one request, JSON response on stdout
 *
 *          - Batch directory mode: parallel requests with BatchProcessor
 *
 * @note Logs go to stderr so stdout carries only the JSON document. Set
 *       PARALLEL_STREAMS to control batch parallelism.
 */

#include <chrono>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <string>
#include <vector>

extern "C" {
#include <libavutil/log.h>
}

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "vidpress/artifact_store.hpp"
#include "vidpress/batch_processor.hpp"
#include "vidpress/config.hpp"
#include "vidpress/logging.hpp"
#include "vidpress/service.hpp"

using namespace vidpress;
using json = nlohmann::json;

namespace {

void print_usage(const char *prog) {
  LOG_WARN("Usage: {} <input-file|input-dir> <publish-dir> [options-json]",
           prog);
  LOG_WARN("  options-json: {{\"ffmpeg_args\": [\"-crf\", \"28\"], "
           "\"output_format\": \"mp4\"}}");
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  if (argc < 3 || argc > 4) {
    print_usage(argv[0]);
    return 1;
  }

  namespace fs = std::filesystem;
  const std::string input_arg = argv[1];
  const std::string publish_dir = argv[2];
  const std::string options_json = argc == 4 ? argv[3] : "{}";

  Settings settings;
  try {
    settings = Settings::from_env();
  } catch (const std::exception &e) {
    LOG_ERROR("Invalid environment configuration: {}", e.what());
    return 1;
  }

  /// Demuxer chatter from the container check would interleave with logs
  av_log_set_level(AV_LOG_ERROR);

  DirectoryArtifactStore store(publish_dir,
                               std::chrono::seconds(settings.temp_file_ttl_sec));
  store.purge_expired();

  CompressionService service(settings, store);

  std::error_code ec;
  if (fs::is_directory(input_arg, ec)) {
    // **---- BATCH MODE - Parallel requests ----**

    LOG_INFO("vidpress - Batch Mode");
    LOG_INFO("Input directory: {}", input_arg);
    LOG_INFO("Publish directory: {}", publish_dir);

    std::vector<std::string> files = collect_inputs(input_arg, settings);
    if (files.empty()) {
      LOG_WARN("No video files found in directory");
      fmt::print("[]\n");
      return 0;
    }
    LOG_INFO("Found {} video files", files.size());

    BatchProcessor processor(service, settings.parallel_streams);
    int failures = processor.process(files, options_json);

    json out = json::array();
    for (const auto &result : processor.results()) {
      out.push_back(result.payload);
    }
    fmt::print("{}\n", dump_json(out));
    return failures == 0 ? 0 : 1;
  }

  // **---- SINGLE FILE MODE ----**

  LOG_INFO("vidpress - Single File Mode");
  LOG_INFO("Input: {}", input_arg);
  LOG_INFO("Publish directory: {}", publish_dir);

  auto outcome = service.handle(input_arg, options_json);
  if (is_error(outcome)) {
    const Error &err = error_of(outcome);
    json out = err;
    LOG_ERROR("Request failed ({} {})", http_status(err.kind),
              error_code(err.kind));
    fmt::print("{}\n", dump_json(out));
    return 1;
  }

  json out = std::get<CompressionResponse>(outcome);
  fmt::print("{}\n", dump_json(out));
  return 0;
}
