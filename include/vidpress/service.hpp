/**
 * @file service.hpp
 * @brief Request-level handling: one input file in, one published artifact out
 *
 * @details CompressionService::handle runs a whole request:
 *
 *          1. Parse the options document
 *
 *          2. Validate extension and size of the source
 *
 *          3. Stage a private copy of the source in the temp directory
 *
 *          4. Validate the container (when enabled)
 *
 *          5. Compress through CompressionOrchestrator
 *
 *          6. Upload and sign through the ArtifactStore
 *
 * @note The staged input and the local output are removed on every exit
 *       path. Only the uploaded copy in the store survives a success.
 */

#ifndef VIDPRESS_SERVICE_HPP
#define VIDPRESS_SERVICE_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "artifact_store.hpp"
#include "compressor.hpp"
#include "config.hpp"
#include "error.hpp"
#include "file_validator.hpp"

namespace vidpress {

struct FileInfo {
  std::uint64_t original_size = 0;
  std::uint64_t compressed_size = 0;
  double compression_ratio = 0.0; //< compressed / original
  std::optional<double> duration;
  std::optional<std::string> original_format;
};

struct CompressionResponse {
  std::string status = "success";
  std::string download_url;
  std::chrono::system_clock::time_point expires_at;
  double processing_time = 0.0; //< Seconds spent in compress()
  FileInfo file_info;
  std::string artifact_id;
  std::string command;
  std::optional<nlohmann::json> metadata; //< Caller metadata, echoed back
};

void to_json(nlohmann::json &j, const FileInfo &info);
void to_json(nlohmann::json &j, const CompressionResponse &response);

/**
 * @brief Error payload: {status, error_code, message, details}.
 * @note details carries exit_code, token and stderr when present.
 */
void to_json(nlohmann::json &j, const Error &error);

/**
 * @brief Pretty-print a document for output.
 * @note Invalid UTF-8 (tool stderr, file names) becomes U+FFFD instead of
 *       throwing.
 */
std::string dump_json(const nlohmann::json &j);

/**
 * @class CompressionService
 * @brief Stateless request handler; safe to share between worker threads.
 */
class CompressionService {
public:
  CompressionService(const Settings &settings, ArtifactStore &store);

  /**
   * @brief Process one source file.
   * @param source_path File to compress; never modified
   * @param options_json Options document ("" or "{}" for defaults)
   */
  Result<CompressionResponse> handle(const std::string &source_path,
                                     const std::string &options_json) const;

private:
  Result<std::string> stage_input(const std::string &source_path,
                                  const std::string &request_id) const;

  const Settings &settings_;
  ArtifactStore &store_;
  FileValidator file_validator_;
  CompressionOrchestrator orchestrator_;
};

} // namespace vidpress

#endif // VIDPRESS_SERVICE_HPP
