/**
 * @file service.cpp
 * @brief Request-level handling implementation
 */

#include "vidpress/service.hpp"

#include <filesystem>
#include <system_error>

#include <fmt/core.h>

#include "vidpress/logging.hpp"
#include "vidpress/options.hpp"
#include "vidpress/system.hpp"
#include "vidpress/temp_file.hpp"

namespace vidpress {

namespace fs = std::filesystem;
using json = nlohmann::json;

// **---- JSON rendering ----**

void to_json(json &j, const FileInfo &info) {
  j = json{{"original_size", info.original_size},
           {"compressed_size", info.compressed_size},
           {"compression_ratio", info.compression_ratio},
           {"duration", nullptr},
           {"original_format", nullptr}};
  if (info.duration)
    j["duration"] = *info.duration;
  if (info.original_format)
    j["original_format"] = *info.original_format;
}

void to_json(json &j, const CompressionResponse &response) {
  j = json{{"status", response.status},
           {"download_url", response.download_url},
           {"expires_at", format_iso8601_utc(response.expires_at)},
           {"processing_time", response.processing_time},
           {"file_info", response.file_info},
           {"artifact_id", response.artifact_id},
           {"command", response.command}};
  if (response.metadata)
    j["metadata"] = *response.metadata;
}

void to_json(json &j, const Error &error) {
  json details = json::object();
  if (error.exit_code)
    details["exit_code"] = *error.exit_code;
  if (error.token)
    details["token"] = *error.token;
  if (error.stderr_text)
    details["stderr"] = *error.stderr_text;

  j = json{{"status", "error"},
           {"error_code", error_code(error.kind)},
           {"message", error.message}};
  j["details"] = details.empty() ? json(nullptr) : details;
}

std::string dump_json(const json &j) {
  return j.dump(2, ' ', false, json::error_handler_t::replace);
}

// **---- CompressionService ----**

CompressionService::CompressionService(const Settings &settings,
                                       ArtifactStore &store)
    : settings_(settings), store_(store), file_validator_(settings_),
      orchestrator_(settings_) {}

Result<std::string>
CompressionService::stage_input(const std::string &source_path,
                                const std::string &request_id) const {
  std::error_code ec;
  fs::create_directories(settings_.temp_dir, ec);
  if (ec) {
    return Error::system(fmt::format("Cannot create temp dir {}: {}",
                                     settings_.temp_dir, ec.message()));
  }

  const std::string staged =
      (fs::path(settings_.temp_dir) /
       fmt::format("upload_{}{}", request_id,
                   FileValidator::extension_of(source_path)))
          .string();

  fs::copy_file(source_path, staged, fs::copy_options::none, ec);
  if (ec) {
    return Error::file_validation(
        fmt::format("Failed to save uploaded file: {}", ec.message()));
  }
  return staged;
}

Result<CompressionResponse>
CompressionService::handle(const std::string &source_path,
                           const std::string &options_json) const {
  // **---- Options ----**

  auto parsed = CompressionOptions::parse(options_json, settings_);
  if (is_error(parsed)) {
    return error_of(parsed);
  }
  auto &options = std::get<CompressionOptions>(parsed);

  // **---- Source checks ----**

  if (auto err = file_validator_.validate_extension(source_path)) {
    return *err;
  }

  std::error_code ec;
  std::uint64_t original_size = fs::file_size(source_path, ec);
  if (ec) {
    return Error::file_validation(
        fmt::format("Cannot read input file {}: {}", source_path, ec.message()));
  }
  if (auto err = file_validator_.validate_size(original_size)) {
    return *err;
  }

  // **---- Staging ----**

  auto staged = stage_input(source_path, make_request_id());
  if (is_error(staged)) {
    return error_of(staged);
  }
  ScopedTempFile input(std::get<std::string>(staged));

  if (settings_.verify_container) {
    if (auto err = file_validator_.validate_container(input.path())) {
      return *err;
    }
  }

  // **---- Compression ----**

  auto compressed = orchestrator_.compress(input.path(), options.ffmpeg_args,
                                           options.output_format);
  if (is_error(compressed)) {
    return error_of(compressed);
  }
  auto &result = std::get<CompressionResult>(compressed);
  ScopedTempFile output(result.output_path);

  std::uint64_t compressed_size = fs::file_size(output.path(), ec);
  if (ec) {
    return Error::system(fmt::format("Cannot stat output {}: {}",
                                     output.path(), ec.message()));
  }

  // **---- Publication ----**

  auto uploaded =
      store_.upload(output.path(), "video/" + options.output_format);
  if (is_error(uploaded)) {
    return error_of(uploaded);
  }
  const std::string artifact_id = std::get<std::string>(uploaded);

  auto signed_url =
      store_.sign(artifact_id, std::chrono::seconds(settings_.temp_file_ttl_sec));
  if (is_error(signed_url)) {
    store_.remove(artifact_id);
    return error_of(signed_url);
  }
  auto &link = std::get<SignedUrl>(signed_url);

  CompressionResponse response;
  response.download_url = link.url;
  response.expires_at = link.expires_at;
  response.processing_time = result.processing_time_sec;
  response.file_info.original_size = original_size;
  response.file_info.compressed_size = compressed_size;
  response.file_info.compression_ratio =
      original_size > 0 ? static_cast<double>(compressed_size) /
                              static_cast<double>(original_size)
                        : 0.0;
  response.file_info.duration = result.input_info.duration;
  response.file_info.original_format = result.input_info.format_name;
  response.artifact_id = artifact_id;
  response.command = result.command.to_string();
  response.metadata = std::move(options.metadata);

#if VIDPRESS_ENABLE_TIMING
  print_timing_summary(result.timings);
#endif

  return response;
}

} // namespace vidpress
