/**
 * @file media_prober.cpp
 * @brief ffprobe invocation and tolerant JSON parsing
 */

#include "vidpress/media_prober.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <system_error>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "vidpress/command_builder.hpp"
#include "vidpress/logging.hpp"

namespace vidpress {

using json = nlohmann::json;

namespace {

/// ffprobe reports duration as a decimal string ("12.480000") or "N/A"
std::optional<double> parse_duration(const json &value) {
  if (value.is_number()) {
    double d = value.get<double>();
    return std::isfinite(d) ? std::optional<double>(d) : std::nullopt;
  }
  if (!value.is_string())
    return std::nullopt;

  const std::string &text = value.get_ref<const std::string &>();
  if (text.empty())
    return std::nullopt;

  errno = 0;
  char *end = nullptr;
  double d = std::strtod(text.c_str(), &end);
  if (errno != 0 || end == text.c_str() || *end != '\0' || !std::isfinite(d))
    return std::nullopt;
  return d;
}

} // anonymous namespace

MediaProber::MediaProber(const Settings &settings, const ProcessRunner &runner)
    : executable_(settings.ffprobe_bin),
      timeout_(std::chrono::seconds(settings.probe_timeout_sec)),
      runner_(runner) {}

std::vector<std::string>
MediaProber::probe_command(const std::string &file_path) const {
  return {executable_,     "-v",           "quiet",
          "-print_format", "json",         "-show_format",
          "-show_streams", CommandBuilder::path_operand(file_path)};
}

MediaMetadata MediaProber::parse_probe_output(const std::string &json_text) {
  MediaMetadata meta;

  json root = json::parse(json_text, nullptr, false);
  if (root.is_discarded() || !root.is_object()) {
    meta.warning = "Could not parse probe output";
    return meta;
  }

  auto fmt_it = root.find("format");
  if (fmt_it != root.end() && fmt_it->is_object()) {
    auto dur_it = fmt_it->find("duration");
    if (dur_it != fmt_it->end()) {
      meta.duration = parse_duration(*dur_it);
    }
    auto name_it = fmt_it->find("format_name");
    if (name_it != fmt_it->end() && name_it->is_string()) {
      meta.format_name = name_it->get<std::string>();
    }
  }

  auto streams_it = root.find("streams");
  if (streams_it != root.end() && streams_it->is_array()) {
    meta.stream_count = static_cast<int>(streams_it->size());
  }

  return meta;
}

MediaMetadata MediaProber::probe(const std::string &file_path) const {
  std::optional<std::uint64_t> file_size;
  {
    std::error_code ec;
    auto size = std::filesystem::file_size(file_path, ec);
    if (!ec)
      file_size = static_cast<std::uint64_t>(size);
  }

  auto outcome = runner_.run(probe_command(file_path), timeout_);

  MediaMetadata meta;
  if (is_error(outcome)) {
    meta.warning =
        fmt::format("Failed to get video info: {}", error_of(outcome).message);
  } else {
    const auto &exec = std::get<ExecutionResult>(outcome);
    if (exec.exit_code != 0) {
      meta.warning = fmt::format("Could not get video info (exit code {})",
                                 exec.exit_code);
    } else {
      meta = parse_probe_output(exec.stdout_text);
    }
  }

  meta.file_size = file_size;
  if (meta.warning) {
    LOG_WARN("Probe of {}: {}",
             std::filesystem::path(file_path).filename().string(),
             *meta.warning);
  }
  return meta;
}

} // namespace vidpress
