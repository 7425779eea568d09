/**
 * @file options.cpp
 * @brief Options document parsing
 */

#include "vidpress/options.hpp"

#include <cctype>

#include <fmt/core.h>
#include <fmt/ranges.h>

namespace vidpress {

using json = nlohmann::json;

namespace {

bool is_blank(const std::string &text) {
  for (unsigned char c : text) {
    if (!std::isspace(c))
      return false;
  }
  return true;
}

} // anonymous namespace

Result<CompressionOptions>
CompressionOptions::parse(const std::string &json_text,
                          const Settings &settings) {
  CompressionOptions opts;
  if (is_blank(json_text)) {
    return opts;
  }

  json doc = json::parse(json_text, nullptr, false);
  if (doc.is_discarded()) {
    return Error::invalid_options("Invalid JSON in options");
  }
  if (!doc.is_object()) {
    return Error::invalid_options(
        "Invalid options format: expected a JSON object");
  }

  // **---- ffmpeg_args ----**

  auto args_it = doc.find("ffmpeg_args");
  if (args_it != doc.end() && !args_it->is_null()) {
    if (!args_it->is_array()) {
      return Error::invalid_options(
          "Invalid options format: ffmpeg_args must be a list");
    }
    for (const auto &item : *args_it) {
      if (!item.is_string()) {
        return Error::invalid_options(
            "Invalid options format: ffmpeg_args must contain only strings",
            item.dump());
      }
      opts.ffmpeg_args.push_back(item.get<std::string>());
    }
    if (opts.ffmpeg_args.size() > settings.max_args) {
      return Error::invalid_options("Too many ffmpeg arguments");
    }
  }

  // **---- output_format ----**

  auto fmt_it = doc.find("output_format");
  if (fmt_it != doc.end() && !fmt_it->is_null()) {
    if (!fmt_it->is_string()) {
      return Error::invalid_options(
          "Invalid options format: output_format must be a string");
    }
    opts.output_format = fmt_it->get<std::string>();
  }
  if (!settings.is_allowed_output_format(opts.output_format)) {
    return Error::invalid_options(
        fmt::format("Output format must be one of: {}",
                    fmt::join(settings.allowed_output_formats, ", ")),
        opts.output_format);
  }

  // **---- metadata ----**

  auto meta_it = doc.find("metadata");
  if (meta_it != doc.end() && !meta_it->is_null()) {
    if (!meta_it->is_object()) {
      return Error::invalid_options(
          "Invalid options format: metadata must be an object");
    }
    opts.metadata = *meta_it;
  }

  return opts;
}

} // namespace vidpress
