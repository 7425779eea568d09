/**
 * @file argument_validator.cpp
 * @brief Argument allowlist/denylist validation implementation
 */

#include "vidpress/argument_validator.hpp"

#include <algorithm>
#include <regex>

#include <fmt/core.h>

namespace vidpress {

namespace {

/// Characters that may only appear inside a recognised safe value
constexpr const char *DANGEROUS_CHARS = "/\\|&;`$()";

const std::vector<std::regex> &safe_value_patterns() {
  static const std::vector<std::regex> patterns = {
      std::regex(R"(^\d+$)"),
      std::regex(R"(^(libx264|libx265|libvpx|aac)$)"),
      std::regex(R"(^(ultrafast|superfast|veryfast|faster|fast|medium|slow|)"
                 R"(slower|veryslow)$)"),
      std::regex(R"(^\d+x\d+$)"),
      std::regex(R"(^scale=\d+:\d+$)"),
  };
  return patterns;
}

std::string join_tokens(const RawArgumentList &tokens) {
  std::string out;
  for (std::size_t i = 0; i < tokens.size(); ++i) {
    if (i > 0)
      out += ' ';
    out += tokens[i];
  }
  return out;
}

} // anonymous namespace

ArgumentValidator::ArgumentValidator(const Settings &settings)
    : allowed_flags_(settings.allowed_flags.begin(),
                     settings.allowed_flags.end()),
      forbidden_patterns_(settings.forbidden_patterns) {}

bool ArgumentValidator::is_safe_value(const std::string &value) {
  const auto &patterns = safe_value_patterns();
  return std::any_of(patterns.begin(), patterns.end(),
                     [&value](const std::regex &re) {
                       return std::regex_match(value, re);
                     });
}

bool ArgumentValidator::has_dangerous_char(const std::string &value) {
  return value.find_first_of(DANGEROUS_CHARS) != std::string::npos;
}

Result<ValidatedArguments>
ArgumentValidator::validate(const RawArgumentList &raw_args) const {
  if (raw_args.empty()) {
    return ValidatedArguments(raw_args);
  }

  // **---- Rule 1: denylist over the whole argument text ----**

  const std::string joined = join_tokens(raw_args);
  for (const auto &pattern : forbidden_patterns_) {
    if (joined.find(pattern) == std::string::npos)
      continue;

    /// Patterns contain no spaces, so the hit lies inside one token
    auto it = std::find_if(raw_args.begin(), raw_args.end(),
                           [&pattern](const std::string &t) {
                             return t.find(pattern) != std::string::npos;
                           });
    std::string token = (it != raw_args.end()) ? *it : joined;
    return Error::invalid_options(
        fmt::format("forbidden pattern detected: {}", pattern), token);
  }

  // **---- Rules 2 and 3: per-token checks ----**

  for (const auto &arg : raw_args) {
    if (!arg.empty() && arg[0] == '-') {
      if (allowed_flags_.count(arg) == 0) {
        return Error::invalid_options(
            fmt::format("flag not allowed: {}", arg), arg);
      }
    } else if (has_dangerous_char(arg) && !is_safe_value(arg)) {
      return Error::invalid_options(
          fmt::format("potentially dangerous value: {}", arg), arg);
    }
  }

  return ValidatedArguments(raw_args);
}

} // namespace vidpress
