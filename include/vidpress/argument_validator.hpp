/**
 * @file argument_validator.hpp
 * @brief Allowlist/denylist validation of caller-supplied transcoder tokens
 *
 * @details Rules, applied in order:
 *
 *          1. Denylist: the space-joined token text must not contain any
 *             forbidden pattern (extra input flag, device paths, URL schemes,
 *             exec/system/pipe keywords, command substitution markers).
 *
 *          2. Flag allowlist: every token starting with '-' must exactly
 *             equal an allowed flag.
 *
 *          3. Value safety: a non-flag token containing a dangerous
 *             character must match one of the safe value patterns.
 *
 * @note Pure function over its input. The first failing rule wins.
 */

#ifndef VIDPRESS_ARGUMENT_VALIDATOR_HPP
#define VIDPRESS_ARGUMENT_VALIDATOR_HPP

#include <string>
#include <unordered_set>
#include <vector>

#include "config.hpp"
#include "error.hpp"
#include "types.hpp"

namespace vidpress {

/**
 * @class ArgumentValidator
 * @brief Classifies a RawArgumentList as safe or rejects it with a reason.
 */
class ArgumentValidator {
public:
  explicit ArgumentValidator(const Settings &settings);

  /**
   * @brief Validate caller tokens.
   * @return The unchanged tokens as ValidatedArguments, or an InvalidOptions
   *         error naming the offending token or pattern
   */
  Result<ValidatedArguments> validate(const RawArgumentList &raw_args) const;

  /**
   * @brief Check a value token against the fixed safe-value patterns.
   * @note Integers, known codec names, encoder presets, WIDTHxHEIGHT and
   *       scale=WIDTH:HEIGHT.
   */
  static bool is_safe_value(const std::string &value);

  /**
   * @brief Check whether a value token contains a dangerous character.
   */
  static bool has_dangerous_char(const std::string &value);

private:
  std::unordered_set<std::string> allowed_flags_;
  std::vector<std::string> forbidden_patterns_;
};

} // namespace vidpress

#endif // VIDPRESS_ARGUMENT_VALIDATOR_HPP
