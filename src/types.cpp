/**
 * @file types.cpp
 * @brief Small helpers on the core data types
 */

#include "vidpress/types.hpp"

#include <algorithm>

namespace vidpress {

bool ValidatedArguments::has_flag(const std::string &flag) const {
  return std::any_of(tokens_.begin(), tokens_.end(),
                     [&flag](const std::string &t) {
                       return !t.empty() && t[0] == '-' && t == flag;
                     });
}

std::string Command::to_string() const {
  std::string out;
  for (std::size_t i = 0; i < argv.size(); ++i) {
    if (i > 0)
      out += ' ';
    out += argv[i];
  }
  return out;
}

} // namespace vidpress
