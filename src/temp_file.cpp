/**
 * @file temp_file.cpp
 * @brief Request identifiers and scoped temporary files implementation
 */

#include "vidpress/temp_file.hpp"

#include <filesystem>
#include <random>
#include <system_error>
#include <utility>

#include <fmt/core.h>

#include "vidpress/logging.hpp"

namespace vidpress {

namespace {

/// Fill the whole engine state; a single 32-bit seed allows only 2^32 streams
std::mt19937_64 make_engine() {
  std::random_device rd;
  std::seed_seq seq{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
  return std::mt19937_64(seq);
}

thread_local std::mt19937_64 rng = make_engine();
thread_local std::uniform_int_distribution<unsigned long long> dist;

} // anonymous namespace

std::string make_request_id() {
  return fmt::format("{:016x}{:016x}", dist(rng), dist(rng));
}

// **---- ScopedTempFile Implementation ----**

ScopedTempFile::~ScopedTempFile() { remove(); }

ScopedTempFile::ScopedTempFile(ScopedTempFile &&other) noexcept
    : path_(std::move(other.path_)) {
  other.path_.clear();
}

ScopedTempFile &ScopedTempFile::operator=(ScopedTempFile &&other) noexcept {
  if (this != &other) {
    remove();
    path_ = std::move(other.path_);
    other.path_.clear();
  }
  return *this;
}

std::string ScopedTempFile::release() {
  std::string p = std::move(path_);
  path_.clear();
  return p;
}

void ScopedTempFile::remove() {
  if (path_.empty())
    return;

  std::error_code ec;
  std::filesystem::remove(path_, ec);
  if (ec) {
    LOG_WARN("Failed to remove temporary file {}: {}", path_, ec.message());
  }
  path_.clear();
}

} // namespace vidpress
