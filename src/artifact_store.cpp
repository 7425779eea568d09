/**
 * @file artifact_store.cpp
 * @brief Directory-backed artifact store implementation
 */

#include "vidpress/artifact_store.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <vector>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "vidpress/logging.hpp"
#include "vidpress/temp_file.hpp"

namespace vidpress {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr const char *PREFIX = "compressed/";
constexpr const char *SIDECAR_SUFFIX = ".meta.json";

std::int64_t to_epoch(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(
             tp.time_since_epoch())
      .count();
}

/// Ids are "compressed/<name>" with no further path components
bool is_valid_id(const std::string &id) {
  const std::string prefix(PREFIX);
  if (id.size() <= prefix.size() || id.compare(0, prefix.size(), prefix) != 0)
    return false;
  std::string name = id.substr(prefix.size());
  return name.find('/') == std::string::npos && name != "." && name != "..";
}

std::string sidecar_of(const std::string &artifact_path) {
  return artifact_path + SIDECAR_SUFFIX;
}

} // anonymous namespace

DirectoryArtifactStore::DirectoryArtifactStore(std::string root,
                                               std::chrono::seconds default_ttl)
    : root_(std::move(root)), default_ttl_(default_ttl) {}

std::string DirectoryArtifactStore::path_of(const std::string &artifact_id) const {
  return (fs::path(root_) / artifact_id).string();
}

Result<std::string>
DirectoryArtifactStore::upload(const std::string &local_path,
                               const std::string &content_type) {
  std::error_code ec;
  fs::create_directories(fs::path(root_) / PREFIX, ec);
  if (ec) {
    return Error::storage(fmt::format("Failed to create publish directory {}: {}",
                                      root_, ec.message()));
  }

  const std::string basename = fs::path(local_path).filename().string();
  const std::string id =
      fmt::format("{}{}_{}", PREFIX, make_request_id(), basename);
  const std::string dest = path_of(id);

  fs::copy_file(local_path, dest, fs::copy_options::none, ec);
  if (ec) {
    return Error::storage(
        fmt::format("Failed to upload file: {}", ec.message()));
  }

  json meta = {
      {"uploaded_at", to_epoch(std::chrono::system_clock::now())},
      {"ttl", default_ttl_.count()},
      {"content_type", content_type},
  };
  std::ofstream out(sidecar_of(dest), std::ios::trunc);
  out << meta.dump(2) << '\n';
  out.close();
  if (!out) {
    fs::remove(dest, ec);
    return Error::storage(
        fmt::format("Failed to write artifact metadata for {}", id));
  }

  LOG_INFO("Published {} ({})", id, content_type);
  return id;
}

Result<SignedUrl> DirectoryArtifactStore::sign(const std::string &artifact_id,
                                               std::chrono::seconds ttl) {
  if (!is_valid_id(artifact_id)) {
    return Error::storage(fmt::format("Invalid artifact id: {}", artifact_id));
  }

  std::error_code ec;
  fs::path p = fs::absolute(path_of(artifact_id), ec);
  if (ec || !fs::exists(p, ec)) {
    return Error::storage(
        fmt::format("Failed to generate signed URL: {} not found", artifact_id));
  }

  SignedUrl signed_url;
  signed_url.expires_at = std::chrono::system_clock::now() + ttl;
  signed_url.url = fmt::format("file://{}?expires={}", p.string(),
                               to_epoch(signed_url.expires_at));
  return signed_url;
}

bool DirectoryArtifactStore::remove(const std::string &artifact_id) {
  if (!is_valid_id(artifact_id))
    return false;

  std::error_code ec;
  const std::string p = path_of(artifact_id);
  bool removed = fs::remove(p, ec);
  if (ec) {
    LOG_WARN("Failed to delete artifact {}: {}", artifact_id, ec.message());
    return false;
  }
  fs::remove(sidecar_of(p), ec);
  return removed;
}

int DirectoryArtifactStore::purge_expired() {
  return purge_expired_at(std::chrono::system_clock::now());
}

int DirectoryArtifactStore::purge_expired_at(
    std::chrono::system_clock::time_point now) {
  const fs::path dir = fs::path(root_) / PREFIX;
  std::error_code ec;
  if (!fs::is_directory(dir, ec))
    return 0;

  const std::int64_t now_epoch = to_epoch(now);
  const std::string suffix(SIDECAR_SUFFIX);
  int deleted = 0;

  /// Collect first; entries are deleted below
  std::vector<fs::path> sidecars;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    const std::string name = it->path().filename().string();
    if (name.size() > suffix.size() &&
        name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0)
      sidecars.push_back(it->path());
  }
  if (ec) {
    LOG_WARN("Cleanup failed: {}", ec.message());
    return 0;
  }

  for (const auto &sidecar : sidecars) {
    const std::string name = sidecar.filename().string();
    std::ifstream in(sidecar);
    json meta = json::parse(in, nullptr, false);
    if (meta.is_discarded() || !meta.is_object() ||
        !meta.contains("uploaded_at") ||
        !meta["uploaded_at"].is_number_integer()) {
      LOG_WARN("Skipping unreadable artifact metadata: {}", name);
      continue;
    }

    std::int64_t uploaded_at = meta["uploaded_at"].get<std::int64_t>();
    std::int64_t ttl = default_ttl_.count();
    if (meta.contains("ttl") && meta["ttl"].is_number_integer()) {
      ttl = meta["ttl"].get<std::int64_t>();
    }
    if (now_epoch <= uploaded_at + ttl)
      continue;

    const std::string artifact_name =
        name.substr(0, name.size() - suffix.size());
    if (remove(PREFIX + artifact_name)) {
      ++deleted;
    } else {
      /// Artifact already gone; drop the orphaned sidecar
      fs::remove(sidecar, ec);
    }
  }

  if (deleted > 0) {
    LOG_INFO("Purged {} expired artifact(s) from {}", deleted, root_);
  }
  return deleted;
}

} // namespace vidpress
