/**
 * @file artifact_store.hpp
 * @brief Publication of finished artifacts
 *
 * @details ArtifactStore is the seam between the compression pipeline and
 *          wherever results are published. The pipeline only needs four
 *          operations: upload a local file, hand out a time-limited link,
 *          delete an artifact, and sweep expired ones.
 *
 *          DirectoryArtifactStore publishes into a local directory:
 *
 *            <root>/compressed/<hex>_<basename>
 *            <root>/compressed/<hex>_<basename>.meta.json
 *
 *          The sidecar holds uploaded_at (epoch seconds), ttl (seconds) and
 *          content_type.
 */

#ifndef VIDPRESS_ARTIFACT_STORE_HPP
#define VIDPRESS_ARTIFACT_STORE_HPP

#include <chrono>
#include <string>

#include "error.hpp"

namespace vidpress {

/**
 * @struct SignedUrl
 * @brief Time-limited download link.
 */
struct SignedUrl {
  std::string url;
  std::chrono::system_clock::time_point expires_at;
};

/**
 * @class ArtifactStore
 * @brief Abstract destination for compressed outputs.
 * @note Implementations must be safe to call from several batch workers.
 */
class ArtifactStore {
public:
  virtual ~ArtifactStore() = default;

  /**
   * @brief Copy a local file into the store.
   * @return Artifact id (store-relative name), or a Storage error
   */
  virtual Result<std::string> upload(const std::string &local_path,
                                     const std::string &content_type) = 0;

  /**
   * @brief Issue a link valid for ttl from now.
   */
  virtual Result<SignedUrl> sign(const std::string &artifact_id,
                                 std::chrono::seconds ttl) = 0;

  /// @return true if the artifact existed and was deleted
  virtual bool remove(const std::string &artifact_id) = 0;

  /**
   * @brief Delete artifacts whose uploaded_at + ttl lies in the past.
   * @return Number of artifacts deleted; failures are logged, never raised
   */
  virtual int purge_expired() = 0;
};

/**
 * @class DirectoryArtifactStore
 * @brief ArtifactStore backed by a local directory tree.
 */
class DirectoryArtifactStore : public ArtifactStore {
public:
  /**
   * @param root Publish directory (created on first upload)
   * @param default_ttl TTL recorded in each sidecar
   */
  DirectoryArtifactStore(std::string root, std::chrono::seconds default_ttl);

  Result<std::string> upload(const std::string &local_path,
                             const std::string &content_type) override;
  Result<SignedUrl> sign(const std::string &artifact_id,
                         std::chrono::seconds ttl) override;
  bool remove(const std::string &artifact_id) override;
  int purge_expired() override;

  /**
   * @brief purge_expired() evaluated at an explicit instant.
   */
  int purge_expired_at(std::chrono::system_clock::time_point now);

  /// Absolute path of an artifact inside the store
  std::string path_of(const std::string &artifact_id) const;

  const std::string &root() const { return root_; }

private:
  std::string root_;
  std::chrono::seconds default_ttl_;
};

} // namespace vidpress

#endif // VIDPRESS_ARTIFACT_STORE_HPP
