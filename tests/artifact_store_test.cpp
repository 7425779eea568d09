#include <chrono>
#include <filesystem>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "test_support.hpp"
#include "vidpress/artifact_store.hpp"

using namespace vidpress;
using namespace vidpress::testing_support;
using namespace std::chrono_literals;

class ArtifactStoreTest : public ::testing::Test {
protected:
  ScratchDir dir;
  DirectoryArtifactStore store{dir.file("publish"), 3600s};
  std::string local;

  void SetUp() override {
    local = dir.file("compressed_abc.mp4");
    write_file(local, "payload");
  }

  std::string upload_ok() {
    auto r = store.upload(local, "video/mp4");
    EXPECT_FALSE(is_error(r));
    return is_error(r) ? std::string() : std::get<std::string>(r);
  }
};

TEST_F(ArtifactStoreTest, UploadCopiesFileAndWritesSidecar) {
  std::string id = upload_ok();
  EXPECT_EQ(id.rfind("compressed/", 0), 0u);
  EXPECT_NE(id.find("_compressed_abc.mp4"), std::string::npos);

  EXPECT_EQ(read_file(store.path_of(id)), "payload");
  EXPECT_TRUE(std::filesystem::exists(local)) << "upload must not move";

  auto meta = nlohmann::json::parse(read_file(store.path_of(id) + ".meta.json"));
  EXPECT_EQ(meta["ttl"], 3600);
  EXPECT_EQ(meta["content_type"], "video/mp4");
  EXPECT_TRUE(meta["uploaded_at"].is_number_integer());
}

TEST_F(ArtifactStoreTest, UploadsNeverCollide) {
  EXPECT_NE(upload_ok(), upload_ok());
}

TEST_F(ArtifactStoreTest, UploadOfMissingFileIsStorageError) {
  auto r = store.upload(dir.file("absent.mp4"), "video/mp4");
  ASSERT_TRUE(is_error(r));
  EXPECT_EQ(error_of(r).kind, ErrorKind::Storage);
}

TEST_F(ArtifactStoreTest, SignCarriesExpiry) {
  std::string id = upload_ok();
  auto before = std::chrono::system_clock::now();
  auto r = store.sign(id, 600s);
  ASSERT_FALSE(is_error(r));
  const auto &link = std::get<SignedUrl>(r);

  EXPECT_EQ(link.url.rfind("file://", 0), 0u);
  EXPECT_NE(link.url.find("?expires="), std::string::npos);
  EXPECT_GE(link.expires_at, before + 600s);
  EXPECT_LE(link.expires_at, std::chrono::system_clock::now() + 600s);
}

TEST_F(ArtifactStoreTest, SignRejectsUnknownAndEscapingIds) {
  EXPECT_TRUE(is_error(store.sign("compressed/nope.mp4", 60s)));
  EXPECT_TRUE(is_error(store.sign("../etc/passwd", 60s)));
  EXPECT_TRUE(is_error(store.sign("compressed/../../x", 60s)));
}

TEST_F(ArtifactStoreTest, RemoveDeletesArtifactAndSidecar) {
  std::string id = upload_ok();
  EXPECT_TRUE(store.remove(id));
  EXPECT_FALSE(std::filesystem::exists(store.path_of(id)));
  EXPECT_FALSE(std::filesystem::exists(store.path_of(id) + ".meta.json"));
  EXPECT_FALSE(store.remove(id));
}

TEST_F(ArtifactStoreTest, PurgeRemovesOnlyExpired) {
  std::string id = upload_ok();
  auto now = std::chrono::system_clock::now();

  EXPECT_EQ(store.purge_expired_at(now), 0);
  EXPECT_TRUE(std::filesystem::exists(store.path_of(id)));

  EXPECT_EQ(store.purge_expired_at(now + 3601s), 1);
  EXPECT_FALSE(std::filesystem::exists(store.path_of(id)));
}

TEST_F(ArtifactStoreTest, PurgeSkipsUnreadableSidecars) {
  std::string id = upload_ok();
  write_file(store.path_of(id) + ".meta.json", "garbage");
  EXPECT_EQ(store.purge_expired_at(std::chrono::system_clock::now() + 9999s), 0);
  EXPECT_TRUE(std::filesystem::exists(store.path_of(id)));
}

TEST_F(ArtifactStoreTest, PurgeOnMissingRootIsNoop) {
  DirectoryArtifactStore empty(dir.file("never-created"), 60s);
  EXPECT_EQ(empty.purge_expired(), 0);
}
