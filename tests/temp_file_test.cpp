#include <filesystem>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "test_support.hpp"
#include "vidpress/temp_file.hpp"

using namespace vidpress;
using namespace vidpress::testing_support;

// **---- make_request_id ----**

TEST(RequestIdTest, ThirtyTwoLowercaseHexChars) {
  std::string id = make_request_id();
  EXPECT_EQ(id.size(), 32u);
  EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST(RequestIdTest, UniqueAcrossConcurrentThreads) {
  constexpr int THREADS = 8;
  constexpr int PER_THREAD = 500;

  std::mutex mutex;
  std::set<std::string> ids;
  std::vector<std::thread> threads;
  for (int t = 0; t < THREADS; ++t) {
    threads.emplace_back([&] {
      std::vector<std::string> local;
      for (int i = 0; i < PER_THREAD; ++i) {
        local.push_back(make_request_id());
      }
      std::lock_guard<std::mutex> lock(mutex);
      ids.insert(local.begin(), local.end());
    });
  }
  for (auto &t : threads) {
    t.join();
  }
  EXPECT_EQ(ids.size(), static_cast<std::size_t>(THREADS * PER_THREAD));
}

TEST(RequestIdTest, FreshThreadsStartFromDifferentStreams) {
  /// First id drawn by each new thread; a shared seed would repeat it
  std::vector<std::string> first(16);
  std::vector<std::thread> threads;
  for (std::size_t i = 0; i < first.size(); ++i) {
    threads.emplace_back([&first, i] { first[i] = make_request_id(); });
  }
  for (auto &t : threads) {
    t.join();
  }
  EXPECT_EQ(std::set<std::string>(first.begin(), first.end()).size(),
            first.size());
}

// **---- ScopedTempFile ----**

TEST(ScopedTempFileTest, RemovesFileOnDestruction) {
  ScratchDir dir;
  const std::string path = dir.file("scratch.mp4");
  write_file(path, "x");
  {
    ScopedTempFile file(path);
    EXPECT_TRUE(file.owns());
  }
  EXPECT_FALSE(std::filesystem::exists(path));
}

TEST(ScopedTempFileTest, ReleaseKeepsFile) {
  ScratchDir dir;
  const std::string path = dir.file("kept.mp4");
  write_file(path, "x");
  {
    ScopedTempFile file(path);
    EXPECT_EQ(file.release(), path);
    EXPECT_FALSE(file.owns());
  }
  EXPECT_TRUE(std::filesystem::exists(path));
}

TEST(ScopedTempFileTest, MoveTransfersOwnership) {
  ScratchDir dir;
  const std::string path = dir.file("moved.mp4");
  write_file(path, "x");

  ScopedTempFile outer;
  {
    ScopedTempFile inner(path);
    outer = std::move(inner);
  }
  EXPECT_TRUE(std::filesystem::exists(path));
  outer.remove();
  EXPECT_FALSE(std::filesystem::exists(path));
}

TEST(ScopedTempFileTest, MissingFileIsNotAnError) {
  ScratchDir dir;
  ScopedTempFile file(dir.file("never-written.mp4"));
  file.remove();
  EXPECT_FALSE(file.owns());
}
