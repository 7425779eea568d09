#include <cstdlib>
#include <stdexcept>

#include <gtest/gtest.h>

#include "vidpress/config.hpp"

using namespace vidpress;

class ConfigTest : public ::testing::Test {
protected:
  void TearDown() override {
    for (const char *name :
         {"FFMPEG_BIN", "TEMP_DIR", "MAX_PROCESSING_TIME", "PROBE_TIMEOUT",
          "MAX_FFMPEG_ARGS", "PARALLEL_STREAMS", "VERIFY_CONTAINER"}) {
      unsetenv(name);
    }
  }
};

TEST_F(ConfigTest, Defaults) {
  Settings s = Settings::from_env();
  EXPECT_EQ(s.ffmpeg_bin, "ffmpeg");
  EXPECT_EQ(s.temp_dir, "/tmp");
  EXPECT_EQ(s.max_processing_time_sec, 60);
  EXPECT_EQ(s.max_args, 20u);
  EXPECT_EQ(s.max_file_size, 200ULL * 1024 * 1024);
  EXPECT_TRUE(s.verify_container);
  EXPECT_EQ(s.allowed_flags.size(), 14u);
}

TEST_F(ConfigTest, EnvironmentOverrides) {
  setenv("FFMPEG_BIN", "/opt/ff/ffmpeg", 1);
  setenv("TEMP_DIR", "/var/tmp/vp", 1);
  setenv("MAX_PROCESSING_TIME", "120", 1);
  setenv("PARALLEL_STREAMS", "3", 1);
  setenv("VERIFY_CONTAINER", "0", 1);

  Settings s = Settings::from_env();
  EXPECT_EQ(s.ffmpeg_bin, "/opt/ff/ffmpeg");
  EXPECT_EQ(s.temp_dir, "/var/tmp/vp");
  EXPECT_EQ(s.max_processing_time_sec, 120);
  EXPECT_EQ(s.parallel_streams, 3);
  EXPECT_FALSE(s.verify_container);
}

TEST_F(ConfigTest, ProbeTimeoutNeverExceedsProcessingTimeout) {
  setenv("MAX_PROCESSING_TIME", "5", 1);
  setenv("PROBE_TIMEOUT", "30", 1);
  Settings s = Settings::from_env();
  EXPECT_EQ(s.probe_timeout_sec, 5);
}

TEST_F(ConfigTest, EmptyStringFallsBackToDefault) {
  setenv("FFMPEG_BIN", "", 1);
  EXPECT_EQ(Settings::from_env().ffmpeg_bin, "ffmpeg");
}

TEST_F(ConfigTest, MalformedNumberThrows) {
  setenv("MAX_FFMPEG_ARGS", "lots", 1);
  EXPECT_THROW(Settings::from_env(), std::invalid_argument);
}

TEST_F(ConfigTest, OutputFormatAllowlist) {
  Settings s;
  EXPECT_TRUE(s.is_allowed_output_format("mkv"));
  EXPECT_FALSE(s.is_allowed_output_format("MKV"));
  EXPECT_FALSE(s.is_allowed_output_format("gif"));
}
