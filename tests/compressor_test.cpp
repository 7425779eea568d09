#include <filesystem>

#include <gtest/gtest.h>

#include "test_support.hpp"
#include "vidpress/compressor.hpp"

using namespace vidpress;
using namespace vidpress::testing_support;

class CompressorTest : public ::testing::Test {
protected:
  ScratchDir dir;
  Settings settings = scratch_settings(dir);
  std::string input;

  void SetUp() override {
    input = dir.file("input.mp4");
    write_file(input, "source-bytes");
    write_script(settings.ffprobe_bin, FAKE_FFPROBE_OK);
  }

  std::vector<std::string> leftovers() const {
    return files_with_prefix(settings.temp_dir, "compressed_");
  }
};

TEST_F(CompressorTest, SuccessfulCompression) {
  write_script(settings.ffmpeg_bin, FAKE_FFMPEG_OK);
  CompressionOrchestrator orchestrator(settings);

  auto r = orchestrator.compress(input, {"-preset", "fast"}, "mp4");
  ASSERT_FALSE(is_error(r)) << error_of(r).message;
  const auto &res = std::get<CompressionResult>(r);

  EXPECT_EQ(read_file(res.output_path), "compressed");
  EXPECT_EQ(res.request_id.size(), 32u);
  EXPECT_EQ(res.output_path, orchestrator.output_path_for(res.request_id, "mp4"));
  EXPECT_EQ(res.command.argv.back(), res.output_path);
  EXPECT_EQ(res.command.argv[2], input);
  ASSERT_TRUE(res.input_info.duration.has_value());
  EXPECT_DOUBLE_EQ(*res.input_info.duration, 12.5);
  EXPECT_EQ(res.output_info.file_size, std::optional<std::uint64_t>(10));
  EXPECT_GE(res.processing_time_sec, 0.0);

  /// Caller owns the artifact now
  std::filesystem::remove(res.output_path);
}

TEST_F(CompressorTest, OutputNamesAreUnique) {
  write_script(settings.ffmpeg_bin, FAKE_FFMPEG_OK);
  CompressionOrchestrator orchestrator(settings);

  auto a = orchestrator.compress(input, {}, "mkv");
  auto b = orchestrator.compress(input, {}, "mkv");
  ASSERT_FALSE(is_error(a));
  ASSERT_FALSE(is_error(b));
  EXPECT_NE(std::get<CompressionResult>(a).output_path,
            std::get<CompressionResult>(b).output_path);
  EXPECT_EQ(leftovers().size(), 2u);
}

TEST_F(CompressorTest, RejectedArgumentsSpawnNothing) {
  const std::string marker = dir.file("spawned");
  write_script(settings.ffmpeg_bin, "touch " + marker + "\n" + FAKE_FFMPEG_OK);
  write_script(settings.ffprobe_bin, "touch " + marker + "\n");
  CompressionOrchestrator orchestrator(settings);

  auto r = orchestrator.compress(input, {"-i", "/etc/passwd"}, "mp4");
  ASSERT_TRUE(is_error(r));
  EXPECT_EQ(error_of(r).kind, ErrorKind::InvalidOptions);
  EXPECT_FALSE(std::filesystem::exists(marker));
  EXPECT_TRUE(leftovers().empty());
}

TEST_F(CompressorTest, UnknownOutputFormatIsInvalidOptions) {
  write_script(settings.ffmpeg_bin, FAKE_FFMPEG_OK);
  CompressionOrchestrator orchestrator(settings);

  auto r = orchestrator.compress(input, {}, "exe");
  ASSERT_TRUE(is_error(r));
  EXPECT_EQ(error_of(r).kind, ErrorKind::InvalidOptions);
  EXPECT_EQ(error_of(r).token, std::optional<std::string>("exe"));
}

TEST_F(CompressorTest, TooManyArgumentsIsInvalidOptions) {
  write_script(settings.ffmpeg_bin, FAKE_FFMPEG_OK);
  CompressionOrchestrator orchestrator(settings);

  RawArgumentList raw;
  for (int i = 0; i < 11; ++i) {
    raw.push_back("-r");
    raw.push_back("30");
  }
  auto r = orchestrator.compress(input, raw, "mp4");
  ASSERT_TRUE(is_error(r));
  EXPECT_EQ(error_of(r).kind, ErrorKind::InvalidOptions);
}

TEST_F(CompressorTest, NonZeroExitIsExecutionErrorAndCleansUp) {
  write_script(settings.ffmpeg_bin,
               "for last; do :; done\n"
               "printf 'partial' > \"$last\"\n"
               "echo 'Invalid data found when processing input' >&2\n"
               "exit 1\n");
  CompressionOrchestrator orchestrator(settings);

  auto r = orchestrator.compress(input, {}, "mp4");
  ASSERT_TRUE(is_error(r));
  const Error &err = error_of(r);
  EXPECT_EQ(err.kind, ErrorKind::Execution);
  EXPECT_EQ(err.exit_code, std::optional<int>(1));
  EXPECT_EQ(err.message, "FFmpeg failed with exit code 1");
  ASSERT_TRUE(err.stderr_text.has_value());
  EXPECT_NE(err.stderr_text->find("Invalid data found"), std::string::npos);
  EXPECT_TRUE(leftovers().empty());
}

TEST_F(CompressorTest, SuccessWithoutOutputIsExecutionError) {
  write_script(settings.ffmpeg_bin, "exit 0\n");
  CompressionOrchestrator orchestrator(settings);

  auto r = orchestrator.compress(input, {}, "mp4");
  ASSERT_TRUE(is_error(r));
  EXPECT_EQ(error_of(r).kind, ErrorKind::Execution);
}

TEST_F(CompressorTest, TimeoutRemovesPartialOutput) {
  write_script(settings.ffmpeg_bin, "for last; do :; done\n"
                                    "printf 'partial' > \"$last\"\n"
                                    "sleep 30\n");
  settings.max_processing_time_sec = 1;
  CompressionOrchestrator orchestrator(settings);

  auto start = std::chrono::steady_clock::now();
  auto r = orchestrator.compress(input, {}, "mp4");
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));

  ASSERT_TRUE(is_error(r));
  EXPECT_EQ(error_of(r).kind, ErrorKind::Timeout);
  EXPECT_EQ(error_of(r).message, "Processing timeout after 1 seconds");
  EXPECT_TRUE(leftovers().empty());
}

TEST_F(CompressorTest, MissingTranscoderIsToolNotFound) {
  CompressionOrchestrator orchestrator(settings); //< no ffmpeg script
  auto r = orchestrator.compress(input, {}, "mp4");
  ASSERT_TRUE(is_error(r));
  EXPECT_EQ(error_of(r).kind, ErrorKind::ToolNotFound);
  EXPECT_TRUE(leftovers().empty());
}

TEST_F(CompressorTest, InputIsNeverModified) {
  write_script(settings.ffmpeg_bin, FAKE_FFMPEG_OK);
  CompressionOrchestrator orchestrator(settings);
  auto r = orchestrator.compress(input, {"-crf", "30"}, "webm");
  ASSERT_FALSE(is_error(r));
  EXPECT_EQ(read_file(input), "source-bytes");
  std::filesystem::remove(std::get<CompressionResult>(r).output_path);
}

TEST(StageNameTest, EveryStageHasAName) {
  EXPECT_STREQ(stage_name(Stage::Validating), "Validating");
  EXPECT_STREQ(stage_name(Stage::ProbingOutput), "ProbingOutput");
  EXPECT_STREQ(stage_name(Stage::Failed), "Failed");
}
