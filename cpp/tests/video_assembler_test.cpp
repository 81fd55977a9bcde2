#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "pipeline/ffmpeg_encoder.hpp"
#include "pipeline/video_assembler.hpp"
#include "utils/cancel_flag.hpp"
#include "utils/media_probe.hpp"
#include "utils/pipeline_error.hpp"
#include "test_utils.hpp"

using namespace lyricvid;
using namespace lyricvid::pipeline;

namespace {

AssemblyRequest tone_request(double seconds)
{
    AssemblyRequest request;
    request.image.bytes = test::solid_jpeg(200, 200, 90, 60, 30);
    request.image.mime_type = "image/jpeg";
    request.audio.bytes = test::sine_wav(seconds);
    request.audio.extension = ".wav";
    request.subtitles = "1\n00:00:00,000 --> 00:00:10,000\nhello\n";
    request.caption_position = 50;
    return request;
}

class VideoAssemblerTest : public ::testing::Test {
protected:
    VideoAssemblerTest()
        : assembler(test::small_config(), encoder)
    {
        assembler.set_progress_callback([this](double ratio) { progress.push_back(ratio); });
        assembler.set_status_callback([this](const std::string& line) { status.push_back(line); });
    }

    void TearDown() override
    {
        utils::reset_cancel();
    }

    void expect_storage_empty()
    {
        ASSERT_TRUE(encoder.storage().is_ready());
        EXPECT_TRUE(encoder.storage().list().empty());
    }

    FFmpegEncoder encoder;
    VideoAssembler assembler;
    std::vector<double> progress;
    std::vector<std::string> status;
};

TEST(AssemblerHelpers, AudioExtension)
{
    EXPECT_EQ(sanitize_audio_extension(".MP3"), "mp3");
    EXPECT_EQ(sanitize_audio_extension("wav"), "wav");
    EXPECT_EQ(sanitize_audio_extension(""), "mp3");
    EXPECT_EQ(sanitize_audio_extension("../../x"), "x");
    EXPECT_EQ(sanitize_audio_extension("./"), "mp3");
}

TEST(AssemblerHelpers, FrameNames)
{
    EXPECT_EQ(frame_file_name(0), "frame00000.jpg");
    EXPECT_EQ(frame_file_name(39), "frame00039.jpg");
    EXPECT_EQ(frame_file_name(12345), "frame12345.jpg");
}

TEST_F(VideoAssemblerTest, TenSecondToneWithOneCue)
{
    std::vector<uint8_t> video = assembler.assemble(tone_request(10.0));
    ASSERT_FALSE(video.empty());

    const AssemblyStats& stats = assembler.last_stats();
    EXPECT_TRUE(stats.duration_probed);
    EXPECT_NEAR(stats.duration, 10.0, 1e-6);
    EXPECT_EQ(stats.total_frames, 40);
    EXPECT_EQ(stats.frames_written, 40);
    EXPECT_EQ(stats.compositor_renders, 1);

    double output_duration = 0.0;
    ASSERT_TRUE(utils::probe_duration(video, output_duration));
    EXPECT_NEAR(output_duration, 10.0, 0.5);

    expect_storage_empty();

    ASSERT_FALSE(progress.empty());
    EXPECT_DOUBLE_EQ(progress.front(), 0.01);
    EXPECT_DOUBLE_EQ(progress.back(), 1.0);
    for (size_t i = 1; i < progress.size(); i++) {
        EXPECT_GE(progress[i], progress[i - 1]);
    }

    ASSERT_GE(status.size(), 2u);
    EXPECT_EQ(status[0], "Loading video engine...");
    EXPECT_EQ(status[1], "Engine ready!");
}

TEST_F(VideoAssemblerTest, CaptionChangesTriggerRenders)
{
    AssemblyRequest request = tone_request(3.0);
    request.subtitles =
        "1\n00:00:00,000 --> 00:00:01,000\none\n\n"
        "2\n00:00:01,000 --> 00:00:02,000\ntwo\n";

    assembler.assemble(request);

    // "one", "two", then the empty caption for the last second
    const AssemblyStats& stats = assembler.last_stats();
    EXPECT_EQ(stats.total_frames, 12);
    EXPECT_EQ(stats.compositor_renders, 3);
    expect_storage_empty();
}

TEST_F(VideoAssemblerTest, UnreadableAudioFallsBackThenFailsInEncoder)
{
    AssemblyRequest request = tone_request(1.0);
    request.audio.bytes.assign(4096, 0x42);
    request.audio.extension = "mp3";

    try {
        assembler.assemble(request);
        FAIL() << "expected PipelineError";
    } catch (const PipelineError& ex) {
        EXPECT_EQ(ex.code(), ErrorCode::EncoderInvocation);
    }

    const AssemblyStats& stats = assembler.last_stats();
    EXPECT_FALSE(stats.duration_probed);
    EXPECT_DOUBLE_EQ(stats.duration, 180.0);
    EXPECT_EQ(stats.total_frames, 720);
    expect_storage_empty();

    // Same engine, next job succeeds
    std::vector<uint8_t> video = assembler.assemble(tone_request(2.0));
    EXPECT_FALSE(video.empty());
    EXPECT_EQ(assembler.last_stats().total_frames, 8);
    expect_storage_empty();
}

TEST_F(VideoAssemblerTest, UndecodableImage)
{
    AssemblyRequest request = tone_request(1.0);
    request.image.bytes.assign(1024, 0x00);

    try {
        assembler.assemble(request);
        FAIL() << "expected PipelineError";
    } catch (const PipelineError& ex) {
        EXPECT_EQ(ex.code(), ErrorCode::ImageDecode);
    }
    expect_storage_empty();
}

TEST_F(VideoAssemblerTest, CancelledBeforeFrames)
{
    utils::request_cancel();

    try {
        assembler.assemble(tone_request(1.0));
        FAIL() << "expected PipelineError";
    } catch (const PipelineError& ex) {
        EXPECT_EQ(ex.code(), ErrorCode::Cancelled);
    }
    utils::reset_cancel();
    expect_storage_empty();
}

TEST_F(VideoAssemblerTest, CancelStaysSetUntilReset)
{
    utils::request_cancel();
    for (int attempt = 0; attempt < 2; attempt++) {
        try {
            assembler.assemble(tone_request(1.0));
            FAIL() << "expected PipelineError";
        } catch (const PipelineError& ex) {
            EXPECT_EQ(ex.code(), ErrorCode::Cancelled);
        }
    }

    utils::reset_cancel();
    std::vector<uint8_t> video = assembler.assemble(tone_request(1.0));
    EXPECT_FALSE(video.empty());
    EXPECT_EQ(assembler.last_stats().frames_written, 4);
    expect_storage_empty();
}

} // namespace
