#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "pipeline/ffmpeg_encoder.hpp"
#include "utils/pipeline_error.hpp"
#include "test_utils.hpp"

using namespace lyricvid;
using namespace lyricvid::pipeline;

namespace {

TEST(FFmpegEncoder, LoadIsLazyAndIdempotent)
{
    FFmpegEncoder encoder;
    EXPECT_FALSE(encoder.is_loaded());

    std::vector<std::string> status;
    encoder.set_status_callback([&status](const std::string& line) { status.push_back(line); });

    encoder.load();
    ASSERT_TRUE(encoder.is_loaded());
    EXPECT_TRUE(encoder.storage().is_ready());
    ASSERT_EQ(status.size(), 2u);
    EXPECT_EQ(status.front(), "Loading video engine...");
    EXPECT_EQ(status.back(), "Engine ready!");

    encoder.load();
    EXPECT_EQ(status.size(), 2u);
}

TEST(FFmpegEncoder, RunWithoutLoadFails)
{
    FFmpegEncoder encoder;
    EncodeJob job;
    job.audio_name = "audio.wav";

    try {
        encoder.run(job);
        FAIL() << "expected PipelineError";
    } catch (const PipelineError& ex) {
        EXPECT_EQ(ex.code(), ErrorCode::EncoderInvocation);
    }
}

TEST(FFmpegEncoder, MissingFramesIsInvocationError)
{
    FFmpegEncoder encoder;
    encoder.load();
    ASSERT_TRUE(encoder.storage().write_file("audio.wav", test::sine_wav(1.0)));

    EncodeJob job;
    job.audio_name = "audio.wav";

    try {
        encoder.run(job);
        FAIL() << "expected PipelineError";
    } catch (const PipelineError& ex) {
        EXPECT_EQ(ex.code(), ErrorCode::EncoderInvocation);
    }
}

TEST(FFmpegEncoder, EncodesShortestStream)
{
    FFmpegEncoder encoder;
    encoder.load();

    // 2 s of frames against 5 s of audio
    std::vector<uint8_t> frame = test::solid_jpeg(160, 90, 40, 80, 120);
    ASSERT_FALSE(frame.empty());
    for (int i = 0; i < 8; i++) {
        char name[32];
        snprintf(name, sizeof(name), "frame%05d.jpg", i);
        ASSERT_TRUE(encoder.storage().write_file(name, frame));
    }
    ASSERT_TRUE(encoder.storage().write_file("audio.wav", test::sine_wav(5.0)));

    std::vector<double> progress;
    encoder.set_progress_callback([&progress](double ratio) { progress.push_back(ratio); });

    EncodeJob job;
    job.audio_name = "audio.wav";
    job.expected_frames = 8;
    ASSERT_NO_THROW(encoder.run(job));

    EXPECT_EQ(encoder.frames_encoded(), 8);
    ASSERT_FALSE(progress.empty());
    EXPECT_DOUBLE_EQ(progress.back(), 1.0);
    for (double p : progress) {
        EXPECT_GE(p, 0.0);
        EXPECT_LE(p, 1.0);
    }

    std::vector<uint8_t> output;
    ASSERT_TRUE(encoder.storage().read_file(job.output_name, output));
    EXPECT_GT(output.size(), 1000u);
}

TEST(EncoderSession, ReleasesCallbacks)
{
    FFmpegEncoder encoder;
    int calls = 0;
    {
        EncoderSession session(encoder, [&calls](const std::string&) { calls++; });
        EXPECT_TRUE(encoder.is_loaded());
        EXPECT_EQ(calls, 2);
        encoder.emit_status("inside");
        EXPECT_EQ(calls, 3);
    }

    encoder.emit_status("after release");
    EXPECT_EQ(calls, 3);

    // The engine can be acquired again
    EncoderSession again(encoder, nullptr);
    EXPECT_EQ(&again.encoder(), &encoder);
    EXPECT_TRUE(again.storage().is_ready());
}

TEST(FFmpegEncoder, StatusLinesAreDeliveredOneAtATime)
{
    FFmpegEncoder encoder;
    std::atomic<int> in_flight{0};
    std::atomic<int> max_in_flight{0};
    std::atomic<int> delivered{0};
    encoder.set_status_callback([&](const std::string&) {
        int now = ++in_flight;
        int seen = max_in_flight.load();
        while (now > seen && !max_in_flight.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::yield();
        --in_flight;
        ++delivered;
    });

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([&encoder]() {
            for (int i = 0; i < 200; i++) {
                encoder.emit_status("line");
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(delivered.load(), 800);
    EXPECT_EQ(max_in_flight.load(), 1);
}

} // namespace
