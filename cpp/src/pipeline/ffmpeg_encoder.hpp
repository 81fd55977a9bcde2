#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

#include "config/render_config.hpp"
#include "pipeline/working_storage.hpp"

// Forward declarations
struct AVFormatContext;
struct AVCodecContext;
struct AVCodec;

namespace lyricvid {
namespace pipeline {

using ProgressCallback = std::function<void(double ratio)>;
using StatusCallback = std::function<void(const std::string& line)>;

// One encode invocation. Names refer to files in the encoder's working storage.
struct EncodeJob {
    std::string frame_pattern = FRAME_PATTERN;
    int frame_rate = SAMPLE_RATE;
    int64_t expected_frames = 0;     // used for progress only, 0 if unknown
    std::string audio_name;
    std::string output_name = OUTPUT_NAME;
    std::string preset = VIDEO_PRESET;
    std::string audio_bitrate = AUDIO_BITRATE;
    bool use_hw_accel = false;
    bool shortest = true;
};

/**
 * FFmpeg video engine
 *
 * Muxes a numbered JPEG sequence with an audio track into H.264/AAC MP4,
 * working out of its own temporary storage. Loaded once and reused across
 * jobs. NVENC is tried first when requested, libx264 otherwise.
 */
class FFmpegEncoder {
public:
    FFmpegEncoder();
    ~FFmpegEncoder();

    FFmpegEncoder(const FFmpegEncoder&) = delete;
    FFmpegEncoder& operator=(const FFmpegEncoder&) = delete;

    // Check codecs and create storage. No-op when already loaded.
    // Throws PipelineError(EncoderLoad).
    void load();
    bool is_loaded() const { return loaded_; }

    // Throws PipelineError(EncoderInvocation) or PipelineError(Cancelled)
    void run(const EncodeJob& job);

    WorkingStorage& storage() { return storage_; }

    void set_progress_callback(ProgressCallback callback);
    void set_status_callback(StatusCallback callback);
    void clear_callbacks();

    // Any thread; the status callback never runs concurrently with itself
    void emit_status(const std::string& line);

    // Serializes jobs on this engine
    std::mutex& job_mutex() { return job_mutex_; }

    // Video frames written by the last run
    int64_t frames_encoded() const { return frames_encoded_; }
    const std::string& video_codec_name() const { return video_codec_name_; }

private:
    struct Transcode;

    void open_inputs(Transcode& t, const EncodeJob& job);
    void open_output(Transcode& t, const EncodeJob& job);
    void open_video_encoder(Transcode& t, const EncodeJob& job);
    void open_audio_encoder(Transcode& t, const EncodeJob& job);
    void write_header(Transcode& t, const EncodeJob& job);

    bool step_video(Transcode& t);
    bool step_audio(Transcode& t);
    void flush_encoders(Transcode& t);

    void report_progress(double ratio);

    WorkingStorage storage_;
    bool loaded_;
    const AVCodec* video_codec_;
    std::string video_codec_name_;
    int64_t frames_encoded_;

    std::mutex job_mutex_;
    std::mutex callback_mutex_;
    std::mutex status_delivery_mutex_;
    ProgressCallback progress_callback_;
    StatusCallback status_callback_;
};

/**
 * Scoped use of an encoder for one job.
 *
 * Holds the engine's job lock, loads it on first use and routes its status
 * lines to the caller. Releasing drops the job's callbacks so the engine
 * stays usable after a failed job.
 */
class EncoderSession {
public:
    EncoderSession(FFmpegEncoder& encoder, StatusCallback status);
    ~EncoderSession();

    EncoderSession(const EncoderSession&) = delete;
    EncoderSession& operator=(const EncoderSession&) = delete;

    FFmpegEncoder& encoder() { return encoder_; }
    WorkingStorage& storage() { return encoder_.storage(); }

private:
    FFmpegEncoder& encoder_;
    std::unique_lock<std::mutex> lock_;
};

} // namespace pipeline
} // namespace lyricvid
