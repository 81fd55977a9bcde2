#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "config/render_config.hpp"
#include "pipeline/ffmpeg_encoder.hpp"

namespace lyricvid {
namespace pipeline {

struct AudioAsset {
    std::vector<uint8_t> bytes;
    std::string extension;      // from the source file name, may be empty
};

struct BackgroundImage {
    std::vector<uint8_t> bytes;
    std::string mime_type;      // hint only, content is probed when unknown
};

struct AssemblyRequest {
    BackgroundImage image;
    AudioAsset audio;
    std::string subtitles;      // SRT document
    int caption_position = CAPTION_POSITION;
};

struct AssemblyStats {
    int64_t total_frames = 0;
    int64_t frames_written = 0;
    int64_t compositor_renders = 0;
    double duration = 0.0;
    bool duration_probed = false;
};

/**
 * Video Assembler
 *
 * Builds a lyric video from one background image, an audio track and an
 * SRT document:
 * 1. Parse the cues and probe the audio duration
 * 2. Render one JPEG per sample (4 per second) with the active caption
 * 3. Hand frames and audio to the encoder and collect the MP4
 *
 * Every artifact written to the encoder's storage is removed again,
 * whether the job succeeds or fails.
 */
class VideoAssembler {
public:
    VideoAssembler(const config::RenderConfig& config, FFmpegEncoder& encoder);

    void set_progress_callback(ProgressCallback callback);
    void set_status_callback(StatusCallback callback);

    // Throws PipelineError. The cancel flag is process-wide and stays set
    // after a cancelled job: every later call throws Cancelled at once
    // until utils::reset_cancel() is called.
    std::vector<uint8_t> assemble(const AssemblyRequest& request);

    const AssemblyStats& last_stats() const { return stats_; }

private:
    config::RenderConfig config_;
    FFmpegEncoder& encoder_;
    ProgressCallback progress_callback_;
    StatusCallback status_callback_;
    AssemblyStats stats_;
};

// Lowercased alphanumeric extension, "mp3" when nothing usable remains
std::string sanitize_audio_extension(const std::string& extension);

// Sample index -> file name in the encoder's storage
std::string frame_file_name(int64_t index);

} // namespace pipeline
} // namespace lyricvid
