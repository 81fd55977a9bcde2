/**
 * Video Assembler Implementation
 */

#include "video_assembler.hpp"
#include "pipeline/frame_cache.hpp"
#include "pipeline/frame_compositor.hpp"
#include "subtitles/subtitle_track.hpp"
#include "utils/cancel_flag.hpp"
#include "utils/media_probe.hpp"
#include "utils/pipeline_error.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <utility>

namespace lyricvid {
namespace pipeline {

namespace {

constexpr size_t kMaxExtensionLength = 8;

// Clamped to [0,1] and never goes backwards
class ProgressReporter {
public:
    explicit ProgressReporter(ProgressCallback callback)
        : callback_(std::move(callback))
        , last_(0.0)
    {
    }

    void report(double ratio) {
        ratio = std::clamp(ratio, 0.0, 1.0);
        if (ratio < last_) {
            ratio = last_;
        }
        last_ = ratio;
        if (callback_) {
            callback_(ratio);
        }
    }

private:
    ProgressCallback callback_;
    double last_;
};

/**
 * Per-job state: compositor, frame cache and the artifacts written so far.
 * Destruction removes every artifact and detaches from the encoder.
 */
class PipelineState {
public:
    PipelineState(FFmpegEncoder& encoder, const config::RenderConfig& config, int caption_position)
        : encoder_(encoder)
        , compositor_(config.width, config.height, caption_position, config.jpeg_quality)
        , cache_([this](const std::string& caption, std::vector<uint8_t>& out) {
            return compositor_.render(caption, out);
        })
    {
    }

    ~PipelineState() {
        encoder_.set_progress_callback(nullptr);
        cleanup();
    }

    PipelineState(const PipelineState&) = delete;
    PipelineState& operator=(const PipelineState&) = delete;

    FrameCompositor& compositor() { return compositor_; }
    FrameCache& cache() { return cache_; }

    void write(const std::string& name, const std::vector<uint8_t>& data) {
        // Tracked first so a partial write is still removed
        artifacts_.push_back(name);
        if (!encoder_.storage().write_file(name, data)) {
            throw PipelineError(ErrorCode::EncoderInvocation, "cannot write " + name + " to working storage");
        }
    }

    void track(const std::string& name) {
        artifacts_.push_back(name);
    }

    // Best effort, failures are only logged
    void cleanup() {
        size_t failed = 0;
        for (const std::string& name : artifacts_) {
            if (encoder_.storage().exists(name) && !encoder_.storage().remove_file(name)) {
                failed++;
            }
        }
        if (failed > 0) {
            fprintf(stderr, "[Assembler] Warning: %zu artifacts could not be removed\n", failed);
        }
        artifacts_.clear();
    }

private:
    FFmpegEncoder& encoder_;
    FrameCompositor compositor_;
    FrameCache cache_;
    std::vector<std::string> artifacts_;
};

} // namespace

std::string sanitize_audio_extension(const std::string& extension) {
    std::string result;
    for (char c : extension) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) {
            result += static_cast<char>(std::tolower(uc));
        }
        if (result.size() >= kMaxExtensionLength) {
            break;
        }
    }
    return result.empty() ? std::string("mp3") : result;
}

std::string frame_file_name(int64_t index) {
    char name[64];
    snprintf(name, sizeof(name), FRAME_PATTERN, static_cast<int>(index));
    return name;
}

VideoAssembler::VideoAssembler(const config::RenderConfig& config, FFmpegEncoder& encoder)
    : config_(config)
    , encoder_(encoder)
{
}

void VideoAssembler::set_progress_callback(ProgressCallback callback) {
    progress_callback_ = std::move(callback);
}

void VideoAssembler::set_status_callback(StatusCallback callback) {
    status_callback_ = std::move(callback);
}

std::vector<uint8_t> VideoAssembler::assemble(const AssemblyRequest& request) {
    stats_ = AssemblyStats();
    auto start_time = std::chrono::steady_clock::now();

    ProgressReporter progress(progress_callback_);
    progress.report(0.01);

    EncoderSession session(encoder_, status_callback_);

    std::vector<subtitles::Cue> cues = subtitles::parse_cues(request.subtitles);

    double duration = 0.0;
    if (utils::probe_duration(request.audio.bytes, duration)) {
        stats_.duration_probed = true;
    } else {
        duration = config_.default_duration;
        fprintf(stderr, "[Assembler] Could not determine audio duration, using %.0fs\n", duration);
    }
    stats_.duration = duration;
    printf("[Assembler] Audio duration: %.3f seconds\n", duration);

    progress.report(0.05);

    const int fps = config_.fps;
    const int64_t total_frames = static_cast<int64_t>(std::ceil(duration * fps));
    stats_.total_frames = total_frames;
    printf("[Assembler] Generating %lld frames at %d fps...\n", static_cast<long long>(total_frames), fps);

    PipelineState state(encoder_, config_, request.caption_position);
    if (!state.compositor().load_font(config_.font_path, config_.font_size)) {
        fprintf(stderr, "[Assembler] Warning: no caption font, frames will have no text\n");
    }
    state.compositor().load_background(request.image.bytes, request.image.mime_type);

    for (int64_t i = 0; i < total_frames; i++) {
        if (utils::is_cancel_requested()) {
            throw PipelineError(ErrorCode::Cancelled, "frame generation interrupted");
        }

        double t = static_cast<double>(i) / fps;
        std::string caption = subtitles::caption_at(cues, t);

        const std::vector<uint8_t>* frame = state.cache().get(caption);
        if (!frame) {
            throw PipelineError(ErrorCode::EncoderInvocation,
                                "failed to render frame " + std::to_string(i));
        }

        state.write(frame_file_name(i), *frame);
        stats_.frames_written++;

        if (i % PROGRESS_INTERVAL == 0) {
            progress.report(0.05 + (static_cast<double>(i) / total_frames) * 0.4);
            printf("[Assembler] Generated frame %lld/%lld\n",
                   static_cast<long long>(i + 1), static_cast<long long>(total_frames));
        }
    }
    stats_.compositor_renders = state.cache().render_count();

    progress.report(0.45);

    std::string audio_name = "audio." + sanitize_audio_extension(request.audio.extension);
    state.write(audio_name, request.audio.bytes);

    progress.report(0.50);

    session.encoder().set_progress_callback([&progress](double ratio) {
        progress.report(0.50 + ratio * 0.45);
    });

    EncodeJob job;
    job.frame_pattern = FRAME_PATTERN;
    job.frame_rate = fps;
    job.expected_frames = total_frames;
    job.audio_name = audio_name;
    job.output_name = OUTPUT_NAME;
    job.preset = config_.preset;
    job.audio_bitrate = config_.audio_bitrate;
    job.use_hw_accel = config_.use_hw_accel;
    job.shortest = true;

    printf("[Assembler] Combining frames into video...\n");
    state.track(job.output_name);
    session.encoder().run(job);

    progress.report(0.95);

    std::vector<uint8_t> output;
    if (!session.storage().read_file(job.output_name, output) || output.empty()) {
        throw PipelineError(ErrorCode::EncoderInvocation, "encoder produced no output");
    }

    state.cleanup();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();
    printf("[Assembler] Done: %lld frames (%lld renders), %zu bytes in %.2fs\n",
           static_cast<long long>(stats_.frames_written),
           static_cast<long long>(stats_.compositor_renders),
           output.size(), elapsed / 1000.0);

    progress.report(1.0);
    return output;
}

} // namespace pipeline
} // namespace lyricvid
