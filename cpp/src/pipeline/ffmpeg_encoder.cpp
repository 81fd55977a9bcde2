/**
 * FFmpeg Video Engine Implementation
 */

#include "ffmpeg_encoder.hpp"
#include "subtitles/timestamp.hpp"
#include "utils/cancel_flag.hpp"
#include "utils/pipeline_error.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/audio_fifo.h>
#include <libavutil/channel_layout.h>
#include <libavutil/opt.h>
#include <libavutil/pixfmt.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
#include <libswscale/swscale.h>
}

#include <algorithm>
#include <cmath>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <utility>
#include <vector>

namespace lyricvid {
namespace pipeline {

namespace {

const int kAacSampleRates[] = {
    96000, 88200, 64000, 48000, 44100, 32000, 24000, 22050, 16000, 12000, 11025, 8000, 7350
};
constexpr int kFallbackSampleRate = 44100;
constexpr int kFallbackFrameSize = 1024;

// av_log is process-wide; lines go to whichever engine is running a job
std::mutex g_log_mutex;
FFmpegEncoder* g_log_sink = nullptr;
std::string g_log_partial;
int g_log_print_prefix = 1;

std::string av_error_string(int err) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(err, buf, sizeof(buf));
    return buf;
}

PipelineError invocation_error(const std::string& what, int err = 0) {
    std::string message = what;
    if (err < 0) {
        message += ": " + av_error_string(err);
    }
    fprintf(stderr, "[Encoder] %s\n", message.c_str());
    return PipelineError(ErrorCode::EncoderInvocation, message);
}

void forward_log(void* avcl, int level, const char* fmt, va_list vl) {
    FFmpegEncoder* sink = nullptr;
    std::vector<std::string> complete_lines;
    {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        if (!g_log_sink) {
            av_log_default_callback(avcl, level, fmt, vl);
            return;
        }
        if (level > AV_LOG_INFO) {
            return;
        }

        char line[1024];
        av_log_format_line2(avcl, level, fmt, vl, line, sizeof(line), &g_log_print_prefix);
        g_log_partial += line;

        size_t newline;
        while ((newline = g_log_partial.find_first_of("\r\n")) != std::string::npos) {
            std::string complete = g_log_partial.substr(0, newline);
            g_log_partial.erase(0, newline + 1);
            if (!complete.empty()) {
                complete_lines.push_back(std::move(complete));
            }
        }
        sink = g_log_sink;
    }

    // Delivered outside g_log_mutex; emit_status serializes the callback
    for (const std::string& complete : complete_lines) {
        sink->emit_status(complete);
    }
}

class LogSinkGuard {
public:
    explicit LogSinkGuard(FFmpegEncoder* sink) {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        g_log_sink = sink;
        g_log_partial.clear();
        g_log_print_prefix = 1;
    }

    ~LogSinkGuard() {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        g_log_sink = nullptr;
        g_log_partial.clear();
    }
};

int output_sample_rate(int input_rate) {
    for (int rate : kAacSampleRates) {
        if (rate == input_rate) {
            return rate;
        }
    }
    return kFallbackSampleRate;
}

AVCodecContext* open_decoder(AVStream* stream, const char* what) {
    const AVCodec* codec = avcodec_find_decoder(stream->codecpar->codec_id);
    if (!codec) {
        throw invocation_error(std::string("No decoder for ") + what);
    }

    AVCodecContext* ctx = avcodec_alloc_context3(codec);
    if (!ctx) {
        throw invocation_error(std::string("Failed to allocate decoder for ") + what);
    }

    int ret = avcodec_parameters_to_context(ctx, stream->codecpar);
    if (ret >= 0) {
        ctx->pkt_timebase = stream->time_base;
        ret = avcodec_open2(ctx, codec, nullptr);
    }
    if (ret < 0) {
        avcodec_free_context(&ctx);
        throw invocation_error(std::string("Failed to open decoder for ") + what, ret);
    }
    return ctx;
}

// Returns 0 with a frame, AVERROR_EOF once the stream is drained, <0 on error
int receive_decoded(
    AVFormatContext* input,
    AVCodecContext* decoder,
    int stream_index,
    AVPacket* packet,
    AVFrame* frame,
    bool& input_eof
) {
    while (true) {
        int ret = avcodec_receive_frame(decoder, frame);
        if (ret == 0 || ret == AVERROR_EOF) {
            return ret;
        }
        if (ret != AVERROR(EAGAIN)) {
            return ret;
        }
        if (input_eof) {
            return AVERROR_EOF;
        }

        ret = av_read_frame(input, packet);
        if (ret == AVERROR_EOF) {
            input_eof = true;
            ret = avcodec_send_packet(decoder, nullptr);
            if (ret < 0 && ret != AVERROR_EOF) {
                return ret;
            }
            continue;
        }
        if (ret < 0) {
            return ret;
        }

        if (packet->stream_index == stream_index) {
            ret = avcodec_send_packet(decoder, packet);
            av_packet_unref(packet);
            if (ret < 0 && ret != AVERROR(EAGAIN)) {
                return ret;
            }
        } else {
            av_packet_unref(packet);
        }
    }
}

int write_packets(AVFormatContext* output, AVCodecContext* encoder, AVStream* stream, AVPacket* packet) {
    while (true) {
        int ret = avcodec_receive_packet(encoder, packet);
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
            return 0;
        } else if (ret < 0) {
            return ret;
        }

        av_packet_rescale_ts(packet, encoder->time_base, stream->time_base);
        packet->stream_index = stream->index;

        ret = av_interleaved_write_frame(output, packet);
        av_packet_unref(packet);
        if (ret < 0) {
            return ret;
        }
    }
}

// Set up the resampler from the first decoded frame
int ensure_resampler(SwrContext** swr, const AVFrame* in, const AVCodecContext* encoder) {
    if (*swr) {
        return 0;
    }

    AVChannelLayout in_layout;
    std::memset(&in_layout, 0, sizeof(in_layout));
    if (in->ch_layout.nb_channels > 0 && in->ch_layout.order != AV_CHANNEL_ORDER_UNSPEC) {
        int ret = av_channel_layout_copy(&in_layout, &in->ch_layout);
        if (ret < 0) {
            return ret;
        }
    } else {
        av_channel_layout_default(&in_layout, std::max(1, in->ch_layout.nb_channels));
    }

    int ret = swr_alloc_set_opts2(
        swr,
        &encoder->ch_layout, encoder->sample_fmt, encoder->sample_rate,
        &in_layout, static_cast<AVSampleFormat>(in->format), in->sample_rate,
        0, nullptr
    );
    av_channel_layout_uninit(&in_layout);
    if (ret < 0) {
        return ret;
    }

    ret = swr_init(*swr);
    if (ret < 0) {
        swr_free(swr);
    }
    return ret;
}

// Convert a decoded frame (or flush with nullptr) into the FIFO
int resample_into_fifo(SwrContext* swr, AVAudioFifo* fifo, const AVFrame* in, int channels) {
    int in_samples = in ? in->nb_samples : 0;
    int out_samples = swr_get_out_samples(swr, in_samples);
    if (out_samples <= 0) {
        return out_samples;
    }

    uint8_t** buffer = nullptr;
    int ret = av_samples_alloc_array_and_samples(
        &buffer, nullptr, channels, out_samples, AV_SAMPLE_FMT_FLTP, 0);
    if (ret < 0) {
        return ret;
    }

    const uint8_t** in_data = in ? const_cast<const uint8_t**>(in->extended_data) : nullptr;
    int converted = swr_convert(swr, buffer, out_samples, in_data, in_samples);
    if (converted > 0) {
        ret = av_audio_fifo_write(fifo, reinterpret_cast<void**>(buffer), converted);
    } else {
        ret = converted;
    }

    av_freep(&buffer[0]);
    av_freep(&buffer);
    return ret < 0 ? ret : 0;
}

} // namespace

// All FFmpeg state of one run, released on every exit path
struct FFmpegEncoder::Transcode {
    AVFormatContext* video_in = nullptr;
    AVFormatContext* audio_in = nullptr;
    AVFormatContext* output = nullptr;
    AVCodecContext* video_dec = nullptr;
    AVCodecContext* audio_dec = nullptr;
    AVCodecContext* video_enc = nullptr;
    AVCodecContext* audio_enc = nullptr;
    AVStream* video_out = nullptr;
    AVStream* audio_out = nullptr;
    SwsContext* sws = nullptr;
    SwrContext* swr = nullptr;
    AVAudioFifo* fifo = nullptr;
    AVPacket* in_packet = nullptr;
    AVPacket* out_packet = nullptr;
    AVFrame* decoded = nullptr;
    AVFrame* video_frame = nullptr;
    AVFrame* audio_frame = nullptr;

    int video_stream = -1;
    int audio_stream = -1;
    bool video_input_eof = false;
    bool audio_input_eof = false;
    bool resampler_flushed = false;
    bool video_done = false;
    bool audio_done = false;

    int frame_rate = SAMPLE_RATE;
    int audio_frame_size = kFallbackFrameSize;
    int64_t video_frames = 0;
    int64_t audio_samples = 0;
    double expected_seconds = 0.0;

    ~Transcode() {
        if (audio_frame) av_frame_free(&audio_frame);
        if (video_frame) av_frame_free(&video_frame);
        if (decoded) av_frame_free(&decoded);
        if (in_packet) av_packet_free(&in_packet);
        if (out_packet) av_packet_free(&out_packet);
        if (fifo) av_audio_fifo_free(fifo);
        if (swr) swr_free(&swr);
        if (sws) sws_freeContext(sws);
        if (video_enc) avcodec_free_context(&video_enc);
        if (audio_enc) avcodec_free_context(&audio_enc);
        if (video_dec) avcodec_free_context(&video_dec);
        if (audio_dec) avcodec_free_context(&audio_dec);
        if (video_in) avformat_close_input(&video_in);
        if (audio_in) avformat_close_input(&audio_in);
        if (output) {
            if (!(output->oformat->flags & AVFMT_NOFILE) && output->pb) {
                avio_closep(&output->pb);
            }
            avformat_free_context(output);
            output = nullptr;
        }
    }
};

FFmpegEncoder::FFmpegEncoder()
    : loaded_(false)
    , video_codec_(nullptr)
    , frames_encoded_(0)
{
}

FFmpegEncoder::~FFmpegEncoder() {
    clear_callbacks();
}

void FFmpegEncoder::load() {
    if (loaded_) {
        return;
    }

    emit_status("Loading video engine...");
    av_log_set_callback(forward_log);

    std::string missing;
    video_codec_ = avcodec_find_encoder_by_name("libx264");
    if (!video_codec_) {
        video_codec_ = avcodec_find_encoder(AV_CODEC_ID_H264);
    }
    if (!video_codec_) missing += " h264-encoder";
    if (!avcodec_find_encoder(AV_CODEC_ID_AAC)) missing += " aac-encoder";
    if (!avcodec_find_decoder(AV_CODEC_ID_MJPEG)) missing += " mjpeg-decoder";
    if (!av_find_input_format("image2")) missing += " image2-demuxer";
    if (!av_guess_format("mp4", nullptr, nullptr)) missing += " mp4-muxer";

    if (!missing.empty()) {
        fprintf(stderr, "[Encoder] Missing FFmpeg components:%s\n", missing.c_str());
        throw PipelineError(ErrorCode::EncoderLoad, "missing FFmpeg components:" + missing);
    }

    if (!storage_.create()) {
        throw PipelineError(ErrorCode::EncoderLoad, "cannot create working storage");
    }

    video_codec_name_ = video_codec_->name;
    loaded_ = true;

    printf("[Encoder] Engine loaded: %s + aac, storage %s\n",
           video_codec_name_.c_str(), storage_.root().string().c_str());
    emit_status("Engine ready!");
}

void FFmpegEncoder::set_progress_callback(ProgressCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    progress_callback_ = std::move(callback);
}

void FFmpegEncoder::set_status_callback(StatusCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    status_callback_ = std::move(callback);
}

void FFmpegEncoder::clear_callbacks() {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    progress_callback_ = nullptr;
    status_callback_ = nullptr;
}

void FFmpegEncoder::emit_status(const std::string& line) {
    StatusCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = status_callback_;
    }
    if (callback) {
        // One line at a time, whichever thread av_log runs on
        std::lock_guard<std::mutex> delivery(status_delivery_mutex_);
        callback(line);
    }
}

void FFmpegEncoder::report_progress(double ratio) {
    ProgressCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = progress_callback_;
    }
    if (callback) {
        callback(std::clamp(ratio, 0.0, 1.0));
    }
}

void FFmpegEncoder::run(const EncodeJob& job) {
    if (!loaded_) {
        throw invocation_error("Engine not loaded");
    }
    if (job.frame_rate <= 0) {
        throw invocation_error("Invalid frame rate");
    }

    frames_encoded_ = 0;
    LogSinkGuard log_guard(this);

    Transcode t;
    t.frame_rate = job.frame_rate;
    t.in_packet = av_packet_alloc();
    t.out_packet = av_packet_alloc();
    t.decoded = av_frame_alloc();
    if (!t.in_packet || !t.out_packet || !t.decoded) {
        throw invocation_error("Failed to allocate frame/packet");
    }

    open_inputs(t, job);
    open_output(t, job);
    open_video_encoder(t, job);
    open_audio_encoder(t, job);
    write_header(t, job);

    report_progress(0.0);

    while (!t.video_done || !t.audio_done) {
        if (utils::is_cancel_requested()) {
            throw PipelineError(ErrorCode::Cancelled, "encode interrupted");
        }
        if (job.shortest && (t.video_done || t.audio_done)) {
            break;
        }

        double video_ts = static_cast<double>(t.video_frames) / t.frame_rate;
        double audio_ts = static_cast<double>(t.audio_samples) / t.audio_enc->sample_rate;

        if (!t.video_done && (t.audio_done || video_ts <= audio_ts)) {
            if (!step_video(t)) {
                t.video_done = true;
            }
        } else if (!step_audio(t)) {
            t.audio_done = true;
        }
    }

    if (t.video_frames == 0) {
        throw invocation_error("No frames were encoded");
    }

    flush_encoders(t);

    int ret = av_write_trailer(t.output);
    if (ret < 0) {
        throw invocation_error("Failed to write trailer", ret);
    }

    frames_encoded_ = t.video_frames;
    printf("[Encoder] Wrote %s: %lld frames, %.2fs audio\n",
           job.output_name.c_str(),
           static_cast<long long>(t.video_frames),
           static_cast<double>(t.audio_samples) / t.audio_enc->sample_rate);

    report_progress(1.0);
}

void FFmpegEncoder::open_inputs(Transcode& t, const EncodeJob& job) {
    // Image sequence at the sampling rate
    const AVInputFormat* image2 = av_find_input_format("image2");
    AVDictionary* options = nullptr;
    av_dict_set_int(&options, "framerate", job.frame_rate, 0);
    av_dict_set(&options, "start_number", "0", 0);

    std::string pattern = storage_.path_of(job.frame_pattern);
    int ret = avformat_open_input(&t.video_in, pattern.c_str(), image2, &options);
    av_dict_free(&options);
    if (ret < 0) {
        throw invocation_error("Cannot open image sequence " + job.frame_pattern, ret);
    }

    ret = avformat_find_stream_info(t.video_in, nullptr);
    if (ret < 0) {
        throw invocation_error("Cannot read image sequence info", ret);
    }

    t.video_stream = av_find_best_stream(t.video_in, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (t.video_stream < 0) {
        throw invocation_error("No video stream in image sequence", t.video_stream);
    }
    t.video_dec = open_decoder(t.video_in->streams[t.video_stream], "frames");

    // Audio track, format probed from content
    std::string audio_path = storage_.path_of(job.audio_name);
    ret = avformat_open_input(&t.audio_in, audio_path.c_str(), nullptr, nullptr);
    if (ret < 0) {
        throw invocation_error("Cannot open audio " + job.audio_name, ret);
    }

    ret = avformat_find_stream_info(t.audio_in, nullptr);
    if (ret < 0) {
        throw invocation_error("Cannot read audio info", ret);
    }

    t.audio_stream = av_find_best_stream(t.audio_in, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (t.audio_stream < 0) {
        throw invocation_error("No audio stream in " + job.audio_name, t.audio_stream);
    }
    t.audio_dec = open_decoder(t.audio_in->streams[t.audio_stream], "audio");

    double video_seconds = job.expected_frames > 0
        ? static_cast<double>(job.expected_frames) / job.frame_rate : 0.0;
    double audio_seconds = t.audio_in->duration > 0
        ? static_cast<double>(t.audio_in->duration) / AV_TIME_BASE : 0.0;

    if (video_seconds > 0.0 && audio_seconds > 0.0) {
        t.expected_seconds = job.shortest
            ? std::min(video_seconds, audio_seconds)
            : std::max(video_seconds, audio_seconds);
    } else {
        t.expected_seconds = std::max(video_seconds, audio_seconds);
    }
}

void FFmpegEncoder::open_output(Transcode& t, const EncodeJob& job) {
    std::string path = storage_.path_of(job.output_name);
    int ret = avformat_alloc_output_context2(&t.output, nullptr, "mp4", path.c_str());
    if (ret < 0 || !t.output) {
        throw invocation_error("Failed to create output context", ret);
    }
}

void FFmpegEncoder::open_video_encoder(Transcode& t, const EncodeJob& job) {
    int width = t.video_dec->width;
    int height = t.video_dec->height;
    if (width <= 0 || height <= 0) {
        throw invocation_error("Frames have no dimensions");
    }

    bool use_nvenc = false;
    const AVCodec* codec = video_codec_;
    if (job.use_hw_accel) {
        const AVCodec* nvenc = avcodec_find_encoder_by_name("h264_nvenc");
        if (nvenc) {
            codec = nvenc;
            use_nvenc = true;
        } else {
            fprintf(stderr, "[Encoder] h264_nvenc not available, falling back to %s\n", video_codec_->name);
        }
    }

    while (true) {
        t.video_enc = avcodec_alloc_context3(codec);
        if (!t.video_enc) {
            throw invocation_error("Failed to allocate video encoder");
        }

        t.video_enc->width = width;
        t.video_enc->height = height;
        t.video_enc->time_base = AVRational{1, job.frame_rate};
        t.video_enc->framerate = AVRational{job.frame_rate, 1};
        t.video_enc->pix_fmt = use_nvenc ? AV_PIX_FMT_NV12 : AV_PIX_FMT_YUV420P;
        t.video_enc->color_range = AVCOL_RANGE_MPEG;

        if (t.output->oformat->flags & AVFMT_GLOBALHEADER) {
            t.video_enc->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
        }

        const char* preset = use_nvenc ? NVENC_PRESET : job.preset.c_str();
        if (av_opt_set(t.video_enc->priv_data, "preset", preset, 0) < 0) {
            fprintf(stderr, "[Encoder] %s does not accept preset '%s'\n", codec->name, preset);
        }

        int ret = avcodec_open2(t.video_enc, codec, nullptr);
        if (ret >= 0) {
            break;
        }

        avcodec_free_context(&t.video_enc);
        if (use_nvenc) {
            fprintf(stderr, "[Encoder] Failed to open NVENC, falling back to %s\n", video_codec_->name);
            codec = video_codec_;
            use_nvenc = false;
            continue;
        }
        throw invocation_error(std::string("Failed to open video encoder ") + codec->name, ret);
    }

    t.video_out = avformat_new_stream(t.output, nullptr);
    if (!t.video_out) {
        throw invocation_error("Failed to create video stream");
    }

    int ret = avcodec_parameters_from_context(t.video_out->codecpar, t.video_enc);
    if (ret < 0) {
        throw invocation_error("Failed to copy video codec params", ret);
    }
    t.video_out->time_base = t.video_enc->time_base;

    t.video_frame = av_frame_alloc();
    if (!t.video_frame) {
        throw invocation_error("Failed to allocate video frame");
    }
    t.video_frame->format = t.video_enc->pix_fmt;
    t.video_frame->width = width;
    t.video_frame->height = height;

    ret = av_frame_get_buffer(t.video_frame, 0);
    if (ret < 0) {
        throw invocation_error("Failed to allocate video frame buffer", ret);
    }

    printf("[Encoder] Video: %dx%d @ %d fps, %s\n", width, height, job.frame_rate, codec->name);
}

void FFmpegEncoder::open_audio_encoder(Transcode& t, const EncodeJob& job) {
    const AVCodec* codec = avcodec_find_encoder(AV_CODEC_ID_AAC);
    if (!codec) {
        throw invocation_error("AAC encoder not available");
    }

    t.audio_enc = avcodec_alloc_context3(codec);
    if (!t.audio_enc) {
        throw invocation_error("Failed to allocate audio encoder");
    }

    int channels = std::min(std::max(t.audio_dec->ch_layout.nb_channels, 1), 2);
    t.audio_enc->sample_fmt = AV_SAMPLE_FMT_FLTP;
    t.audio_enc->sample_rate = output_sample_rate(t.audio_dec->sample_rate);
    av_channel_layout_default(&t.audio_enc->ch_layout, channels);
    t.audio_enc->time_base = AVRational{1, t.audio_enc->sample_rate};

    int ret = av_opt_set(t.audio_enc, "b", job.audio_bitrate.c_str(), 0);
    if (ret < 0) {
        throw invocation_error("Invalid audio bitrate " + job.audio_bitrate, ret);
    }

    if (t.output->oformat->flags & AVFMT_GLOBALHEADER) {
        t.audio_enc->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
    }

    ret = avcodec_open2(t.audio_enc, codec, nullptr);
    if (ret < 0) {
        throw invocation_error("Failed to open audio encoder", ret);
    }

    t.audio_out = avformat_new_stream(t.output, nullptr);
    if (!t.audio_out) {
        throw invocation_error("Failed to create audio stream");
    }

    ret = avcodec_parameters_from_context(t.audio_out->codecpar, t.audio_enc);
    if (ret < 0) {
        throw invocation_error("Failed to copy audio codec params", ret);
    }
    t.audio_out->time_base = t.audio_enc->time_base;

    t.audio_frame_size = t.audio_enc->frame_size > 0 ? t.audio_enc->frame_size : kFallbackFrameSize;

    t.fifo = av_audio_fifo_alloc(AV_SAMPLE_FMT_FLTP, channels, t.audio_frame_size);
    t.audio_frame = av_frame_alloc();
    if (!t.fifo || !t.audio_frame) {
        throw invocation_error("Failed to allocate audio buffers");
    }

    t.audio_frame->nb_samples = t.audio_frame_size;
    t.audio_frame->format = AV_SAMPLE_FMT_FLTP;
    t.audio_frame->sample_rate = t.audio_enc->sample_rate;
    ret = av_channel_layout_copy(&t.audio_frame->ch_layout, &t.audio_enc->ch_layout);
    if (ret >= 0) {
        ret = av_frame_get_buffer(t.audio_frame, 0);
    }
    if (ret < 0) {
        throw invocation_error("Failed to allocate audio frame buffer", ret);
    }

    printf("[Encoder] Audio: %d Hz, %d ch, aac %s\n",
           t.audio_enc->sample_rate, channels, job.audio_bitrate.c_str());
}

void FFmpegEncoder::write_header(Transcode& t, const EncodeJob& job) {
    if (!(t.output->oformat->flags & AVFMT_NOFILE)) {
        std::string path = storage_.path_of(job.output_name);
        int ret = avio_open(&t.output->pb, path.c_str(), AVIO_FLAG_WRITE);
        if (ret < 0) {
            throw invocation_error("Failed to open output file", ret);
        }
    }

    av_opt_set(t.output->priv_data, "movflags", "+faststart", 0);

    int ret = avformat_write_header(t.output, nullptr);
    if (ret < 0) {
        throw invocation_error("Failed to write header", ret);
    }
}

bool FFmpegEncoder::step_video(Transcode& t) {
    int ret = receive_decoded(t.video_in, t.video_dec, t.video_stream, t.in_packet, t.decoded, t.video_input_eof);
    if (ret == AVERROR_EOF) {
        return false;
    }
    if (ret < 0) {
        throw invocation_error("Failed to decode frame", ret);
    }

    t.sws = sws_getCachedContext(
        t.sws,
        t.decoded->width, t.decoded->height, static_cast<AVPixelFormat>(t.decoded->format),
        t.video_enc->width, t.video_enc->height, t.video_enc->pix_fmt,
        SWS_BICUBIC, nullptr, nullptr, nullptr
    );
    if (!t.sws) {
        av_frame_unref(t.decoded);
        throw invocation_error("Failed to init sws context");
    }

    ret = av_frame_make_writable(t.video_frame);
    if (ret < 0) {
        av_frame_unref(t.decoded);
        throw invocation_error("Video frame not writable", ret);
    }

    sws_scale(t.sws, t.decoded->data, t.decoded->linesize, 0, t.decoded->height,
              t.video_frame->data, t.video_frame->linesize);
    av_frame_unref(t.decoded);

    t.video_frame->pts = t.video_frames;
    ret = avcodec_send_frame(t.video_enc, t.video_frame);
    if (ret >= 0) {
        ret = write_packets(t.output, t.video_enc, t.video_out, t.out_packet);
    }
    if (ret < 0) {
        throw invocation_error("Failed to encode video frame", ret);
    }

    t.video_frames++;

    int64_t position_ms = t.video_frames * 1000 / t.frame_rate;
    char line[96];
    snprintf(line, sizeof(line), "frame=%5lld time=%s",
             static_cast<long long>(t.video_frames),
             subtitles::format_encoder_clock(position_ms).c_str());
    emit_status(line);

    if (t.expected_seconds > 0.0) {
        report_progress(static_cast<double>(position_ms) / 1000.0 / t.expected_seconds);
    }

    return true;
}

bool FFmpegEncoder::step_audio(Transcode& t) {
    int channels = t.audio_enc->ch_layout.nb_channels;

    while (av_audio_fifo_size(t.fifo) < t.audio_frame_size && !t.resampler_flushed) {
        int ret = receive_decoded(t.audio_in, t.audio_dec, t.audio_stream, t.in_packet, t.decoded, t.audio_input_eof);
        if (ret == AVERROR_EOF) {
            t.resampler_flushed = true;
            if (t.swr) {
                ret = resample_into_fifo(t.swr, t.fifo, nullptr, channels);
                if (ret < 0) {
                    throw invocation_error("Failed to flush resampler", ret);
                }
            }
            break;
        }
        if (ret < 0) {
            throw invocation_error("Failed to decode audio", ret);
        }

        ret = ensure_resampler(&t.swr, t.decoded, t.audio_enc);
        if (ret >= 0) {
            ret = resample_into_fifo(t.swr, t.fifo, t.decoded, channels);
        }
        av_frame_unref(t.decoded);
        if (ret < 0) {
            throw invocation_error("Failed to resample audio", ret);
        }
    }

    int available = av_audio_fifo_size(t.fifo);
    if (available <= 0) {
        return false;
    }

    int ret = av_frame_make_writable(t.audio_frame);
    if (ret < 0) {
        throw invocation_error("Audio frame not writable", ret);
    }

    int samples = std::min(available, t.audio_frame_size);
    t.audio_frame->nb_samples = samples;
    if (av_audio_fifo_read(t.fifo, reinterpret_cast<void**>(t.audio_frame->data), samples) < samples) {
        throw invocation_error("Audio FIFO underrun");
    }

    t.audio_frame->pts = t.audio_samples;
    t.audio_samples += samples;

    ret = avcodec_send_frame(t.audio_enc, t.audio_frame);
    if (ret >= 0) {
        ret = write_packets(t.output, t.audio_enc, t.audio_out, t.out_packet);
    }
    if (ret < 0) {
        throw invocation_error("Failed to encode audio frame", ret);
    }

    return true;
}

void FFmpegEncoder::flush_encoders(Transcode& t) {
    int ret = avcodec_send_frame(t.video_enc, nullptr);
    if (ret >= 0) {
        ret = write_packets(t.output, t.video_enc, t.video_out, t.out_packet);
    }
    if (ret < 0) {
        throw invocation_error("Failed to flush video encoder", ret);
    }

    ret = avcodec_send_frame(t.audio_enc, nullptr);
    if (ret >= 0) {
        ret = write_packets(t.output, t.audio_enc, t.audio_out, t.out_packet);
    }
    if (ret < 0) {
        throw invocation_error("Failed to flush audio encoder", ret);
    }
}

EncoderSession::EncoderSession(FFmpegEncoder& encoder, StatusCallback status)
    : encoder_(encoder)
    , lock_(encoder.job_mutex())
{
    encoder_.set_status_callback(std::move(status));
    try {
        encoder_.load();
    } catch (const PipelineError&) {
        encoder_.clear_callbacks();
        throw;
    }
}

EncoderSession::~EncoderSession() {
    encoder_.clear_callbacks();
}

} // namespace pipeline
} // namespace lyricvid
