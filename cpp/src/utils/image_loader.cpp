/**
 * Image loader and basic processing helpers (BGR).
 */

#include "image_loader.hpp"
#include "memory_input.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libswscale/swscale.h>
#include <libavutil/imgutils.h>
}

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>

namespace lyricvid {
namespace utils {

namespace {

const char* demuxer_for_mime(const std::string& mime_type) {
    if (mime_type == "image/jpeg" || mime_type == "image/jpg") return "jpeg_pipe";
    if (mime_type == "image/png") return "png_pipe";
    if (mime_type == "image/webp") return "webp_pipe";
    if (mime_type == "image/bmp") return "bmp_pipe";
    if (mime_type == "image/gif") return "gif";
    return nullptr;
}

bool decode_first_frame(AVFormatContext* format_ctx, ImageData& out) {
    int stream_idx = -1;
    for (unsigned int i = 0; i < format_ctx->nb_streams; i++) {
        if (format_ctx->streams[i]->codecpar->codec_type == AVMEDIA_TYPE_VIDEO) {
            stream_idx = static_cast<int>(i);
            break;
        }
    }

    if (stream_idx < 0) {
        fprintf(stderr, "[Image] No image stream found\n");
        return false;
    }

    AVCodecParameters* codecpar = format_ctx->streams[stream_idx]->codecpar;
    const AVCodec* codec = avcodec_find_decoder(codecpar->codec_id);
    if (!codec) {
        fprintf(stderr, "[Image] No decoder for codec id %d\n", static_cast<int>(codecpar->codec_id));
        return false;
    }

    AVCodecContext* codec_ctx = avcodec_alloc_context3(codec);
    if (!codec_ctx || avcodec_parameters_to_context(codec_ctx, codecpar) < 0) {
        fprintf(stderr, "[Image] Failed to init codec context\n");
        if (codec_ctx) avcodec_free_context(&codec_ctx);
        return false;
    }

    if (avcodec_open2(codec_ctx, codec, nullptr) < 0) {
        fprintf(stderr, "[Image] Failed to open codec\n");
        avcodec_free_context(&codec_ctx);
        return false;
    }

    AVPacket* packet = av_packet_alloc();
    AVFrame* frame = av_frame_alloc();
    if (!packet || !frame) {
        fprintf(stderr, "[Image] Failed to allocate frames\n");
        if (packet) av_packet_free(&packet);
        if (frame) av_frame_free(&frame);
        avcodec_free_context(&codec_ctx);
        return false;
    }

    bool got_frame = false;
    bool flushed = false;
    while (!got_frame) {
        int ret = avcodec_receive_frame(codec_ctx, frame);
        if (ret == 0) {
            got_frame = true;
            break;
        }
        if (ret != AVERROR(EAGAIN) || flushed) {
            break;
        }

        ret = av_read_frame(format_ctx, packet);
        if (ret < 0) {
            // Drain whatever the decoder still holds
            avcodec_send_packet(codec_ctx, nullptr);
            flushed = true;
            continue;
        }

        if (packet->stream_index == stream_idx) {
            avcodec_send_packet(codec_ctx, packet);
        }
        av_packet_unref(packet);
    }

    if (!got_frame || frame->width <= 0 || frame->height <= 0) {
        fprintf(stderr, "[Image] Failed to decode image\n");
        av_packet_free(&packet);
        av_frame_free(&frame);
        avcodec_free_context(&codec_ctx);
        return false;
    }

    int width = frame->width;
    int height = frame->height;

    SwsContext* sws = sws_getContext(
        width, height, static_cast<AVPixelFormat>(frame->format),
        width, height, AV_PIX_FMT_BGR24,
        SWS_BICUBIC, nullptr, nullptr, nullptr
    );

    if (!sws) {
        fprintf(stderr, "[Image] Failed to init sws context\n");
        av_packet_free(&packet);
        av_frame_free(&frame);
        avcodec_free_context(&codec_ctx);
        return false;
    }

    out.width = width;
    out.height = height;
    out.pixels.resize(static_cast<size_t>(width) * height * 3);

    uint8_t* dst_slices[] = { out.pixels.data() };
    int dst_stride[] = { width * 3 };
    sws_scale(sws, frame->data, frame->linesize, 0, height, dst_slices, dst_stride);

    sws_freeContext(sws);
    av_packet_free(&packet);
    av_frame_free(&frame);
    avcodec_free_context(&codec_ctx);

    return true;
}

} // namespace

bool decode_image_bgr(const std::vector<uint8_t>& bytes, const std::string& mime_type, ImageData& out) {
    if (bytes.empty()) {
        fprintf(stderr, "[Image] Empty image data\n");
        return false;
    }

    MemoryInput input;
    const char* demuxer = demuxer_for_mime(mime_type);
    if (demuxer && input.open(bytes, demuxer) && decode_first_frame(input.format_context(), out)) {
        return true;
    }

    // The MIME hint can be wrong; let FFmpeg probe the content
    if (demuxer) {
        fprintf(stderr, "[Image] Not decodable as %s, probing content\n", mime_type.c_str());
    }
    if (!input.open(bytes, nullptr)) {
        fprintf(stderr, "[Image] Unrecognized image data (%s, %zu bytes)\n",
                mime_type.empty() ? "no mime type" : mime_type.c_str(), bytes.size());
        return false;
    }

    return decode_first_frame(input.format_context(), out);
}

bool resize_image_bgr(const ImageData& src, int dst_width, int dst_height, ImageData& out) {
    if (src.width <= 0 || src.height <= 0 || src.pixels.empty() || dst_width <= 0 || dst_height <= 0) {
        return false;
    }

    out.width = dst_width;
    out.height = dst_height;
    out.pixels.resize(static_cast<size_t>(dst_width) * dst_height * 3);

    SwsContext* sws = sws_getContext(
        src.width, src.height, AV_PIX_FMT_BGR24,
        dst_width, dst_height, AV_PIX_FMT_BGR24,
        SWS_BICUBIC, nullptr, nullptr, nullptr
    );

    if (!sws) {
        fprintf(stderr, "[Image] Failed to init resize sws\n");
        return false;
    }

    const uint8_t* src_slices[] = { src.pixels.data() };
    int src_stride[] = { src.width * 3 };
    uint8_t* dst_slices[] = { out.pixels.data() };
    int dst_stride[] = { dst_width * 3 };

    sws_scale(sws, src_slices, src_stride, 0, src.height, dst_slices, dst_stride);
    sws_freeContext(sws);

    return true;
}

void fill_image_bgr(ImageData& image, int width, int height,
                    unsigned char b, unsigned char g, unsigned char r) {
    image.width = width;
    image.height = height;
    image.pixels.resize(static_cast<size_t>(width) * height * 3);
    for (size_t i = 0; i < image.pixels.size(); i += 3) {
        image.pixels[i + 0] = b;
        image.pixels[i + 1] = g;
        image.pixels[i + 2] = r;
    }
}

void draw_centered_bgr(const ImageData& src, ImageData& dst) {
    if (src.pixels.empty() || dst.pixels.empty()) {
        return;
    }

    int offset_x = (dst.width - src.width) / 2;
    int offset_y = (dst.height - src.height) / 2;

    int start_x = std::max(0, offset_x);
    int end_x = std::min(dst.width, offset_x + src.width);
    int start_y = std::max(0, offset_y);
    int end_y = std::min(dst.height, offset_y + src.height);
    if (start_x >= end_x || start_y >= end_y) {
        return;
    }

    size_t row_bytes = static_cast<size_t>(end_x - start_x) * 3;
    for (int y = start_y; y < end_y; y++) {
        const unsigned char* src_ptr = src.pixels.data() +
            (static_cast<size_t>(y - offset_y) * src.width + (start_x - offset_x)) * 3;
        unsigned char* dst_ptr = dst.pixels.data() + (static_cast<size_t>(y) * dst.width + start_x) * 3;
        std::memcpy(dst_ptr, src_ptr, row_bytes);
    }
}

bool encode_jpeg(const ImageData& image, float quality, std::vector<uint8_t>& out) {
    if (image.width <= 0 || image.height <= 0 || image.pixels.empty()) {
        return false;
    }

    const AVCodec* codec = avcodec_find_encoder(AV_CODEC_ID_MJPEG);
    if (!codec) {
        fprintf(stderr, "[Image] MJPEG encoder not available\n");
        return false;
    }

    AVCodecContext* codec_ctx = avcodec_alloc_context3(codec);
    if (!codec_ctx) {
        fprintf(stderr, "[Image] Failed to allocate JPEG codec context\n");
        return false;
    }

    // Map [0,1] quality onto the MJPEG quantizer scale (2 = best, 31 = worst)
    float clamped = std::min(1.0f, std::max(0.0f, quality));
    int qscale = std::max(2, std::min(31, static_cast<int>(std::lround(1.0f + (1.0f - clamped) * 20.0f))));

    codec_ctx->width = image.width;
    codec_ctx->height = image.height;
    codec_ctx->pix_fmt = AV_PIX_FMT_YUVJ420P;
    codec_ctx->color_range = AVCOL_RANGE_JPEG;
    codec_ctx->time_base = AVRational{1, 25};
    codec_ctx->flags |= AV_CODEC_FLAG_QSCALE;
    codec_ctx->global_quality = FF_QP2LAMBDA * qscale;
    codec_ctx->qmin = qscale;
    codec_ctx->qmax = qscale;

    if (avcodec_open2(codec_ctx, codec, nullptr) < 0) {
        fprintf(stderr, "[Image] Failed to open JPEG encoder\n");
        avcodec_free_context(&codec_ctx);
        return false;
    }

    AVFrame* frame = av_frame_alloc();
    AVPacket* packet = av_packet_alloc();
    if (!frame || !packet) {
        fprintf(stderr, "[Image] Failed to allocate JPEG frame\n");
        if (frame) av_frame_free(&frame);
        if (packet) av_packet_free(&packet);
        avcodec_free_context(&codec_ctx);
        return false;
    }

    frame->format = codec_ctx->pix_fmt;
    frame->width = image.width;
    frame->height = image.height;
    frame->color_range = AVCOL_RANGE_JPEG;

    SwsContext* sws = nullptr;
    bool ok = av_frame_get_buffer(frame, 0) >= 0;
    if (ok) {
        sws = sws_getContext(
            image.width, image.height, AV_PIX_FMT_BGR24,
            image.width, image.height, AV_PIX_FMT_YUVJ420P,
            SWS_BICUBIC, nullptr, nullptr, nullptr
        );
        ok = sws != nullptr;
    }

    if (ok) {
        const uint8_t* src_slices[] = { image.pixels.data() };
        int src_stride[] = { image.width * 3 };
        sws_scale(sws, src_slices, src_stride, 0, image.height, frame->data, frame->linesize);

        frame->pts = 0;
        frame->quality = codec_ctx->global_quality;
        ok = avcodec_send_frame(codec_ctx, frame) >= 0 &&
             avcodec_receive_packet(codec_ctx, packet) >= 0;
    }

    if (ok) {
        out.assign(packet->data, packet->data + packet->size);
        av_packet_unref(packet);
    } else {
        fprintf(stderr, "[Image] JPEG encoding failed (%dx%d)\n", image.width, image.height);
    }

    if (sws) sws_freeContext(sws);
    av_packet_free(&packet);
    av_frame_free(&frame);
    avcodec_free_context(&codec_ctx);

    return ok;
}

} // namespace utils
} // namespace lyricvid
