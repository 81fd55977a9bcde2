/**
 * In-memory demuxer input
 */

#include "memory_input.hpp"

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/mem.h>
}

#include <algorithm>
#include <cstdio>
#include <cstring>

namespace lyricvid {
namespace utils {

namespace {
constexpr int kAvioBufferSize = 32 * 1024;
} // namespace

MemoryInput::MemoryInput()
    : data_(nullptr)
    , position_(0)
    , avio_ctx_(nullptr)
    , format_ctx_(nullptr)
{
}

MemoryInput::~MemoryInput() {
    close();
}

bool MemoryInput::open(const std::vector<uint8_t>& bytes, const char* format_name) {
    close();
    if (bytes.empty()) {
        return false;
    }

    data_ = &bytes;
    position_ = 0;

    unsigned char* buffer = static_cast<unsigned char*>(av_malloc(kAvioBufferSize));
    if (!buffer) {
        fprintf(stderr, "[FFmpeg] Failed to allocate AVIO buffer\n");
        return false;
    }

    avio_ctx_ = avio_alloc_context(buffer, kAvioBufferSize, 0, this,
                                   &MemoryInput::read_packet, nullptr, &MemoryInput::seek);
    if (!avio_ctx_) {
        fprintf(stderr, "[FFmpeg] Failed to allocate AVIO context\n");
        av_free(buffer);
        return false;
    }

    format_ctx_ = avformat_alloc_context();
    if (!format_ctx_) {
        fprintf(stderr, "[FFmpeg] Failed to allocate format context\n");
        close();
        return false;
    }
    format_ctx_->pb = avio_ctx_;
    format_ctx_->flags |= AVFMT_FLAG_CUSTOM_IO;

    const AVInputFormat* input_format = nullptr;
    if (format_name) {
        input_format = av_find_input_format(format_name);
    }

    // avformat_open_input frees the context on failure
    if (avformat_open_input(&format_ctx_, nullptr, input_format, nullptr) < 0) {
        format_ctx_ = nullptr;
        close();
        return false;
    }

    if (avformat_find_stream_info(format_ctx_, nullptr) < 0) {
        close();
        return false;
    }

    return true;
}

void MemoryInput::close() {
    if (format_ctx_) {
        avformat_close_input(&format_ctx_);
        format_ctx_ = nullptr;
    }
    if (avio_ctx_) {
        av_freep(&avio_ctx_->buffer);
        avio_context_free(&avio_ctx_);
        avio_ctx_ = nullptr;
    }
    data_ = nullptr;
    position_ = 0;
}

int MemoryInput::read_packet(void* opaque, uint8_t* buf, int buf_size) {
    auto* self = static_cast<MemoryInput*>(opaque);
    if (!self->data_ || self->position_ >= self->data_->size()) {
        return AVERROR_EOF;
    }

    size_t remaining = self->data_->size() - self->position_;
    size_t count = std::min(remaining, static_cast<size_t>(buf_size));
    std::memcpy(buf, self->data_->data() + self->position_, count);
    self->position_ += count;
    return static_cast<int>(count);
}

int64_t MemoryInput::seek(void* opaque, int64_t offset, int whence) {
    auto* self = static_cast<MemoryInput*>(opaque);
    if (!self->data_) {
        return -1;
    }

    const int64_t size = static_cast<int64_t>(self->data_->size());
    if (whence == AVSEEK_SIZE) {
        return size;
    }

    int64_t target = 0;
    switch (whence & ~AVSEEK_FORCE) {
        case SEEK_SET: target = offset; break;
        case SEEK_CUR: target = static_cast<int64_t>(self->position_) + offset; break;
        case SEEK_END: target = size + offset; break;
        default: return -1;
    }

    if (target < 0 || target > size) {
        return -1;
    }
    self->position_ = static_cast<size_t>(target);
    return target;
}

} // namespace utils
} // namespace lyricvid
