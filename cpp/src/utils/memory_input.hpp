#pragma once

#include <cstdint>
#include <vector>

// Forward declarations for FFmpeg types
struct AVFormatContext;
struct AVIOContext;

namespace lyricvid {
namespace utils {

/**
 * Demuxer over an in-memory byte buffer.
 *
 * The buffer must outlive the MemoryInput.
 */
class MemoryInput {
public:
    MemoryInput();
    ~MemoryInput();

    MemoryInput(const MemoryInput&) = delete;
    MemoryInput& operator=(const MemoryInput&) = delete;

    // Open with an explicit demuxer name, or probe when format_name is null
    bool open(const std::vector<uint8_t>& bytes, const char* format_name = nullptr);
    void close();

    AVFormatContext* format_context() const { return format_ctx_; }

private:
    static int read_packet(void* opaque, uint8_t* buf, int buf_size);
    static int64_t seek(void* opaque, int64_t offset, int whence);

    const std::vector<uint8_t>* data_;
    size_t position_;
    AVIOContext* avio_ctx_;
    AVFormatContext* format_ctx_;
};

} // namespace utils
} // namespace lyricvid
