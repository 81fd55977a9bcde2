#include "media_probe.hpp"
#include "memory_input.hpp"

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
}

#include <cmath>
#include <cstdio>

namespace lyricvid {
namespace utils {

bool probe_duration(const std::vector<uint8_t>& bytes, double& out_seconds) {
    MemoryInput input;
    if (!input.open(bytes)) {
        fprintf(stderr, "[Probe] Unrecognized media (%zu bytes)\n", bytes.size());
        return false;
    }

    AVFormatContext* format_ctx = input.format_context();
    double duration = 0.0;
    if (format_ctx->duration != AV_NOPTS_VALUE && format_ctx->duration > 0) {
        duration = static_cast<double>(format_ctx->duration) / AV_TIME_BASE;
    } else {
        // Fall back to the longest stream
        for (unsigned int i = 0; i < format_ctx->nb_streams; i++) {
            const AVStream* stream = format_ctx->streams[i];
            if (stream->duration == AV_NOPTS_VALUE || stream->duration <= 0) continue;
            double stream_duration = stream->duration * av_q2d(stream->time_base);
            if (stream_duration > duration) duration = stream_duration;
        }
    }

    if (!std::isfinite(duration) || duration <= 0.0) {
        fprintf(stderr, "[Probe] No duration metadata\n");
        return false;
    }

    out_seconds = duration;
    return true;
}

} // namespace utils
} // namespace lyricvid
