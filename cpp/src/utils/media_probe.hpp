#pragma once

#include <cstdint>
#include <vector>

namespace lyricvid {
namespace utils {

// Duration in seconds of an in-memory media file.
// Returns false when the container cannot be opened or carries no usable duration.
bool probe_duration(const std::vector<uint8_t>& bytes, double& out_seconds);

} // namespace utils
} // namespace lyricvid
