#pragma once

#include <cstdint>
#include <string>

namespace lyricvid {
namespace subtitles {

/**
 * Timestamp parsing for loosely formatted timed text.
 *
 * Components may be separated by ':', ',' or '.', and the hours field may be
 * missing. Recognized shapes:
 *   4 components  H:MM:SS:mmm
 *   3 components  MM:SS:mmm when the last component is > 59 or exactly three
 *                 characters wide, H:MM:SS otherwise
 *   2 components  MM:SS
 * Non-numeric components count as 0. Any other component count is rejected.
 */

// Parse to whole milliseconds. Returns false on an unrecognized shape.
bool parse_timestamp_ms(const std::string& raw, int64_t& out_ms);

// Parse to seconds. Returns false on an unrecognized shape.
bool parse_timestamp(const std::string& raw, double& out_seconds);

// Rewrite into strict HH:MM:SS,mmm. Unrecognized input is returned trimmed.
std::string canonicalize_timestamp(const std::string& raw);

// HH:MM:SS,mmm for a millisecond count
std::string format_timestamp(int64_t ms);

// "HH:MM:SS" + "mmm" -> "H:MM:SS.cc" (styled subtitle clock)
std::string to_encoder_clock(const std::string& hhmmss, const std::string& millis);

// H:MM:SS.cc for a millisecond count
std::string format_encoder_clock(int64_t ms);

} // namespace subtitles
} // namespace lyricvid
