#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace lyricvid {
namespace subtitles {

/**
 * One timed caption. Active over [start, end).
 */
struct Cue {
    std::string text;
    int64_t start_ms = 0;
    int64_t end_ms = 0;

    double start_sec() const { return start_ms / 1000.0; }
    double end_sec() const { return end_ms / 1000.0; }
    bool contains(double t) const { return t >= start_sec() && t < end_sec(); }
};

/**
 * Split a timed-text document into cues, in document order.
 *
 * Blocks are separated by empty lines. Within a block, the first line holding
 * "-->" is the timing line; lines above it are ignored and non-blank lines
 * below it are joined with line_joiner. Blocks without a timing line, with a
 * timing line that does not split into exactly two timestamps, with an
 * unrecognized timestamp, with end before start, or with no text are dropped.
 */
std::vector<Cue> parse_cues(const std::string& document, const std::string& line_joiner = " ");

// First cue in list order that contains t, or nullptr
const Cue* find_active_cue(const std::vector<Cue>& cues, double t);

// Caption text visible at t (empty when no cue is active)
std::string caption_at(const std::vector<Cue>& cues, double t);

// Rewrite every timing line as "HH:MM:SS,mmm --> HH:MM:SS,mmm"
std::string normalize_timing_lines(const std::string& document);

} // namespace subtitles
} // namespace lyricvid
