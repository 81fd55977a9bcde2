/**
 * Subtitle track parsing
 */

#include "subtitle_track.hpp"
#include "timestamp.hpp"

#include <cctype>
#include <cstdio>

namespace lyricvid {
namespace subtitles {

namespace {

constexpr const char* kArrow = "-->";

std::vector<std::string> split_lines(const std::string& document) {
    std::vector<std::string> lines;
    std::string current;
    for (char c : document) {
        if (c == '\n') {
            if (!current.empty() && current.back() == '\r') current.pop_back();
            lines.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty() && current.back() == '\r') current.pop_back();
    lines.push_back(current);
    return lines;
}

bool is_blank(const std::string& s) {
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

std::vector<std::string> split_arrow(const std::string& line) {
    std::vector<std::string> parts;
    size_t start = 0;
    size_t pos = line.find(kArrow);
    while (pos != std::string::npos) {
        parts.push_back(line.substr(start, pos - start));
        start = pos + 3;
        pos = line.find(kArrow, start);
    }
    parts.push_back(line.substr(start));
    return parts;
}

// Blocks are runs of non-empty lines
std::vector<std::vector<std::string>> split_blocks(const std::string& document) {
    std::vector<std::vector<std::string>> blocks;
    std::vector<std::string> current;
    for (const auto& line : split_lines(document)) {
        if (line.empty()) {
            if (!current.empty()) {
                blocks.push_back(current);
                current.clear();
            }
            continue;
        }
        current.push_back(line);
    }
    if (!current.empty()) {
        blocks.push_back(current);
    }
    return blocks;
}

bool parse_block(const std::vector<std::string>& lines, const std::string& line_joiner, Cue& out) {
    if (lines.size() < 2) {
        return false;
    }

    size_t timing_index = lines.size();
    for (size_t i = 0; i < lines.size(); i++) {
        if (lines[i].find(kArrow) != std::string::npos) {
            timing_index = i;
            break;
        }
    }
    if (timing_index == lines.size()) {
        return false;
    }

    std::vector<std::string> times = split_arrow(lines[timing_index]);
    if (times.size() != 2) {
        return false;
    }

    int64_t start_ms = 0;
    int64_t end_ms = 0;
    if (!parse_timestamp_ms(times[0], start_ms) || !parse_timestamp_ms(times[1], end_ms)) {
        fprintf(stderr, "[Subtitles] Failed to parse timing: %s\n", lines[timing_index].c_str());
        return false;
    }
    if (end_ms < start_ms) {
        fprintf(stderr, "[Subtitles] End before start, skipping: %s\n", lines[timing_index].c_str());
        return false;
    }

    std::string text;
    for (size_t i = timing_index + 1; i < lines.size(); i++) {
        if (is_blank(lines[i])) continue;
        if (!text.empty()) text += line_joiner;
        text += lines[i];
    }
    if (text.empty()) {
        return false;
    }

    out.text = text;
    out.start_ms = start_ms;
    out.end_ms = end_ms;
    return true;
}

} // namespace

std::vector<Cue> parse_cues(const std::string& document, const std::string& line_joiner) {
    std::vector<Cue> cues;
    size_t dropped = 0;

    for (const auto& block : split_blocks(document)) {
        Cue cue;
        if (parse_block(block, line_joiner, cue)) {
            cues.push_back(cue);
        } else {
            dropped++;
        }
    }

    printf("[Subtitles] Parsed %zu cues (%zu blocks dropped)\n", cues.size(), dropped);
    return cues;
}

const Cue* find_active_cue(const std::vector<Cue>& cues, double t) {
    for (const auto& cue : cues) {
        if (cue.contains(t)) {
            return &cue;
        }
    }
    return nullptr;
}

std::string caption_at(const std::vector<Cue>& cues, double t) {
    const Cue* cue = find_active_cue(cues, t);
    return cue ? cue->text : std::string();
}

std::string normalize_timing_lines(const std::string& document) {
    std::vector<std::string> lines = split_lines(document);
    std::string result;

    for (size_t i = 0; i < lines.size(); i++) {
        const std::string& line = lines[i];
        if (line.find(kArrow) != std::string::npos) {
            std::vector<std::string> times = split_arrow(line);
            if (times.size() == 2) {
                result += canonicalize_timestamp(times[0]) + " --> " + canonicalize_timestamp(times[1]);
            } else {
                result += line;
            }
        } else {
            result += line;
        }
        if (i + 1 < lines.size()) result += '\n';
    }

    return result;
}

} // namespace subtitles
} // namespace lyricvid
