/**
 * Advanced SubStation export
 */

#include "ass_export.hpp"
#include "timestamp.hpp"

#include <cstdio>
#include <sstream>

namespace lyricvid {
namespace subtitles {

namespace {
constexpr const char* kNewlineMarker = "\\N";
} // namespace

std::vector<DialogueEvent> to_dialogue_events(const std::vector<Cue>& cues) {
    std::vector<DialogueEvent> events;
    events.reserve(cues.size());
    for (const auto& cue : cues) {
        DialogueEvent event;
        event.start = format_encoder_clock(cue.start_ms);
        event.end = format_encoder_clock(cue.end_ms);
        event.text = cue.text;
        events.push_back(event);
    }
    return events;
}

std::vector<DialogueEvent> export_dialogue_events(const std::string& document) {
    return to_dialogue_events(parse_cues(document, kNewlineMarker));
}

std::string build_ass_document(const std::vector<DialogueEvent>& events, int play_res_x, int play_res_y) {
    std::ostringstream out;

    out << "[Script Info]\n";
    out << "Title: Lyrics\n";
    out << "ScriptType: v4.00+\n";
    out << "WrapStyle: 0\n";
    out << "ScaledBorderAndShadow: yes\n";
    out << "YCbCr Matrix: None\n";
    out << "PlayResX: " << play_res_x << "\n";
    out << "PlayResY: " << play_res_y << "\n";
    out << "\n";
    out << "[V4+ Styles]\n";
    out << "Format: Name, Fontname, Fontsize, PrimaryColour, SecondaryColour, OutlineColour, "
           "BackColour, Bold, Italic, Underline, StrikeOut, ScaleX, ScaleY, Spacing, Angle, "
           "BorderStyle, Outline, Shadow, Alignment, MarginL, MarginR, MarginV, Encoding\n";
    out << "Style: Default,Arial,72,&H00FFFFFF,&H000000FF,&H00000000,&H80000000,"
           "-1,0,0,0,100,100,0,0,1,4,2,2,20,20,60,1\n";
    out << "\n";
    out << "[Events]\n";
    out << "Format: Layer, Start, End, Style, Name, MarginL, MarginR, MarginV, Effect, Text\n";

    for (size_t i = 0; i < events.size(); i++) {
        const auto& event = events[i];
        out << "Dialogue: 0," << event.start << "," << event.end << ",Default,,0,0,0,," << event.text;
        if (i + 1 < events.size()) out << "\n";
    }

    printf("[Subtitles] ASS events generated: %zu\n", events.size());
    return out.str();
}

} // namespace subtitles
} // namespace lyricvid
