#pragma once

#include <string>
#include <vector>

#include "config/render_config.hpp"
#include "subtitle_track.hpp"

namespace lyricvid {
namespace subtitles {

// One "Dialogue:" line of an Advanced SubStation script
struct DialogueEvent {
    std::string start;  // H:MM:SS.cc
    std::string end;    // H:MM:SS.cc
    std::string text;   // lines joined with \N
};

// Styled-event view of an already parsed cue list
std::vector<DialogueEvent> to_dialogue_events(const std::vector<Cue>& cues);

// Parse a timed-text document straight into dialogue events
std::vector<DialogueEvent> export_dialogue_events(const std::string& document);

// Complete .ass script with the single caption style
std::string build_ass_document(
    const std::vector<DialogueEvent>& events,
    int play_res_x = ASS_PLAY_RES_X,
    int play_res_y = ASS_PLAY_RES_Y
);

} // namespace subtitles
} // namespace lyricvid
