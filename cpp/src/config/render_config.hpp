#pragma once

#include <string>
#include <cstdint>

namespace lyricvid {

// Video specifications
constexpr int VIDEO_WIDTH = 1280;
constexpr int VIDEO_HEIGHT = 720;
constexpr int SAMPLE_RATE = 4;               // frames per second of the image sequence
constexpr double DEFAULT_DURATION = 180.0;   // used when the audio cannot be probed
constexpr int PROGRESS_INTERVAL = 20;        // frames between progress reports

// Caption style profile
constexpr int FONT_SIZE = 48;
constexpr float LINE_HEIGHT_FACTOR = 1.3f;
constexpr int CAPTION_SIDE_MARGIN = 60;      // max line width is width - margin
constexpr float OUTLINE_WIDTH = 6.0f;
constexpr int CAPTION_POSITION = 50;         // percent from top

// Encoding settings
constexpr float JPEG_QUALITY = 0.9f;
constexpr const char* VIDEO_PRESET = "ultrafast";
constexpr const char* NVENC_PRESET = "p1";
constexpr const char* AUDIO_BITRATE = "128k";
constexpr const char* FRAME_PATTERN = "frame%05d.jpg";
constexpr const char* OUTPUT_NAME = "output.mp4";

// Styled subtitle export
constexpr int ASS_PLAY_RES_X = 1920;
constexpr int ASS_PLAY_RES_Y = 1080;

namespace config {

// Render configuration with file I/O
class RenderConfig {
public:
    RenderConfig();

    bool load_from_file(const std::string& path);
    bool save_to_file(const std::string& path) const;

    int width;
    int height;
    int fps;
    int caption_position;
    int font_size;
    std::string font_path;
    float jpeg_quality;
    std::string preset;
    std::string audio_bitrate;
    bool use_hw_accel;
    double default_duration;
};

} // namespace config

} // namespace lyricvid
