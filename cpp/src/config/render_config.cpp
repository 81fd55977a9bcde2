/**
 * Render Configuration Implementation
 */

#include "render_config.hpp"
#include <fstream>
#include <sstream>
#include <cstdio>
#include <stdexcept>

namespace lyricvid {
namespace config {

RenderConfig::RenderConfig()
    : width(VIDEO_WIDTH)
    , height(VIDEO_HEIGHT)
    , fps(SAMPLE_RATE)
    , caption_position(CAPTION_POSITION)
    , font_size(FONT_SIZE)
    , font_path()
    , jpeg_quality(JPEG_QUALITY)
    , preset(VIDEO_PRESET)
    , audio_bitrate(AUDIO_BITRATE)
    , use_hw_accel(false)
    , default_duration(DEFAULT_DURATION)
{
}

bool RenderConfig::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        fprintf(stderr, "[Config] Failed to open: %s\n", path.c_str());
        return false;
    }

    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        line_number++;
        if (!line.empty() && line.back() == '\r') line.pop_back();

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') continue;

        // Find key=value
        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = line.substr(0, eq_pos);
        std::string value = line.substr(eq_pos + 1);

        // Trim whitespace
        while (!key.empty() && (key.back() == ' ' || key.back() == '\t')) key.pop_back();
        while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) value.erase(0, 1);
        while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) value.pop_back();

        try {
            if (key == "width") width = std::stoi(value);
            else if (key == "height") height = std::stoi(value);
            else if (key == "fps") fps = std::stoi(value);
            else if (key == "caption_position") caption_position = std::stoi(value);
            else if (key == "font_size") font_size = std::stoi(value);
            else if (key == "font_path") font_path = value;
            else if (key == "jpeg_quality") jpeg_quality = std::stof(value);
            else if (key == "preset") preset = value;
            else if (key == "audio_bitrate") audio_bitrate = value;
            else if (key == "use_hw_accel") use_hw_accel = (value == "true" || value == "1");
            else if (key == "default_duration") default_duration = std::stod(value);
            else fprintf(stderr, "[Config] Ignoring unknown key '%s' (line %d)\n",
                         key.c_str(), line_number);
        } catch (const std::logic_error&) {
            fprintf(stderr, "[Config] Invalid value for '%s' (line %d): %s\n",
                    key.c_str(), line_number, value.c_str());
            return false;
        }
    }

    if (width <= 0 || height <= 0 || fps <= 0) {
        fprintf(stderr, "[Config] Invalid output geometry: %dx%d @ %d fps\n", width, height, fps);
        return false;
    }

    printf("[Config] Loaded: %dx%d @ %d fps, caption at %d%%, preset=%s\n",
           width, height, fps, caption_position, preset.c_str());

    return true;
}

bool RenderConfig::save_to_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        fprintf(stderr, "[Config] Failed to write: %s\n", path.c_str());
        return false;
    }

    file << "# Lyric Video Renderer Configuration\n\n";
    file << "# Video settings\n";
    file << "width=" << width << "\n";
    file << "height=" << height << "\n";
    file << "fps=" << fps << "\n";
    file << "default_duration=" << default_duration << "\n";
    file << "\n# Caption settings\n";
    file << "caption_position=" << caption_position << "\n";
    file << "font_size=" << font_size << "\n";
    file << "font_path=" << font_path << "\n";
    file << "\n# Encoding settings\n";
    file << "jpeg_quality=" << jpeg_quality << "\n";
    file << "preset=" << preset << "\n";
    file << "audio_bitrate=" << audio_bitrate << "\n";
    file << "use_hw_accel=" << (use_hw_accel ? "true" : "false") << "\n";

    return file.good();
}

} // namespace config
} // namespace lyricvid
