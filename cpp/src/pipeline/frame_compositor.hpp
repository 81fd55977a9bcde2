#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "effects/caption_renderer.hpp"
#include "utils/image_loader.hpp"

namespace lyricvid {
namespace pipeline {

/**
 * Frame Compositor
 *
 * Renders one output frame: the background scaled to cover the frame
 * (centered, no letterboxing) over black, with an optional caption.
 * The cover-fitted background is prepared once and reused for every frame.
 */
class FrameCompositor {
public:
    FrameCompositor(int width, int height, int caption_position, float jpeg_quality);

    // Load the caption face; captions are skipped when this fails
    bool load_font(const std::string& font_path, int font_size);

    // Decode and cover-fit the background. Throws PipelineError(ImageDecode).
    void load_background(const std::vector<uint8_t>& bytes, const std::string& mime_type);
    void set_background(const utils::ImageData& image);

    // Compose the raster frame
    bool compose(const std::string& caption, utils::ImageData& out);

    // Compose and encode as JPEG
    bool render(const std::string& caption, std::vector<uint8_t>& out);

    int width() const { return width_; }
    int height() const { return height_; }

private:
    int width_;
    int height_;
    int caption_position_;
    float jpeg_quality_;

    utils::ImageData background_;  // already cover-fitted to width_ x height_
    effects::CaptionRenderer captions_;
};

} // namespace pipeline
} // namespace lyricvid
