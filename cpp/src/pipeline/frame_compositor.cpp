/**
 * Frame compositor - cover-fit background plus burned-in caption.
 */

#include "frame_compositor.hpp"
#include "utils/pipeline_error.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace lyricvid {
namespace pipeline {

FrameCompositor::FrameCompositor(int width, int height, int caption_position, float jpeg_quality)
    : width_(width)
    , height_(height)
    , caption_position_(caption_position)
    , jpeg_quality_(jpeg_quality)
{
    utils::fill_image_bgr(background_, width_, height_, 0, 0, 0);
}

bool FrameCompositor::load_font(const std::string& font_path, int font_size) {
    return captions_.load_font(font_path, font_size);
}

void FrameCompositor::load_background(const std::vector<uint8_t>& bytes, const std::string& mime_type) {
    utils::ImageData image;
    if (!utils::decode_image_bgr(bytes, mime_type, image)) {
        throw PipelineError(ErrorCode::ImageDecode,
                            "cannot decode background image (" + std::to_string(bytes.size()) + " bytes, " +
                            (mime_type.empty() ? std::string("unknown type") : mime_type) + ")");
    }
    set_background(image);
}

void FrameCompositor::set_background(const utils::ImageData& image) {
    utils::fill_image_bgr(background_, width_, height_, 0, 0, 0);
    if (image.width <= 0 || image.height <= 0 || image.pixels.empty()) {
        return;
    }

    // Scale to fill, crop center
    double scale = std::max(
        static_cast<double>(width_) / image.width,
        static_cast<double>(height_) / image.height
    );
    int scaled_w = std::max(1, static_cast<int>(std::round(image.width * scale)));
    int scaled_h = std::max(1, static_cast<int>(std::round(image.height * scale)));

    utils::ImageData scaled;
    if (!utils::resize_image_bgr(image, scaled_w, scaled_h, scaled)) {
        fprintf(stderr, "[Compositor] Failed to resize background to %dx%d\n", scaled_w, scaled_h);
        throw PipelineError(ErrorCode::ImageDecode, "cannot scale background image");
    }

    utils::draw_centered_bgr(scaled, background_);
    printf("[Compositor] Background %dx%d -> %dx%d (scale %.3f)\n",
           image.width, image.height, scaled_w, scaled_h, scale);
}

bool FrameCompositor::compose(const std::string& caption, utils::ImageData& out) {
    out = background_;
    captions_.draw(out, caption, caption_position_);
    return true;
}

bool FrameCompositor::render(const std::string& caption, std::vector<uint8_t>& out) {
    utils::ImageData frame;
    if (!compose(caption, frame)) {
        return false;
    }
    if (!utils::encode_jpeg(frame, jpeg_quality_, out)) {
        fprintf(stderr, "[Compositor] Failed to encode frame\n");
        return false;
    }
    return true;
}

} // namespace pipeline
} // namespace lyricvid
