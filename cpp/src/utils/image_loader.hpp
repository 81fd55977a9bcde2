#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace lyricvid {
namespace utils {

struct ImageData {
    int width = 0;
    int height = 0;
    std::vector<unsigned char> pixels;  // BGR, tightly packed
};

// Decode a compressed image (JPEG, PNG, WebP, ...) to BGR.
// mime_type selects the demuxer when recognized; the format is probed otherwise.
bool decode_image_bgr(const std::vector<uint8_t>& bytes, const std::string& mime_type, ImageData& out);

bool resize_image_bgr(const ImageData& src, int dst_width, int dst_height, ImageData& out);

// Solid color canvas
void fill_image_bgr(ImageData& image, int width, int height,
                    unsigned char b, unsigned char g, unsigned char r);

// Copy src onto dst with their centers aligned, clipping whatever falls outside dst
void draw_centered_bgr(const ImageData& src, ImageData& dst);

// Encode BGR pixels as a baseline JPEG. quality is in [0, 1].
bool encode_jpeg(const ImageData& image, float quality, std::vector<uint8_t>& out);

} // namespace utils
} // namespace lyricvid
