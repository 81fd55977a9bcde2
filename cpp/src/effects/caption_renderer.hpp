#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "utils/image_loader.hpp"

// Forward declarations for FreeType types
struct FT_LibraryRec_;
struct FT_FaceRec_;
struct FT_StrokerRec_;

namespace lyricvid {
namespace effects {

// Width in pixels of a UTF-8 string
using MeasureFunction = std::function<int(const std::string&)>;

// Split UTF-8 text into its characters (one code point each)
std::vector<std::string> utf8_characters(const std::string& text);

/**
 * Character-level greedy wrap.
 *
 * Appends characters to the current line and starts a new one when the
 * extended line would exceed max_width. A single character wider than
 * max_width still gets its own line.
 */
std::vector<std::string> wrap_characters(
    const std::string& text,
    int max_width,
    const MeasureFunction& measure
);

// Y of the first line's center so the wrapped block is centered on height * position / 100
double caption_start_y(int height, int position, size_t line_count, double line_height);

/**
 * Caption text renderer
 *
 * Draws centered lines in white over a black round-joined outline using a
 * bold face. Without a usable font the caption is skipped.
 */
class CaptionRenderer {
public:
    CaptionRenderer();
    ~CaptionRenderer();

    CaptionRenderer(const CaptionRenderer&) = delete;
    CaptionRenderer& operator=(const CaptionRenderer&) = delete;

    // Load preferred_path, or the first bold system font found when empty
    bool load_font(const std::string& preferred_path, int pixel_size);
    bool is_loaded() const { return face_ != nullptr; }

    int pixel_size() const { return pixel_size_; }
    double line_height() const;

    int measure(const std::string& text);

    // Draw caption onto canvas, anchored at position percent of its height
    void draw(utils::ImageData& canvas, const std::string& caption, int position);

private:
    int advance(uint32_t codepoint);
    void draw_line(utils::ImageData& canvas, const std::string& line, double center_y, bool outline);
    void close();

    FT_LibraryRec_* library_;
    FT_FaceRec_* face_;
    FT_StrokerRec_* stroker_;
    bool synthetic_bold_;
    bool warned_missing_font_;
    int pixel_size_;
    std::unordered_map<uint32_t, int> advance_cache_;
};

} // namespace effects
} // namespace lyricvid
