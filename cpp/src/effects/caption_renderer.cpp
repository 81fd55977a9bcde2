/**
 * Caption rendering with FreeType
 */

#include "caption_renderer.hpp"
#include "config/render_config.hpp"

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_GLYPH_H
#include FT_OUTLINE_H
#include FT_STROKER_H

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <system_error>

namespace lyricvid {
namespace effects {

namespace {

constexpr uint32_t kReplacementChar = 0xFFFD;

struct Color {
    unsigned char b;
    unsigned char g;
    unsigned char r;
};

constexpr Color kOutlineColor{0, 0, 0};
constexpr Color kFillColor{255, 255, 255};

// Bold faces first; regular faces get synthetic emboldening
const char* const kFontCandidates[] = {
    "/usr/share/fonts/opentype/noto/NotoSansCJK-Bold.ttc",
    "/usr/share/fonts/noto-cjk/NotoSansCJK-Bold.ttc",
    "/usr/share/fonts/google-noto-cjk/NotoSansCJK-Bold.ttc",
    "/usr/share/fonts/truetype/dejavu/DejaVuSans-Bold.ttf",
    "/usr/share/fonts/dejavu/DejaVuSans-Bold.ttf",
    "/usr/share/fonts/TTF/DejaVuSans-Bold.ttf",
    "/usr/share/fonts/truetype/liberation/LiberationSans-Bold.ttf",
    "/System/Library/Fonts/PingFang.ttc",
    "C:/Windows/Fonts/msyhbd.ttc",
    "C:/Windows/Fonts/arialbd.ttf",
    "fonts/DejaVuSans-Bold.ttf",
    "../fonts/DejaVuSans-Bold.ttf",
    "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
    "/usr/share/fonts/dejavu/DejaVuSans.ttf",
};

uint32_t decode_codepoint(const std::string& ch) {
    if (ch.empty()) return kReplacementChar;

    const unsigned char lead = static_cast<unsigned char>(ch[0]);
    if (lead < 0x80) return lead;

    int extra = 0;
    uint32_t cp = 0;
    if ((lead & 0xE0) == 0xC0) { extra = 1; cp = lead & 0x1F; }
    else if ((lead & 0xF0) == 0xE0) { extra = 2; cp = lead & 0x0F; }
    else if ((lead & 0xF8) == 0xF0) { extra = 3; cp = lead & 0x07; }
    else return kReplacementChar;

    if (static_cast<int>(ch.size()) != extra + 1) return kReplacementChar;
    for (int i = 1; i <= extra; i++) {
        cp = (cp << 6) | (static_cast<unsigned char>(ch[i]) & 0x3F);
    }
    return cp;
}

void blend_bitmap(utils::ImageData& canvas, const FT_Bitmap& bitmap, int x0, int y0, Color color) {
    for (unsigned int row = 0; row < bitmap.rows; row++) {
        int y = y0 + static_cast<int>(row);
        if (y < 0 || y >= canvas.height) continue;

        for (unsigned int col = 0; col < bitmap.width; col++) {
            int x = x0 + static_cast<int>(col);
            if (x < 0 || x >= canvas.width) continue;

            unsigned int alpha = bitmap.buffer[static_cast<long>(row) * bitmap.pitch + col];
            if (alpha == 0) continue;

            unsigned char* px = canvas.pixels.data() + (static_cast<size_t>(y) * canvas.width + x) * 3;
            px[0] = static_cast<unsigned char>((px[0] * (255 - alpha) + color.b * alpha) / 255);
            px[1] = static_cast<unsigned char>((px[1] * (255 - alpha) + color.g * alpha) / 255);
            px[2] = static_cast<unsigned char>((px[2] * (255 - alpha) + color.r * alpha) / 255);
        }
    }
}

} // namespace

std::vector<std::string> utf8_characters(const std::string& text) {
    std::vector<std::string> chars;
    size_t i = 0;
    while (i < text.size()) {
        const unsigned char lead = static_cast<unsigned char>(text[i]);
        size_t len = 1;
        if ((lead & 0xE0) == 0xC0) len = 2;
        else if ((lead & 0xF0) == 0xE0) len = 3;
        else if ((lead & 0xF8) == 0xF0) len = 4;

        // Truncated or malformed sequences are taken one byte at a time
        size_t valid = 1;
        while (valid < len && i + valid < text.size() &&
               (static_cast<unsigned char>(text[i + valid]) & 0xC0) == 0x80) {
            valid++;
        }
        if (valid != len) len = 1;

        chars.push_back(text.substr(i, len));
        i += len;
    }
    return chars;
}

std::vector<std::string> wrap_characters(const std::string& text, int max_width, const MeasureFunction& measure) {
    std::vector<std::string> lines;
    std::string current;

    for (const auto& ch : utf8_characters(text)) {
        std::string candidate = current + ch;
        if (measure(candidate) > max_width && !current.empty()) {
            lines.push_back(current);
            current = ch;
        } else {
            current = candidate;
        }
    }

    if (!current.empty()) {
        lines.push_back(current);
    }
    return lines;
}

double caption_start_y(int height, int position, size_t line_count, double line_height) {
    double anchor_y = static_cast<double>(height) * position / 100.0;
    double total_height = static_cast<double>(line_count) * line_height;
    return anchor_y - total_height / 2.0 + line_height / 2.0;
}

CaptionRenderer::CaptionRenderer()
    : library_(nullptr)
    , face_(nullptr)
    , stroker_(nullptr)
    , synthetic_bold_(false)
    , warned_missing_font_(false)
    , pixel_size_(FONT_SIZE)
{
}

CaptionRenderer::~CaptionRenderer() {
    close();
}

void CaptionRenderer::close() {
    if (stroker_) {
        FT_Stroker_Done(stroker_);
        stroker_ = nullptr;
    }
    if (face_) {
        FT_Done_Face(face_);
        face_ = nullptr;
    }
    if (library_) {
        FT_Done_FreeType(library_);
        library_ = nullptr;
    }
    advance_cache_.clear();
}

bool CaptionRenderer::load_font(const std::string& preferred_path, int pixel_size) {
    close();
    pixel_size_ = std::max(1, pixel_size);

    if (FT_Init_FreeType(&library_) != 0) {
        fprintf(stderr, "[Fonts] Failed to initialize FreeType\n");
        library_ = nullptr;
        return false;
    }

    std::vector<std::string> candidates;
    if (!preferred_path.empty()) {
        candidates.push_back(preferred_path);
    }
    for (const char* path : kFontCandidates) {
        candidates.push_back(path);
    }

    for (const auto& path : candidates) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            if (path == preferred_path) {
                fprintf(stderr, "[Fonts] Font not found: %s\n", path.c_str());
            }
            continue;
        }
        if (FT_New_Face(library_, path.c_str(), 0, &face_) != 0) {
            fprintf(stderr, "[Fonts] Failed to open font: %s\n", path.c_str());
            face_ = nullptr;
            continue;
        }
        printf("[Fonts] Using font: %s\n", path.c_str());
        break;
    }

    if (!face_) {
        fprintf(stderr, "[Fonts] No suitable font file found\n");
        close();
        return false;
    }

    if (FT_Set_Pixel_Sizes(face_, 0, static_cast<FT_UInt>(pixel_size_)) != 0) {
        fprintf(stderr, "[Fonts] Failed to set pixel size %d\n", pixel_size_);
        close();
        return false;
    }

    synthetic_bold_ = (face_->style_flags & FT_STYLE_FLAG_BOLD) == 0;

    if (FT_Stroker_New(library_, &stroker_) != 0) {
        fprintf(stderr, "[Fonts] Failed to create stroker\n");
        close();
        return false;
    }
    FT_Stroker_Set(stroker_,
                   static_cast<FT_Fixed>(OUTLINE_WIDTH / 2.0f * 64.0f),
                   FT_STROKER_LINECAP_ROUND,
                   FT_STROKER_LINEJOIN_ROUND,
                   0);

    return true;
}

double CaptionRenderer::line_height() const {
    return pixel_size_ * LINE_HEIGHT_FACTOR;
}

int CaptionRenderer::advance(uint32_t codepoint) {
    auto it = advance_cache_.find(codepoint);
    if (it != advance_cache_.end()) {
        return it->second;
    }

    int width = 0;
    FT_UInt index = FT_Get_Char_Index(face_, codepoint);
    if (FT_Load_Glyph(face_, index, FT_LOAD_NO_BITMAP) == 0) {
        FT_Pos adv = face_->glyph->advance.x;
        if (synthetic_bold_) {
            adv += FT_MulFix(face_->units_per_EM, face_->size->metrics.y_scale) / 24;
        }
        width = static_cast<int>((adv + 32) >> 6);
    }

    advance_cache_[codepoint] = width;
    return width;
}

int CaptionRenderer::measure(const std::string& text) {
    if (!face_) {
        return 0;
    }
    int width = 0;
    for (const auto& ch : utf8_characters(text)) {
        width += advance(decode_codepoint(ch));
    }
    return width;
}

void CaptionRenderer::draw_line(utils::ImageData& canvas, const std::string& line, double center_y, bool outline) {
    const FT_Size_Metrics& metrics = face_->size->metrics;
    const double ascender = metrics.ascender / 64.0;
    const double descender = metrics.descender / 64.0;
    const int baseline = static_cast<int>(std::lround(center_y + (ascender + descender) / 2.0));
    const FT_Pos embolden = FT_MulFix(face_->units_per_EM, metrics.y_scale) / 24;

    double pen_x = canvas.width / 2.0 - measure(line) / 2.0;

    for (const auto& ch : utf8_characters(line)) {
        uint32_t codepoint = decode_codepoint(ch);
        int step = advance(codepoint);

        FT_UInt index = FT_Get_Char_Index(face_, codepoint);
        if (FT_Load_Glyph(face_, index, FT_LOAD_NO_BITMAP) != 0) {
            pen_x += step;
            continue;
        }
        if (synthetic_bold_ && face_->glyph->format == FT_GLYPH_FORMAT_OUTLINE) {
            FT_Outline_Embolden(&face_->glyph->outline, embolden);
        }

        FT_Glyph glyph = nullptr;
        if (FT_Get_Glyph(face_->glyph, &glyph) != 0) {
            pen_x += step;
            continue;
        }

        bool ok = true;
        if (outline) {
            ok = FT_Glyph_Stroke(&glyph, stroker_, 1) == 0;
        }
        if (ok) {
            ok = FT_Glyph_To_Bitmap(&glyph, FT_RENDER_MODE_NORMAL, nullptr, 1) == 0;
        }
        if (ok) {
            auto* bitmap_glyph = reinterpret_cast<FT_BitmapGlyph>(glyph);
            blend_bitmap(canvas,
                         bitmap_glyph->bitmap,
                         static_cast<int>(std::lround(pen_x)) + bitmap_glyph->left,
                         baseline - bitmap_glyph->top,
                         outline ? kOutlineColor : kFillColor);
        }

        FT_Done_Glyph(glyph);
        pen_x += step;
    }
}

void CaptionRenderer::draw(utils::ImageData& canvas, const std::string& caption, int position) {
    if (caption.empty()) {
        return;
    }
    if (!face_) {
        if (!warned_missing_font_) {
            fprintf(stderr, "[Fonts] No font loaded, captions will not be drawn\n");
            warned_missing_font_ = true;
        }
        return;
    }

    const int max_width = canvas.width - CAPTION_SIDE_MARGIN;
    std::vector<std::string> lines = wrap_characters(
        caption, max_width, [this](const std::string& text) { return measure(text); });

    const double height = line_height();
    const double start_y = caption_start_y(canvas.height, position, lines.size(), height);

    for (size_t i = 0; i < lines.size(); i++) {
        const double line_y = start_y + static_cast<double>(i) * height;
        draw_line(canvas, lines[i], line_y, true);
        draw_line(canvas, lines[i], line_y, false);
    }
}

} // namespace effects
} // namespace lyricvid
