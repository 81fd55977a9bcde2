#include <gtest/gtest.h>

#include "pipeline/frame_compositor.hpp"
#include "utils/pipeline_error.hpp"
#include "test_utils.hpp"

using namespace lyricvid;
using namespace lyricvid::pipeline;

namespace {

constexpr int kWidth = 320;
constexpr int kHeight = 180;

const unsigned char* pixel_at(const utils::ImageData& image, int x, int y)
{
    return image.pixels.data() + (static_cast<size_t>(y) * image.width + x) * 3;
}

void expect_color(const utils::ImageData& image, int x, int y, int b, int g, int r)
{
    const unsigned char* p = pixel_at(image, x, y);
    EXPECT_NEAR(p[0], b, 12) << "x=" << x << " y=" << y;
    EXPECT_NEAR(p[1], g, 12) << "x=" << x << " y=" << y;
    EXPECT_NEAR(p[2], r, 12) << "x=" << x << " y=" << y;
}

// Counts pixels in rows [y0, y1) that are nearly white / nearly black
void count_extremes(const utils::ImageData& image, int y0, int y1, int& white, int& black)
{
    white = 0;
    black = 0;
    for (int y = y0; y < y1; y++) {
        for (int x = 0; x < image.width; x++) {
            const unsigned char* p = pixel_at(image, x, y);
            if (p[0] > 235 && p[1] > 235 && p[2] > 235) white++;
            if (p[0] < 20 && p[1] < 20 && p[2] < 20) black++;
        }
    }
}

TEST(FrameCompositor, BlackUntilBackgroundLoaded)
{
    FrameCompositor compositor(kWidth, kHeight, 50, 0.9f);
    utils::ImageData frame;
    ASSERT_TRUE(compositor.compose("", frame));
    EXPECT_EQ(frame.width, kWidth);
    EXPECT_EQ(frame.height, kHeight);
    expect_color(frame, kWidth / 2, kHeight / 2, 0, 0, 0);
}

TEST(FrameCompositor, UndecodableBackgroundThrows)
{
    FrameCompositor compositor(kWidth, kHeight, 50, 0.9f);
    std::vector<uint8_t> garbage(2048, 0x5A);

    try {
        compositor.load_background(garbage, "image/jpeg");
        FAIL() << "expected PipelineError";
    } catch (const PipelineError& ex) {
        EXPECT_EQ(ex.code(), ErrorCode::ImageDecode);
    }
}

TEST(FrameCompositor, WideImageCoversFrame)
{
    FrameCompositor compositor(kWidth, kHeight, 50, 0.9f);
    std::vector<uint8_t> jpeg = test::solid_jpeg(100, 50, 0, 0, 220);
    ASSERT_FALSE(jpeg.empty());
    compositor.load_background(jpeg, "image/jpeg");

    utils::ImageData frame;
    ASSERT_TRUE(compositor.compose("", frame));
    expect_color(frame, 0, 0, 0, 0, 220);
    expect_color(frame, kWidth - 1, kHeight - 1, 0, 0, 220);
    expect_color(frame, kWidth / 2, kHeight / 2, 0, 0, 220);
}

TEST(FrameCompositor, TallImageCoversFrame)
{
    FrameCompositor compositor(kWidth, kHeight, 50, 0.9f);
    compositor.load_background(test::solid_jpeg(40, 120, 210, 40, 40), "");

    utils::ImageData frame;
    ASSERT_TRUE(compositor.compose("", frame));
    expect_color(frame, 0, 0, 210, 40, 40);
    expect_color(frame, kWidth - 1, 0, 210, 40, 40);
    expect_color(frame, 0, kHeight - 1, 210, 40, 40);
}

TEST(FrameCompositor, CaptionWithoutFontIsSkipped)
{
    utils::ImageData background;
    utils::fill_image_bgr(background, kWidth, kHeight, 128, 128, 128);

    // No load_font call: the caption is dropped, the frame is still produced
    FrameCompositor compositor(kWidth, kHeight, 50, 0.9f);
    compositor.set_background(background);

    utils::ImageData frame;
    ASSERT_TRUE(compositor.compose("no font here", frame));
    int white = 0;
    int black = 0;
    count_extremes(frame, 0, kHeight, white, black);
    EXPECT_EQ(white, 0);
    EXPECT_EQ(black, 0);
}

// Gray frame with "HELLO" drawn by the configured test font
utils::ImageData compose_caption(int position)
{
    FrameCompositor compositor(kWidth, kHeight, position, 0.9f);
    EXPECT_TRUE(compositor.load_font(LYRICVID_TEST_FONT, 24)) << "cannot load " << LYRICVID_TEST_FONT;

    utils::ImageData background;
    utils::fill_image_bgr(background, kWidth, kHeight, 128, 128, 128);
    compositor.set_background(background);

    utils::ImageData frame;
    EXPECT_TRUE(compositor.compose("HELLO", frame));
    return frame;
}

TEST(FrameCompositor, DrawsOutlinedCaptionAtPosition)
{
    utils::ImageData frame = compose_caption(25);
    ASSERT_EQ(frame.width, kWidth);

    int white = 0;
    int black = 0;
    count_extremes(frame, 0, kHeight / 2, white, black);
    EXPECT_GT(white, 0);
    EXPECT_GT(black, 0);

    // Anchored at 25%, the lower half is untouched
    count_extremes(frame, kHeight / 2 + 10, kHeight, white, black);
    EXPECT_EQ(white, 0);
    EXPECT_EQ(black, 0);
}

TEST(FrameCompositor, LowAnchorLeavesUpperHalfUntouched)
{
    utils::ImageData frame = compose_caption(75);
    ASSERT_EQ(frame.width, kWidth);

    int white = 0;
    int black = 0;
    count_extremes(frame, kHeight / 2, kHeight, white, black);
    EXPECT_GT(white, 0);
    EXPECT_GT(black, 0);

    count_extremes(frame, 0, kHeight / 2 - 10, white, black);
    EXPECT_EQ(white, 0);
    EXPECT_EQ(black, 0);
}

TEST(FrameCompositor, RenderProducesJpeg)
{
    FrameCompositor compositor(kWidth, kHeight, 50, 0.9f);
    compositor.load_background(test::solid_jpeg(64, 64, 30, 160, 30), "image/jpeg");

    std::vector<uint8_t> jpeg;
    ASSERT_TRUE(compositor.render("", jpeg));
    ASSERT_GT(jpeg.size(), 4u);
    EXPECT_EQ(jpeg[0], 0xFF);
    EXPECT_EQ(jpeg[1], 0xD8);

    utils::ImageData decoded;
    ASSERT_TRUE(utils::decode_image_bgr(jpeg, "image/jpeg", decoded));
    EXPECT_EQ(decoded.width, kWidth);
    EXPECT_EQ(decoded.height, kHeight);
}

} // namespace
