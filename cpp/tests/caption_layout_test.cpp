#include <gtest/gtest.h>

#include "effects/caption_renderer.hpp"
#include "config/render_config.hpp"

using namespace lyricvid::effects;

namespace {

// Every character is 10 px wide
int fixed_width(const std::string& text)
{
    return static_cast<int>(utf8_characters(text).size()) * 10;
}

TEST(CaptionLayout, SplitsUtf8Characters)
{
    auto chars = utf8_characters("a\xC3\xA9\xE4\xB8\xAD\xF0\x9F\x8E\xB5");
    ASSERT_EQ(chars.size(), 4u);
    EXPECT_EQ(chars[0], "a");
    EXPECT_EQ(chars[1], "\xC3\xA9");
    EXPECT_EQ(chars[2], "\xE4\xB8\xAD");
    EXPECT_EQ(chars[3], "\xF0\x9F\x8E\xB5");
}

TEST(CaptionLayout, WrapsGreedilyPerCharacter)
{
    auto lines = wrap_characters("abcdefghij", 35, fixed_width);
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "abc");
    EXPECT_EQ(lines[1], "def");
    EXPECT_EQ(lines[2], "ghi");
    EXPECT_EQ(lines[3], "j");
}

TEST(CaptionLayout, BreaksInsideWords)
{
    // No word boundaries: spaces are ordinary characters
    auto lines = wrap_characters("ab cd", 30, fixed_width);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "ab ");
    EXPECT_EQ(lines[1], "cd");
}

TEST(CaptionLayout, FitsOnOneLine)
{
    auto lines = wrap_characters("hello", 50, fixed_width);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "hello");
}

TEST(CaptionLayout, OversizedCharacterGetsOwnLine)
{
    auto lines = wrap_characters("abc", 5, fixed_width);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "a");
}

TEST(CaptionLayout, EmptyTextHasNoLines)
{
    EXPECT_TRUE(wrap_characters("", 100, fixed_width).empty());
}

TEST(CaptionLayout, BlockIsCenteredOnAnchor)
{
    const double line_height = lyricvid::FONT_SIZE * lyricvid::LINE_HEIGHT_FACTOR;

    EXPECT_DOUBLE_EQ(caption_start_y(720, 50, 1, line_height), 360.0);
    EXPECT_DOUBLE_EQ(caption_start_y(720, 50, 3, line_height), 360.0 - line_height);
    EXPECT_DOUBLE_EQ(caption_start_y(720, 80, 2, line_height), 576.0 - line_height / 2.0);
    EXPECT_DOUBLE_EQ(caption_start_y(720, 0, 1, line_height), 0.0);
}

TEST(CaptionLayout, LineHeightFollowsFontSize)
{
    CaptionRenderer renderer;
    EXPECT_FALSE(renderer.is_loaded());
    EXPECT_DOUBLE_EQ(renderer.line_height(), lyricvid::FONT_SIZE * 1.3);
}

} // namespace
