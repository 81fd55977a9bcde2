#include <gtest/gtest.h>

#include <cstdio>

#include "config/render_config.hpp"
#include "utils/file_io.hpp"
#include "test_utils.hpp"

using namespace lyricvid;

namespace {

TEST(RenderConfig, Defaults)
{
    config::RenderConfig config;
    EXPECT_EQ(config.width, 1280);
    EXPECT_EQ(config.height, 720);
    EXPECT_EQ(config.fps, 4);
    EXPECT_EQ(config.caption_position, 50);
    EXPECT_EQ(config.font_size, 48);
    EXPECT_FLOAT_EQ(config.jpeg_quality, 0.9f);
    EXPECT_EQ(config.preset, "ultrafast");
    EXPECT_EQ(config.audio_bitrate, "128k");
    EXPECT_FALSE(config.use_hw_accel);
    EXPECT_DOUBLE_EQ(config.default_duration, 180.0);
}

TEST(RenderConfig, SaveAndLoad)
{
    std::string path = test::temp_path("render.conf");

    config::RenderConfig saved;
    saved.width = 640;
    saved.height = 360;
    saved.caption_position = 80;
    saved.font_path = "/tmp/some font.ttf";
    saved.preset = "veryfast";
    saved.use_hw_accel = true;
    saved.default_duration = 42.5;
    ASSERT_TRUE(saved.save_to_file(path));

    config::RenderConfig loaded;
    ASSERT_TRUE(loaded.load_from_file(path));
    EXPECT_EQ(loaded.width, 640);
    EXPECT_EQ(loaded.height, 360);
    EXPECT_EQ(loaded.caption_position, 80);
    EXPECT_EQ(loaded.font_path, "/tmp/some font.ttf");
    EXPECT_EQ(loaded.preset, "veryfast");
    EXPECT_TRUE(loaded.use_hw_accel);
    EXPECT_DOUBLE_EQ(loaded.default_duration, 42.5);

    std::remove(path.c_str());
}

TEST(RenderConfig, CommentsAndUnknownKeys)
{
    std::string path = test::temp_path("comments.conf");
    ASSERT_TRUE(utils::write_text_file(path,
        "# output\n"
        "width = 960\r\n"
        "\n"
        "colour=blue\n"
        "not a pair\n"
        "fps=8\n"));

    config::RenderConfig config;
    ASSERT_TRUE(config.load_from_file(path));
    EXPECT_EQ(config.width, 960);
    EXPECT_EQ(config.height, 720);
    EXPECT_EQ(config.fps, 8);

    std::remove(path.c_str());
}

TEST(RenderConfig, RejectsInvalidValues)
{
    std::string path = test::temp_path("invalid.conf");
    ASSERT_TRUE(utils::write_text_file(path, "width=wide\n"));
    config::RenderConfig config;
    EXPECT_FALSE(config.load_from_file(path));

    ASSERT_TRUE(utils::write_text_file(path, "height=-4\n"));
    config::RenderConfig negative;
    EXPECT_FALSE(negative.load_from_file(path));

    std::remove(path.c_str());
}

TEST(RenderConfig, MissingFile)
{
    config::RenderConfig config;
    EXPECT_FALSE(config.load_from_file(test::temp_path("does-not-exist.conf")));
}

} // namespace
