#include <gtest/gtest.h>

#include "pipeline/frame_cache.hpp"

using namespace lyricvid::pipeline;

namespace {

class FrameCacheTest : public ::testing::Test {
protected:
    FrameCacheTest()
        : calls(0)
        , fail_next(false)
        , cache([this](const std::string& caption, std::vector<uint8_t>& out) {
            calls++;
            if (fail_next) {
                fail_next = false;
                return false;
            }
            out.assign(caption.begin(), caption.end());
            out.push_back(static_cast<uint8_t>(calls));
            return true;
        })
    {
    }

    int calls;
    bool fail_next;
    FrameCache cache;
};

TEST_F(FrameCacheTest, ReusesFrameForSameCaption)
{
    const std::vector<uint8_t>* first = cache.get("hello");
    ASSERT_NE(first, nullptr);
    std::vector<uint8_t> copy = *first;

    const std::vector<uint8_t>* second = cache.get("hello");
    ASSERT_NE(second, nullptr);
    EXPECT_EQ(*second, copy);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(cache.render_count(), 1);
}

TEST_F(FrameCacheTest, RendersOnEveryChange)
{
    cache.get("");
    cache.get("");
    cache.get("a");
    cache.get("a");
    cache.get("");
    EXPECT_EQ(cache.render_count(), 3);
    EXPECT_EQ(cache.caption(), "");
}

TEST_F(FrameCacheTest, EmptyCaptionIsCachedToo)
{
    ASSERT_NE(cache.get(""), nullptr);
    EXPECT_TRUE(cache.has_entry());
    ASSERT_NE(cache.get(""), nullptr);
    EXPECT_EQ(calls, 1);
}

TEST_F(FrameCacheTest, FailedRenderIsNotCached)
{
    fail_next = true;
    EXPECT_EQ(cache.get("x"), nullptr);
    EXPECT_FALSE(cache.has_entry());

    ASSERT_NE(cache.get("x"), nullptr);
    EXPECT_EQ(calls, 2);
}

TEST_F(FrameCacheTest, ClearForcesRender)
{
    cache.get("x");
    cache.clear();
    EXPECT_FALSE(cache.has_entry());
    cache.get("x");
    EXPECT_EQ(calls, 2);
}

} // namespace
