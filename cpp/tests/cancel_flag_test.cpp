#include <gtest/gtest.h>

#include "utils/cancel_flag.hpp"

using namespace lyricvid::utils;

namespace {

TEST(CancelFlag, RequestAndReset)
{
    reset_cancel();
    EXPECT_FALSE(is_cancel_requested());

    request_cancel();
    EXPECT_TRUE(is_cancel_requested());
    EXPECT_EQ(cancel_signal(), 0);

    reset_cancel();
    EXPECT_FALSE(is_cancel_requested());
}

} // namespace
