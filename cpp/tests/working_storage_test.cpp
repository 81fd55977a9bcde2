#include <gtest/gtest.h>

#include <filesystem>

#include "pipeline/working_storage.hpp"

using namespace lyricvid::pipeline;

namespace {

TEST(WorkingStorage, NotReadyBeforeCreate)
{
    WorkingStorage storage;
    EXPECT_FALSE(storage.is_ready());
    EXPECT_FALSE(storage.write_file("a.bin", {1, 2, 3}));
    EXPECT_FALSE(storage.exists("a.bin"));
    EXPECT_TRUE(storage.list().empty());
}

TEST(WorkingStorage, WriteReadListRemove)
{
    WorkingStorage storage;
    ASSERT_TRUE(storage.create("lyricvid-test"));
    ASSERT_TRUE(std::filesystem::is_directory(storage.root()));

    const std::vector<uint8_t> data = {0, 1, 2, 250, 255};
    ASSERT_TRUE(storage.write_file("frame00001.jpg", data));
    ASSERT_TRUE(storage.write_file("frame00000.jpg", {}));
    EXPECT_TRUE(storage.exists("frame00001.jpg"));

    std::vector<uint8_t> read;
    ASSERT_TRUE(storage.read_file("frame00001.jpg", read));
    EXPECT_EQ(read, data);

    auto names = storage.list();
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "frame00000.jpg");
    EXPECT_EQ(names[1], "frame00001.jpg");

    EXPECT_TRUE(storage.remove_file("frame00001.jpg"));
    EXPECT_FALSE(storage.exists("frame00001.jpg"));
    EXPECT_EQ(storage.list().size(), 1u);
}

TEST(WorkingStorage, RemovingMissingFileIsNotAnError)
{
    WorkingStorage storage;
    ASSERT_TRUE(storage.create("lyricvid-test"));
    EXPECT_NO_THROW({
        EXPECT_FALSE(storage.remove_file("never-written.jpg"));
    });
}

TEST(WorkingStorage, DestroyRemovesDirectory)
{
    WorkingStorage storage;
    ASSERT_TRUE(storage.create("lyricvid-test"));
    std::filesystem::path root = storage.root();
    ASSERT_TRUE(storage.write_file("audio.mp3", {1, 2, 3}));

    storage.destroy();
    EXPECT_FALSE(storage.is_ready());
    EXPECT_FALSE(std::filesystem::exists(root));
}

TEST(WorkingStorage, EachStorageIsPrivate)
{
    WorkingStorage a;
    WorkingStorage b;
    ASSERT_TRUE(a.create("lyricvid-test"));
    ASSERT_TRUE(b.create("lyricvid-test"));
    EXPECT_NE(a.root(), b.root());

    ASSERT_TRUE(a.write_file("output.mp4", {9}));
    EXPECT_FALSE(b.exists("output.mp4"));
}

} // namespace
