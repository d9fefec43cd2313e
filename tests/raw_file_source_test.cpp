#include <gtest/gtest.h>

#include <cstddef>
#include <string>

#include "core/detection_types.h"
#include "core/raw_file_source.h"
#include "test_helpers.h"

using core::FsFileSource;

TEST(FsFileSourceTest, SmallFileWithHugeWindow) {
    testutil::TempDir dir;
    testutil::write_file(dir.file("tiny.txt"), "hello");

    // a window this large cannot be allocated up front
    FsFileSource src(dir.file("tiny.txt"));
    std::string bytes = src.read_prefix(std::size_t(1) << 40);
    EXPECT_EQ(bytes, "hello");
    EXPECT_LE(bytes.capacity(), std::size_t(1) << 20);
}

TEST(FsFileSourceTest, ReadIsBoundedByTheWindow) {
    testutil::TempDir dir;
    testutil::write_file(dir.file("big.bin"), std::string(4096, 'x'));
    FsFileSource src(dir.file("big.bin"));
    EXPECT_EQ(src.read_prefix(100).size(), 100u);
    EXPECT_EQ(src.extension(), "bin");
}

TEST(FsFileSourceTest, MissingFileThrowsReadError) {
    testutil::TempDir dir;
    FsFileSource src(dir.file("gone.jpg"));
    EXPECT_THROW(src.read_prefix(16), core::ReadError);
}

TEST(FsFileSourceTest, ExtensionOf) {
    EXPECT_EQ(core::extension_of("photo.JPG"), "JPG");
    EXPECT_EQ(core::extension_of("archive.tar.gz"), "gz");
    EXPECT_EQ(core::extension_of(".bashrc"), "");
    EXPECT_EQ(core::extension_of("dir/README"), "");
}
