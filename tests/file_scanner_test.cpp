#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "core/file_scanner.h"
#include "test_helpers.h"

using core::FileInfo;
using core::FileScanner;
using core::ScanConfig;

class FileScannerTest : public ::testing::Test {
protected:
    void SetUp() override {
        testutil::write_file(dir_.file("b.txt"), "bb");
        testutil::write_file(dir_.file("a.png"), "a");
        testutil::write_file(dir_.file("sub/c.json"), "{}");
    }

    testutil::TempDir dir_;
};

TEST_F(FileScannerTest, RecursiveScanIsSortedWithSizes) {
    std::vector<FileInfo> files = FileScanner().scan(dir_.path().string());
    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0].path, dir_.file("a.png"));
    EXPECT_EQ(files[0].size_bytes, 1u);
    EXPECT_EQ(files[1].path, dir_.file("b.txt"));
    EXPECT_EQ(files[1].size_bytes, 2u);
    EXPECT_EQ(files[2].path, dir_.file("sub/c.json"));
}

TEST_F(FileScannerTest, NonRecursiveSkipsSubdirectories) {
    ScanConfig cfg;
    cfg.recursive = false;
    EXPECT_EQ(FileScanner(cfg).scan(dir_.path().string()).size(), 2u);
}

TEST_F(FileScannerTest, SingleFileRoot) {
    auto files = FileScanner().scan(dir_.file("b.txt"));
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].path, dir_.file("b.txt"));
}

TEST_F(FileScannerTest, SkipPathsExcludeTheReport) {
    testutil::write_file(dir_.file("report.csv"), "path\r\n");
    ScanConfig cfg;
    cfg.skip_paths = {dir_.file("sub/../report.csv")};
    auto files = FileScanner(cfg).scan(dir_.path().string());
    ASSERT_EQ(files.size(), 3u);
    for (const auto& f : files) EXPECT_NE(f.path, dir_.file("report.csv"));
}

TEST_F(FileScannerTest, MaxFilesLimitsTheResult) {
    ScanConfig cfg;
    cfg.max_files = 2;
    EXPECT_EQ(FileScanner(cfg).scan(dir_.path().string()).size(), 2u);
}

TEST_F(FileScannerTest, MissingRootYieldsNothing) {
    EXPECT_TRUE(FileScanner().scan(dir_.file("nope")).empty());
}
