#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "core/result_record.h"
#include "report/csv_report.h"
#include "test_helpers.h"

using core::ResultRecord;

namespace {

ResultRecord sample() {
    ResultRecord r;
    r.path = "photos/photo.txt";
    r.size_bytes = 48;
    r.current_ext = "txt";
    r.detected_ext = "png";
    r.detected_mime = "image/png";
    r.confidence = 1.0;
    r.is_match = false;
    r.action = "rename";
    r.new_path = "photos/photo.png";
    r.reason = "mismatch";
    return r;
}

} // namespace

TEST(CsvReportTest, HeaderHasElevenColumnsInOrder) {
    ASSERT_EQ(report::kColumnCount, 11u);
    std::ostringstream out;
    report::write_csv(out, {});
    EXPECT_EQ(out.str(),
              "path,size_bytes,current_ext,detected_ext,detected_mime,confidence,"
              "is_match,action,new_path,error,reason\r\n");
}

TEST(CsvReportTest, RowFormatting) {
    EXPECT_EQ(report::format_row(sample()),
              "photos/photo.txt,48,txt,png,image/png,1.00,false,rename,photos/photo.png,,mismatch");

    ResultRecord json;
    json.path = "notes.json";
    json.size_bytes = 7;
    json.current_ext = "json";
    json.detected_ext = "json";
    json.detected_mime = "application/json";
    json.confidence = 0.7;
    json.is_match = true;
    json.reason = "match";
    EXPECT_EQ(report::format_row(json), "notes.json,7,json,json,application/json,0.70,true,none,,,match");
}

TEST(CsvReportTest, Escaping) {
    EXPECT_EQ(report::csv_escape("plain"), "plain");
    EXPECT_EQ(report::csv_escape(""), "");
    EXPECT_EQ(report::csv_escape("a,b"), "\"a,b\"");
    EXPECT_EQ(report::csv_escape("say \"hi\""), "\"say \"\"hi\"\"\"");
    EXPECT_EQ(report::csv_escape("two\nlines"), "\"two\nlines\"");

    ResultRecord r = sample();
    r.path = "odd, name.txt";
    EXPECT_EQ(report::format_row(r).rfind("\"odd, name.txt\",48,", 0), 0u);
}

TEST(CsvReportTest, WritesFileAndCreatesParentDirectories) {
    testutil::TempDir dir;
    std::string path = dir.file("out/nested/report.csv");
    std::string err;
    ASSERT_TRUE(report::write_csv(path, {sample(), sample()}, &err)) << err;

    std::string text = testutil::read_file(path);
    std::size_t lines = 0;
    for (std::size_t pos = 0; (pos = text.find("\r\n", pos)) != std::string::npos; pos += 2) ++lines;
    EXPECT_EQ(lines, 3u);
}

TEST(CsvReportTest, UnwritablePathFails) {
    testutil::TempDir dir;
    // a regular file where a directory is needed
    testutil::write_file(dir.file("blocker"), "x");
    std::string err;
    EXPECT_FALSE(report::write_csv(dir.file("blocker/report.csv"), {sample()}, &err));
    EXPECT_FALSE(err.empty());
}
