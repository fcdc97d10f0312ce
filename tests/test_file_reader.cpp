#include "io/file_reader.hpp"
#include "testing.hpp"

#include <cerrno>
#include <gtest/gtest.h>
#include <string>

namespace imgbuild {
namespace {

class FileReaderTest : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
};

TEST_F(FileReaderTest, RegularFileReportsSizeAndContents) {
    const std::string p = tmp.Join("Dockerfile");
    const std::string body = "FROM alpine\nRUN echo hi\n";
    testutil::WriteFile(p, body);

    FileOrStdinReader r;
    auto res = FileOrStdinReader::Open(p, r);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_FALSE(r.IsStdin());
    ASSERT_TRUE(r.TotalSize().has_value());
    EXPECT_EQ(*r.TotalSize(), body.size());
    EXPECT_EQ(testutil::ReadAll(r), body);
    EXPECT_TRUE(r.Error().empty());
}

TEST_F(FileReaderTest, LargeFileReadsCompletely) {
    const std::string p = tmp.Join("context.tar");
    std::string data(2 * 1024 * 1024 + 7, '\0');
    for (size_t i = 0; i < data.size(); ++i)
        data[i] = static_cast<char>((i * 13) & 0xFF);
    testutil::WriteFile(p, data);

    FileOrStdinReader r;
    ASSERT_TRUE(FileOrStdinReader::Open(p, r).is_ok());
    EXPECT_EQ(testutil::ReadAll(r), data);
}

TEST_F(FileReaderTest, MissingFileFailsWithErrno) {
    FileOrStdinReader r;
    auto res = FileOrStdinReader::Open(tmp.Join("nope"), r);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.err, ENOENT);
    EXPECT_NE(res.msg.find("nope"), std::string::npos) << res.msg;
}

TEST_F(FileReaderTest, DirectoryIsRefused) {
    FileOrStdinReader r;
    auto res = FileOrStdinReader::Open(tmp.Path(), r);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.err, EISDIR);
}

TEST_F(FileReaderTest, DashMeansStdin) {
    FileOrStdinReader r;
    ASSERT_TRUE(FileOrStdinReader::Open(kStdinPath, r).is_ok());
    EXPECT_TRUE(r.IsStdin());
    EXPECT_EQ(r.Path(), "-");
}

} // namespace
} // namespace imgbuild
