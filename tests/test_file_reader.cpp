#include "bpm/io/file_reader.hpp"
#include "testing.hpp"

#include <sys/stat.h>

#include <cerrno>
#include <cstdint>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {

class FileReaderTests : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;

    std::string MakePath(const std::string& name) { return tmp.Path() + "/" + name; }
};

TEST_F(FileReaderTests, OpenReportsSizeAndMode) {
    const std::string p = MakePath("tool");
    testutil::WriteFile(p, std::string(12345, 'x'));
    ASSERT_EQ(::chmod(p.c_str(), 0750), 0);

    bpm::FileReader r;
    auto res = bpm::FileReader::Open(p, r);
    ASSERT_TRUE(res.ok) << res.msg;

    auto sz = r.TotalSize();
    ASSERT_TRUE(sz.has_value());
    EXPECT_EQ(*sz, 12345u);
    EXPECT_EQ(r.Mode(), 0750u);
    EXPECT_EQ(r.Path(), p);
}

TEST_F(FileReaderTests, OpenNonexistentCarriesErrno) {
    bpm::FileReader r;
    auto res = bpm::FileReader::Open(MakePath("nope.bin"), r);
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.code, bpm::Errc::IoError);
    EXPECT_EQ(res.err, ENOENT);
}

TEST_F(FileReaderTests, OpenDirectoryFails) {
    bpm::FileReader r;
    auto res = bpm::FileReader::Open(tmp.Path(), r);
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.err, EISDIR);
}

TEST_F(FileReaderTests, ReadFileBytesEqualsInput) {
    const std::string p = MakePath("in.bin");
    std::string data(2 * 1024 * 1024 + 7, '\0');
    for (size_t i = 0; i < data.size(); ++i)
        data[i] = static_cast<char>((i * 13) & 0xFF);
    testutil::WriteFile(p, data);

    std::vector<std::uint8_t> out;
    auto res = bpm::ReadFileBytes(p, out);
    ASSERT_TRUE(res.ok) << res.msg;
    ASSERT_EQ(out.size(), data.size());
    EXPECT_EQ(std::string(out.begin(), out.end()), data);
}

TEST_F(FileReaderTests, ReadFileToStringEmptyFile) {
    const std::string p = MakePath("empty");
    testutil::WriteFile(p, "");

    std::string out = "stale";
    ASSERT_TRUE(bpm::ReadFileToString(p, out).ok);
    EXPECT_TRUE(out.empty());
}

} // namespace
