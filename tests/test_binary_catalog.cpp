#include <gtest/gtest.h>

#include "bpm/crypto/sha256.hpp"
#include "bpm/pkg/binary_catalog.hpp"
#include "testing.hpp"

#include <filesystem>
#include <string>

namespace bpm {
namespace {

std::span<const std::uint8_t> Bytes(const std::string& s) {
    return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}

class BinaryCatalogTest : public ::testing::Test {
protected:
    testutil::TemporaryDirectory temp_dir;
    TarCatalog catalog;

    std::string CatalogFile() const { return temp_dir.Path() + "/packages.db"; }
};

TEST_F(BinaryCatalogTest, MissingCatalogListsEmpty) {
    std::vector<CatalogEntry> entries;
    ASSERT_TRUE(TarCatalog::List(CatalogFile(), entries).is_ok());
    EXPECT_TRUE(entries.empty());
}

TEST_F(BinaryCatalogTest, RecordAppendsEntries) {
    ASSERT_TRUE(catalog.Record(CatalogFile(), "hello", Bytes("hello-bytes")).is_ok());
    ASSERT_TRUE(catalog.Record(CatalogFile(), "world", Bytes("w")).is_ok());
    EXPECT_FALSE(std::filesystem::exists(CatalogFile() + ".tmp"));

    std::vector<CatalogEntry> entries;
    ASSERT_TRUE(TarCatalog::List(CatalogFile(), entries).is_ok());
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].name, "hello");
    EXPECT_EQ(entries[0].size, 11u);
    EXPECT_EQ(entries[0].sha256, Sha256Hex(Bytes("hello-bytes")));
    EXPECT_EQ(entries[1].name, "world");
}

TEST_F(BinaryCatalogTest, RecordReplacesSameName) {
    ASSERT_TRUE(catalog.Record(CatalogFile(), "tool", Bytes("v1")).is_ok());
    ASSERT_TRUE(catalog.Record(CatalogFile(), "other", Bytes("o")).is_ok());
    ASSERT_TRUE(catalog.Record(CatalogFile(), "tool", Bytes("version-two")).is_ok());

    std::vector<CatalogEntry> entries;
    ASSERT_TRUE(TarCatalog::List(CatalogFile(), entries).is_ok());
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].name, "other");
    EXPECT_EQ(entries[1].name, "tool");

    std::vector<std::uint8_t> data;
    ASSERT_TRUE(TarCatalog::Read(CatalogFile(), "tool", data).is_ok());
    EXPECT_EQ(std::string(data.begin(), data.end()), "version-two");
}

TEST_F(BinaryCatalogTest, EmptyBinaryIsRecorded) {
    ASSERT_TRUE(catalog.Record(CatalogFile(), "empty", {}).is_ok());
    std::vector<std::uint8_t> data{1, 2, 3};
    ASSERT_TRUE(TarCatalog::Read(CatalogFile(), "empty", data).is_ok());
    EXPECT_TRUE(data.empty());
}

TEST_F(BinaryCatalogTest, ReadUnknownEntryFails) {
    ASSERT_TRUE(catalog.Record(CatalogFile(), "a", Bytes("a")).is_ok());
    std::vector<std::uint8_t> data;
    auto res = TarCatalog::Read(CatalogFile(), "b", data);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.code, Errc::CatalogFailed);
}

TEST_F(BinaryCatalogTest, CorruptCatalogIsReportedAndLeftInPlace) {
    testutil::WriteFile(CatalogFile(), std::string(700, 'x'));
    auto res = catalog.Record(CatalogFile(), "a", Bytes("a"));
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.code, Errc::CatalogFailed);
    EXPECT_EQ(testutil::ReadFile(CatalogFile()), std::string(700, 'x'));
    EXPECT_FALSE(std::filesystem::exists(CatalogFile() + ".tmp"));
}

TEST_F(BinaryCatalogTest, EmptyNameRejected) {
    auto res = catalog.Record(CatalogFile(), "", Bytes("x"));
    EXPECT_EQ(res.code, Errc::InvalidArgument);
}

} // namespace
} // namespace bpm
