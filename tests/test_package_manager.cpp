#include <gtest/gtest.h>

#include "bpm/pkg/package_manager.hpp"
#include "bpm/pkg/store_paths.hpp"
#include "testing.hpp"

#include <cerrno>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace bpm {
namespace {

class PackageManagerTest : public ::testing::Test {
protected:
    testutil::TemporaryDirectory temp_dir;
    fs::path root{temp_dir.Path()};
    testutil::RepoBuilder repo{root, "main"};
    std::shared_ptr<testutil::FakeFileOps> file_ops = std::make_shared<testutil::FakeFileOps>();
    PackageManager pm{PackageManager::Options{.file_ops = file_ops}};

    std::string BinPath(const std::string& name) const { return (BinDir(root) / name).string(); }

    InstalledState List() {
        InstalledState state;
        EXPECT_TRUE(pm.ListInstalled(root, state).is_ok());
        return state;
    }
};

TEST_F(PackageManagerTest, RemoveDeletesBinariesAndRecord) {
    repo.Add("hello", "1.0", {"hello", "hello-helper"}).Write();
    InstallReport installed;
    ASSERT_TRUE(pm.Install(root, "main", "hello", std::nullopt, installed).is_ok());

    RemoveReport report;
    ASSERT_TRUE(pm.Remove(root, "hello", report).is_ok());

    EXPECT_TRUE(report.was_installed);
    EXPECT_EQ(report.record.version, "1.0");
    EXPECT_EQ(report.deleted.size(), 2u);
    EXPECT_FALSE(fs::exists(BinPath("hello")));
    EXPECT_FALSE(fs::exists(BinPath("hello-helper")));
    EXPECT_TRUE(List().Empty());
}

TEST_F(PackageManagerTest, RemoveAttemptsEveryBinaryDespiteFailures) {
    repo.Add("hello", "1.0", {"first", "second"}).Write();
    InstallReport installed;
    ASSERT_TRUE(pm.Install(root, "main", "hello", std::nullopt, installed).is_ok());
    file_ops->fail_remove.insert(BinPath("first"));

    RemoveReport report;
    ASSERT_TRUE(pm.Remove(root, "hello", report).is_ok());

    const std::vector<std::string> attempted = {BinPath("first"), BinPath("second")};
    EXPECT_EQ(file_ops->remove_calls, attempted);
    ASSERT_EQ(report.delete_failures.size(), 1u);
    EXPECT_EQ(report.delete_failures[0].subject, BinPath("first"));
    EXPECT_EQ(report.delete_failures[0].result.code, Errc::BinaryDeleteFailed);
    EXPECT_EQ(report.deleted, std::vector<std::string>{BinPath("second")});
    EXPECT_FALSE(List().Contains("hello"));
}

TEST_F(PackageManagerTest, RemoveOfMissingBinaryStillDropsRecord) {
    repo.Add("hello", "1.0", {"hello"}).Write();
    InstallReport installed;
    ASSERT_TRUE(pm.Install(root, "main", "hello", std::nullopt, installed).is_ok());
    fs::remove(BinPath("hello"));

    RemoveReport report;
    ASSERT_TRUE(pm.Remove(root, "hello", report).is_ok());
    ASSERT_EQ(report.delete_failures.size(), 1u);
    EXPECT_EQ(report.delete_failures[0].result.code, Errc::BinaryDeleteFailed);
    EXPECT_EQ(report.delete_failures[0].result.err, ENOENT);
    EXPECT_TRUE(List().Empty());
}

TEST_F(PackageManagerTest, RemoveKeepsBinariesWhenSaveFails) {
    repo.Add("tool", "1.0", {"tool"}).Write();
    InstallReport installed;
    ASSERT_TRUE(pm.Install(root, "main", "tool", std::nullopt, installed).is_ok());
    fs::create_directory(InstalledDbPath(root).string() + ".tmp");

    RemoveReport report;
    auto res = pm.Remove(root, "tool", report);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.code, Errc::StateWriteFailed);
    EXPECT_FALSE(report.was_installed);
    EXPECT_TRUE(file_ops->remove_calls.empty());
    EXPECT_TRUE(fs::exists(BinPath("tool")));
    EXPECT_TRUE(List().Contains("tool"));
}

TEST_F(PackageManagerTest, RemoveNotInstalledIsNoOp) {
    RemoveReport report;
    ASSERT_TRUE(pm.Remove(root, "ghost", report).is_ok());
    EXPECT_FALSE(report.was_installed);
    EXPECT_TRUE(file_ops->remove_calls.empty());
    EXPECT_FALSE(fs::exists(InstalledDbPath(root)));
}

TEST_F(PackageManagerTest, RemoveLeavesOtherPackages) {
    repo.Add("a", "1.0", {"a"}).Add("b", "1.0", {"b"}).Write();
    InstallReport installed;
    ASSERT_TRUE(pm.Install(root, "main", "a", std::nullopt, installed).is_ok());
    ASSERT_TRUE(pm.Install(root, "main", "b", std::nullopt, installed).is_ok());

    RemoveReport report;
    ASSERT_TRUE(pm.Remove(root, "a", report).is_ok());

    auto state = List();
    EXPECT_FALSE(state.Contains("a"));
    EXPECT_TRUE(state.Contains("b"));
    EXPECT_TRUE(fs::exists(BinPath("b")));
}

TEST_F(PackageManagerTest, RemoveOnCorruptStateFails) {
    testutil::WriteFile(InstalledDbPath(root), "[1, 2");
    RemoveReport report;
    auto res = pm.Remove(root, "x", report);
    EXPECT_EQ(res.code, Errc::StateCorrupt);
    EXPECT_EQ(testutil::ReadFile(InstalledDbPath(root)), "[1, 2");
}

TEST_F(PackageManagerTest, UpdateMovesToLatest) {
    repo.Add("hello", "1.0", {"hello", "legacy"}).Add("hello", "2.0", {"hello"}).Write();
    InstallReport installed;
    ASSERT_TRUE(pm.Install(root, "main", "hello", "1.0", installed).is_ok());

    UpdateReport report;
    ASSERT_TRUE(pm.Update(root, "main", "hello", report).is_ok());

    EXPECT_TRUE(report.removed.was_installed);
    EXPECT_EQ(report.removed.record.version, "1.0");
    EXPECT_EQ(report.installed.installed, std::vector<std::string>{"hello:2.0"});
    EXPECT_FALSE(fs::exists(BinPath("legacy")));
    EXPECT_EQ(testutil::ReadFile(BinPath("hello")), "hello-2.0:hello");

    auto rec = List().Get("hello");
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->version, "2.0");
    EXPECT_EQ(rec->binaries, std::vector<std::string>{BinPath("hello")});
}

TEST_F(PackageManagerTest, UpdateOfNotInstalledPackageInstalls) {
    repo.Add("hello", "1.0", {"hello"}).Write();

    UpdateReport report;
    ASSERT_TRUE(pm.Update(root, "main", "hello", report).is_ok());
    EXPECT_FALSE(report.removed.was_installed);
    EXPECT_TRUE(List().Contains("hello"));
}

TEST_F(PackageManagerTest, UpdateToUnknownPackageLeavesItRemoved) {
    repo.Add("hello", "1.0", {"hello"}).Write();
    InstallReport installed;
    ASSERT_TRUE(pm.Install(root, "main", "hello", std::nullopt, installed).is_ok());

    testutil::RepoBuilder emptied(root, "main");
    emptied.Add("other", "1.0").Write();

    UpdateReport report;
    auto res = pm.Update(root, "main", "hello", report);
    EXPECT_EQ(res.code, Errc::PackageNotFound);
    EXPECT_TRUE(report.removed.was_installed);
    EXPECT_FALSE(List().Contains("hello"));
}

TEST_F(PackageManagerTest, ListInstalledIsSortedByName) {
    repo.Add("zeta", "1.0").Add("alpha", "1.0").Add("mid", "1.0").Write();
    InstallReport installed;
    for (const char* name : {"zeta", "alpha", "mid"}) {
        ASSERT_TRUE(pm.Install(root, "main", name, std::nullopt, installed).is_ok());
    }

    const auto state = List();
    std::vector<std::string> names;
    for (const auto& [name, rec] : state.Records()) {
        names.push_back(name);
        EXPECT_EQ(rec.repo, "main");
    }
    const std::vector<std::string> expected = {"alpha", "mid", "zeta"};
    EXPECT_EQ(names, expected);
}

TEST_F(PackageManagerTest, ListOnFreshStoreIsEmpty) {
    const fs::path fresh = root / "not-yet";
    InstalledState state;
    ASSERT_TRUE(pm.ListInstalled(fresh, state).is_ok());
    EXPECT_TRUE(state.Empty());
    EXPECT_FALSE(fs::exists(fresh));
}

TEST_F(PackageManagerTest, EmptyArgumentsRejected) {
    RemoveReport report;
    EXPECT_EQ(pm.Remove(root, "", report).code, Errc::InvalidArgument);
    EXPECT_EQ(pm.Remove("", "x", report).code, Errc::InvalidArgument);
}

} // namespace
} // namespace bpm
