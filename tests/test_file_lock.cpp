#include <gtest/gtest.h>

#include "bpm/io/file_lock.hpp"
#include "testing.hpp"

#include <cerrno>
#include <filesystem>
#include <utility>

namespace bpm {
namespace {

class FileLockTest : public ::testing::Test {
protected:
    testutil::TemporaryDirectory temp_dir;

    std::string LockPath() const { return temp_dir.Path() + "/installed.json.lock"; }
};

TEST_F(FileLockTest, ExclusiveLockBlocksSecondHolder) {
    FileLock first;
    ASSERT_TRUE(FileLock::Acquire(LockPath(), FileLock::Mode::Exclusive, first).is_ok());
    EXPECT_TRUE(first.Held());
    EXPECT_TRUE(std::filesystem::exists(LockPath()));

    FileLock second;
    auto res = FileLock::TryAcquire(LockPath(), FileLock::Mode::Exclusive, second);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.code, Errc::LockFailed);
    EXPECT_EQ(res.err, EWOULDBLOCK);
    EXPECT_FALSE(second.Held());
}

TEST_F(FileLockTest, SharedLocksCoexistButExcludeWriters) {
    FileLock reader_a;
    FileLock reader_b;
    ASSERT_TRUE(FileLock::Acquire(LockPath(), FileLock::Mode::Shared, reader_a).is_ok());
    ASSERT_TRUE(FileLock::TryAcquire(LockPath(), FileLock::Mode::Shared, reader_b).is_ok());

    FileLock writer;
    EXPECT_FALSE(FileLock::TryAcquire(LockPath(), FileLock::Mode::Exclusive, writer).is_ok());
}

TEST_F(FileLockTest, ReleaseAllowsReacquire) {
    {
        FileLock lock;
        ASSERT_TRUE(FileLock::Acquire(LockPath(), FileLock::Mode::Exclusive, lock).is_ok());
    }

    FileLock again;
    EXPECT_TRUE(FileLock::TryAcquire(LockPath(), FileLock::Mode::Exclusive, again).is_ok());
    again.Release();
    EXPECT_FALSE(again.Held());

    FileLock third;
    EXPECT_TRUE(FileLock::TryAcquire(LockPath(), FileLock::Mode::Exclusive, third).is_ok());
}

TEST_F(FileLockTest, MovedLockStaysHeld) {
    FileLock original;
    ASSERT_TRUE(FileLock::Acquire(LockPath(), FileLock::Mode::Exclusive, original).is_ok());

    FileLock moved(std::move(original));
    EXPECT_TRUE(moved.Held());

    FileLock other;
    EXPECT_FALSE(FileLock::TryAcquire(LockPath(), FileLock::Mode::Exclusive, other).is_ok());
}

TEST_F(FileLockTest, MissingDirectoryFails) {
    FileLock lock;
    auto res = FileLock::Acquire(temp_dir.Path() + "/no/such/dir/x.lock", FileLock::Mode::Shared, lock);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.code, Errc::LockFailed);
    EXPECT_EQ(res.err, ENOENT);
}

TEST_F(FileLockTest, ReadOnlyFailureClassification) {
    EXPECT_TRUE(IsReadOnlyLockFailure(Result::Fail(Errc::LockFailed, "x", EACCES)));
    EXPECT_TRUE(IsReadOnlyLockFailure(Result::Fail(Errc::LockFailed, "x", EROFS)));
    EXPECT_FALSE(IsReadOnlyLockFailure(Result::Fail(Errc::LockFailed, "x", EWOULDBLOCK)));
    EXPECT_FALSE(IsReadOnlyLockFailure(Result::Fail(Errc::IoError, "x", EACCES)));

    FileLock lock;
    auto missing = FileLock::Acquire(temp_dir.Path() + "/no/such/dir/x.lock", FileLock::Mode::Shared, lock);
    EXPECT_FALSE(IsReadOnlyLockFailure(missing));
}

} // namespace
} // namespace bpm
