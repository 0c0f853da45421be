#pragma once

#include "bpm/io/fd.hpp"
#include "bpm/util/result.hpp"

#include <string>

namespace bpm {

// Advisory flock(2) held on a dedicated lock file for the lifetime of the
// object. The lock file is never the protected document itself, since
// documents are replaced by rename.
class FileLock {
  public:
    enum class Mode {
        Shared,
        Exclusive,
    };

    FileLock() = default;
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;
    FileLock(FileLock&& other) noexcept = default;
    FileLock& operator=(FileLock&& other) noexcept;
    ~FileLock();

    // Blocks until the lock is granted. Creates the lock file if needed.
    static Result Acquire(const std::string& path, Mode mode, FileLock& out);

    // Fails with LockFailed (err == EWOULDBLOCK) instead of waiting.
    static Result TryAcquire(const std::string& path, Mode mode, FileLock& out);

    bool Held() const { return fd_.Valid(); }
    void Release();

  private:
    static Result Lock(const std::string& path, Mode mode, bool wait, FileLock& out);

    Fd fd_;
};

// True when the lock file could not be opened because the store is not
// writable by this process (EACCES, EROFS). Readers may go on unlocked.
bool IsReadOnlyLockFailure(const Result& r);

} // namespace bpm
