#include "bpm/io/file_lock.hpp"

#include "bpm/util/logger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace bpm {

FileLock& FileLock::operator=(FileLock&& other) noexcept {
    if (this != &other) {
        Release();
        fd_ = std::move(other.fd_);
    }
    return *this;
}

FileLock::~FileLock() { Release(); }

Result FileLock::Acquire(const std::string& path, Mode mode, FileLock& out) {
    return Lock(path, mode, true, out);
}

Result FileLock::TryAcquire(const std::string& path, Mode mode, FileLock& out) {
    return Lock(path, mode, false, out);
}

Result FileLock::Lock(const std::string& path, Mode mode, bool wait, FileLock& out) {
    out.Release();

    int fd = ::open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd < 0) {
        const int err = errno;
        return Result::Fail(Errc::LockFailed,
                            "cannot open lock file " + path + ": " + std::strerror(err), err);
    }
    Fd holder(fd);

    int op = (mode == Mode::Exclusive) ? LOCK_EX : LOCK_SH;
    if (!wait) op |= LOCK_NB;

    while (::flock(holder.Get(), op) != 0) {
        const int err = errno;
        if (err == EINTR) continue;
        if (err == EWOULDBLOCK) {
            return Result::Fail(Errc::LockFailed, "store is locked by another process: " + path, err);
        }
        return Result::Fail(Errc::LockFailed, "flock failed on " + path + ": " + std::strerror(err), err);
    }

    out.fd_ = std::move(holder);
    return Result::Ok();
}

bool IsReadOnlyLockFailure(const Result& r) {
    return r.code == Errc::LockFailed && (r.err == EACCES || r.err == EROFS);
}

void FileLock::Release() {
    if (!fd_.Valid()) return;
    if (::flock(fd_.Get(), LOCK_UN) != 0) {
        LogWarn("flock(LOCK_UN) failed: %s", std::strerror(errno));
    }
    fd_.Close();
}

} // namespace bpm
