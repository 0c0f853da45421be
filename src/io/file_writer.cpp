#include "bpm/io/file_writer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace bpm {

Result FileWriter::Open(std::string path, FileWriter& out, mode_t mode) {
    out.path_ = std::move(path);

    int fd = ::open(out.path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
    if (fd < 0) {
        const int err = errno;
        return Result::Fail(
            Errc::IoError, "Failed to open output: " + out.path_ + " (" + std::strerror(err) + ")", err);
    }
    out.fd_.Reset(fd);
    return Result::Ok();
}

Result FileWriter::WriteAll(std::span<const std::uint8_t> in) {
    size_t rem = in.size();
    const std::uint8_t* p = in.data();

    while (rem > 0) {
        ssize_t n = ::write(fd_.Get(), p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        const int err = errno;
        return Result::Fail(Errc::IoError,
                            "Write failed: " + path_ + " (" + std::strerror(err) + ")", err);
    }

    return Result::Ok();
}

Result FileWriter::FsyncNow() {
    if (::fsync(fd_.Get()) == -1) {
        const int err = errno;
        return Result::Fail(Errc::IoError,
                            "fsync failed: " + path_ + " (" + std::strerror(err) + ")", err);
    }
    return Result::Ok();
}

Result WriteFileAtomic(const std::string& path, std::span<const std::uint8_t> data, mode_t mode) {
    const std::string tmp_path = path + ".tmp";

    {
        FileWriter writer;
        auto r = FileWriter::Open(tmp_path, writer, mode);
        if (!r.is_ok()) return r;

        r = writer.WriteAll(data);
        if (r.is_ok()) r = writer.FsyncNow();
        if (!r.is_ok()) {
            ::unlink(tmp_path.c_str());
            return r;
        }
    }

    if (::rename(tmp_path.c_str(), path.c_str()) != 0) {
        const int err = errno;
        ::unlink(tmp_path.c_str());
        return Result::Fail(Errc::IoError,
                            "Atomic rename failed: " + path + " (" + std::strerror(err) + ")", err);
    }
    return Result::Ok();
}

Result WriteFileAtomic(const std::string& path, std::string_view data, mode_t mode) {
    return WriteFileAtomic(
        path,
        std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(data.data()), data.size()),
        mode);
}

} // namespace bpm
