#include "bpm/io/file_reader.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace bpm {

namespace {

template <typename Sink>
Result Drain(FileReader& reader, Sink&& sink) {
    std::array<std::uint8_t, 64 * 1024> buf{};
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) {
            const int err = errno;
            return Result::Fail(Errc::IoError,
                                "Read failed: " + reader.Path() + " (" + std::strerror(err) + ")",
                                err);
        }
        sink(buf.data(), static_cast<size_t>(n));
    }
    return Result::Ok();
}

} // namespace

Result FileReader::Open(std::string path, FileReader& out) {
    out.path_ = std::move(path);

    int fd = ::open(out.path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        const int err = errno;
        return Result::Fail(
            Errc::IoError, "Failed to open input: " + out.path_ + " (" + std::strerror(err) + ")", err);
    }
    out.fd_.Reset(fd);

    struct stat st{};
    if (::fstat(fd, &st) == 0) {
        if (S_ISDIR(st.st_mode)) {
            out.fd_.Close();
            return Result::Fail(Errc::IoError, "Input is a directory: " + out.path_, EISDIR);
        }
        out.mode_ = st.st_mode & 07777;
        out.size_ = static_cast<std::uint64_t>(st.st_size);
    } else {
        out.size_ = std::nullopt;
    }

    return Result::Ok();
}

std::optional<std::uint64_t> FileReader::TotalSize() const { return size_; }

ssize_t FileReader::Read(std::span<std::uint8_t> out) {
    while (true) {
        ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n >= 0) {
            return n;
        }
        if (errno == EINTR) {
            continue;
        }
        return -1;
    }
}

Result ReadFileToString(const std::string& path, std::string& out) {
    out.clear();
    FileReader reader;
    auto r = FileReader::Open(path, reader);
    if (!r.is_ok()) return r;
    if (auto size = reader.TotalSize()) out.reserve(static_cast<size_t>(*size));
    return Drain(reader, [&out](const std::uint8_t* p, size_t n) {
        out.append(reinterpret_cast<const char*>(p), n);
    });
}

Result ReadFileBytes(const std::string& path, std::vector<std::uint8_t>& out) {
    out.clear();
    FileReader reader;
    auto r = FileReader::Open(path, reader);
    if (!r.is_ok()) return r;
    if (auto size = reader.TotalSize()) out.reserve(static_cast<size_t>(*size));
    return Drain(reader, [&out](const std::uint8_t* p, size_t n) {
        out.insert(out.end(), p, p + n);
    });
}

} // namespace bpm
