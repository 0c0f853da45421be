#include "bpm/pkg/file_ops.hpp"

#include "bpm/io/file_reader.hpp"
#include "bpm/io/file_writer.hpp"

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace bpm {

namespace {

Result PipeReaderToWriter(FileReader& r, FileWriter& w) {
    std::array<std::uint8_t, 64 * 1024> buffer{};
    while (true) {
        const ssize_t n = r.Read(std::span<std::uint8_t>(buffer.data(), buffer.size()));
        if (n == 0) break;
        if (n < 0) {
            const int err = errno;
            return Result::Fail(Errc::IoError, "Read failed during copy of " + r.Path(), err);
        }

        auto res = w.WriteAll({buffer.data(), static_cast<size_t>(n)});
        if (!res.is_ok()) return res;
    }
    return w.FsyncNow();
}

class PosixFileOps final : public IFileOps {
  public:
    Result CreateDirectories(const std::string& dir) const override {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            return Result::Fail(Errc::IoError,
                                "create_directories failed: " + dir + ": " + ec.message(), ec.value());
        }
        return Result::Ok();
    }

    Result CopyFile(const std::string& src, const std::string& dst) const override {
        FileReader reader;
        auto open_res = FileReader::Open(src, reader);
        if (!open_res.is_ok()) return open_res;

        // Written beside the destination, then renamed into place.
        const std::string tmp_path = dst + ".tmp";
        {
            FileWriter writer;
            auto w = FileWriter::Open(tmp_path, writer, reader.Mode() & 0777);
            if (!w.is_ok()) return w;

            auto pipe_res = PipeReaderToWriter(reader, writer);
            if (!pipe_res.is_ok()) {
                ::unlink(tmp_path.c_str());
                return pipe_res;
            }
        }

        if (::chmod(tmp_path.c_str(), reader.Mode() & 07777) != 0) {
            const int err = errno;
            ::unlink(tmp_path.c_str());
            return Result::Fail(Errc::IoError, "chmod failed: " + std::string(std::strerror(err)), err);
        }

        if (::rename(tmp_path.c_str(), dst.c_str()) != 0) {
            const int err = errno;
            ::unlink(tmp_path.c_str());
            return Result::Fail(Errc::IoError, "Atomic rename failed: " + std::string(std::strerror(err)), err);
        }
        return Result::Ok();
    }

    Result ReadFile(const std::string& path, std::vector<std::uint8_t>& out) const override {
        return ReadFileBytes(path, out);
    }

    Result RemoveFile(const std::string& path) const override {
        if (::unlink(path.c_str()) != 0) {
            const int err = errno;
            return Result::Fail(Errc::IoError,
                                "unlink failed: " + path + " (" + std::strerror(err) + ")", err);
        }
        return Result::Ok();
    }
};

} // namespace

std::shared_ptr<const IFileOps> DefaultFileOps() {
    static const std::shared_ptr<const IFileOps> kDefault = std::make_shared<PosixFileOps>();
    return kDefault;
}

} // namespace bpm
