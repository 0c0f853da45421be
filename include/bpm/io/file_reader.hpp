#pragma once

#include "bpm/io/fd.hpp"
#include "bpm/io/io.hpp"
#include "bpm/util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <sys/types.h>
#include <vector>

namespace bpm {

class FileReader final : public IReader {
public:
    static Result Open(std::string path, FileReader &out);

    std::optional<std::uint64_t> TotalSize() const override;
    ssize_t Read(std::span<std::uint8_t> out) override;

    // Permission bits of the opened file.
    mode_t Mode() const { return mode_; }
    const std::string &Path() const { return path_; }

private:
    std::string path_;
    Fd fd_;
    std::optional<std::uint64_t> size_;
    mode_t mode_ = 0644;
};

Result ReadFileToString(const std::string &path, std::string &out);
Result ReadFileBytes(const std::string &path, std::vector<std::uint8_t> &out);

} // namespace bpm
