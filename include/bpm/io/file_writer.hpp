#pragma once

#include "bpm/io/fd.hpp"
#include "bpm/io/io.hpp"
#include "bpm/util/result.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <sys/types.h>

namespace bpm {

class FileWriter final : public IWriter {
  public:
    // Creates or truncates `path`.
    static Result Open(std::string path, FileWriter& out, mode_t mode = 0644);

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;

  private:
    std::string path_;
    Fd fd_;
};

// Writes `data` to "<path>.tmp", fsyncs it and renames it over `path`.
// On failure the temporary file is removed and `path` is left untouched.
Result WriteFileAtomic(const std::string& path, std::span<const std::uint8_t> data, mode_t mode = 0644);
Result WriteFileAtomic(const std::string& path, std::string_view data, mode_t mode = 0644);

} // namespace bpm
