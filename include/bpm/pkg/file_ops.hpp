#pragma once

#include "bpm/util/result.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace bpm {

// File-system primitives used by install and remove. Swappable so that
// copy and delete failures can be exercised without a hostile file system.
class IFileOps {
  public:
    virtual ~IFileOps() = default;
    virtual Result CreateDirectories(const std::string& dir) const = 0;
    // Overwrites `dst`, keeping the permission bits of `src`.
    virtual Result CopyFile(const std::string& src, const std::string& dst) const = 0;
    virtual Result ReadFile(const std::string& path, std::vector<std::uint8_t>& out) const = 0;
    virtual Result RemoveFile(const std::string& path) const = 0;
};

std::shared_ptr<const IFileOps> DefaultFileOps();

} // namespace bpm
