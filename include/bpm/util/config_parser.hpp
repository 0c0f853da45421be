#pragma once

#include "bpm/util/logger.hpp"
#include "bpm/util/result.hpp"

#include <optional>
#include <string>

namespace bpm::config {

inline constexpr const char* kDefaultConfigPath = "/etc/bpm/bpm.conf";

class BpmConfigFromFile {
public:
    std::string store_root;

    std::optional<LogLevel> log_level;
    std::optional<bool> progress;
    std::optional<std::string> progress_file;
    std::optional<bool> catalog;

    Result LoadFile(const std::string &path);

    void Reset();
};

} // namespace bpm::config
