#include "bpm/util/config_json_utils.hpp"

#include <fstream>

namespace bpm::config::detail {

namespace {

// Present but mistyped keys are reported; absent keys are not.
bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::optional<std::string>& out,
                        std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key, std::optional<bool>& out,
                      std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_boolean()) {
        err = std::string(key) + " must be a boolean";
        return false;
    }
    out = it->get<bool>();
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, BpmConfigFromFile& cfg, std::string& err) {
    std::optional<std::string> root;
    if (!GetStringIfPresent(j, "StoreRoot", root, err))
        return false;
    if (root) {
        if (root->empty()) {
            err = "StoreRoot must not be empty";
            return false;
        }
        cfg.store_root = *root;
    }

    std::optional<std::string> level;
    if (!GetStringIfPresent(j, "LogLevel", level, err))
        return false;
    if (level) {
        cfg.log_level = ParseLogLevel(*level);
        if (!cfg.log_level) {
            err = "unknown LogLevel '" + *level + "'";
            return false;
        }
    }

    if (!GetBoolIfPresent(j, "Progress", cfg.progress, err))
        return false;
    if (!GetStringIfPresent(j, "ProgressFile", cfg.progress_file, err))
        return false;
    if (!GetBoolIfPresent(j, "Catalog", cfg.catalog, err))
        return false;

    return true;
}

} // namespace bpm::config::detail
