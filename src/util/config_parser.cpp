#include "bpm/util/config_parser.hpp"

#include "bpm/util/config_json_utils.hpp"

namespace bpm::config {

void BpmConfigFromFile::Reset() {
    store_root.clear();
    log_level.reset();
    progress.reset();
    progress_file.reset();
    catalog.reset();
}

Result BpmConfigFromFile::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail(Errc::ConfigInvalid, "Config: " + err);
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        return Result::Fail(Errc::ConfigInvalid, "Config: " + err + " in " + path);
    }

    return Result::Ok();
}

} // namespace bpm::config
