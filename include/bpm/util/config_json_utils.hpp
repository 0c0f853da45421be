#pragma once

#include "bpm/util/config_parser.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace bpm::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);
bool FillConfigFromJson(const nlohmann::json& j, BpmConfigFromFile& cfg, std::string& err);

} // namespace bpm::config::detail
