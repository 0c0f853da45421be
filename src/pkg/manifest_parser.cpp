#include "bpm/pkg/manifest_parser.hpp"

#include <nlohmann/json.hpp>

namespace bpm {

using json = nlohmann::json;

namespace {

std::expected<std::vector<std::string>, std::string> ParseStringArray(const json& arr,
                                                                      const std::string& where) {
    if (!arr.is_array()) {
        return std::unexpected(where + " must be an array");
    }

    std::vector<std::string> out;
    out.reserve(arr.size());
    for (const auto& item : arr) {
        if (!item.is_string()) {
            return std::unexpected(where + " entries must be strings");
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

std::expected<PackageVersion, std::string> ParseVersion(const json& j, const std::string& where) {
    if (!j.is_object()) {
        return std::unexpected(where + " must be an object");
    }

    PackageVersion pv;

    auto path = j.find("path");
    if (path == j.end() || !path->is_string()) {
        return std::unexpected(where + " missing string 'path'");
    }
    pv.path = path->get<std::string>();

    auto bins = j.find("binaries");
    if (bins == j.end()) {
        return std::unexpected(where + " missing 'binaries'");
    }
    auto parsed_bins = ParseStringArray(*bins, where + ".binaries");
    if (!parsed_bins)
        return std::unexpected(parsed_bins.error());
    pv.binaries = std::move(*parsed_bins);

    if (auto deps = j.find("dependencies"); deps != j.end()) {
        auto parsed_deps = ParseStringArray(*deps, where + ".dependencies");
        if (!parsed_deps)
            return std::unexpected(parsed_deps.error());
        pv.dependencies = std::move(*parsed_deps);
    }

    return pv;
}

} // namespace

std::expected<Manifest, std::string> ManifestParser::Parse(const std::string& json_input) const {
    try {
        if (json_input.find_first_not_of(" \t\n\r") == std::string::npos) {
            return std::unexpected("Empty input");
        }

        auto j = json::parse(json_input);
        if (!j.is_object()) {
            return std::unexpected("JSON root must be an object");
        }

        Manifest m;
        for (const auto& [name, versions] : j.items()) {
            if (!versions.is_object()) {
                return std::unexpected("package '" + name + "' must map versions to objects");
            }
            VersionMap vm;
            for (const auto& [ver, body] : versions.items()) {
                auto parsed = ParseVersion(body, name + "." + ver);
                if (!parsed)
                    return std::unexpected(parsed.error());
                vm.emplace(ver, std::move(*parsed));
            }
            m.packages.emplace(name, std::move(vm));
        }

        return m;
    } catch (const json::parse_error& e) {
        return std::unexpected(std::string("Syntax Error: ") + e.what());
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Internal Error: ") + e.what());
    }
}

} // namespace bpm
