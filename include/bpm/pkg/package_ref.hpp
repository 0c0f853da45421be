#pragma once

#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace bpm {

// "repo:package[:version]" as typed on the command line.
struct PackageRef {
    std::string repo;
    std::string package;
    std::optional<std::string> version;
};

// "name" or "name:version" inside a manifest dependency list.
struct DependencyRef {
    std::string name;
    std::optional<std::string> version;
};

inline std::string MakeNodeKey(std::string_view package, std::string_view version) {
    std::string key;
    key.reserve(package.size() + version.size() + 1);
    key.append(package);
    key.push_back(':');
    key.append(version);
    return key;
}

// Text after the first ':' up to the next ':' is the version. An empty
// name or an empty version ("name:") is rejected.
inline std::expected<DependencyRef, std::string> ParseDependencyRef(std::string_view text) {
    DependencyRef out;
    const auto colon = text.find(':');
    out.name = std::string(text.substr(0, colon));
    if (out.name.empty()) {
        return std::unexpected("empty dependency name in '" + std::string(text) + "'");
    }
    if (colon == std::string_view::npos) {
        return out;
    }
    std::string_view rest = text.substr(colon + 1);
    rest = rest.substr(0, rest.find(':'));
    if (rest.empty()) {
        return std::unexpected("empty dependency version in '" + std::string(text) + "'");
    }
    out.version = std::string(rest);
    return out;
}

inline std::expected<PackageRef, std::string> ParsePackageRef(std::string_view text) {
    const auto first = text.find(':');
    if (first == std::string_view::npos) {
        return std::unexpected("expected <repo:package[:version]>, got '" + std::string(text) + "'");
    }

    PackageRef out;
    out.repo = std::string(text.substr(0, first));
    std::string_view rest = text.substr(first + 1);
    const auto second = rest.find(':');
    out.package = std::string(rest.substr(0, second));
    if (second != std::string_view::npos) {
        std::string_view ver = rest.substr(second + 1);
        if (ver.find(':') != std::string_view::npos) {
            return std::unexpected("too many ':' in '" + std::string(text) + "'");
        }
        if (!ver.empty()) out.version = std::string(ver);
    }

    if (out.repo.empty()) return std::unexpected("empty repository name in '" + std::string(text) + "'");
    if (out.package.empty()) return std::unexpected("empty package name in '" + std::string(text) + "'");
    if (out.repo.find('/') != std::string::npos || out.repo == "." || out.repo == "..") {
        return std::unexpected("invalid repository name '" + out.repo + "'");
    }
    return out;
}

} // namespace bpm
