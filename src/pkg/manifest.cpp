#include "bpm/pkg/manifest.hpp"

#include "bpm/io/file_reader.hpp"
#include "bpm/pkg/manifest_parser.hpp"
#include "bpm/pkg/store_paths.hpp"
#include "bpm/util/logger.hpp"

namespace bpm {

const VersionMap* Manifest::FindPackage(const std::string& name) const {
    auto it = packages.find(name);
    if (it == packages.end())
        return nullptr;
    return &it->second;
}

std::expected<Manifest, std::string> ManifestHandler::Parse(const std::string& jsonInput) {
    ManifestParser parser;
    return parser.Parse(jsonInput);
}

Result ManifestHandler::Load(const std::filesystem::path& store_root,
                             const std::string& repo,
                             Manifest& out) {
    const std::string path = ManifestPath(store_root, repo).string();

    std::string content;
    auto read_result = ReadFileToString(path, content);
    if (!read_result.is_ok()) {
        return Result::Fail(Errc::ManifestUnreadable,
                            "cannot read manifest of repo '" + repo + "': " + read_result.msg,
                            read_result.err);
    }

    auto parsed = Parse(content);
    if (!parsed) {
        return Result::Fail(Errc::ManifestMalformed,
                            "malformed manifest " + path + ": " + parsed.error());
    }

    out = std::move(*parsed);
    LogDebug("Loaded manifest %s packages=%zu", path.c_str(), out.packages.size());
    return Result::Ok();
}

Result ManifestHandler::Resolve(const Manifest& manifest,
                                const std::string& package,
                                const std::optional<std::string>& requested,
                                ResolvedPackage& out) {
    const VersionMap* versions = manifest.FindPackage(package);
    if (!versions) {
        return Result::Fail(Errc::PackageNotFound, "package '" + package + "' not found");
    }

    std::string version;
    if (requested) {
        version = *requested;
    } else if (!versions->empty()) {
        version = versions->rbegin()->first;
    } else {
        return Result::Fail(Errc::VersionNotFound, "package '" + package + "' has no versions");
    }

    auto it = versions->find(version);
    if (it == versions->end()) {
        return Result::Fail(Errc::VersionNotFound,
                            "version '" + version + "' not found for package '" + package + "'");
    }

    out.name = package;
    out.version = version;
    out.spec = it->second;
    return Result::Ok();
}

} // namespace bpm
