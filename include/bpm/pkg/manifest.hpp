#pragma once

#include "bpm/util/result.hpp"

#include <expected>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace bpm {

struct PackageVersion {
    std::string path;                       // directory holding the built artifacts
    std::vector<std::string> binaries;      // relative to `path`, may be empty
    std::vector<std::string> dependencies;  // "name" or "name:version"
};

// Ordered so that rbegin() is the ordinal maximum version.
using VersionMap = std::map<std::string, PackageVersion>;

struct Manifest {
    std::map<std::string, VersionMap> packages;

    const VersionMap* FindPackage(const std::string& name) const;
};

struct ResolvedPackage {
    std::string name;
    std::string version;
    PackageVersion spec;
};

class ManifestHandler {
public:
    static std::expected<Manifest, std::string> Parse(const std::string& jsonInput);

    // Reads <store_root>/<repo>/packages.json. No caching.
    static Result Load(const std::filesystem::path& store_root,
                       const std::string& repo,
                       Manifest& out);

    // Picks `requested` if given, else the ordinal maximum version.
    static Result Resolve(const Manifest& manifest,
                          const std::string& package,
                          const std::optional<std::string>& requested,
                          ResolvedPackage& out);
};

} // namespace bpm
