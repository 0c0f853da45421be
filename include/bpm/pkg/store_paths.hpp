#pragma once

#include <filesystem>
#include <string_view>

namespace bpm {

// Fixed layout under a store root:
//   <root>/<repo>/packages.json   repository manifest
//   <root>/installed.json         installed-state document
//   <root>/installed.json.lock    lock guarding the document
//   <root>/bins/                  flat binary directory
//   <root>/packages.db            binary catalog
inline constexpr std::string_view kManifestFileName = "packages.json";
inline constexpr std::string_view kInstalledDbFileName = "installed.json";
inline constexpr std::string_view kBinDirName = "bins";
inline constexpr std::string_view kCatalogFileName = "packages.db";
inline constexpr std::string_view kLockSuffix = ".lock";

inline std::filesystem::path ManifestPath(const std::filesystem::path& store_root,
                                          std::string_view repo) {
    return store_root / repo / kManifestFileName;
}

inline std::filesystem::path InstalledDbPath(const std::filesystem::path& store_root) {
    return store_root / kInstalledDbFileName;
}

inline std::filesystem::path LockPathFor(const std::filesystem::path& document) {
    std::filesystem::path p = document;
    p += kLockSuffix;
    return p;
}

inline std::filesystem::path BinDir(const std::filesystem::path& store_root) {
    return store_root / kBinDirName;
}

inline std::filesystem::path CatalogPath(const std::filesystem::path& store_root) {
    return store_root / kCatalogFileName;
}

} // namespace bpm
