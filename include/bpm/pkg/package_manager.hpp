#pragma once

#include "bpm/pkg/installed_state.hpp"
#include "bpm/pkg/installer.hpp"
#include "bpm/util/result.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace bpm {

struct RemoveReport {
    bool was_installed = false;
    InstalledRecord record;                    // the record that was dropped
    std::vector<std::string> deleted;          // binaries unlinked
    std::vector<SoftFailure> delete_failures;  // binary path, BinaryDeleteFailed
};

struct UpdateReport {
    RemoveReport removed;
    InstallReport installed;
};

// Entry points over one store root. Every operation takes the store root
// explicitly and reads on-disk state afresh.
class PackageManager {
public:
    using Options = Installer::Options;

    PackageManager();
    explicit PackageManager(Options opt);

    Result Install(const std::filesystem::path& store_root,
                   const std::string& repo,
                   const std::string& package,
                   const std::optional<std::string>& version,
                   InstallReport& report) const;

    // Removing a package that is not installed succeeds with
    // report.was_installed == false.
    Result Remove(const std::filesystem::path& store_root,
                  const std::string& package,
                  RemoveReport& report) const;

    // Remove followed by an unpinned Install. Not atomic across the pair.
    Result Update(const std::filesystem::path& store_root,
                  const std::string& repo,
                  const std::string& package,
                  UpdateReport& report) const;

    Result ListInstalled(const std::filesystem::path& store_root, InstalledState& out) const;

private:
    Options opt_;
    Installer installer_;
};

} // namespace bpm
