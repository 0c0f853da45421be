#include "bpm/pkg/package_manager.hpp"

#include "bpm/util/logger.hpp"

#include <utility>

namespace bpm {

PackageManager::PackageManager() : PackageManager(Options{}) {}

PackageManager::PackageManager(Options opt) : opt_(std::move(opt)), installer_(opt_) {
    if (!opt_.file_ops) opt_.file_ops = DefaultFileOps();
}

Result PackageManager::Install(const std::filesystem::path& store_root,
                               const std::string& repo,
                               const std::string& package,
                               const std::optional<std::string>& version,
                               InstallReport& report) const {
    return installer_.Install(store_root, repo, package, version, report);
}

Result PackageManager::Remove(const std::filesystem::path& store_root,
                              const std::string& package,
                              RemoveReport& report) const {
    report = RemoveReport{};
    if (store_root.empty()) return Result::Fail(Errc::InvalidArgument, "store root is empty");
    if (package.empty()) return Result::Fail(Errc::InvalidArgument, "package name is empty");

    InstalledStateStore store(store_root);
    auto result = store.Modify([&](InstalledState& state) {
        auto record = state.Remove(package);
        if (!record) {
            return false;
        }
        report.was_installed = true;
        report.record = std::move(*record);
        return true;
    });
    if (!result.is_ok()) {
        report = RemoveReport{};
        return result;
    }

    // Binaries go only once the record is gone from disk.
    for (const auto& bin : report.record.binaries) {
        auto rm = opt_.file_ops->RemoveFile(bin);
        if (rm.is_ok()) {
            report.deleted.push_back(bin);
        } else {
            LogWarn("Could not delete %s: %s", bin.c_str(), rm.msg.c_str());
            report.delete_failures.push_back(
                {bin, Result::Fail(Errc::BinaryDeleteFailed, rm.msg, rm.err)});
        }
    }

    if (report.was_installed) {
        LogInfo("Removed package %s", package.c_str());
    } else {
        LogInfo("Package %s is not installed.", package.c_str());
    }
    return Result::Ok();
}

Result PackageManager::Update(const std::filesystem::path& store_root,
                              const std::string& repo,
                              const std::string& package,
                              UpdateReport& report) const {
    report = UpdateReport{};

    auto removed = Remove(store_root, package, report.removed);
    if (!removed.is_ok())
        return removed;

    return Install(store_root, repo, package, std::nullopt, report.installed);
}

Result PackageManager::ListInstalled(const std::filesystem::path& store_root, InstalledState& out) const {
    if (store_root.empty()) return Result::Fail(Errc::InvalidArgument, "store root is empty");
    InstalledStateStore store(store_root);
    return store.Load(out);
}

} // namespace bpm
