#include "bpm/pkg/installer.hpp"

#include "bpm/pkg/package_ref.hpp"
#include "bpm/pkg/store_paths.hpp"
#include "bpm/util/logger.hpp"

#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace bpm {

namespace {

// Marks a node in progress for the lifetime of the guard.
class VisitGuard final {
public:
    VisitGuard(std::unordered_set<std::string>& visited, std::string key)
        : visited_(visited), key_(std::move(key)) {
        visited_.insert(key_);
    }
    VisitGuard(const VisitGuard&) = delete;
    VisitGuard& operator=(const VisitGuard&) = delete;
    ~VisitGuard() { visited_.erase(key_); }

private:
    std::unordered_set<std::string>& visited_;
    std::string key_;
};

} // namespace

Installer::Installer() : Installer(Options{}) {}

Installer::Installer(Options opt) : opt_(std::move(opt)) {
    if (!opt_.file_ops) opt_.file_ops = DefaultFileOps();
}

Result Installer::Install(const fs::path& store_root,
                          const std::string& repo,
                          const std::string& package,
                          const std::optional<std::string>& version,
                          InstallReport& report) const {
    report = InstallReport{};
    if (store_root.empty()) return Result::Fail(Errc::InvalidArgument, "store root is empty");
    if (repo.empty()) return Result::Fail(Errc::InvalidArgument, "repository name is empty");
    if (package.empty()) return Result::Fail(Errc::InvalidArgument, "package name is empty");

    std::error_code ec;
    fs::path root = fs::absolute(store_root, ec);
    if (ec) {
        return Result::Fail(Errc::InvalidArgument,
                            "cannot resolve store root " + store_root.string() + ": " + ec.message(),
                            ec.value());
    }

    Context ctx{
        .store_root = root,
        .repo = repo,
        .state = InstalledStateStore(root),
        .visited = {},
        .report = report,
    };

    LogInfo("Install %s:%s%s%s",
            repo.c_str(),
            package.c_str(),
            version ? ":" : "",
            version ? version->c_str() : "");
    return InstallNode(ctx, package, version);
}

Result Installer::InstallNode(Context& ctx,
                              const std::string& package,
                              const std::optional<std::string>& version) const {
    if (opt_.cancel && opt_.cancel->load(std::memory_order_relaxed)) {
        return Result::Fail(Errc::Cancelled, "install cancelled before " + package);
    }

    Manifest manifest;
    auto load_result = ManifestHandler::Load(ctx.store_root, ctx.repo, manifest);
    if (!load_result.is_ok())
        return load_result;

    ResolvedPackage pkg;
    auto resolve_result = ManifestHandler::Resolve(manifest, package, version, pkg);
    if (!resolve_result.is_ok()) {
        resolve_result.msg += " in repo '" + ctx.repo + "'";
        return resolve_result;
    }

    const std::string key = MakeNodeKey(pkg.name, pkg.version);
    if (ctx.visited.contains(key)) {
        LogWarn("Circular dependency detected at %s, skipping this branch", key.c_str());
        ctx.report.cycles.push_back(
            {key, Result::Fail(Errc::CycleDetected, "circular dependency at " + key)});
        return Result::Ok();
    }
    VisitGuard in_progress(ctx.visited, key);

    for (const auto& dep_text : pkg.spec.dependencies) {
        auto parsed = ParseDependencyRef(dep_text);
        if (!parsed) {
            return Result::Fail(Errc::ManifestMalformed, parsed.error() + " in " + key);
        }
        const DependencyRef& dep = *parsed;

        // Satisfied by name alone; the installed version is not compared.
        InstalledState state;
        auto state_result = ctx.state.Load(state);
        if (!state_result.is_ok())
            return state_result;

        if (state.Contains(dep.name)) {
            LogInfo("Dependency %s already installed.", dep.name.c_str());
            ctx.report.skipped.push_back(dep.name);
            continue;
        }

        LogInfo("Installing dependency %s of %s...", dep.name.c_str(), key.c_str());
        auto dep_result = InstallNode(ctx, dep.name, dep.version);
        if (!dep_result.is_ok())
            return dep_result;
    }

    std::vector<std::string> installed_paths;
    auto bin_result = InstallBinaries(ctx, pkg, installed_paths);
    if (!bin_result.is_ok())
        return bin_result;

    InstalledRecord record{
        .repo = ctx.repo,
        .version = pkg.version,
        .binaries = std::move(installed_paths),
    };
    auto save_result = ctx.state.Modify([&](InstalledState& state) {
        state.Insert(pkg.name, record);
        return true;
    });
    if (!save_result.is_ok()) {
        // No record points at these copies; drop them.
        for (const auto& path : record.binaries) {
            auto rm = opt_.file_ops->RemoveFile(path);
            if (!rm.is_ok()) {
                LogWarn("Could not clean up %s: %s", path.c_str(), rm.msg.c_str());
            }
        }
        return save_result;
    }

    ctx.report.installed.push_back(key);
    LogInfo("Installed %s (%zu binaries)", key.c_str(), record.binaries.size());
    return Result::Ok();
}

Result Installer::InstallBinaries(Context& ctx,
                                  const ResolvedPackage& pkg,
                                  std::vector<std::string>& out_paths) const {
    out_paths.clear();

    const fs::path bins_dir = BinDir(ctx.store_root);
    auto mk = opt_.file_ops->CreateDirectories(bins_dir.string());
    if (!mk.is_ok())
        return mk;

    const std::string catalog_path = CatalogPath(ctx.store_root).string();

    if (opt_.progress_sink) {
        opt_.progress_sink->Begin(pkg.spec.binaries.size(), "Installing " + pkg.name);
    }

    for (const auto& bin : pkg.spec.binaries) {
        const fs::path src = fs::path(pkg.spec.path) / bin;
        const fs::path filename = fs::path(bin).filename();

        if (filename.empty()) {
            LogWarn("Binary entry '%s' of %s has no file name, skipped", bin.c_str(), pkg.name.c_str());
            ctx.report.copy_failures.push_back(
                {src.string(), Result::Fail(Errc::BinaryCopyFailed, "binary entry '" + bin + "' has no file name")});
            if (opt_.progress_sink) opt_.progress_sink->Advance(1);
            continue;
        }

        const fs::path dest = bins_dir / filename;
        auto copy_result = opt_.file_ops->CopyFile(src.string(), dest.string());
        if (!copy_result.is_ok()) {
            LogWarn("Copy %s -> %s failed: %s",
                    src.c_str(), dest.c_str(), copy_result.msg.c_str());
            ctx.report.copy_failures.push_back(
                {src.string(), Result::Fail(Errc::BinaryCopyFailed, copy_result.msg, copy_result.err)});
            if (opt_.progress_sink) opt_.progress_sink->Advance(1);
            continue;
        }
        LogDebug("Copied %s -> %s", src.c_str(), dest.c_str());
        out_paths.push_back(dest.string());

        if (opt_.catalog_sink) {
            std::vector<std::uint8_t> bytes;
            auto read_result = opt_.file_ops->ReadFile(dest.string(), bytes);
            if (!read_result.is_ok()) {
                LogWarn("Cannot read back %s for the catalog: %s", dest.c_str(), read_result.msg.c_str());
                ctx.report.catalog_failures.push_back(
                    {filename.string(), Result::Fail(Errc::CatalogFailed, read_result.msg, read_result.err)});
            } else {
                auto rec = opt_.catalog_sink->Record(catalog_path, filename.string(), bytes);
                if (!rec.is_ok()) {
                    LogWarn("Catalog record of %s failed: %s", filename.c_str(), rec.msg.c_str());
                    ctx.report.catalog_failures.push_back(
                        {filename.string(), Result::Fail(Errc::CatalogFailed, rec.msg, rec.err)});
                }
            }
        }

        if (opt_.progress_sink) opt_.progress_sink->Advance(1);
    }

    if (opt_.progress_sink) {
        opt_.progress_sink->Finish("Installed " + pkg.name + " successfully!");
    }
    return Result::Ok();
}

} // namespace bpm
