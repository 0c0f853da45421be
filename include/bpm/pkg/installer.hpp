#pragma once

#include "bpm/pkg/binary_catalog.hpp"
#include "bpm/pkg/file_ops.hpp"
#include "bpm/pkg/installed_state.hpp"
#include "bpm/pkg/manifest.hpp"
#include "bpm/pkg/progress.hpp"
#include "bpm/util/result.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace bpm {

// A failure that was logged and skipped without aborting the operation.
struct SoftFailure {
    std::string subject;
    Result result;
};

// Soft outcomes of one top-level install, in the order they happened.
struct InstallReport {
    std::vector<std::string> installed;          // "package:version" of every node installed
    std::vector<std::string> skipped;            // dependencies found already installed
    std::vector<SoftFailure> cycles;             // "package:version", CycleDetected
    std::vector<SoftFailure> copy_failures;      // source path, BinaryCopyFailed
    std::vector<SoftFailure> catalog_failures;   // binary name, CatalogFailed
};

// Depth-first dependency installer. Dependencies of a node are installed
// before the node itself; a node is "in progress" from the moment its
// version is resolved until its own record is written, and meeting an
// in-progress node again cuts that branch as a cycle.
class Installer {
public:
    struct Options {
        IProgress* progress_sink = nullptr;
        ICatalogSink* catalog_sink = nullptr;
        // Checked before every node; set it to abort between steps.
        const std::atomic_bool* cancel = nullptr;
        std::shared_ptr<const IFileOps> file_ops;
    };

    Installer();
    explicit Installer(Options opt);

    Result Install(const std::filesystem::path& store_root,
                   const std::string& repo,
                   const std::string& package,
                   const std::optional<std::string>& version,
                   InstallReport& report) const;

private:
    struct Context {
        std::filesystem::path store_root;
        std::string repo;
        InstalledStateStore state;
        std::unordered_set<std::string> visited;
        InstallReport& report;
    };

    Result InstallNode(Context& ctx,
                       const std::string& package,
                       const std::optional<std::string>& version) const;

    Result InstallBinaries(Context& ctx,
                           const ResolvedPackage& pkg,
                           std::vector<std::string>& out_paths) const;

    Options opt_;
};

} // namespace bpm
