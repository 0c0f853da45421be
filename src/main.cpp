#include "bpm/pkg/binary_catalog.hpp"
#include "bpm/pkg/package_manager.hpp"
#include "bpm/pkg/package_ref.hpp"
#include "bpm/pkg/progress_sinks.hpp"
#include "bpm/pkg/store_paths.hpp"
#include "bpm/system/signals.hpp"
#include "bpm/util/config_parser.hpp"
#include "bpm/util/logger.hpp"

#include <cstdio>
#include <filesystem>
#include <getopt.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

constexpr const char *kBpmVersion = "0.1.2";

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [options] install <repo:package[:version]>\n"
        "   %s [options] remove <package>\n"
        "   %s [options] update <repo:package>\n"
        "   %s [options] list\n"
        "   %s [options] catalog\n"
        "   %s version\n"
        "\n"
        "Options:\n"
        "  -c, --config <file>    Config file (default %s)\n"
        "  -s, --store <dir>      Store root, overrides StoreRoot from the config\n"
        "  -q, --quiet            No progress output\n"
        "  -v, --verbose          Debug logging\n"
        "  -V, --version          Print version\n"
        "  -h, --help             Show this help\n",
        argv, argv, argv, argv, argv, argv, bpm::config::kDefaultConfigPath);
}

int ReportFailure(const bpm::Result &r) {
    std::fprintf(stderr, "ERROR: [%s] %s\n", bpm::ToString(r.code), r.msg.c_str());
    return 1;
}

void PrintInstallSummary(const bpm::InstallReport &report) {
    for (const auto &f : report.cycles) {
        std::printf("Circular dependency detected at %s (branch skipped)\n", f.subject.c_str());
    }
    for (const auto &f : report.copy_failures) {
        std::printf("Could not copy %s: %s\n", f.subject.c_str(), f.result.msg.c_str());
    }
    for (const auto &f : report.catalog_failures) {
        std::printf("Not catalogued %s: %s\n", f.subject.c_str(), f.result.msg.c_str());
    }
    for (const auto &key : report.installed) {
        std::printf("Installed %s\n", key.c_str());
    }
}

int CmdList(const bpm::PackageManager &pm, const std::filesystem::path &store_root) {
    bpm::InstalledState state;
    if (auto r = pm.ListInstalled(store_root, state); !r.is_ok()) {
        return ReportFailure(r);
    }
    if (state.Empty()) {
        std::printf("No packages installed.\n");
        return 0;
    }
    std::printf("Installed packages:\n");
    for (const auto &[name, rec] : state.Records()) {
        std::printf("%s (%s) from %s\n", name.c_str(), rec.version.c_str(), rec.repo.c_str());
        for (const auto &bin : rec.binaries) {
            std::printf("    %s\n", bin.c_str());
        }
    }
    return 0;
}

int CmdCatalog(const std::filesystem::path &store_root) {
    std::vector<bpm::CatalogEntry> entries;
    if (auto r = bpm::TarCatalog::List(bpm::CatalogPath(store_root).string(), entries); !r.is_ok()) {
        return ReportFailure(r);
    }
    if (entries.empty()) {
        std::printf("Catalog is empty.\n");
        return 0;
    }
    for (const auto &e : entries) {
        std::printf("%-32s %12llu  %s\n",
                    e.name.c_str(),
                    (unsigned long long)e.size,
                    e.sha256.c_str());
    }
    return 0;
}

} // namespace

int main(int argc, char **argv) {
    bpm::InstallSignalHandlers();

    std::string config_path = bpm::config::kDefaultConfigPath;
    const char *store_cli = nullptr;
    bool quiet = false;
    bool verbose = false;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"store", required_argument, nullptr, 's'},
        {"quiet", no_argument, nullptr, 'q'},
        {"verbose", no_argument, nullptr, 'v'},
        {"version", no_argument, nullptr, 'V'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "+c:s:qvVh", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'V':
                std::printf("bpm ver: %s\n", kBpmVersion);
                return 0;

            case 'c':
                config_path = optarg;
                break;

            case 's':
                store_cli = optarg;
                break;

            case 'q':
                quiet = true;
                break;

            case 'v':
                verbose = true;
                break;

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (optind >= argc) {
        PrintUsage(argv[0]);
        return 2;
    }
    const std::string command = argv[optind];
    const int nargs = argc - optind - 1;
    char **args = argv + optind + 1;

    if (command == "help") {
        PrintUsage(argv[0]);
        return 0;
    }
    if (command == "version") {
        std::printf("bpm ver: %s\n", kBpmVersion);
        return 0;
    }

    bpm::config::BpmConfigFromFile cfg;
    std::error_code ec;
    if (std::filesystem::exists(config_path, ec)) {
        if (auto r = cfg.LoadFile(config_path); !r.is_ok()) {
            std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
            return 1;
        }
    } else if (!store_cli) {
        std::fprintf(stderr, "ERROR: cannot load config: %s\n", config_path.c_str());
        return 1;
    }

    if (cfg.log_level) {
        bpm::Logger::Instance().SetLevel(*cfg.log_level);
    }
    if (verbose) {
        bpm::Logger::Instance().SetLevel(bpm::LogLevel::Debug);
    }

    const std::filesystem::path store_root = store_cli ? std::filesystem::path(store_cli)
                                                       : std::filesystem::path(cfg.store_root);
    if (store_root.empty()) {
        std::fprintf(stderr, "ERROR: no store root (set StoreRoot in %s or pass --store)\n",
                     config_path.c_str());
        return 1;
    }

    std::unique_ptr<bpm::ConsoleProgressSink> console_sink;
    std::unique_ptr<bpm::FileProgressSink> file_sink;
    if (!quiet && cfg.progress.value_or(true)) {
        console_sink = std::make_unique<bpm::ConsoleProgressSink>();
    }
    if (cfg.progress_file && !cfg.progress_file->empty()) {
        file_sink = std::make_unique<bpm::FileProgressSink>(*cfg.progress_file);
    }
    bpm::TeeProgressSink progress({console_sink.get(), file_sink.get()});

    bpm::TarCatalog catalog;

    bpm::PackageManager::Options opt;
    opt.progress_sink = &progress;
    opt.catalog_sink = cfg.catalog.value_or(true) ? &catalog : nullptr;
    opt.cancel = &bpm::g_cancel;
    bpm::PackageManager pm(opt);

    if (command == "install") {
        if (nargs != 1) {
            std::fprintf(stderr, "Usage: %s install <repo:package[:version]>\n", argv[0]);
            return 2;
        }
        auto ref = bpm::ParsePackageRef(args[0]);
        if (!ref) {
            std::fprintf(stderr, "ERROR: %s\n", ref.error().c_str());
            return 2;
        }
        bpm::InstallReport report;
        auto r = pm.Install(store_root, ref->repo, ref->package, ref->version, report);
        PrintInstallSummary(report);
        return r.is_ok() ? 0 : ReportFailure(r);
    }

    if (command == "remove") {
        if (nargs != 1) {
            std::fprintf(stderr, "Usage: %s remove <package>\n", argv[0]);
            return 2;
        }
        bpm::RemoveReport report;
        auto r = pm.Remove(store_root, args[0], report);
        if (!r.is_ok()) return ReportFailure(r);
        for (const auto &f : report.delete_failures) {
            std::printf("Could not delete %s: %s\n", f.subject.c_str(), f.result.msg.c_str());
        }
        if (report.was_installed) {
            std::printf("Removed package %s\n", args[0]);
        } else {
            std::printf("Package %s is not installed.\n", args[0]);
        }
        return 0;
    }

    if (command == "update") {
        if (nargs != 1) {
            std::fprintf(stderr, "Usage: %s update <repo:package>\n", argv[0]);
            return 2;
        }
        auto ref = bpm::ParsePackageRef(args[0]);
        if (!ref) {
            std::fprintf(stderr, "ERROR: %s\n", ref.error().c_str());
            return 2;
        }
        if (ref->version) {
            std::fprintf(stderr, "ERROR: update always installs the latest version; drop ':%s'\n",
                         ref->version->c_str());
            return 2;
        }
        bpm::UpdateReport report;
        auto r = pm.Update(store_root, ref->repo, ref->package, report);
        PrintInstallSummary(report.installed);
        return r.is_ok() ? 0 : ReportFailure(r);
    }

    if (command == "list") {
        return CmdList(pm, store_root);
    }

    if (command == "catalog") {
        return CmdCatalog(store_root);
    }

    std::fprintf(stderr, "Unknown command '%s'\n", command.c_str());
    PrintUsage(argv[0]);
    return 2;
}
