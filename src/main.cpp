#include "net/curl_downloader.hpp"
#include "net/github_release_index.hpp"
#include "pack/component_registry.hpp"
#include "pack/install_tracker.hpp"
#include "pack/pack_assembler.hpp"
#include "pack/pack_installer.hpp"
#include "pack/progress_sinks.hpp"
#include "pack/version_resolver.hpp"
#include "system/signals.hpp"
#include "util/logger.hpp"
#include "util/pipeline_config.hpp"
#include "util/version.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <getopt.h>
#include <string>
#include <vector>

using namespace packsmith;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitPartial = 1;
constexpr int kExitUsage = 2;

void PrintUsage(const char* argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [-c <config>] [-v] <command> [options] [ids...]\n"
        "\n"
        "Commands:\n"
        "  list-components -r <registry>\n"
        "  resolve         -r <registry> [ids...]\n"
        "  build           -r <registry> -o <outdir> [--skeleton <zip>] [--previous <manifest|zip>]\n"
        "                  [--comment <text>] [--strict] [ids...]\n"
        "  install         -r <registry> -t <root> [--strict] ids...\n"
        "  install-pack    -t <root> <pack.zip>\n"
        "  trash           -t <root> ids...\n"
        "  restore         -t <root> ids...\n"
        "  purge           -t <root> ids...\n"
        "  list            -t <root> [--trash]\n"
        "\n"
        "Options:\n"
        "  -c, --config    JSON config (default $PACKSMITH_CONFIG or ~/.config/packsmith/config.json)\n"
        "  -v, --verbose   Debug logging\n"
        "  -h, --help      Show this help\n"
        "  -V, --version   Print the version\n",
        argv0);
}

struct CommandArgs {
    std::string registry;
    std::string target_root;
    std::string output_dir;
    std::string skeleton;
    std::string previous;
    std::string comment;
    bool strict = false;
    bool trash = false;
    std::vector<std::string> positional;
};

// Parses the options after the command name; argv[0] is the command.
bool ParseCommandArgs(int argc, char** argv, CommandArgs& out) {
    enum { kSkeleton = 1000, kPrevious, kComment, kStrict, kTrash };
    static option long_opts[] = {
        {"registry", required_argument, nullptr, 'r'},
        {"target", required_argument, nullptr, 't'},
        {"output", required_argument, nullptr, 'o'},
        {"skeleton", required_argument, nullptr, kSkeleton},
        {"previous", required_argument, nullptr, kPrevious},
        {"comment", required_argument, nullptr, kComment},
        {"strict", no_argument, nullptr, kStrict},
        {"trash", no_argument, nullptr, kTrash},
        {nullptr, 0, nullptr, 0},
    };

    optind = 0;
    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "r:t:o:", long_opts, &idx)) != -1) {
        switch (c) {
            case 'r': out.registry = optarg; break;
            case 't': out.target_root = optarg; break;
            case 'o': out.output_dir = optarg; break;
            case kSkeleton: out.skeleton = optarg; break;
            case kPrevious: out.previous = optarg; break;
            case kComment: out.comment = optarg; break;
            case kStrict: out.strict = true; break;
            case kTrash: out.trash = true; break;
            default: return false;
        }
    }
    for (int i = optind; i < argc; ++i) out.positional.emplace_back(argv[i]);
    return true;
}

std::string DefaultConfigPath() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return {};
    return std::string(home) + "/.config/packsmith/config.json";
}

bool LoadRegistry(const CommandArgs& args, ComponentRegistry& out) {
    if (args.registry.empty()) {
        std::fprintf(stderr, "ERROR: -r <registry> is required\n");
        return false;
    }
    auto res = ComponentRegistry::LoadFile(args.registry, out);
    if (!res.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", res.message().c_str());
        return false;
    }
    return true;
}

void SaveRegistry(const ComponentRegistry& registry, const std::string& path) {
    auto res = registry.SaveFile(path);
    if (!res.is_ok()) LogWarn("Resolution cache not saved: %s", res.message().c_str());
}

std::vector<std::string> SelectedIds(const CommandArgs& args, const ComponentRegistry& registry) {
    if (!args.positional.empty()) return args.positional;
    std::vector<std::string> ids;
    for (const auto& def : registry.All()) ids.push_back(def.id);
    return ids;
}

void PrintFailures(const std::vector<ComponentFailure>& failures) {
    for (const auto& f : failures) {
        const auto kind = ErrorKindName(f.kind);
        std::printf("FAILED  %-24s %.*s during %s: %s\n", f.component_id.c_str(),
                    (int)kind.size(), kind.data(), f.action.c_str(), f.message.c_str());
        for (const auto& p : f.partial_paths) std::printf("        partial: %s\n", p.c_str());
    }
}

int CmdListComponents(const CommandArgs& args) {
    ComponentRegistry registry;
    if (!LoadRegistry(args, registry)) return kExitUsage;

    for (const auto& def : registry.All()) {
        const std::string version = def.resolved ? def.resolved->version : std::string("-");
        std::printf("%-24s %-16s %-20s %s\n", def.id.c_str(), def.category.c_str(),
                    version.empty() ? "-" : version.c_str(), DescribeSource(def.source).c_str());
    }
    return kExitOk;
}

int CmdResolve(const CommandArgs& args, const PipelineConfig& cfg) {
    ComponentRegistry registry;
    if (!LoadRegistry(args, registry)) return kExitUsage;

    CurlDownloader downloader;
    GitHubReleaseIndex index(downloader, cfg);
    VersionResolver resolver(index, cfg.resolve_mode);

    size_t failed = 0;
    for (const auto& id : SelectedIds(args, registry)) {
        const ComponentDefinition* def = registry.Find(id);
        if (!def) {
            std::printf("FAILED  %-24s NotFound: unknown component id\n", id.c_str());
            ++failed;
            continue;
        }

        std::vector<ResolvedAsset> assets;
        Result res;
        if (def->assets.empty()) {
            assets.resize(1);
            res = resolver.Resolve(def->source, def->pinned_version, assets.front());
        } else {
            std::vector<std::string> patterns;
            for (const auto& recipe : def->assets) patterns.push_back(recipe.pattern);
            res = resolver.ResolveAssets(std::get<ReleaseSource>(def->source), patterns, def->pinned_version, assets);
        }
        if (!res.is_ok()) {
            const auto kind = ErrorKindName(res.kind);
            std::printf("FAILED  %-24s %.*s: %s\n", id.c_str(), (int)kind.size(), kind.data(), res.message().c_str());
            ++failed;
            continue;
        }
        registry.UpdateResolved(id, assets.front());
        for (const auto& asset : assets) {
            std::printf("%-24s %-20s %s\n", id.c_str(), asset.version.empty() ? "-" : asset.version.c_str(),
                        asset.filename.c_str());
        }
    }

    SaveRegistry(registry, args.registry);
    return failed ? kExitPartial : kExitOk;
}

int CmdAssemble(const CommandArgs& args, PipelineConfig cfg, AssembleMode mode) {
    ComponentRegistry registry;
    if (!LoadRegistry(args, registry)) return kExitUsage;

    AssembleOptions opt;
    opt.mode = mode;
    if (mode == AssembleMode::ToArchive) {
        if (args.output_dir.empty()) {
            std::fprintf(stderr, "ERROR: -o <outdir> is required\n");
            return kExitUsage;
        }
        opt.output_dir = args.output_dir;
        opt.skeleton_path = args.skeleton;
        opt.previous_manifest = args.previous;
        opt.comment = args.comment;
    } else {
        if (args.target_root.empty() || args.positional.empty()) {
            std::fprintf(stderr, "ERROR: install needs -t <root> and at least one id\n");
            return kExitUsage;
        }
        opt.target_root = args.target_root;
    }
    if (args.strict) cfg.resolve_mode = ResolveMode::Strict;

    CurlDownloader downloader;
    GitHubReleaseIndex index(downloader, cfg);
    ConsoleProgressSink progress;
    PackAssembler assembler(registry, downloader, index, cfg, cfg.progress ? &progress : nullptr);

    const auto ids = SelectedIds(args, registry);
    BuildResult result;
    auto res = assembler.Assemble(ids, opt, result);
    SaveRegistry(registry, args.registry);

    for (const auto& c : result.components) {
        std::printf("OK      %-24s %-20s %zu files\n", c.component_id.c_str(),
                    c.version.empty() ? "-" : c.version.c_str(), c.files.size());
    }
    PrintFailures(result.failures);

    if (!res.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", res.message().c_str());
        return kExitPartial;
    }
    if (!result.pack_path.empty()) {
        std::printf("Pack: %s (supported firmware: %s)\n", result.pack_path.c_str(),
                    result.supported_firmware.c_str());
    }
    std::printf("%zu of %zu components succeeded\n", result.components.size(), ids.size());
    return result.AllSucceeded() ? kExitOk : kExitPartial;
}

int CmdInstallPack(const CommandArgs& args, const PipelineConfig& cfg) {
    if (args.target_root.empty() || args.positional.size() != 1) {
        std::fprintf(stderr, "ERROR: install-pack needs -t <root> and one pack file\n");
        return kExitUsage;
    }

    PackInstaller installer(cfg);
    PackInstallReport report;
    auto res = installer.Install(args.positional.front(), args.target_root, report);
    if (!res.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", res.message().c_str());
        return kExitPartial;
    }

    std::printf("Installed %s: %zu files, %zu components recorded\n",
                report.pack_name.c_str(), report.files_written, report.recorded.size());
    for (const auto& name : report.removed_summaries) std::printf("Removed earlier summary %s\n", name.c_str());
    PrintFailures(report.failures);
    return report.failures.empty() ? kExitOk : kExitPartial;
}

int CmdTracker(const std::string& command, const CommandArgs& args, const PipelineConfig& cfg) {
    if (args.target_root.empty()) {
        std::fprintf(stderr, "ERROR: -t <root> is required\n");
        return kExitUsage;
    }
    if (command != "list" && args.positional.empty()) {
        std::fprintf(stderr, "ERROR: %s needs at least one id\n", command.c_str());
        return kExitUsage;
    }

    InstallTracker tracker;
    auto res = InstallTracker::Open(args.target_root, cfg.state_dir, tracker);
    if (!res.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", res.message().c_str());
        return kExitPartial;
    }

    if (command == "list") {
        if (args.trash) {
            for (const auto& snap : tracker.ListSnapshots()) {
                std::printf("%-24s %-20s trashed %s\n", snap.entry.component_id.c_str(),
                            snap.entry.version.empty() ? "-" : snap.entry.version.c_str(),
                            snap.generation.c_str());
            }
            for (const auto& rec : tracker.ListTrashed()) {
                std::printf("  %s%s\n", rec.original_relative_path.c_str(), rec.missing ? " (missing)" : "");
            }
        } else {
            for (const auto& e : tracker.ListInstalled()) {
                std::printf("%-24s %-20s %-22s %zu files\n", e.component_id.c_str(),
                            e.version.empty() ? "-" : e.version.c_str(), e.installed_at.c_str(),
                            e.owned_paths.size());
            }
        }
        return kExitOk;
    }

    std::vector<ComponentOpResult> results;
    if (command == "trash") {
        results = tracker.MoveToTrash(args.positional);
    } else if (command == "restore") {
        results = tracker.Restore(args.positional);
    } else {
        results = tracker.Purge(args.positional);
    }

    size_t failed = 0;
    for (const auto& r : results) {
        if (r.result.is_ok()) {
            std::printf("OK      %-24s %zu files\n", r.component_id.c_str(), r.moved);
            continue;
        }
        ++failed;
        const auto kind = ErrorKindName(r.result.kind);
        std::printf("FAILED  %-24s %.*s: %s\n", r.component_id.c_str(), (int)kind.size(), kind.data(),
                    r.result.message().c_str());
    }
    return failed ? kExitPartial : kExitOk;
}

} // namespace

int main(int argc, char** argv) {
    InstallSignalHandlers();

    std::string config_path;
    bool config_explicit = false;
    bool verbose = false;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'V'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "+c:vhV", long_opts, &idx)) != -1) {
        switch (c) {
            case 'c':
                config_path = optarg;
                config_explicit = true;
                break;

            case 'v':
                verbose = true;
                break;

            case 'h':
                PrintUsage(argv[0]);
                return kExitOk;

            case 'V':
                std::printf("packsmith %s\n", kPackSmithVersion);
                return kExitOk;

            default:
                PrintUsage(argv[0]);
                return kExitUsage;
        }
    }

    if (optind >= argc) {
        PrintUsage(argv[0]);
        return kExitUsage;
    }

    if (config_path.empty()) {
        if (const char* env = std::getenv("PACKSMITH_CONFIG"); env && *env) {
            config_path = env;
            config_explicit = true;
        } else {
            config_path = DefaultConfigPath();
        }
    }

    PipelineConfig cfg;
    cfg.cancel = &g_cancel;

    if (!config_path.empty() && (config_explicit || std::filesystem::exists(config_path))) {
        config::PipelineConfigFromFile file_cfg;
        if (!file_cfg.LoadFile(config_path)) {
            std::fprintf(stderr, "ERROR: cannot load config: %s\n", config_path.c_str());
            return kExitUsage;
        }
        file_cfg.ApplyTo(cfg);
        if (file_cfg.log_level) Logger::Instance().SetLevel(*file_cfg.log_level);
    }
    if (verbose) Logger::Instance().SetLevel(LogLevel::Debug);

    const std::string command = argv[optind];
    CommandArgs args;
    if (!ParseCommandArgs(argc - optind, argv + optind, args)) {
        PrintUsage(argv[0]);
        return kExitUsage;
    }

    if (command == "list-components") return CmdListComponents(args);
    if (command == "resolve") return CmdResolve(args, cfg);
    if (command == "build") return CmdAssemble(args, cfg, AssembleMode::ToArchive);
    if (command == "install") return CmdAssemble(args, cfg, AssembleMode::ToTargetRoot);
    if (command == "install-pack") return CmdInstallPack(args, cfg);
    if (command == "trash" || command == "restore" || command == "purge" || command == "list") {
        return CmdTracker(command, args, cfg);
    }

    std::fprintf(stderr, "Unknown command: %s\n", command.c_str());
    PrintUsage(argv[0]);
    return kExitUsage;
}
