#include "pack/pack_assembler.hpp"

#include "crypto/digesting_writer.hpp"
#include "io/file_writer.hpp"
#include "pack/archive_handle.hpp"
#include "pack/archive_writer.hpp"
#include "pack/firmware_support.hpp"
#include "pack/install_tracker.hpp"
#include "pack/pack_metadata.hpp"
#include "pack/step_processor.hpp"
#include "pack/target_root_lock.hpp"
#include "pack/version_resolver.hpp"
#include "util/logger.hpp"
#include "util/time_utils.hpp"
#include "util/version.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <optional>
#include <thread>
#include <unordered_set>

namespace packsmith {

namespace {

namespace fs = std::filesystem;

// mkdtemp-backed scratch area removed with everything below it.
class WorkDir {
  public:
    WorkDir() = default;
    WorkDir(const WorkDir&) = delete;
    WorkDir& operator=(const WorkDir&) = delete;

    ~WorkDir() {
        if (path_.empty()) return;
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec) LogWarn("could not remove work directory %s: %s", path_.c_str(), ec.message().c_str());
    }

    Result Create() {
        std::error_code ec;
        fs::path base = fs::temp_directory_path(ec);
        if (ec) base = "/tmp";
        std::string tpl = (base / "packsmith-XXXXXX").string();
        if (!::mkdtemp(tpl.data())) {
            const int e = errno;
            return Result::Fail(ErrorKindFromErrno(e), "mkdtemp failed: " + std::string(std::strerror(e)), e);
        }
        path_ = tpl;
        return Result::Ok();
    }

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
};

ComponentFailure MakeFailure(const std::string& id, const Result& r, std::string action,
                             std::vector<std::string> partial = {}) {
    ComponentFailure f;
    f.component_id = id;
    f.kind = r.kind;
    f.action = std::move(action);
    f.message = r.message();
    f.partial_paths = std::move(partial);
    return f;
}

void LogFailure(const ComponentFailure& f) {
    LogError("%s: %s failed (%.*s): %s", f.component_id.c_str(), f.action.c_str(),
             (int)ErrorKindName(f.kind).size(), ErrorKindName(f.kind).data(), f.message.c_str());
    if (!f.partial_paths.empty()) {
        LogError("%s: %zu files were written before the failure", f.component_id.c_str(), f.partial_paths.size());
    }
}

// Directories below root, relative to it.
std::unordered_set<std::string> ListDirectories(const std::string& root) {
    std::unordered_set<std::string> dirs;
    std::error_code ec;
    for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_directory(ec)) dirs.insert(fs::relative(it->path(), root, ec).string());
    }
    return dirs;
}

// Removes what a failed component left in the staging tree so the pack never
// ships files its manifest does not list. Paths the skeleton or an earlier
// component placed are kept, as are directories that existed before.
void DiscardStaged(const std::string& staging,
                   const std::vector<std::string>& written,
                   const std::unordered_set<std::string>& keep,
                   const std::unordered_set<std::string>& dirs_before) {
    size_t removed = 0;
    for (const auto& rel : written) {
        if (keep.count(rel)) {
            LogWarn("%s was overwritten by a failed component", rel.c_str());
            continue;
        }
        std::error_code ec;
        fs::remove_all(fs::path(staging) / rel, ec);
        if (ec) {
            LogWarn("cannot discard staged %s: %s", rel.c_str(), ec.message().c_str());
            continue;
        }
        ++removed;

        for (fs::path dir = fs::path(rel).parent_path(); !dir.empty(); dir = dir.parent_path()) {
            if (dirs_before.count(dir.string())) break;
            const fs::path abs = fs::path(staging) / dir;
            if (!fs::is_directory(abs, ec) || !fs::is_empty(abs, ec) || ec) break;
            if (!fs::remove(abs, ec) || ec) break;
        }
    }
    if (removed > 0) LogInfo("Discarded %zu staged files of the failed component", removed);
}

} // namespace

struct PackAssembler::Fetched {
    struct Asset {
        ResolvedAsset resolved;
        std::string path;
        std::string sha256;
    };

    bool ok = false;
    bool from_cache = false;
    std::vector<Asset> assets; // one per AssetRecipes() entry
    std::optional<ComponentFailure> failure;
};

PackAssembler::PackAssembler(ComponentRegistry& registry,
                             IDownloader& downloader,
                             IReleaseIndex& releases,
                             const PipelineConfig& cfg,
                             IProgress* progress)
    : registry_(registry), downloader_(downloader), releases_(releases), cfg_(cfg), progress_(progress) {}

void PackAssembler::FetchOne(const ComponentDefinition& def,
                             const std::string& download_dir,
                             size_t index,
                             Fetched& out) const {
    VersionResolver resolver(releases_, cfg_.resolve_mode);

    std::vector<ResolvedAsset> resolved;
    Result res;
    if (def.assets.empty()) {
        ResolvedAsset one;
        res = resolver.Resolve(def.source, def.pinned_version, one);
        if (res.is_ok()) resolved.push_back(std::move(one));
    } else {
        std::vector<std::string> patterns;
        for (const auto& recipe : def.assets) patterns.push_back(recipe.pattern);
        res = resolver.ResolveAssets(std::get<ReleaseSource>(def.source), patterns, def.pinned_version, resolved);
    }

    if (!res.is_ok()) {
        // The cache holds a single asset, so only single-asset components fall back.
        if (cfg_.resolve_mode == ResolveMode::BestEffort && def.resolved && def.assets.empty() &&
            res.kind != ErrorKind::Cancelled) {
            LogWarn("%s: resolution failed (%s), using cached %s %s",
                    def.id.c_str(), res.message().c_str(),
                    def.resolved->filename.c_str(), def.resolved->version.c_str());
            resolved = {*def.resolved};
            out.from_cache = true;
        } else {
            out.failure = MakeFailure(def.id, res, "resolve");
            return;
        }
    }

    for (size_t a = 0; a < resolved.size(); ++a) {
        Fetched::Asset fetched;
        fetched.resolved = resolved[a];
        fetched.path = (fs::path(download_dir) /
                        (std::to_string(index) + "-" + std::to_string(a) + "-" + fetched.resolved.filename)).string();

        FileWriter file;
        res = FileWriter::Open(fetched.path, file);
        if (!res.is_ok()) {
            out.failure = MakeFailure(def.id, res, "download");
            return;
        }

        FetchOptions opt = MakeFetchOptions(cfg_);
        opt.progress = progress_;
        opt.tag = def.id;

        DigestingWriter sink(file, DigestAlgorithm::Sha256);
        LogInfo("%s: downloading %s", def.id.c_str(), fetched.resolved.download_url.c_str());
        res = downloader_.Fetch(fetched.resolved.download_url, opt, sink);
        if (res.is_ok()) res = file.Close();
        if (!res.is_ok()) {
            out.failure = MakeFailure(def.id, res, "download");
            std::error_code ec;
            fs::remove(fetched.path, ec);
            return;
        }

        fetched.sha256 = sink.FinalHex();
        out.assets.push_back(std::move(fetched));
    }
    out.ok = true;
}

Result PackAssembler::SeedSkeleton(const std::string& skeleton,
                                   const std::string& staging,
                                   std::unordered_set<std::string>& placed) const {
    ArchiveHandle archive;
    auto res = ArchiveHandle::OpenFile(skeleton, "", archive);
    if (!res.is_ok()) return res;

    std::vector<std::string> written;
    res = archive.ExtractEach(
        [&](const ArchiveEntry& e) {
            placed.insert(e.path);
            return (fs::path(staging) / e.path).string();
        },
        written);
    if (res.is_ok()) LogInfo("Skeleton %s: %zu files", skeleton.c_str(), written.size());
    return res;
}

Result PackAssembler::Assemble(const std::vector<std::string>& ids, const AssembleOptions& opt, BuildResult& out) {
    out = BuildResult{};

    if (opt.mode == AssembleMode::ToTargetRoot && opt.target_root.empty()) {
        return Result::Fail(ErrorKind::DefinitionInvalid, "no target root given");
    }
    if (opt.mode == AssembleMode::ToArchive && opt.output_dir.empty()) {
        return Result::Fail(ErrorKind::DefinitionInvalid, "no output directory given");
    }

    WorkDir work;
    auto res = work.Create();
    if (!res.is_ok()) return res;

    const std::string download_dir = work.Path() + "/downloads";
    const std::string staging = work.Path() + "/staging";
    std::error_code ec;
    fs::create_directories(download_dir, ec);
    if (!ec) fs::create_directories(staging, ec);
    if (ec) return Result::Fail(ErrorKindFromErrno(ec.value()), "cannot create work area: " + ec.message());

    InstallTracker tracker;
    std::unordered_set<std::string> staged; // ToArchive: paths the pack already accounts for
    if (opt.mode == AssembleMode::ToTargetRoot) {
        res = InstallTracker::Open(opt.target_root, cfg_.state_dir, tracker);
        if (!res.is_ok()) return res;
    } else {
        const std::string skeleton = opt.skeleton_path.empty() ? cfg_.skeleton_path : opt.skeleton_path;
        if (!skeleton.empty()) {
            res = SeedSkeleton(skeleton, staging, staged);
            if (!res.is_ok()) LogWarn("Skeleton not applied: %s", res.message().c_str());
        }
    }

    // Resolve + download, bounded parallelism.
    std::vector<const ComponentDefinition*> defs(ids.size(), nullptr);
    std::vector<Fetched> fetched(ids.size());
    for (size_t i = 0; i < ids.size(); ++i) {
        defs[i] = registry_.Find(ids[i]);
        if (!defs[i]) {
            fetched[i].failure = MakeFailure(ids[i], Result::Fail(ErrorKind::NotFound, "unknown component id"), "resolve");
        }
    }

    std::atomic<size_t> next{0};
    auto worker = [&]() {
        while (true) {
            const size_t i = next.fetch_add(1);
            if (i >= ids.size()) return;
            if (!defs[i]) continue;
            if (cfg_.cancel && cfg_.cancel->load(std::memory_order_relaxed)) {
                fetched[i].failure = MakeFailure(ids[i], Result::Fail(ErrorKind::Cancelled, "cancelled"), "download");
                continue;
            }
            FetchOne(*defs[i], download_dir, i, fetched[i]);
        }
    };

    const unsigned workers = std::max(1u, std::min<unsigned>(cfg_.fetch_workers, static_cast<unsigned>(ids.size())));
    if (workers <= 1) {
        worker();
    } else {
        std::vector<std::thread> pool;
        pool.reserve(workers);
        for (unsigned w = 0; w < workers; ++w) pool.emplace_back(worker);
        for (auto& t : pool) t.join();
    }

    // Placement, one component at a time in selection order.
    const std::string root = opt.mode == AssembleMode::ToArchive ? staging : opt.target_root;
    StepProcessor processor(cfg_.cancel);

    for (size_t i = 0; i < ids.size(); ++i) {
        const std::string& id = ids[i];
        Fetched& f = fetched[i];

        if (!f.ok) {
            out.failures.push_back(*f.failure);
            LogFailure(out.failures.back());
            continue;
        }
        if (!f.from_cache) registry_.UpdateResolved(id, f.assets.front().resolved);

        const ComponentDefinition& def = *defs[i];
        const std::vector<AssetRecipe> recipes = AssetRecipes(def);
        const std::string& version = f.assets.front().resolved.version;

        StepReport report;
        res = Result::Ok();
        {
            TargetRootLock lock(root);
            std::unordered_set<std::string> dirs_before;
            if (opt.mode == AssembleMode::ToArchive) dirs_before = ListDirectories(staging);

            for (size_t a = 0; a < f.assets.size() && res.is_ok(); ++a) {
                const auto& asset = f.assets[a];
                LogInfo("%s: placing %s %s", id.c_str(), asset.resolved.filename.c_str(), version.c_str());

                ArchiveHandle archive;
                res = ArchiveHandle::OpenFile(asset.path, asset.resolved.filename, archive);
                if (!res.is_ok()) {
                    report.failed_action = "open";
                    break;
                }
                archive.SetCancelFlag(cfg_.cancel);
                res = processor.Apply(recipes[a].steps, archive, root, report);
            }

            if (res.is_ok() && opt.mode == AssembleMode::ToTargetRoot) {
                res = tracker.RecordInstall(id, report.written, version, def.name);
                if (!res.is_ok()) report.failed_action = "record_install";
            }
            if (!res.is_ok() && opt.mode == AssembleMode::ToArchive) {
                DiscardStaged(staging, report.written, staged, dirs_before);
            }
        }

        for (const auto& asset : f.assets) {
            std::error_code rm_ec;
            fs::remove(asset.path, rm_ec);
        }

        if (!res.is_ok()) {
            const std::string action = report.failed_action.empty() ? std::string("apply") : report.failed_action;
            out.failures.push_back(MakeFailure(id, res, action, report.written));
            LogFailure(out.failures.back());
            continue;
        }

        LogInfo("%s: %zu files placed", id.c_str(), report.written.size());
        ComponentBuild build;
        build.component_id = id;
        build.version = version;
        build.asset_sha256 = f.assets.front().sha256;
        for (const auto& asset : f.assets) build.assets.push_back(PackAssetInfo{asset.resolved.filename, asset.sha256});
        if (opt.mode == AssembleMode::ToArchive) staged.insert(report.written.begin(), report.written.end());
        build.files = std::move(report.written);
        out.components.push_back(std::move(build));
    }

    LogInfo("%zu of %zu components succeeded", out.components.size(), ids.size());

    if (opt.mode == AssembleMode::ToArchive) {
        if (out.components.empty()) {
            LogError("No component succeeded; pack not written");
            return Result::Ok();
        }
        return WritePack(opt, staging, out);
    }
    return Result::Ok();
}

Result PackAssembler::WritePack(const AssembleOptions& opt,
                                const std::string& staging,
                                BuildResult& out) const {
    std::vector<std::pair<std::string, std::string>> id_versions;
    for (const auto& c : out.components) id_versions.emplace_back(c.component_id, c.version);
    out.content_hash = ComputeContentHash(id_versions);

    const std::string base = PackBaseName(cfg_.pack_prefix, TodayUtc(), out.content_hash);

    PackManifest previous;
    bool have_previous = false;
    if (!opt.previous_manifest.empty()) {
        auto res = LoadPackManifest(opt.previous_manifest, previous);
        if (res.is_ok()) {
            have_previous = true;
        } else {
            LogWarn("Previous manifest ignored: %s", res.message().c_str());
        }
    }
    out.supported_firmware = SupportedFirmware(out, have_previous ? &previous : nullptr);

    PackManifest manifest;
    manifest.pack_name = base + ".zip";
    manifest.build_date = NowIso8601Utc();
    manifest.builder_version = kPackSmithVersion;
    manifest.supported_firmware = out.supported_firmware;
    manifest.content_hash = out.content_hash;
    for (const auto& c : out.components) {
        const ComponentDefinition* def = registry_.Find(c.component_id);
        PackComponentInfo info;
        info.id = c.component_id;
        info.name = def ? def->name : c.component_id;
        info.version = c.version;
        info.category = def ? def->category : std::string();
        info.source = def ? DescribeSource(def->source) : std::string();
        info.asset_sha256 = c.asset_sha256;
        info.assets = c.assets;
        info.files = c.files;
        manifest.components.push_back(std::move(info));
    }

    auto res = WriteFileAtomic(staging + "/" + kPackManifestName, SerializePackManifest(manifest));
    if (!res.is_ok()) return res;

    const std::string summary = RenderPackSummary(manifest, have_previous ? &previous : nullptr,
                                                  opt.comment, NowIso8601Utc());
    res = WriteFileAtomic(staging + "/" + base + ".txt", summary);
    if (!res.is_ok()) return res;

    std::error_code ec;
    fs::create_directories(opt.output_dir, ec);
    if (ec) {
        return Result::Fail(ErrorKindFromErrno(ec.value()),
                            "cannot create output directory " + opt.output_dir + ": " + ec.message());
    }

    out.pack_path = (fs::path(opt.output_dir) / manifest.pack_name).string();
    res = WriteZipFromDirectory(staging, out.pack_path);
    if (!res.is_ok()) {
        out.pack_path.clear();
        return res;
    }
    return Result::Ok();
}

std::string PackAssembler::SupportedFirmware(const BuildResult& build, const PackManifest* previous) const {
    const std::string inherited = previous ? previous->supported_firmware : std::string(kUnknownFirmware);

    auto it = std::find_if(build.components.begin(), build.components.end(),
                           [&](const ComponentBuild& c) { return c.component_id == cfg_.firmware_component; });
    if (it == build.components.end() || it->version.empty()) return inherited;
    const ComponentDefinition* def = registry_.Find(it->component_id);
    const auto* source = def ? std::get_if<ReleaseSource>(&def->source) : nullptr;
    if (!source) return inherited;

    std::string fw;
    auto res = LookupSupportedFirmware(releases_, *source, it->version, fw);
    if (!res.is_ok()) {
        LogWarn("%s: supported firmware not determined: %s", it->component_id.c_str(), res.message().c_str());
        return inherited;
    }
    if (fw == kUnknownFirmware) {
        LogWarn("%s %s: release notes name no firmware", it->component_id.c_str(), it->version.c_str());
        return inherited;
    }
    LogInfo("%s %s supports firmware up to %s", it->component_id.c_str(), it->version.c_str(), fw.c_str());
    return fw;
}

} // namespace packsmith
