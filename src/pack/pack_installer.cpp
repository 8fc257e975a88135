#include "pack/pack_installer.hpp"

#include "pack/archive_handle.hpp"
#include "pack/archive_path_policy.hpp"
#include "pack/install_tracker.hpp"
#include "pack/pack_metadata.hpp"
#include "pack/target_root_lock.hpp"
#include "util/glob.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <filesystem>
#include <unordered_map>
#include <unordered_set>

namespace packsmith {

namespace {

namespace fs = std::filesystem;

// Summaries of earlier packs ("<prefix>-*.txt" at the root) describe what is
// no longer installed. Removal failures are logged, not fatal.
void RemoveEarlierSummaries(const std::string& target_root,
                            const std::string& prefix,
                            const std::string& keep,
                            std::vector<std::string>& removed) {
    const std::string pattern = prefix + "-*.txt";
    std::error_code ec;
    for (fs::directory_iterator it(target_root, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (name == keep || !GlobMatch(pattern, name)) continue;
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec) || it->is_symlink(type_ec)) continue;

        std::error_code rm_ec;
        if (!fs::remove(it->path(), rm_ec) || rm_ec) {
            LogWarn("cannot remove earlier summary %s: %s", name.c_str(), rm_ec.message().c_str());
            continue;
        }
        LogInfo("Removed earlier summary %s", name.c_str());
        removed.push_back(name);
    }
    if (ec) LogWarn("cannot scan %s for earlier summaries: %s", target_root.c_str(), ec.message().c_str());
}

} // namespace

Result PackInstaller::Install(const std::string& pack_path, const std::string& target_root, PackInstallReport& out) const {
    out = PackInstallReport{};

    ArchiveHandle pack;
    auto res = ArchiveHandle::OpenFile(pack_path, "", pack);
    if (!res.is_ok()) return res;
    pack.SetCancelFlag(cfg_.cancel);

    std::string text;
    res = pack.ReadEntry(kPackManifestName, text);
    if (!res.is_ok()) {
        if (res.kind == ErrorKind::NotFound) {
            return Result::Fail(ErrorKind::ManifestCorrupt, pack_path + " has no " + kPackManifestName);
        }
        return res;
    }
    auto manifest = ParsePackManifest(text);
    if (!manifest) return Result::Fail(ErrorKind::ManifestCorrupt, pack_path + ": " + manifest.error());
    out.pack_name = manifest->pack_name;

    InstallTracker tracker;
    res = InstallTracker::Open(target_root, cfg_.state_dir, tracker);
    if (!res.is_ok()) return res;

    TargetRootLock lock(target_root);

    const std::string summary = StemOf(out.pack_name) + ".txt";

    // Resolve every destination before the first write.
    std::unordered_map<std::string, std::string> dest_of;
    for (const auto& e : pack.Files()) {
        std::string abs;
        res = ArchivePathPolicy::ResolveUnderRoot(target_root, e.path, abs);
        if (!res.is_ok()) return res;
        dest_of.emplace(e.path, abs);
    }

    RemoveEarlierSummaries(target_root, cfg_.pack_prefix, summary, out.removed_summaries);

    std::unordered_set<std::string> extracted;
    std::vector<std::string> written;
    res = pack.ExtractEach(
        [&](const ArchiveEntry& e) -> std::string {
            if (e.is_directory) return {};
            auto it = dest_of.find(e.path);
            if (it == dest_of.end()) return {};
            extracted.insert(e.path);
            return it->second;
        },
        written);
    out.files_written = written.size();
    if (!res.is_ok()) return res;

    LogInfo("%s: %zu files extracted to %s", pack_path.c_str(), written.size(), target_root.c_str());

    for (const auto& comp : manifest->components) {
        std::vector<std::string> owned;
        for (const auto& f : comp.files) {
            const std::string rel = NormalizeRelPath(f);
            if (rel == kPackManifestName || rel == summary) continue;
            if (!extracted.count(rel)) {
                LogWarn("%s: %s listed in the manifest but not in the pack", comp.id.c_str(), rel.c_str());
                continue;
            }
            owned.push_back(rel);
        }

        res = tracker.RecordInstall(comp.id, owned, comp.version, comp.name);
        if (!res.is_ok()) {
            ComponentFailure f;
            f.component_id = comp.id;
            f.kind = res.kind;
            f.action = "record_install";
            f.message = res.message();
            out.failures.push_back(std::move(f));
            LogError("%s: %s", comp.id.c_str(), res.message().c_str());
            continue;
        }
        out.recorded.push_back(comp.id);
    }

    return Result::Ok();
}

} // namespace packsmith
