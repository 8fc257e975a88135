#include "pack/install_tracker.hpp"

#include "io/file_reader.hpp"
#include "io/file_writer.hpp"
#include "pack/archive_path_policy.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"
#include "util/time_utils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <unordered_set>

namespace packsmith {

namespace {

namespace fs = std::filesystem;

constexpr const char* kInstalledFile = "installed.json";
constexpr const char* kTrashFile = "trash.json";

bool PathPresent(const std::string& abs) {
    std::error_code ec;
    return fs::exists(fs::symlink_status(abs, ec));
}

Result MoveFile(const std::string& from, const std::string& to) {
    auto res = CreateParentDirs(to);
    if (!res.is_ok()) return res;
    if (std::rename(from.c_str(), to.c_str()) != 0) {
        const int e = errno;
        return Result::Fail(ErrorKindFromErrno(e),
                            "cannot move " + from + " to " + to + " (" + std::strerror(e) + ")", e);
    }
    return Result::Ok();
}

template <typename Loader>
Result LoadStateFile(const std::string& path, Loader&& load) {
    std::string text;
    auto res = ReadFileToString(path, text);
    if (!res.is_ok()) {
        if (res.kind == ErrorKind::NotFound) return Result::Ok();
        return res;
    }
    const std::string err = load(text);
    if (!err.empty()) {
        return Result::Fail(ErrorKind::ManifestCorrupt, path + " is corrupt: " + err);
    }
    return Result::Ok();
}

} // namespace

Result InstallTracker::Open(const std::string& target_root, const std::string& state_dir, InstallTracker& out) {
    InstallTracker t;
    t.root_ = target_root;

    auto res = ArchivePathPolicy::NormalizeDefinitionPath(state_dir, t.state_dir_);
    if (!res.is_ok()) return res;
    if (t.state_dir_.empty()) return Result::Fail(ErrorKind::DefinitionInvalid, "state directory must not be the target root");

    const std::string dir = t.StateDirPath();
    res = LoadStateFile(dir + "/" + kInstalledFile, [&](const std::string& text) -> std::string {
        auto parsed = ParseInstalledState(text);
        if (!parsed) return parsed.error();
        t.installed_ = std::move(*parsed);
        return {};
    });
    if (!res.is_ok()) return res;

    res = LoadStateFile(dir + "/" + kTrashFile, [&](const std::string& text) -> std::string {
        auto parsed = ParseTrashState(text);
        if (!parsed) return parsed.error();
        t.trash_ = std::move(*parsed);
        return {};
    });
    if (!res.is_ok()) return res;

    LogDebug("tracker %s: %zu installed, %zu trash records",
             dir.c_str(), t.installed_.components.size(), t.trash_.records.size());
    out = std::move(t);
    return Result::Ok();
}

std::string InstallTracker::StateDirPath() const {
    return Abs(state_dir_);
}

std::string InstallTracker::Abs(const std::string& rel) const {
    return (fs::path(root_) / rel).string();
}

const InstalledEntry* InstallTracker::FindInstalled(const std::string& component_id) const {
    for (const auto& e : installed_.components) {
        if (e.component_id == component_id) return &e;
    }
    return nullptr;
}

Result InstallTracker::SaveInstalled() const {
    const std::string path = StateDirPath() + "/" + kInstalledFile;
    auto res = CreateParentDirs(path);
    if (!res.is_ok()) return res;
    return WriteFileAtomic(path, SerializeInstalledState(installed_));
}

Result InstallTracker::SaveTrash() const {
    const std::string path = StateDirPath() + "/" + kTrashFile;
    auto res = CreateParentDirs(path);
    if (!res.is_ok()) return res;
    return WriteFileAtomic(path, SerializeTrashState(trash_));
}

Result InstallTracker::RemoveOwnedFile(const std::string& rel) const {
    const std::string abs = Abs(rel);
    std::error_code ec;
    if (!fs::exists(fs::symlink_status(abs, ec))) return Result::Ok();

    fs::remove(abs, ec);
    if (ec) {
        return Result::Fail(ErrorKindFromErrno(ec.value()), "cannot remove " + rel + ": " + ec.message(), ec.value());
    }
    return Result::Ok();
}

void InstallTracker::PruneEmptyParents(const std::string& rel) const {
    fs::path dir = fs::path(rel).parent_path();
    while (!dir.empty()) {
        const std::string abs = Abs(dir.string());
        std::error_code ec;
        if (!fs::is_directory(fs::symlink_status(abs, ec)) || !fs::is_empty(abs, ec) || ec) break;
        if (!fs::remove(abs, ec) || ec) break;
        dir = dir.parent_path();
    }
}

Result InstallTracker::RecordInstall(const std::string& component_id,
                                     const std::vector<std::string>& paths,
                                     const std::string& version,
                                     const std::string& name) {
    if (component_id.empty()) return Result::Fail(ErrorKind::DefinitionInvalid, "empty component id");

    std::vector<std::string> owned;
    std::unordered_set<std::string> seen;
    for (const auto& p : paths) {
        std::string rel;
        auto res = ArchivePathPolicy::NormalizeDefinitionPath(p, rel);
        if (!res.is_ok()) return res;
        if (rel.empty()) return Result::Fail(ErrorKind::UnsafeArchivePath, component_id + ": cannot own the target root");
        if (IsRelPathWithin(rel, state_dir_)) {
            return Result::Fail(ErrorKind::UnsafeArchivePath,
                                component_id + ": " + rel + " lies inside the tracker state directory");
        }
        if (seen.insert(rel).second) owned.push_back(rel);
    }

    auto it = std::find_if(installed_.components.begin(), installed_.components.end(),
                           [&](const InstalledEntry& e) { return e.component_id == component_id; });

    if (it != installed_.components.end()) {
        for (const auto& old : it->owned_paths) {
            if (seen.count(old)) continue;
            auto res = RemoveOwnedFile(old);
            if (!res.is_ok()) {
                LogWarn("%s: stale file not removed: %s", component_id.c_str(), res.message().c_str());
                continue;
            }
            LogDebug("%s: removed stale %s", component_id.c_str(), old.c_str());
            PruneEmptyParents(old);
        }
    }

    InstalledEntry entry;
    entry.component_id = component_id;
    entry.installed_at = NowIso8601Utc();
    entry.version = version;
    entry.name = name.empty() ? component_id : name;
    entry.owned_paths = std::move(owned);

    if (it != installed_.components.end()) {
        *it = std::move(entry);
    } else {
        installed_.components.push_back(std::move(entry));
    }
    return SaveInstalled();
}

Result InstallTracker::DropTrashGeneration(const std::string& id) {
    const std::string dir = Abs(JoinRelPath(state_dir_, "trash/" + id));
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        return Result::Fail(ErrorKindFromErrno(ec.value()), "cannot remove " + dir + ": " + ec.message(), ec.value());
    }

    std::erase_if(trash_.records, [&](const TrashRecord& r) { return r.component_id == id; });
    std::erase_if(trash_.snapshots, [&](const TrashSnapshot& s) { return s.entry.component_id == id; });
    return Result::Ok();
}

ComponentOpResult InstallTracker::TrashOne(const std::string& id) {
    ComponentOpResult out;
    out.component_id = id;

    auto it = std::find_if(installed_.components.begin(), installed_.components.end(),
                           [&](const InstalledEntry& e) { return e.component_id == id; });
    const bool in_trash = std::any_of(trash_.snapshots.begin(), trash_.snapshots.end(),
                                      [&](const TrashSnapshot& s) { return s.entry.component_id == id; });

    if (it == installed_.components.end()) {
        if (in_trash) {
            out.warnings.push_back("already in trash");
            return out;
        }
        out.result = Result::Fail(ErrorKind::NotFound, id + " is not installed");
        return out;
    }

    // A component still installed while it has trash records was only partly
    // moved before (or reinstalled since): the new moves join that generation.
    auto snap_it = std::find_if(trash_.snapshots.begin(), trash_.snapshots.end(),
                                [&](const TrashSnapshot& s) { return s.entry.component_id == id; });
    auto earlier_record = [&](const std::string& rel) {
        return std::find_if(trash_.records.begin(), trash_.records.end(), [&](const TrashRecord& r) {
            return r.component_id == id && r.original_relative_path == rel;
        });
    };
    for (const auto& rel : it->owned_paths) {
        auto rec_it = earlier_record(rel);
        if (rec_it != trash_.records.end() && !rec_it->missing && PathPresent(Abs(rec_it->trash_relative_path))) {
            out.result = Result::Fail(ErrorKind::RestoreConflict,
                                      id + ": trash already holds an earlier copy of " + rel +
                                          "; restore or purge it first");
            return out;
        }
    }
    // Records of paths that never reached the trash are superseded by this attempt.
    for (const auto& rel : it->owned_paths) {
        auto rec_it = earlier_record(rel);
        if (rec_it != trash_.records.end()) trash_.records.erase(rec_it);
    }

    const std::string generation =
        snap_it != trash_.snapshots.end() ? snap_it->generation : CompactUtcStamp();
    const std::string moved_at = NowIso8601Utc();
    const std::string trash_dir = JoinRelPath(state_dir_, "trash/" + id + "/" + generation);

    if (snap_it == trash_.snapshots.end()) {
        TrashSnapshot snapshot;
        snapshot.generation = generation;
        snapshot.entry = *it;
        trash_.snapshots.push_back(std::move(snapshot));
    } else {
        auto& owned = snap_it->entry.owned_paths;
        for (const auto& rel : it->owned_paths) {
            if (std::find(owned.begin(), owned.end(), rel) == owned.end()) owned.push_back(rel);
        }
        out.warnings.push_back("continuing trash generation " + generation);
    }

    Result failure;
    std::vector<std::string> remaining;
    for (const auto& rel : it->owned_paths) {
        if (!failure.is_ok()) {
            remaining.push_back(rel);
            continue;
        }

        TrashRecord rec;
        rec.component_id = id;
        rec.original_relative_path = rel;
        rec.trash_relative_path = JoinRelPath(trash_dir, rel);
        rec.moved_at = moved_at;
        rec.generation = generation;

        if (!PathPresent(Abs(rel))) {
            rec.missing = true;
            out.warnings.push_back("already missing: " + rel);
            trash_.records.push_back(std::move(rec));
            continue;
        }

        auto res = MoveFile(Abs(rel), Abs(rec.trash_relative_path));
        if (!res.is_ok()) {
            failure = res;
            remaining.push_back(rel);
            continue;
        }
        trash_.records.push_back(std::move(rec));
        ++out.moved;
        PruneEmptyParents(rel);
    }

    if (failure.is_ok()) {
        installed_.components.erase(it);
    } else {
        it->owned_paths = std::move(remaining);
    }

    auto saved = SaveTrash();
    if (saved.is_ok()) saved = SaveInstalled();

    if (!failure.is_ok()) {
        out.result = failure;
    } else if (!saved.is_ok()) {
        out.result = saved;
    }
    return out;
}

ComponentOpResult InstallTracker::RestoreOne(const std::string& id) {
    ComponentOpResult out;
    out.component_id = id;

    auto snap_it = std::find_if(trash_.snapshots.begin(), trash_.snapshots.end(),
                                [&](const TrashSnapshot& s) { return s.entry.component_id == id; });
    const bool has_records = std::any_of(trash_.records.begin(), trash_.records.end(),
                                         [&](const TrashRecord& r) { return r.component_id == id; });

    if (snap_it == trash_.snapshots.end() && !has_records) {
        if (FindInstalled(id)) {
            out.warnings.push_back("not in trash; nothing to restore");
            return out;
        }
        out.result = Result::Fail(ErrorKind::NotFound, id + " is not in the trash");
        return out;
    }

    Result failure;
    std::unordered_set<std::string> missing;
    std::vector<TrashRecord> kept;
    for (auto& rec : trash_.records) {
        if (rec.component_id != id) {
            kept.push_back(std::move(rec));
            continue;
        }
        if (rec.missing) {
            missing.insert(rec.original_relative_path);
            continue;
        }

        const std::string src = Abs(rec.trash_relative_path);
        const std::string dst = Abs(rec.original_relative_path);
        const bool src_present = PathPresent(src);
        const bool dst_present = PathPresent(dst);

        if (!src_present) {
            out.warnings.push_back(std::string(dst_present ? "already restored: " : "trashed copy lost: ") +
                                   rec.original_relative_path);
            continue;
        }
        if (dst_present) {
            out.conflicts.push_back(rec.original_relative_path);
            kept.push_back(std::move(rec));
            continue;
        }

        auto res = MoveFile(src, dst);
        if (!res.is_ok()) {
            if (failure.is_ok()) failure = res;
            kept.push_back(std::move(rec));
            continue;
        }
        ++out.moved;
    }
    trash_.records = std::move(kept);

    const bool complete = out.conflicts.empty() && failure.is_ok();
    if (complete) {
        InstalledEntry entry;
        if (snap_it != trash_.snapshots.end()) {
            entry = snap_it->entry;
            trash_.snapshots.erase(snap_it);
        } else {
            entry.component_id = id;
            entry.name = id;
            entry.installed_at = NowIso8601Utc();
        }
        std::erase_if(entry.owned_paths, [&](const std::string& p) { return missing.count(p) > 0; });

        auto it = std::find_if(installed_.components.begin(), installed_.components.end(),
                               [&](const InstalledEntry& e) { return e.component_id == id; });
        if (it != installed_.components.end()) {
            *it = std::move(entry);
        } else {
            installed_.components.push_back(std::move(entry));
        }

        std::error_code ec;
        fs::remove_all(Abs(JoinRelPath(state_dir_, "trash/" + id)), ec);
        if (ec) out.warnings.push_back("trash folder not removed: " + ec.message());
    }

    auto saved = SaveTrash();
    if (saved.is_ok() && complete) saved = SaveInstalled();

    if (!out.conflicts.empty()) {
        std::string list;
        for (const auto& c : out.conflicts) list += (list.empty() ? "" : ", ") + c;
        out.result = Result::Fail(ErrorKind::RestoreConflict, id + ": destination occupied: " + list);
    } else if (!failure.is_ok()) {
        out.result = failure;
    } else if (!saved.is_ok()) {
        out.result = saved;
    }
    return out;
}

ComponentOpResult InstallTracker::PurgeOne(const std::string& id) {
    ComponentOpResult out;
    out.component_id = id;

    const size_t records = static_cast<size_t>(std::count_if(
        trash_.records.begin(), trash_.records.end(), [&](const TrashRecord& r) { return r.component_id == id; }));
    const bool has_snapshot = std::any_of(trash_.snapshots.begin(), trash_.snapshots.end(),
                                          [&](const TrashSnapshot& s) { return s.entry.component_id == id; });
    if (records == 0 && !has_snapshot) {
        out.result = Result::Fail(ErrorKind::NotFound, id + " is not in the trash");
        return out;
    }

    auto res = DropTrashGeneration(id);
    if (res.is_ok()) res = SaveTrash();
    out.result = res;
    out.moved = records;
    return out;
}

std::vector<ComponentOpResult> InstallTracker::MoveToTrash(const std::vector<std::string>& ids) {
    std::vector<ComponentOpResult> out;
    for (const auto& id : ids) {
        out.push_back(TrashOne(id));
        const auto& r = out.back();
        if (r.result.is_ok()) {
            LogInfo("%s: moved %zu files to trash", id.c_str(), r.moved);
        } else {
            LogError("%s: trash failed: %s", id.c_str(), r.result.message().c_str());
        }
        for (const auto& w : r.warnings) LogWarn("%s: %s", id.c_str(), w.c_str());
    }
    return out;
}

std::vector<ComponentOpResult> InstallTracker::Restore(const std::vector<std::string>& ids) {
    std::vector<ComponentOpResult> out;
    for (const auto& id : ids) {
        out.push_back(RestoreOne(id));
        const auto& r = out.back();
        if (r.result.is_ok()) {
            LogInfo("%s: restored %zu files", id.c_str(), r.moved);
        } else {
            LogError("%s: restore failed: %s", id.c_str(), r.result.message().c_str());
        }
        for (const auto& w : r.warnings) LogWarn("%s: %s", id.c_str(), w.c_str());
    }
    return out;
}

std::vector<ComponentOpResult> InstallTracker::Purge(const std::vector<std::string>& ids) {
    std::vector<ComponentOpResult> out;
    for (const auto& id : ids) {
        out.push_back(PurgeOne(id));
        const auto& r = out.back();
        if (r.result.is_ok()) {
            LogInfo("%s: purged %zu trashed files", id.c_str(), r.moved);
        } else {
            LogError("%s: purge failed: %s", id.c_str(), r.result.message().c_str());
        }
    }
    return out;
}

} // namespace packsmith
