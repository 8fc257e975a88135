#include "pack/step_processor.hpp"

#include "pack/archive_path_policy.hpp"
#include "util/glob.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <filesystem>
#include <map>
#include <set>
#include <unordered_map>
#include <unordered_set>

namespace packsmith {

namespace {

namespace fs = std::filesystem;

Result StepFail(const std::string& msg) {
    return Result::Fail(ErrorKind::StepExecutionFailed, msg);
}

// One run of Apply(): the archive, the root and the growing written list.
class StepRun {
  public:
    StepRun(const ArchiveHandle& archive, std::string root, StepReport& report)
        : archive_(archive), root_(std::move(root)), report_(report) {
        for (const auto& w : report_.written) seen_.insert(w);
    }

    Result operator()(const step::ExtractAllToRoot&) { return ExtractMapped("", ""); }

    Result operator()(const step::ExtractAllToPath& s) {
        std::string target;
        auto res = ArchivePathPolicy::NormalizeDefinitionPath(s.target_path, target);
        if (!res.is_ok()) return res;
        return ExtractMapped("", target);
    }

    Result operator()(const step::ExtractSubfolderToPath& s) {
        std::string sub, target;
        auto res = ArchivePathPolicy::NormalizeDefinitionPath(s.subfolder_name, sub);
        if (res.is_ok()) res = ArchivePathPolicy::NormalizeDefinitionPath(s.target_path, target);
        if (!res.is_ok()) return res;

        bool present = false;
        for (const auto& e : archive_.ListEntries()) {
            if (e.path != sub && IsRelPathWithin(e.path, sub)) {
                present = true;
                break;
            }
        }
        if (!present) return StepFail("subfolder '" + sub + "' not found in " + archive_.Name());
        return ExtractMapped(sub, target);
    }

    Result operator()(const step::ExtractRootFolderToPath& s) {
        std::string target;
        auto res = ArchivePathPolicy::NormalizeDefinitionPath(s.target_path, target);
        if (!res.is_ok()) return res;

        std::set<std::string> top;
        for (const auto& e : archive_.ListEntries()) {
            const auto slash = e.path.find('/');
            if (slash != std::string::npos) {
                top.insert(e.path.substr(0, slash));
            } else if (e.is_directory) {
                top.insert(e.path);
            }
        }
        if (top.empty()) return StepFail("no top-level folder in " + archive_.Name());
        if (top.size() > 1) {
            std::string names;
            for (const auto& t : top) names += (names.empty() ? "" : ", ") + t;
            return StepFail("several top-level folders in " + archive_.Name() + ": " + names);
        }
        LogDebug("%s: stripping top-level folder %s", archive_.Name().c_str(), top.begin()->c_str());
        return ExtractMapped(*top.begin(), target);
    }

    Result operator()(const step::CopySingleFile& s) { return CopyOnlyFile(s.target_path, false); }

    Result operator()(const step::CopyToDerivedFolder& s) { return CopyOnlyFile(s.target_path, true); }

    Result operator()(const step::FindAndCopy& s) {
        std::string target;
        auto res = ArchivePathPolicy::NormalizeDefinitionPath(s.target_path, target);
        if (!res.is_ok()) return res;

        std::map<std::string, std::string> plan;
        for (const auto& e : archive_.Files()) {
            const std::string name = FileNameOf(e.path);
            if (GlobMatch(s.source_pattern, name)) plan.emplace(e.path, JoinRelPath(target, name));
        }
        if (plan.empty()) {
            if (s.required) return StepFail("no entry matches '" + s.source_pattern + "'");
            LogInfo("%s: nothing matches '%s'", archive_.Name().c_str(), s.source_pattern.c_str());
            return Result::Ok();
        }
        return Place(plan);
    }

    Result operator()(const step::FindAndRename& s) {
        std::string target;
        auto res = ArchivePathPolicy::NormalizeDefinitionPath(s.target_path, target);
        if (!res.is_ok()) return res;

        std::vector<std::string> matches;
        for (const auto& e : archive_.Files()) {
            if (GlobMatch(s.source_pattern, FileNameOf(e.path))) matches.push_back(e.path);
        }
        if (matches.empty()) {
            if (s.required) return StepFail("no entry matches '" + s.source_pattern + "'");
            LogInfo("%s: nothing matches '%s'", archive_.Name().c_str(), s.source_pattern.c_str());
            return Result::Ok();
        }
        if (matches.size() > 1) {
            return Result::Fail(ErrorKind::AmbiguousSourceMatch,
                                std::to_string(matches.size()) + " entries match '" + s.source_pattern +
                                    "' (" + matches[0] + ", " + matches[1] + (matches.size() > 2 ? ", ..." : "") + ")");
        }

        std::map<std::string, std::string> plan;
        plan.emplace(matches.front(), JoinRelPath(target, s.target_filename));
        return Place(plan);
    }

    Result operator()(const step::DeletePath& s) {
        std::string rel;
        auto res = ArchivePathPolicy::NormalizeDefinitionPath(s.path, rel);
        if (!res.is_ok()) return res;
        if (rel.empty()) return StepFail("refusing to delete the target root");

        std::string abs;
        res = ArchivePathPolicy::ResolveUnderRoot(root_, rel, abs);
        if (!res.is_ok()) return res;

        std::error_code ec;
        const auto st = fs::symlink_status(abs, ec);
        if (ec || !fs::exists(st)) {
            LogDebug("delete_path: %s not present", rel.c_str());
        } else {
            fs::remove_all(abs, ec);
            if (ec) {
                return Result::Fail(ErrorKindFromErrno(ec.value()),
                                    "cannot remove " + rel + ": " + ec.message(), ec.value());
            }
        }

        std::vector<std::string> kept;
        for (auto& w : report_.written) {
            if (IsRelPathWithin(w, rel)) {
                seen_.erase(w);
            } else {
                kept.push_back(std::move(w));
            }
        }
        report_.written = std::move(kept);
        return Result::Ok();
    }

  private:
    // Every entry below src_prefix (all entries when empty), prefix stripped,
    // placed below dst_prefix.
    Result ExtractMapped(const std::string& src_prefix, const std::string& dst_prefix) {
        std::map<std::string, std::string> plan;
        std::vector<std::string> dirs;
        for (const auto& e : archive_.ListEntries()) {
            std::string rel;
            if (src_prefix.empty()) {
                rel = e.path;
            } else if (e.path != src_prefix && IsRelPathWithin(e.path, src_prefix)) {
                rel = e.path.substr(src_prefix.size() + 1);
            } else {
                continue;
            }
            if (e.is_directory) {
                dirs.push_back(JoinRelPath(dst_prefix, rel));
            } else {
                plan.emplace(e.path, JoinRelPath(dst_prefix, rel));
            }
        }

        for (const auto& d : dirs) {
            std::string abs;
            auto res = ArchivePathPolicy::ResolveUnderRoot(root_, d, abs);
            if (!res.is_ok()) return res;
            std::error_code ec;
            fs::create_directories(abs, ec);
            if (ec) {
                return Result::Fail(ErrorKindFromErrno(ec.value()),
                                    "cannot create " + d + ": " + ec.message(), ec.value());
            }
        }
        return Place(plan);
    }

    Result CopyOnlyFile(const std::string& target_path, bool derived) {
        std::string target;
        auto res = ArchivePathPolicy::NormalizeDefinitionPath(target_path, target);
        if (!res.is_ok()) return res;

        std::vector<ArchiveEntry> root_files;
        for (const auto& e : archive_.Files()) {
            if (e.path.find('/') == std::string::npos) root_files.push_back(e);
        }
        if (root_files.size() != 1) {
            return StepFail(archive_.Name() + " holds " + std::to_string(root_files.size()) +
                            " files at its root, expected exactly one");
        }

        const std::string& name = root_files.front().path;
        const std::string dir = derived ? JoinRelPath(target, StemOf(name)) : target;

        std::map<std::string, std::string> plan;
        plan.emplace(name, JoinRelPath(dir, name));
        return Place(plan);
    }

    // plan: entry path -> destination relative to the root. Every
    // destination is resolved and checked before the first write.
    Result Place(const std::map<std::string, std::string>& plan) {
        std::unordered_map<std::string, std::string> abs_of_entry;
        std::unordered_map<std::string, std::string> rel_of_abs;
        for (const auto& [entry, rel] : plan) {
            std::string abs;
            auto res = ArchivePathPolicy::ResolveUnderRoot(root_, rel, abs);
            if (!res.is_ok()) return res;
            if (abs == root_canon()) return StepFail("destination for " + entry + " is the target root");
            abs_of_entry.emplace(entry, abs);
            rel_of_abs.emplace(abs, rel);
        }

        std::vector<std::string> written_abs;
        auto res = archive_.ExtractEach(
            [&](const ArchiveEntry& e) -> std::string {
                if (e.is_directory) return {};
                auto it = abs_of_entry.find(e.path);
                return it == abs_of_entry.end() ? std::string() : it->second;
            },
            written_abs);

        for (const auto& abs : written_abs) {
            auto it = rel_of_abs.find(abs);
            if (it != rel_of_abs.end()) AddWritten(it->second);
        }
        return res;
    }

    const std::string& root_canon() {
        if (root_canon_.empty()) {
            std::error_code ec;
            root_canon_ = fs::weakly_canonical(root_, ec).string();
            while (root_canon_.size() > 1 && root_canon_.back() == '/') root_canon_.pop_back();
        }
        return root_canon_;
    }

    void AddWritten(const std::string& rel) {
        if (seen_.insert(rel).second) report_.written.push_back(rel);
    }

    const ArchiveHandle& archive_;
    std::string root_;
    std::string root_canon_;
    StepReport& report_;
    std::unordered_set<std::string> seen_;
};

bool KeepsOwnKind(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnsafeArchivePath:
        case ErrorKind::AmbiguousSourceMatch:
        case ErrorKind::InsufficientSpace:
        case ErrorKind::Cancelled:
        case ErrorKind::StepExecutionFailed:
            return true;
        default:
            return false;
    }
}

} // namespace

Result StepProcessor::Apply(const std::vector<Step>& steps,
                            const ArchiveHandle& archive,
                            const std::string& target_root,
                            StepReport& report) const {
    report.failed_action.clear();

    std::error_code ec;
    fs::create_directories(target_root, ec);
    if (ec) {
        return Result::Fail(ErrorKindFromErrno(ec.value()),
                            "cannot create target root " + target_root + ": " + ec.message(), ec.value());
    }

    StepRun run(archive, target_root, report);
    for (const auto& s : steps) {
        const std::string action(StepActionName(s));
        if (cancel_ && cancel_->load(std::memory_order_relaxed)) {
            report.failed_action = action;
            return Result::Fail(ErrorKind::Cancelled, action + ": cancelled");
        }

        LogDebug("%s: %s", archive.Name().c_str(), action.c_str());
        auto res = std::visit(run, s);
        if (!res.is_ok()) {
            report.failed_action = action;
            if (!KeepsOwnKind(res.kind)) res.kind = ErrorKind::StepExecutionFailed;
            res.msg = action + ": " + res.msg;
            return res;
        }
    }
    return Result::Ok();
}

} // namespace packsmith
