#include "pack/archive_path_policy.hpp"

#include "util/path_utils.hpp"

#include <filesystem>

namespace packsmith {

bool ArchivePathPolicy::HasUnsafeSegment(std::string_view p) {
    if (p.find('\\') != std::string_view::npos) return true;

    std::string_view sv(p);
    while (!sv.empty()) {
        while (!sv.empty() && sv.front() == '/') sv.remove_prefix(1);
        const auto pos = sv.find('/');
        const auto seg = sv.substr(0, pos);
        if (seg == "..") return true;
        if (pos == std::string_view::npos) break;
        sv.remove_prefix(pos);
    }
    return false;
}

Result ArchivePathPolicy::NormalizeEntryPath(const char* raw_path, std::string& out_relative) {
    const std::string_view raw = raw_path ? std::string_view(raw_path) : std::string_view();
    out_relative.clear();

    if (!raw.empty() && raw.front() == '/') {
        return Result::Fail(ErrorKind::UnsafeArchivePath, "Absolute path in archive: " + std::string(raw));
    }
    if (HasUnsafeSegment(raw)) {
        return Result::Fail(ErrorKind::UnsafeArchivePath, "Unsafe path in archive: " + std::string(raw));
    }

    out_relative = NormalizeRelPath(raw);
    return Result::Ok();
}

Result ArchivePathPolicy::NormalizeDefinitionPath(std::string_view raw, std::string& out_relative) {
    out_relative.clear();
    if (HasUnsafeSegment(raw)) {
        return Result::Fail(ErrorKind::UnsafeArchivePath, "Unsafe path: " + std::string(raw));
    }
    out_relative = NormalizeRelPath(raw);
    return Result::Ok();
}

Result ArchivePathPolicy::ResolveUnderRoot(const std::string& root,
                                           const std::string& rel,
                                           std::string& out_absolute) {
    namespace fs = std::filesystem;

    std::error_code ec;
    const fs::path root_canon = fs::weakly_canonical(fs::path(root), ec);
    if (ec) {
        return Result::Fail(ErrorKindFromErrno(ec.value()),
                            "Cannot resolve target root " + root + ": " + ec.message(), ec.value());
    }

    const fs::path joined = rel.empty() ? root_canon : root_canon / fs::path(rel);
    const fs::path resolved = fs::weakly_canonical(joined, ec);
    if (ec) {
        return Result::Fail(ErrorKindFromErrno(ec.value()),
                            "Cannot resolve " + joined.string() + ": " + ec.message(), ec.value());
    }

    std::string root_s = root_canon.string();
    while (root_s.size() > 1 && root_s.back() == '/') root_s.pop_back();
    std::string res_s = resolved.string();
    while (res_s.size() > 1 && res_s.back() == '/') res_s.pop_back();

    const bool inside = res_s == root_s ||
                        (res_s.size() > root_s.size() &&
                         res_s.compare(0, root_s.size(), root_s) == 0 &&
                         (root_s == "/" || res_s[root_s.size()] == '/'));
    if (!inside) {
        return Result::Fail(ErrorKind::UnsafeArchivePath,
                            "Path escapes target root: " + rel);
    }

    out_absolute = res_s;
    return Result::Ok();
}

} // namespace packsmith
