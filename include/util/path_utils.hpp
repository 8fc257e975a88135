#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace packsmith {

// Normalize an archive or definition path to a clean relative form:
// - backslashes are kept (callers reject them)
// - strip leading "./" and "/" (avoid absolute)
// - collapse duplicate slashes and drop "." segments
// - strip a trailing "/"
inline std::string NormalizeRelPath(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && s[i] == '/') ++i;
        const size_t end = s.find('/', i);
        const size_t stop = (end == std::string_view::npos) ? s.size() : end;
        const std::string_view seg = s.substr(i, stop - i);
        if (!seg.empty() && seg != ".") {
            if (!out.empty()) out.push_back('/');
            out.append(seg);
        }
        i = stop;
    }
    return out;
}

// "a" + "b/c" -> "a/b/c"; either side may be empty.
inline std::string JoinRelPath(std::string_view base, std::string_view rel) {
    if (base.empty()) return std::string(rel);
    if (rel.empty()) return std::string(base);
    std::string out(base);
    out.push_back('/');
    out.append(rel);
    return out;
}

inline std::string FileNameOf(std::string_view rel) {
    const auto pos = rel.rfind('/');
    return std::string(pos == std::string_view::npos ? rel : rel.substr(pos + 1));
}

inline std::string StemOf(std::string_view filename) {
    return std::filesystem::path(std::string(filename)).stem().string();
}

// True when rel equals prefix or lies below it.
inline bool IsRelPathWithin(std::string_view rel, std::string_view prefix) {
    if (prefix.empty()) return true;
    if (rel.size() < prefix.size() || rel.compare(0, prefix.size(), prefix) != 0) return false;
    return rel.size() == prefix.size() || rel[prefix.size()] == '/';
}

} // namespace packsmith
