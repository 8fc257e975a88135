#include "util/glob.hpp"

#include <algorithm>
#include <cctype>
#include <fnmatch.h>
#include <string>

namespace packsmith {

namespace {

std::string Lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

} // namespace

bool GlobMatch(std::string_view pattern, std::string_view name) {
    const std::string p = Lower(pattern);
    const std::string n = Lower(name);
    return ::fnmatch(p.c_str(), n.c_str(), FNM_NOESCAPE) == 0;
}

} // namespace packsmith
