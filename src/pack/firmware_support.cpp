#include "pack/firmware_support.hpp"

#include "util/logger.hpp"

#include <algorithm>
#include <regex>

namespace packsmith {

namespace {

constexpr unsigned kFirmwareLookupReleases = 10;

std::string_view StripV(std::string_view tag) {
    if (!tag.empty() && (tag.front() == 'v' || tag.front() == 'V')) tag.remove_prefix(1);
    return tag;
}

} // namespace

std::string ExtractSupportedFirmware(std::string_view release_notes) {
    static const std::regex patterns[] = {
        std::regex(R"((?:support|support was added|HOS)\s*.*?(?:for|up to)\s*(\d+\.\d+\.\d+))", std::regex::icase),
        std::regex(R"((?:HOS|firmware)\s*(\d+\.\d+\.\d+))", std::regex::icase),
        std::regex(R"(supports\s*up\s*to\s*(\d+\.\d+\.\d+))", std::regex::icase),
    };

    const std::string text(release_notes);
    std::smatch m;
    for (const auto& re : patterns) {
        if (std::regex_search(text, m, re)) return m[1].str();
    }
    return {};
}

Result LookupSupportedFirmware(IReleaseIndex& index,
                               const ReleaseSource& source,
                               const std::string& version,
                               std::string& out) {
    out = kUnknownFirmware;

    std::vector<Release> releases;
    auto res = index.ListReleases(source.owner, source.repo, kFirmwareLookupReleases, releases);
    if (!res.is_ok()) return res;

    // Newest first: everything after the target is older.
    auto target = std::find_if(releases.begin(), releases.end(), [&](const Release& r) {
        return StripV(r.tag) == StripV(version);
    });
    if (target == releases.end()) {
        LogWarn("%s/%s: release %s not among the latest %u; supported firmware unknown",
                source.owner.c_str(), source.repo.c_str(), version.c_str(), kFirmwareLookupReleases);
        return Result::Ok();
    }

    for (auto it = target; it != releases.end(); ++it) {
        std::string fw = ExtractSupportedFirmware(it->body);
        if (fw.empty()) continue;
        if (it != target) LogDebug("%s: firmware support inherited from %s", version.c_str(), it->tag.c_str());
        out = std::move(fw);
        break;
    }
    return Result::Ok();
}

} // namespace packsmith
