#include "pack/version_resolver.hpp"

#include "util/glob.hpp"
#include "util/logger.hpp"

namespace packsmith {

namespace {

std::string_view StripV(std::string_view tag) {
    if (!tag.empty() && (tag.front() == 'v' || tag.front() == 'V')) tag.remove_prefix(1);
    return tag;
}

} // namespace

std::string FilenameFromUrl(std::string_view url) {
    const auto cut = url.find_first_of("?#");
    if (cut != std::string_view::npos) url = url.substr(0, cut);

    const auto scheme = url.find("://");
    if (scheme != std::string_view::npos) {
        url.remove_prefix(scheme + 3);
        const auto path_start = url.find('/');
        url = path_start == std::string_view::npos ? std::string_view() : url.substr(path_start);
    }

    while (!url.empty() && url.back() == '/') url.remove_suffix(1);
    const auto slash = url.rfind('/');
    const std::string_view name = slash == std::string_view::npos ? url : url.substr(slash + 1);
    return name.empty() ? std::string("downloaded_file") : std::string(name);
}

Result VersionResolver::Resolve(const ComponentSource& source,
                                const std::string& pinned_version,
                                ResolvedAsset& out) const {
    if (const auto* direct = std::get_if<DirectSource>(&source)) {
        out.download_url = direct->url;
        out.version.clear();
        out.filename = FilenameFromUrl(direct->url);
        return Result::Ok();
    }
    const auto& release = std::get<ReleaseSource>(source);
    std::vector<ResolvedAsset> assets;
    auto res = ResolveAssets(release, {release.asset_pattern}, pinned_version, assets);
    if (res.is_ok()) out = std::move(assets.front());
    return res;
}

Result VersionResolver::ResolveAssets(const ReleaseSource& source,
                                      const std::vector<std::string>& patterns,
                                      const std::string& pinned_version,
                                      std::vector<ResolvedAsset>& out) const {
    out.clear();
    const std::string repo = source.owner + "/" + source.repo;
    const unsigned per_page = pinned_version.empty() ? 5 : 10;

    std::vector<Release> releases;
    auto res = index_.ListReleases(source.owner, source.repo, per_page, releases);
    if (!res.is_ok()) {
        if (res.kind != ErrorKind::SourceUnreachable && res.kind != ErrorKind::Cancelled) {
            res.kind = ErrorKind::SourceUnreachable;
        }
        return res;
    }
    if (releases.empty()) {
        return Result::Fail(ErrorKind::NoMatchingAsset, repo + ": no releases found");
    }

    const Release* release = &releases.front();
    if (!pinned_version.empty()) {
        release = nullptr;
        for (const auto& r : releases) {
            if (r.tag == pinned_version || StripV(r.tag) == StripV(pinned_version)) {
                release = &r;
                break;
            }
        }
        if (!release) {
            return Result::Fail(ErrorKind::NoMatchingAsset,
                                repo + ": no release tagged " + pinned_version);
        }
    }

    for (const auto& pattern : patterns) {
        ResolvedAsset asset;
        res = PickAsset(repo, *release, pattern, asset);
        if (!res.is_ok()) {
            out.clear();
            return res;
        }
        out.push_back(std::move(asset));
    }
    return Result::Ok();
}

Result VersionResolver::PickAsset(const std::string& repo,
                                  const Release& release,
                                  const std::string& pattern,
                                  ResolvedAsset& out) const {
    const ReleaseAsset* match = nullptr;
    size_t matches = 0;
    for (const auto& asset : release.assets) {
        if (!GlobMatch(pattern, asset.filename)) continue;
        if (!match) match = &asset;
        ++matches;
    }

    if (!match) {
        return Result::Fail(ErrorKind::NoMatchingAsset,
                            repo + " " + release.tag + ": no asset matches '" + pattern + "'");
    }
    if (matches > 1) {
        if (mode_ == ResolveMode::Strict) {
            return Result::Fail(ErrorKind::AmbiguousMatch,
                                repo + " " + release.tag + ": " + std::to_string(matches) +
                                    " assets match '" + pattern + "'");
        }
        LogWarn("%s %s: %zu assets match '%s', using %s",
                repo.c_str(), release.tag.c_str(), matches,
                pattern.c_str(), match->filename.c_str());
    }

    out.download_url = match->download_url;
    out.version = release.tag;
    out.filename = match->filename;
    LogDebug("%s: resolved %s (%s)", repo.c_str(), out.filename.c_str(), out.version.c_str());
    return Result::Ok();
}

} // namespace packsmith
