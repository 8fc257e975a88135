#include "net/github_release_index.hpp"

#include "io/memory_writer.hpp"
#include "util/logger.hpp"

#include <nlohmann/json.hpp>

namespace packsmith {

GitHubReleaseIndex::GitHubReleaseIndex(IDownloader& downloader, const PipelineConfig& cfg)
    : downloader_(downloader), cfg_(cfg) {}

Result GitHubReleaseIndex::ListReleases(const std::string& owner,
                                        const std::string& repo,
                                        unsigned per_page,
                                        std::vector<Release>& out) {
    std::string base = cfg_.github_api_base;
    while (!base.empty() && base.back() == '/') base.pop_back();
    const std::string url = base + "/repos/" + owner + "/" + repo + "/releases?per_page=" + std::to_string(per_page);

    FetchOptions opt = MakeFetchOptions(cfg_);
    opt.headers.push_back({"Accept", "application/vnd.github+json"});
    if (!cfg_.github_token.empty()) {
        opt.headers.push_back({"Authorization", "token " + cfg_.github_token});
    }

    MemoryWriter body(8 * 1024 * 1024ULL);
    auto res = downloader_.Fetch(url, opt, body);
    if (!res.is_ok()) {
        if (res.kind == ErrorKind::Cancelled) return res;
        return Result::Fail(ErrorKind::SourceUnreachable,
                            "release listing for " + owner + "/" + repo + " failed: " + res.message(), res.err);
    }

    auto parsed = ParseReleaseListJson(body.Data());
    if (!parsed) {
        return Result::Fail(ErrorKind::SourceUnreachable,
                            "release listing for " + owner + "/" + repo + ": " + parsed.error());
    }

    LogDebug("%s/%s: %zu releases", owner.c_str(), repo.c_str(), parsed->size());
    out = std::move(*parsed);
    return Result::Ok();
}

std::expected<std::vector<Release>, std::string> ParseReleaseListJson(std::string_view text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return std::unexpected(std::string("malformed JSON: ") + e.what());
    }
    if (!j.is_array()) return std::unexpected(std::string("expected a JSON array of releases"));

    std::vector<Release> releases;
    try {
        for (const auto& r : j) {
            if (!r.is_object()) return std::unexpected(std::string("release entry is not an object"));
            if (r.value("draft", false)) continue;

            Release rel;
            rel.tag = r.value("tag_name", std::string());
            if (auto body = r.find("body"); body != r.end() && body->is_string()) rel.body = body->get<std::string>();
            auto assets = r.find("assets");
            if (assets != r.end() && assets->is_array()) {
                for (const auto& a : *assets) {
                    ReleaseAsset asset;
                    asset.filename = a.value("name", std::string());
                    asset.download_url = a.value("browser_download_url", std::string());
                    asset.size = a.value("size", std::uint64_t{0});
                    if (asset.filename.empty() || asset.download_url.empty()) continue;
                    rel.assets.push_back(std::move(asset));
                }
            }
            releases.push_back(std::move(rel));
        }
    } catch (const nlohmann::json::type_error& e) {
        return std::unexpected(std::string("unexpected field type: ") + e.what());
    }
    return releases;
}

} // namespace packsmith
