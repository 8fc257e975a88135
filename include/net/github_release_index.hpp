#pragma once

#include "net/downloader.hpp"
#include "net/release_index.hpp"
#include "util/pipeline_config.hpp"

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace packsmith {

// GET {api_base}/repos/{owner}/{repo}/releases?per_page=N
class GitHubReleaseIndex final : public IReleaseIndex {
public:
    GitHubReleaseIndex(IDownloader& downloader, const PipelineConfig& cfg);

    Result ListReleases(const std::string& owner,
                        const std::string& repo,
                        unsigned per_page,
                        std::vector<Release>& out) override;

private:
    IDownloader& downloader_;
    const PipelineConfig& cfg_;
};

// Drafts are dropped; order is kept.
std::expected<std::vector<Release>, std::string> ParseReleaseListJson(std::string_view text);

} // namespace packsmith
