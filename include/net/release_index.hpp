#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace packsmith {

struct ReleaseAsset {
    std::string filename;
    std::string download_url;
    std::uint64_t size = 0;
};

struct Release {
    std::string tag;
    std::vector<ReleaseAsset> assets;
    std::string body; // release notes, Markdown
};

// Lists the releases of a repository, newest first. Transport failures are
// SourceUnreachable.
class IReleaseIndex {
public:
    virtual ~IReleaseIndex() = default;
    virtual Result ListReleases(const std::string& owner,
                                const std::string& repo,
                                unsigned per_page,
                                std::vector<Release>& out) = 0;
};

} // namespace packsmith
