#pragma once

#include "net/release_index.hpp"
#include "pack/component.hpp"
#include "util/pipeline_config.hpp"
#include "util/result.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace packsmith {

class VersionResolver {
  public:
    VersionResolver(IReleaseIndex& index, ResolveMode mode) : index_(index), mode_(mode) {}

    // Fails with NoMatchingAsset, AmbiguousMatch (strict mode only) or
    // SourceUnreachable.
    Result Resolve(const ComponentSource& source,
                   const std::string& pinned_version,
                   ResolvedAsset& out) const;

    // One asset per pattern, all from the same release (newest, or the
    // pinned one). out follows the order of patterns.
    Result ResolveAssets(const ReleaseSource& source,
                         const std::vector<std::string>& patterns,
                         const std::string& pinned_version,
                         std::vector<ResolvedAsset>& out) const;

  private:
    Result PickAsset(const std::string& repo,
                     const Release& release,
                     const std::string& pattern,
                     ResolvedAsset& out) const;

    IReleaseIndex& index_;
    ResolveMode mode_;
};

// Last path segment of a URL without query or fragment; "downloaded_file"
// when there is none.
std::string FilenameFromUrl(std::string_view url);

} // namespace packsmith
