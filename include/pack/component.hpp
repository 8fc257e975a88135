#pragma once

#include "pack/step.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace packsmith {

struct ReleaseSource {
    std::string owner;
    std::string repo;
    std::string asset_pattern;
};

struct DirectSource {
    std::string url;
};

using ComponentSource = std::variant<ReleaseSource, DirectSource>;

// One asset of a release and the steps that place it. Multi-asset
// components list several; everything else has exactly one.
struct AssetRecipe {
    std::string pattern; // empty for direct sources
    std::vector<Step> steps;
};

struct ResolvedAsset {
    std::string download_url;
    std::string version; // release tag; empty for direct sources
    std::string filename;
};

struct ComponentDefinition {
    std::string id;
    std::string name;
    std::string category;
    std::string description;
    ComponentSource source;
    std::string pinned_version;
    std::vector<Step> steps;

    // "asset_patterns": every entry resolved against the same release. Empty
    // for single-asset components, which use the source pattern and steps.
    std::vector<AssetRecipe> assets;

    // Last observed asset; refreshed by resolution, optional for a build.
    std::optional<ResolvedAsset> resolved;
};

// "owner/repo" for releases, the URL for direct sources.
std::string DescribeSource(const ComponentSource& source);

// The assets to fetch, in order; single-asset components yield one recipe.
std::vector<AssetRecipe> AssetRecipes(const ComponentDefinition& def);

} // namespace packsmith
