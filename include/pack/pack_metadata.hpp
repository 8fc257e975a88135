#pragma once

#include "util/result.hpp"

#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace packsmith {

inline constexpr const char* kPackManifestName = "manifest.json";
inline constexpr const char* kUnknownFirmware = "N/A";

struct PackAssetInfo {
    std::string filename;
    std::string sha256;
};

struct PackComponentInfo {
    std::string id;
    std::string name;
    std::string version;
    std::string category;
    std::string source;
    std::string asset_sha256; // first asset
    std::vector<std::string> files;
    std::vector<PackAssetInfo> assets; // written only for multi-asset components
};

struct PackManifest {
    std::string pack_name;
    std::string build_date;
    std::string builder_version;
    std::string supported_firmware = kUnknownFirmware;
    std::string content_hash;
    std::vector<PackComponentInfo> components; // selection order
};

// First 7 hex digits of SHA-1 over "id:version" of every component, ids
// sorted. An empty version hashes as "N/A".
std::string ComputeContentHash(std::vector<std::pair<std::string, std::string>> id_versions);

// "<prefix>-<date>-<hash>"
std::string PackBaseName(const std::string& prefix, const std::string& date, const std::string& content_hash);

std::string SerializePackManifest(const PackManifest& m);
std::expected<PackManifest, std::string> ParsePackManifest(std::string_view text);

// Accepts a manifest.json or a pack zip containing one.
Result LoadPackManifest(const std::string& path, PackManifest& out);

// Markdown summary shipped as "<base>.txt" next to manifest.json.
std::string RenderPackSummary(const PackManifest& m,
                              const PackManifest* previous,
                              const std::string& comment,
                              const std::string& generated_at);

} // namespace packsmith
