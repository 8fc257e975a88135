#include "util/pipeline_config.hpp"

#include "util/config_json_utils.hpp"

#include <cstdio>

namespace packsmith {

std::optional<ResolveMode> ParseResolveMode(std::string_view s) {
    if (s == "strict") return ResolveMode::Strict;
    if (s == "best-effort" || s == "best_effort") return ResolveMode::BestEffort;
    return std::nullopt;
}

const char* ResolveModeName(ResolveMode mode) {
    return mode == ResolveMode::Strict ? "strict" : "best-effort";
}

namespace config {

void PipelineConfigFromFile::Reset() {
    *this = PipelineConfigFromFile{};
}

bool PipelineConfigFromFile::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        std::fprintf(stderr, "Config: %s\n", err.c_str());
        return false;
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        std::fprintf(stderr, "Config: %s in %s\n", err.c_str(), path.c_str());
        return false;
    }

    return true;
}

void PipelineConfigFromFile::ApplyTo(PipelineConfig& cfg) const {
    if (download_chunk_size) cfg.download_chunk_size = *download_chunk_size;
    if (download_timeout_ms) cfg.download_timeout_ms = static_cast<long>(*download_timeout_ms);
    if (connect_timeout_ms) cfg.connect_timeout_ms = static_cast<long>(*connect_timeout_ms);
    if (github_token) cfg.github_token = *github_token;
    if (github_api_base) cfg.github_api_base = *github_api_base;
    if (user_agent) cfg.user_agent = *user_agent;
    if (resolve_mode) cfg.resolve_mode = *resolve_mode;
    if (fetch_workers) cfg.fetch_workers = static_cast<unsigned>(*fetch_workers);
    if (skeleton_path) cfg.skeleton_path = *skeleton_path;
    if (state_dir) cfg.state_dir = *state_dir;
    if (pack_prefix) cfg.pack_prefix = *pack_prefix;
    if (firmware_component) cfg.firmware_component = *firmware_component;
    if (progress) cfg.progress = *progress;
}

} // namespace config

} // namespace packsmith
