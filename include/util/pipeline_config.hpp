#pragma once

#include "util/logger.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace packsmith {

enum class ResolveMode {
    BestEffort, // resolution failure falls back to the cached asset
    Strict,     // resolution failure or ambiguity fails the component
};

std::optional<ResolveMode> ParseResolveMode(std::string_view s);
const char* ResolveModeName(ResolveMode mode);

// Everything the pipeline needs from its environment. Built once by the
// caller and passed in; nothing below main() reads files or env for it.
struct PipelineConfig {
    std::uint64_t download_chunk_size = 2 * 1024 * 1024ULL;
    long download_timeout_ms = 120000;
    long connect_timeout_ms = 15000;
    std::string github_token;
    std::string github_api_base = "https://api.github.com";
    std::string user_agent = "packsmith";
    ResolveMode resolve_mode = ResolveMode::BestEffort;
    unsigned fetch_workers = 1;
    std::string skeleton_path;
    std::string state_dir = ".packsmith";
    std::string pack_prefix = "HATS";
    std::string firmware_component = "atmosphere"; // its release notes give the pack's supported firmware
    bool progress = true;

    const std::atomic_bool* cancel = nullptr;
};

namespace config {

// Values found in the JSON config file; unset keys keep the defaults.
struct PipelineConfigFromFile {
    std::optional<std::uint64_t> download_chunk_size;
    std::optional<std::uint64_t> download_timeout_ms;
    std::optional<std::uint64_t> connect_timeout_ms;
    std::optional<std::string> github_token;
    std::optional<std::string> github_api_base;
    std::optional<std::string> user_agent;
    std::optional<ResolveMode> resolve_mode;
    std::optional<std::uint64_t> fetch_workers;
    std::optional<std::string> skeleton_path;
    std::optional<std::string> state_dir;
    std::optional<std::string> pack_prefix;
    std::optional<std::string> firmware_component;
    std::optional<bool> progress;
    std::optional<LogLevel> log_level;

    void Reset();
    bool LoadFile(const std::string& path);
    void ApplyTo(PipelineConfig& cfg) const;
};

} // namespace config

} // namespace packsmith
