#include "util/config_json_utils.hpp"

#include <fstream>

namespace packsmith::config::detail {

namespace {

// Present-but-wrong-type is an error; absent is fine.
bool GetStringIfPresent(const nlohmann::json& j, const char* key,
                        std::optional<std::string>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j, const char* key,
                     std::optional<std::uint64_t>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!(it->is_number_unsigned() || it->is_number_integer())) {
        err = std::string(key) + " must be an integer";
        return false;
    }
    auto v = it->get<long long>();
    if (v < 0) {
        err = std::string(key) + " must not be negative";
        return false;
    }
    out = static_cast<std::uint64_t>(v);
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key,
                      std::optional<bool>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_boolean()) {
        err = std::string(key) + " must be a boolean";
        return false;
    }
    out = it->get<bool>();
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, PipelineConfigFromFile& cfg, std::string& err) {
    if (!GetU64IfPresent(j, "DownloadChunkSize", cfg.download_chunk_size, err) ||
        !GetU64IfPresent(j, "DownloadTimeoutMs", cfg.download_timeout_ms, err) ||
        !GetU64IfPresent(j, "ConnectTimeoutMs", cfg.connect_timeout_ms, err) ||
        !GetU64IfPresent(j, "FetchWorkers", cfg.fetch_workers, err) ||
        !GetStringIfPresent(j, "GithubToken", cfg.github_token, err) ||
        !GetStringIfPresent(j, "GithubApiBase", cfg.github_api_base, err) ||
        !GetStringIfPresent(j, "UserAgent", cfg.user_agent, err) ||
        !GetStringIfPresent(j, "SkeletonPath", cfg.skeleton_path, err) ||
        !GetStringIfPresent(j, "StateDir", cfg.state_dir, err) ||
        !GetStringIfPresent(j, "PackPrefix", cfg.pack_prefix, err) ||
        !GetStringIfPresent(j, "FirmwareComponent", cfg.firmware_component, err) ||
        !GetBoolIfPresent(j, "Progress", cfg.progress, err)) {
        return false;
    }

    if (cfg.download_chunk_size && *cfg.download_chunk_size == 0) {
        err = "DownloadChunkSize must be positive";
        return false;
    }
    if (cfg.fetch_workers && (*cfg.fetch_workers == 0 || *cfg.fetch_workers > 16)) {
        err = "FetchWorkers must be within 1..16";
        return false;
    }
    if (cfg.state_dir && cfg.state_dir->empty()) {
        err = "StateDir must not be empty";
        return false;
    }

    {
        std::optional<std::string> mode;
        if (!GetStringIfPresent(j, "ResolutionMode", mode, err))
            return false;
        if (mode) {
            cfg.resolve_mode = ParseResolveMode(*mode);
            if (!cfg.resolve_mode) {
                err = "ResolutionMode must be 'strict' or 'best-effort': " + *mode;
                return false;
            }
        }
    }
    {
        std::optional<std::string> level;
        if (!GetStringIfPresent(j, "LogLevel", level, err))
            return false;
        if (level) {
            cfg.log_level = ParseLogLevel(*level);
            if (!cfg.log_level) {
                err = "unknown LogLevel: " + *level;
                return false;
            }
        }
    }

    return true;
}

} // namespace packsmith::config::detail
