#pragma once

#include "util/pipeline_config.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace packsmith::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);
bool FillConfigFromJson(const nlohmann::json& j, PipelineConfigFromFile& cfg, std::string& err);

} // namespace packsmith::config::detail
