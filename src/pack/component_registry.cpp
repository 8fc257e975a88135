#include "pack/component_registry.hpp"

#include "io/file_reader.hpp"
#include "io/file_writer.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

namespace packsmith {

namespace {

DefinitionError Invalid(const std::string& id, const std::string& msg) {
    return DefinitionError{ErrorKind::DefinitionInvalid, "component '" + id + "': " + msg};
}

bool GetOptionalString(const nlohmann::json& j, const char* key, std::string& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return true;
    if (!it->is_string()) {
        err = std::string("'") + key + "' must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool SplitRepo(const std::string& repo, std::string& owner, std::string& name) {
    const auto slash = repo.find('/');
    if (slash == std::string::npos || repo.find('/', slash + 1) != std::string::npos) return false;
    owner = repo.substr(0, slash);
    name = repo.substr(slash + 1);
    return !owner.empty() && !name.empty();
}

// Missing or null yields extract_all_to_root.
std::optional<DefinitionError> ParseStepList(const std::string& id,
                                             const std::string& where,
                                             const nlohmann::json& parent,
                                             std::vector<Step>& out) {
    auto steps = parent.find("processing_steps");
    if (steps != parent.end() && !steps->is_null()) {
        if (!steps->is_array()) return Invalid(id, where + "'processing_steps' must be an array");
        for (size_t i = 0; i < steps->size(); ++i) {
            auto parsed = ParseStep((*steps)[i]);
            if (!parsed) {
                return DefinitionError{parsed.error().kind, "component '" + id + "': " + where + "step " +
                                                                std::to_string(i + 1) + ": " + parsed.error().message};
            }
            out.push_back(std::move(*parsed));
        }
    }
    if (out.empty()) out.push_back(step::ExtractAllToRoot{});
    return std::nullopt;
}

std::optional<DefinitionError> ParseAssetPatterns(const std::string& id,
                                                  const nlohmann::json& list,
                                                  std::vector<AssetRecipe>& out) {
    if (!list.is_array() || list.empty()) return Invalid(id, "'asset_patterns' must be a non-empty array");
    for (size_t i = 0; i < list.size(); ++i) {
        const std::string where = "asset " + std::to_string(i + 1) + ": ";
        const auto& item = list[i];
        if (!item.is_object()) return Invalid(id, where + "must be an object");

        AssetRecipe recipe;
        std::string err;
        if (!GetOptionalString(item, "pattern", recipe.pattern, err)) return Invalid(id, where + err);
        if (recipe.pattern.empty()) return Invalid(id, where + "missing 'pattern'");
        if (auto e = ParseStepList(id, where, item, recipe.steps)) return e;
        out.push_back(std::move(recipe));
    }
    return std::nullopt;
}

} // namespace

std::vector<AssetRecipe> AssetRecipes(const ComponentDefinition& def) {
    if (!def.assets.empty()) return def.assets;
    AssetRecipe single;
    if (const auto* rel = std::get_if<ReleaseSource>(&def.source)) single.pattern = rel->asset_pattern;
    single.steps = def.steps;
    return {std::move(single)};
}

std::string DescribeSource(const ComponentSource& source) {
    if (const auto* rel = std::get_if<ReleaseSource>(&source)) return rel->owner + "/" + rel->repo;
    return std::get<DirectSource>(source).url;
}

bool IsValidComponentId(const std::string& id) {
    if (id.empty()) return false;
    return std::all_of(id.begin(), id.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-';
    });
}

std::expected<ComponentDefinition, DefinitionError>
ParseComponentDefinition(const std::string& id, const nlohmann::json& j) {
    if (!IsValidComponentId(id)) {
        return std::unexpected(Invalid(id, "id must be non-empty and use only letters, digits, '_' and '-'"));
    }
    if (!j.is_object()) return std::unexpected(Invalid(id, "definition must be an object"));

    ComponentDefinition def;
    def.id = id;

    std::string err;
    std::string source_type, repo, url, asset_pattern;
    if (!GetOptionalString(j, "name", def.name, err) ||
        !GetOptionalString(j, "category", def.category, err) ||
        !GetOptionalString(j, "description", def.description, err) ||
        !GetOptionalString(j, "source_type", source_type, err) ||
        !GetOptionalString(j, "repo", repo, err) ||
        !GetOptionalString(j, "url", url, err) ||
        !GetOptionalString(j, "asset_pattern", asset_pattern, err) ||
        !GetOptionalString(j, "pinned_version", def.pinned_version, err)) {
        return std::unexpected(Invalid(id, err));
    }
    if (def.name.empty()) def.name = id;
    if (def.category.empty()) def.category = "Uncategorized";

    if (source_type.empty()) source_type = url.empty() ? "github_release" : "direct_url";

    auto patterns = j.find("asset_patterns");
    const bool multi = patterns != j.end() && !patterns->is_null();
    if (multi) {
        if (auto e = ParseAssetPatterns(id, *patterns, def.assets)) return std::unexpected(*e);
    }

    if (source_type == "github_release") {
        ReleaseSource rel;
        if (!SplitRepo(repo, rel.owner, rel.repo)) {
            return std::unexpected(Invalid(id, "'repo' must be 'owner/name', got '" + repo + "'"));
        }
        if (multi) asset_pattern = def.assets.front().pattern;
        if (asset_pattern.empty()) return std::unexpected(Invalid(id, "missing 'asset_pattern'"));
        rel.asset_pattern = asset_pattern;
        def.source = rel;
    } else if (source_type == "direct_url") {
        if (multi) return std::unexpected(Invalid(id, "'asset_patterns' needs a github_release source"));
        DirectSource direct;
        direct.url = url.empty() ? repo : url;
        if (direct.url.empty()) return std::unexpected(Invalid(id, "direct_url source needs 'url'"));
        def.source = direct;
    } else {
        return std::unexpected(Invalid(id, "unknown source_type '" + source_type + "'"));
    }

    auto info = j.find("asset_info");
    if (info != j.end() && !info->is_null()) {
        if (!info->is_object()) return std::unexpected(Invalid(id, "'asset_info' must be an object"));
        ResolvedAsset cached;
        if (!GetOptionalString(*info, "version", cached.version, err) ||
            !GetOptionalString(*info, "download_url", cached.download_url, err) ||
            !GetOptionalString(*info, "filename", cached.filename, err)) {
            return std::unexpected(Invalid(id, "asset_info: " + err));
        }
        if (!cached.download_url.empty()) def.resolved = cached;
    }

    // A multi-asset component places each asset with its own steps; the
    // first asset's steps stand in for the component-level list.
    if (multi) {
        def.steps = def.assets.front().steps;
    } else if (auto e = ParseStepList(id, "", j, def.steps)) {
        return std::unexpected(*e);
    }

    return def;
}

Result ComponentRegistry::LoadFile(const std::string& path, ComponentRegistry& out) {
    std::string text;
    auto res = ReadFileToString(path, text);
    if (!res.is_ok()) return res;

    nlohmann::ordered_json j;
    try {
        j = nlohmann::ordered_json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return Result::Fail(ErrorKind::DefinitionInvalid, "Registry " + path + " is not valid JSON: " + e.what());
    }

    res = LoadJson(j, out);
    if (!res.is_ok()) res.msg = path + ": " + res.msg;
    return res;
}

Result ComponentRegistry::LoadJson(const nlohmann::ordered_json& j, ComponentRegistry& out) {
    if (!j.is_object()) return Result::Fail(ErrorKind::DefinitionInvalid, "registry must be a JSON object");

    ComponentRegistry reg;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (reg.Find(it.key())) {
            return Result::Fail(ErrorKind::DefinitionInvalid, "duplicate component id '" + it.key() + "'");
        }
        auto def = ParseComponentDefinition(it.key(), nlohmann::json::parse(it.value().dump()));
        if (!def) return Result::Fail(def.error().kind, def.error().message);
        reg.components_.push_back(std::move(*def));
        reg.raw_.push_back(it.value());
    }

    LogDebug("Loaded %zu component definitions", reg.components_.size());
    out = std::move(reg);
    return Result::Ok();
}

nlohmann::ordered_json ComponentRegistry::ToJson() const {
    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    for (size_t i = 0; i < components_.size(); ++i) {
        const auto& def = components_[i];
        nlohmann::ordered_json obj = raw_[i];
        if (def.resolved) {
            obj["asset_info"] = {
                {"version", def.resolved->version},
                {"download_url", def.resolved->download_url},
                {"filename", def.resolved->filename},
            };
        }
        j[def.id] = std::move(obj);
    }
    return j;
}

Result ComponentRegistry::SaveFile(const std::string& path) const {
    return WriteFileAtomic(path, ToJson().dump(2) + "\n");
}

const ComponentDefinition* ComponentRegistry::Find(const std::string& id) const {
    for (const auto& def : components_) {
        if (def.id == id) return &def;
    }
    return nullptr;
}

ComponentDefinition* ComponentRegistry::Find(const std::string& id) {
    for (auto& def : components_) {
        if (def.id == id) return &def;
    }
    return nullptr;
}

void ComponentRegistry::UpdateResolved(const std::string& id, const ResolvedAsset& asset) {
    if (auto* def = Find(id)) def->resolved = asset;
}

} // namespace packsmith
