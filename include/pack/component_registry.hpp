#pragma once

#include "pack/component.hpp"
#include "util/result.hpp"

#include <nlohmann/json.hpp>

#include <expected>
#include <string>
#include <vector>

namespace packsmith {

// Component definitions keyed by id, kept in file order.
class ComponentRegistry {
  public:
    // Validates every definition; the first invalid one fails the load with
    // DefinitionInvalid or UnsupportedAction naming the component.
    static Result LoadFile(const std::string& path, ComponentRegistry& out);
    static Result LoadJson(const nlohmann::ordered_json& j, ComponentRegistry& out);

    // Writes the definitions, including resolution caches, atomically.
    Result SaveFile(const std::string& path) const;
    nlohmann::ordered_json ToJson() const;

    const ComponentDefinition* Find(const std::string& id) const;
    ComponentDefinition* Find(const std::string& id);

    const std::vector<ComponentDefinition>& All() const { return components_; }
    void UpdateResolved(const std::string& id, const ResolvedAsset& asset);

  private:
    std::vector<ComponentDefinition> components_;
    std::vector<nlohmann::ordered_json> raw_; // as loaded, for saving
};

std::expected<ComponentDefinition, DefinitionError>
ParseComponentDefinition(const std::string& id, const nlohmann::json& j);

bool IsValidComponentId(const std::string& id);

} // namespace packsmith
