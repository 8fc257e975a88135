#include "pack/step.hpp"

#include "pack/archive_path_policy.hpp"

#include <algorithm>
#include <map>
#include <optional>
#include <set>

namespace packsmith {

namespace {

struct ActionSpec {
    std::string_view name;
    std::vector<std::string_view> required;
    std::vector<std::string_view> optional;
};

const std::vector<ActionSpec>& ActionSpecs() {
    static const std::vector<ActionSpec> specs = {
        {"extract_all_to_root", {}, {}},
        {"extract_all_to_path", {"target_path"}, {}},
        {"extract_subfolder_to_path", {"subfolder_name"}, {"target_path"}},
        {"extract_root_folder_to_path", {}, {"target_path"}},
        {"copy_single_file", {"target_path"}, {}},
        {"copy_to_derived_folder", {"target_path"}, {}},
        {"find_and_copy", {"source_pattern", "target_path"}, {"required"}},
        {"find_and_rename", {"source_pattern", "target_path", "target_filename"}, {"required"}},
        {"delete_path", {"path"}, {}},
    };
    return specs;
}

std::string_view CanonicalAction(std::string_view action) {
    if (action == "unzip_to_root") return "extract_all_to_root";
    if (action == "unzip_to_path") return "extract_all_to_path";
    if (action == "copy_file") return "copy_single_file";
    if (action == "delete_file") return "delete_path";
    if (action == "unzip_subfolder_to_root") return "extract_root_folder_to_path";
    return action;
}

// The old editor saved a subfolder_name with unzip_subfolder_to_root that the
// builder never read; the top-level folder is always detected.
bool IgnoredLegacyParam(std::string_view raw_action, std::string_view key) {
    return raw_action == "unzip_subfolder_to_root" && key == "subfolder_name";
}

std::string_view CanonicalParam(std::string_view key) {
    if (key == "source_file_pattern") return "source_pattern";
    return key;
}

bool Contains(const std::vector<std::string_view>& v, std::string_view s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

DefinitionError Invalid(std::string msg) {
    return DefinitionError{ErrorKind::DefinitionInvalid, std::move(msg)};
}

struct Params {
    std::map<std::string, std::string, std::less<>> values;
    bool required = false;

    std::string Get(std::string_view key) const {
        auto it = values.find(key);
        return it == values.end() ? std::string() : it->second;
    }
};

std::optional<DefinitionError> CheckPath(std::string_view action,
                                         std::string_view key,
                                         const std::string& value,
                                         bool allow_root) {
    std::string rel;
    auto res = ArchivePathPolicy::NormalizeDefinitionPath(value, rel);
    if (!res.is_ok()) {
        return Invalid(std::string(action) + ": " + std::string(key) + " '" + value + "' is not a safe relative path");
    }
    if (!allow_root && rel.empty()) {
        return Invalid(std::string(action) + ": " + std::string(key) + " must not denote the target root");
    }
    return std::nullopt;
}

} // namespace

std::string_view StepActionName(const Step& s) {
    return ActionSpecs()[s.index()].name;
}

std::expected<Step, DefinitionError> ParseStep(const nlohmann::json& j) {
    if (!j.is_object()) return std::unexpected(Invalid("processing step must be an object"));

    auto action_it = j.find("action");
    if (action_it == j.end() || !action_it->is_string()) {
        return std::unexpected(Invalid("processing step is missing 'action'"));
    }
    const std::string raw_action = action_it->get<std::string>();
    const std::string_view action = CanonicalAction(raw_action);

    const auto& specs = ActionSpecs();
    auto spec_it = std::find_if(specs.begin(), specs.end(),
                                [&](const ActionSpec& s) { return s.name == action; });
    if (spec_it == specs.end()) {
        return std::unexpected(DefinitionError{ErrorKind::UnsupportedAction,
                                               "unsupported action '" + raw_action + "'"});
    }
    const ActionSpec& spec = *spec_it;

    Params p;
    std::set<std::string, std::less<>> seen;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.key() == "action" || IgnoredLegacyParam(raw_action, it.key())) continue;
        const std::string_view key = CanonicalParam(it.key());
        if (!Contains(spec.required, key) && !Contains(spec.optional, key)) {
            return std::unexpected(Invalid(std::string(action) + ": unknown parameter '" + it.key() + "'"));
        }
        if (!seen.emplace(key).second) {
            return std::unexpected(Invalid(std::string(action) + ": parameter '" + std::string(key) + "' given twice"));
        }
        if (key == "required") {
            if (!it->is_boolean()) {
                return std::unexpected(Invalid(std::string(action) + ": 'required' must be a boolean"));
            }
            p.required = it->get<bool>();
            continue;
        }
        if (!it->is_string()) {
            return std::unexpected(Invalid(std::string(action) + ": '" + it.key() + "' must be a string"));
        }
        p.values.emplace(std::string(key), it->get<std::string>());
    }

    for (auto key : spec.required) {
        if (p.Get(key).empty()) {
            return std::unexpected(Invalid(std::string(action) + ": missing '" + std::string(key) + "'"));
        }
    }

    for (auto key : {std::string_view("target_path"), std::string_view("subfolder_name"), std::string_view("path")}) {
        if (!p.values.contains(key)) continue;
        const bool allow_root = key == "target_path";
        if (auto err = CheckPath(action, key, p.Get(key), allow_root)) return std::unexpected(*err);
    }

    if (p.values.contains("target_filename")) {
        const std::string name = p.Get("target_filename");
        if (name.find('/') != std::string::npos || name.find('\\') != std::string::npos ||
            name == "." || name == "..") {
            return std::unexpected(Invalid(std::string(action) + ": target_filename must be a plain file name"));
        }
    }

    if (action == "extract_all_to_root") return step::ExtractAllToRoot{};
    if (action == "extract_all_to_path") return step::ExtractAllToPath{p.Get("target_path")};
    if (action == "extract_subfolder_to_path") {
        return step::ExtractSubfolderToPath{p.Get("subfolder_name"), p.Get("target_path")};
    }
    if (action == "extract_root_folder_to_path") return step::ExtractRootFolderToPath{p.Get("target_path")};
    if (action == "copy_single_file") return step::CopySingleFile{p.Get("target_path")};
    if (action == "copy_to_derived_folder") return step::CopyToDerivedFolder{p.Get("target_path")};
    if (action == "find_and_copy") {
        return step::FindAndCopy{p.Get("source_pattern"), p.Get("target_path"), p.required};
    }
    if (action == "find_and_rename") {
        return step::FindAndRename{p.Get("source_pattern"), p.Get("target_path"),
                                   p.Get("target_filename"), p.required};
    }
    return step::DeletePath{p.Get("path")};
}

namespace {

struct StepJsonVisitor {
    nlohmann::json& j;

    void operator()(const step::ExtractAllToRoot&) const {}
    void operator()(const step::ExtractAllToPath& s) const { j["target_path"] = s.target_path; }
    void operator()(const step::ExtractSubfolderToPath& s) const {
        j["subfolder_name"] = s.subfolder_name;
        if (!s.target_path.empty()) j["target_path"] = s.target_path;
    }
    void operator()(const step::ExtractRootFolderToPath& s) const {
        if (!s.target_path.empty()) j["target_path"] = s.target_path;
    }
    void operator()(const step::CopySingleFile& s) const { j["target_path"] = s.target_path; }
    void operator()(const step::CopyToDerivedFolder& s) const { j["target_path"] = s.target_path; }
    void operator()(const step::FindAndCopy& s) const {
        j["source_pattern"] = s.source_pattern;
        j["target_path"] = s.target_path;
        if (s.required) j["required"] = true;
    }
    void operator()(const step::FindAndRename& s) const {
        j["source_pattern"] = s.source_pattern;
        j["target_path"] = s.target_path;
        j["target_filename"] = s.target_filename;
        if (s.required) j["required"] = true;
    }
    void operator()(const step::DeletePath& s) const { j["path"] = s.path; }
};

} // namespace

nlohmann::json StepToJson(const Step& s) {
    nlohmann::json j = nlohmann::json::object();
    j["action"] = std::string(StepActionName(s));
    std::visit(StepJsonVisitor{j}, s);
    return j;
}

} // namespace packsmith
