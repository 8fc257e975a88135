#include "pack/install_state.hpp"

namespace packsmith {

namespace {

constexpr int kStateFormat = 1;

nlohmann::json EntryToJson(const InstalledEntry& e) {
    return nlohmann::json{
        {"component_id", e.component_id},
        {"installed_at", e.installed_at},
        {"version", e.version},
        {"name", e.name},
        {"owned_paths", e.owned_paths},
    };
}

// Throws nlohmann::json::exception on a malformed entry.
InstalledEntry EntryFromJson(const nlohmann::json& j) {
    InstalledEntry e;
    e.component_id = j.at("component_id").get<std::string>();
    e.installed_at = j.value("installed_at", std::string());
    e.version = j.value("version", std::string());
    e.name = j.value("name", std::string());
    e.owned_paths = j.at("owned_paths").get<std::vector<std::string>>();
    return e;
}

std::expected<nlohmann::json, std::string> ParseStateObject(std::string_view text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return std::unexpected(std::string(e.what()));
    }
    if (!j.is_object()) return std::unexpected(std::string("state must be a JSON object"));

    const int format = j.value("format", kStateFormat);
    if (format != kStateFormat) {
        return std::unexpected("unsupported state format " + std::to_string(format));
    }
    return j;
}

} // namespace

std::expected<InstalledState, std::string> ParseInstalledState(std::string_view text) {
    auto j = ParseStateObject(text);
    if (!j) return std::unexpected(j.error());

    InstalledState state;
    try {
        for (const auto& c : j->at("components")) {
            state.components.push_back(EntryFromJson(c));
            if (state.components.back().component_id.empty()) {
                return std::unexpected(std::string("component entry without component_id"));
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(std::string(e.what()));
    }
    return state;
}

std::expected<TrashState, std::string> ParseTrashState(std::string_view text) {
    auto j = ParseStateObject(text);
    if (!j) return std::unexpected(j.error());

    TrashState state;
    try {
        for (const auto& r : j->at("entries")) {
            TrashRecord rec;
            rec.component_id = r.at("component_id").get<std::string>();
            rec.original_relative_path = r.at("original_relative_path").get<std::string>();
            rec.trash_relative_path = r.at("trash_relative_path").get<std::string>();
            rec.moved_at = r.value("moved_at", std::string());
            rec.generation = r.at("generation").get<std::string>();
            rec.missing = r.value("missing", false);
            if (rec.component_id.empty() || rec.original_relative_path.empty()) {
                return std::unexpected(std::string("incomplete trash entry"));
            }
            state.records.push_back(std::move(rec));
        }
        for (const auto& s : j->at("snapshots")) {
            TrashSnapshot snap;
            snap.generation = s.at("generation").get<std::string>();
            snap.entry = EntryFromJson(s.at("entry"));
            state.snapshots.push_back(std::move(snap));
        }
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(std::string(e.what()));
    }
    return state;
}

std::string SerializeInstalledState(const InstalledState& state) {
    nlohmann::json comps = nlohmann::json::array();
    for (const auto& e : state.components) comps.push_back(EntryToJson(e));

    nlohmann::json j{{"format", kStateFormat}, {"components", std::move(comps)}};
    return j.dump(2) + "\n";
}

std::string SerializeTrashState(const TrashState& state) {
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& r : state.records) {
        entries.push_back(nlohmann::json{
            {"component_id", r.component_id},
            {"original_relative_path", r.original_relative_path},
            {"trash_relative_path", r.trash_relative_path},
            {"moved_at", r.moved_at},
            {"generation", r.generation},
            {"missing", r.missing},
        });
    }

    nlohmann::json snaps = nlohmann::json::array();
    for (const auto& s : state.snapshots) {
        snaps.push_back(nlohmann::json{{"generation", s.generation}, {"entry", EntryToJson(s.entry)}});
    }

    nlohmann::json j{{"format", kStateFormat}, {"entries", std::move(entries)}, {"snapshots", std::move(snaps)}};
    return j.dump(2) + "\n";
}

} // namespace packsmith
