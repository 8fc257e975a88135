#pragma once

#include <nlohmann/json.hpp>

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace packsmith {

struct InstalledEntry {
    std::string component_id;
    std::string installed_at;
    std::string version;
    std::string name;
    std::vector<std::string> owned_paths; // relative to the target root, install order
};

struct TrashRecord {
    std::string component_id;
    std::string original_relative_path;
    std::string trash_relative_path;
    std::string moved_at;
    std::string generation;
    bool missing = false; // path was already gone when trashed
};

// The manifest entry as it was right before the component was trashed.
struct TrashSnapshot {
    std::string generation;
    InstalledEntry entry;
};

struct InstalledState {
    std::vector<InstalledEntry> components;
};

struct TrashState {
    std::vector<TrashRecord> records;
    std::vector<TrashSnapshot> snapshots;
};

std::expected<InstalledState, std::string> ParseInstalledState(std::string_view text);
std::expected<TrashState, std::string> ParseTrashState(std::string_view text);

std::string SerializeInstalledState(const InstalledState& state);
std::string SerializeTrashState(const TrashState& state);

} // namespace packsmith
