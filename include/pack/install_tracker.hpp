#pragma once

#include "pack/install_state.hpp"
#include "util/result.hpp"

#include <string>
#include <vector>

namespace packsmith {

// Outcome of a trash/restore/purge for one component.
struct ComponentOpResult {
    std::string component_id;
    Result result;
    std::vector<std::string> warnings;
    std::vector<std::string> conflicts; // restore: paths whose destination is occupied
    size_t moved = 0;
};

// Owns <root>/<state_dir>/installed.json and trash.json. Every mutation is
// written to disk before it returns. Not synchronised: callers writing into
// the same root hold its TargetRootLock.
class InstallTracker {
  public:
    // Fails with ManifestCorrupt when either state file cannot be parsed.
    static Result Open(const std::string& target_root, const std::string& state_dir, InstallTracker& out);

    // Replaces the component's entry with exactly paths. Files owned by the
    // previous entry but not listed now are deleted from the root.
    Result RecordInstall(const std::string& component_id,
                         const std::vector<std::string>& paths,
                         const std::string& version = {},
                         const std::string& name = {});

    std::vector<ComponentOpResult> MoveToTrash(const std::vector<std::string>& ids);
    std::vector<ComponentOpResult> Restore(const std::vector<std::string>& ids);
    std::vector<ComponentOpResult> Purge(const std::vector<std::string>& ids);

    const std::vector<InstalledEntry>& ListInstalled() const { return installed_.components; }
    const std::vector<TrashRecord>& ListTrashed() const { return trash_.records; }
    const std::vector<TrashSnapshot>& ListSnapshots() const { return trash_.snapshots; }

    const InstalledEntry* FindInstalled(const std::string& component_id) const;

    const std::string& Root() const { return root_; }
    std::string StateDirPath() const;

  private:
    ComponentOpResult TrashOne(const std::string& id);
    ComponentOpResult RestoreOne(const std::string& id);
    ComponentOpResult PurgeOne(const std::string& id);

    Result SaveInstalled() const;
    Result SaveTrash() const;
    Result DropTrashGeneration(const std::string& id);
    Result RemoveOwnedFile(const std::string& rel) const;
    void PruneEmptyParents(const std::string& rel) const;
    std::string Abs(const std::string& rel) const;

    std::string root_;
    std::string state_dir_; // relative to root_
    InstalledState installed_;
    TrashState trash_;
};

} // namespace packsmith
