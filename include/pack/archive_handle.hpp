#pragma once

#include "util/result.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "pack/archive_common.hpp"

namespace packsmith {

struct ArchiveEntry {
    std::string path; // normalised, relative, '/'-separated
    bool is_directory = false;
    std::uint64_t size = 0;
};

// A downloaded payload opened for placement. Every entry is validated when
// the handle is opened, so a handle that opened successfully never yields an
// unsafe path. Payloads libarchive does not recognise open as a single-file
// archive whose only entry is named after the download.
class ArchiveHandle {
  public:
    // Returns the absolute destination for an entry, or "" to skip it.
    using DestinationFn = std::function<std::string(const ArchiveEntry&)>;

    static Result OpenFile(const std::string& path, const std::string& name, ArchiveHandle& out);
    static Result OpenMemory(std::string bytes, const std::string& name, ArchiveHandle& out);

    // Directories include parents only implied by file paths.
    const std::vector<ArchiveEntry>& ListEntries() const { return entries_; }
    std::vector<ArchiveEntry> Files() const;

    const std::string& Name() const { return name_; }
    bool IsSingleFile() const { return single_file_; }

    void SetCancelFlag(const std::atomic_bool* cancel) { cancel_ = cancel; }

    // Writes one entry to dest, creating parent directories. An existing
    // file at dest is replaced.
    Result Extract(const std::string& entry_path, const std::string& dest) const;

    // Reads one (small) file entry into memory.
    Result ReadEntry(const std::string& entry_path, std::string& out) const;

    // One pass over the payload. Files go to dest_for(entry) and are appended
    // to written in archive order; mapped directory entries are created.
    Result ExtractEach(const DestinationFn& dest_for, std::vector<std::string>& written) const;

  private:
    Result OpenReader(std::unique_ptr<archive, ArchiveReadDeleter>& out) const;
    Result Scan();
    Result ExtractSingle(const DestinationFn& dest_for, std::vector<std::string>& written) const;

    std::string name_;
    std::string file_path_;
    std::shared_ptr<const std::string> bytes_;
    bool single_file_ = false;
    std::vector<ArchiveEntry> entries_;
    const std::atomic_bool* cancel_ = nullptr;
};

// True for names whose extension always denotes an archive container.
bool HasArchiveExtension(const std::string& filename);

} // namespace packsmith
