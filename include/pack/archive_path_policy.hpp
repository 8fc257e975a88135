#pragma once

#include "util/result.hpp"

#include <string>
#include <string_view>

namespace packsmith {

class ArchivePathPolicy {
  public:
    // Archive entry names. Absolute paths, ".." segments and backslashes are
    // UnsafeArchivePath. An empty result means the archive root itself.
    static Result NormalizeEntryPath(const char* raw_path, std::string& out_relative);

    // Paths from component definitions ("target_path", "subfolder_name",
    // "path"). A leading "/" is relative to the target root, so "" and "/"
    // both mean the root. ".." and backslashes are rejected.
    static Result NormalizeDefinitionPath(std::string_view raw, std::string& out_relative);

    // root/rel with symlinks in the existing prefix resolved; fails with
    // UnsafeArchivePath when the result escapes root.
    static Result ResolveUnderRoot(const std::string& root,
                                   const std::string& rel,
                                   std::string& out_absolute);

  private:
    static bool HasUnsafeSegment(std::string_view p);
};

} // namespace packsmith
