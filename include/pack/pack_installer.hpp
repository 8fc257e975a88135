#pragma once

#include "pack/pack_assembler.hpp"
#include "util/pipeline_config.hpp"
#include "util/result.hpp"

#include <string>
#include <vector>

namespace packsmith {

struct PackInstallReport {
    std::string pack_name;
    size_t files_written = 0;
    std::vector<std::string> recorded; // component ids now tracked
    std::vector<ComponentFailure> failures;
    std::vector<std::string> removed_summaries; // earlier packs' <prefix>-*.txt
};

// Unpacks a pack built in ToArchive mode onto a target root and records the
// components listed in its manifest.json.
class PackInstaller {
  public:
    explicit PackInstaller(const PipelineConfig& cfg) : cfg_(cfg) {}

    Result Install(const std::string& pack_path, const std::string& target_root, PackInstallReport& out) const;

  private:
    const PipelineConfig& cfg_;
};

} // namespace packsmith
