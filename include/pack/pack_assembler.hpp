#pragma once

#include "net/downloader.hpp"
#include "net/release_index.hpp"
#include "pack/component_registry.hpp"
#include "pack/pack_metadata.hpp"
#include "pack/progress.hpp"
#include "util/pipeline_config.hpp"
#include "util/result.hpp"

#include <string>
#include <unordered_set>
#include <vector>

namespace packsmith {

enum class AssembleMode {
    ToArchive,    // staging tree zipped into a distributable pack
    ToTargetRoot, // placed on the live root and recorded in its tracker
};

struct AssembleOptions {
    AssembleMode mode = AssembleMode::ToArchive;
    std::string target_root;       // ToTargetRoot
    std::string output_dir;        // ToArchive
    std::string skeleton_path;     // ToArchive; falls back to PipelineConfig::skeleton_path
    std::string previous_manifest; // ToArchive; manifest.json or pack zip for the changelog
    std::string comment;           // ToArchive; build notes in the summary
};

struct ComponentFailure {
    std::string component_id;
    ErrorKind kind = ErrorKind::None;
    std::string action; // step action, or resolve/download/open/record_install
    std::string message;
    std::vector<std::string> partial_paths;
};

struct ComponentBuild {
    std::string component_id;
    std::string version;
    std::string asset_sha256; // first asset
    std::vector<PackAssetInfo> assets;
    std::vector<std::string> files;
};

struct BuildResult {
    std::vector<ComponentBuild> components; // succeeded, selection order
    std::vector<ComponentFailure> failures;
    std::string pack_path;    // ToArchive, empty when nothing was written
    std::string content_hash; // ToArchive
    std::string supported_firmware = kUnknownFirmware; // ToArchive

    bool AllSucceeded() const { return failures.empty(); }
};

class PackAssembler {
  public:
    PackAssembler(ComponentRegistry& registry,
                  IDownloader& downloader,
                  IReleaseIndex& releases,
                  const PipelineConfig& cfg,
                  IProgress* progress = nullptr);

    // Component failures land in out.failures and never stop the others.
    // The returned Result only fails when the run as a whole cannot proceed
    // (work directory, tracker state, writing the pack).
    Result Assemble(const std::vector<std::string>& ids, const AssembleOptions& opt, BuildResult& out);

  private:
    struct Fetched;

    void FetchOne(const ComponentDefinition& def, const std::string& download_dir, size_t index, Fetched& out) const;
    Result SeedSkeleton(const std::string& skeleton,
                        const std::string& staging,
                        std::unordered_set<std::string>& placed) const;
    std::string SupportedFirmware(const BuildResult& build, const PackManifest* previous) const;
    Result WritePack(const AssembleOptions& opt,
                     const std::string& staging,
                     BuildResult& out) const;

    ComponentRegistry& registry_;
    IDownloader& downloader_;
    IReleaseIndex& releases_;
    const PipelineConfig& cfg_;
    IProgress* progress_ = nullptr;
};

} // namespace packsmith
