#pragma once

#include "pack/archive_handle.hpp"
#include "pack/step.hpp"
#include "util/result.hpp"

#include <atomic>
#include <string>
#include <vector>

namespace packsmith {

struct StepReport {
    // Files written, relative to the target root, first-write order, no
    // duplicates. On failure: what earlier steps (and the failed one) wrote.
    std::vector<std::string> written;
    std::string failed_action;
};

class StepProcessor {
  public:
    StepProcessor() = default;
    explicit StepProcessor(const std::atomic_bool* cancel) : cancel_(cancel) {}

    // Runs steps in order; the first failing step stops the rest. Failures
    // are StepExecutionFailed unless a more specific kind applies
    // (UnsafeArchivePath, AmbiguousSourceMatch, InsufficientSpace, Cancelled).
    Result Apply(const std::vector<Step>& steps,
                 const ArchiveHandle& archive,
                 const std::string& target_root,
                 StepReport& report) const;

  private:
    const std::atomic_bool* cancel_ = nullptr;
};

} // namespace packsmith
