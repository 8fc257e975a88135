#pragma once

#include <memory>
#include <mutex>
#include <string>

namespace packsmith {

// Process-wide writer lock for one target root. Roots are compared after
// canonicalisation, so two spellings of the same directory share a lock.
class TargetRootLock {
  public:
    explicit TargetRootLock(const std::string& root);

    TargetRootLock(const TargetRootLock&) = delete;
    TargetRootLock& operator=(const TargetRootLock&) = delete;

  private:
    std::shared_ptr<std::mutex> mutex_;
    std::unique_lock<std::mutex> lock_;
};

} // namespace packsmith
