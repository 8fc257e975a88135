#include "pack/target_root_lock.hpp"

#include <filesystem>
#include <map>

namespace packsmith {

namespace {

std::shared_ptr<std::mutex> MutexForRoot(const std::string& root) {
    static std::mutex registry_mutex;
    static std::map<std::string, std::shared_ptr<std::mutex>> registry;

    std::error_code ec;
    std::string key = std::filesystem::weakly_canonical(root, ec).string();
    if (ec) key = root;

    std::lock_guard<std::mutex> guard(registry_mutex);
    auto& slot = registry[key];
    if (!slot) slot = std::make_shared<std::mutex>();
    return slot;
}

} // namespace

TargetRootLock::TargetRootLock(const std::string& root)
    : mutex_(MutexForRoot(root)), lock_(*mutex_) {}

} // namespace packsmith
