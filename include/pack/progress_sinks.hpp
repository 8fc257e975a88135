#pragma once

#include "pack/progress.hpp"

#include <cstdint>
#include <mutex>
#include <string>

namespace packsmith {

// Single-line download progress on stderr, redrawn at most every 10%.
class ConsoleProgressSink final : public IProgress {
public:
    ConsoleProgressSink() = default;

    void OnProgress(const ProgressEvent& e) override;

private:
    std::mutex mu_;
    std::string last_component_;
    int last_pct_ = -1;
};

bool IsProgressLineActive();
void ClearProgressLine();

} // namespace packsmith
