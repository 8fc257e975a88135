#include "pack/progress_sinks.hpp"

#include <atomic>
#include <cstdio>

namespace packsmith {

namespace {
std::atomic_bool g_progress_line_active{false};
} // namespace

void ConsoleProgressSink::OnProgress(const ProgressEvent& e) {
    std::lock_guard<std::mutex> lk(mu_);

    const std::string cur_component(e.component);
    if (cur_component != last_component_) {
        last_component_ = cur_component;
        last_pct_ = -1;
    }

    if (e.total == 0) {
        std::fprintf(stderr,
                     "\r[%.*s] %.1f MB",
                     (int)e.component.size(),
                     e.component.data(),
                     static_cast<double>(e.done) / (1024.0 * 1024.0));
        std::fflush(stderr);
        g_progress_line_active = true;
        return;
    }

    int pct = static_cast<int>((e.done * 100ULL) / e.total);
    if (pct > 100)
        pct = 100;
    if (last_pct_ >= 0 && pct < last_pct_ + 10 && pct < 100)
        return;
    if (pct == last_pct_)
        return;
    last_pct_ = pct;

    std::fprintf(stderr,
                 "\r[%.*s] %3d%% (%.1f MB / %.1f MB)",
                 (int)e.component.size(),
                 e.component.data(),
                 pct,
                 static_cast<double>(e.done) / (1024.0 * 1024.0),
                 static_cast<double>(e.total) / (1024.0 * 1024.0));
    std::fflush(stderr);
    g_progress_line_active = true;

    if (pct >= 100) {
        std::fprintf(stderr, "\n");
        g_progress_line_active = false;
    }
}

bool IsProgressLineActive() { return g_progress_line_active.load(); }

void ClearProgressLine() {
    if (g_progress_line_active.exchange(false)) {
        std::fprintf(stderr, "\n");
    }
}

} // namespace packsmith
