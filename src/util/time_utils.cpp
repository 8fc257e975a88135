#include "util/time_utils.hpp"

#include <ctime>

namespace packsmith {

namespace {

std::string FormatUtcNow(const char* fmt) {
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    if (gmtime_r(&now, &tm) == nullptr) return {};
    char buf[64]{};
    const size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
    return std::string(buf, n);
}

} // namespace

std::string NowIso8601Utc() { return FormatUtcNow("%Y-%m-%dT%H:%M:%SZ"); }

std::string TodayUtc() { return FormatUtcNow("%Y-%m-%d"); }

std::string CompactUtcStamp() { return FormatUtcNow("%Y%m%dT%H%M%SZ"); }

} // namespace packsmith
