#pragma once

#include <string>

namespace packsmith {

// "2026-10-19T14:03:11Z"
std::string NowIso8601Utc();

// "2026-10-19"
std::string TodayUtc();

// "20261019T140311Z", usable as a path segment.
std::string CompactUtcStamp();

} // namespace packsmith
