#pragma once

namespace packsmith {

// Set by the build from the CMake project version.
inline constexpr const char* kPackSmithVersion = PACKSMITH_VERSION;

} // namespace packsmith
