#pragma once

#include "net/release_index.hpp"
#include "pack/component.hpp"
#include "pack/pack_metadata.hpp"
#include "util/result.hpp"

#include <string>
#include <string_view>

namespace packsmith {

// Firmware version release notes claim support for ("Basic support was added
// for 20.4.0", "HOS 19.0.1", "supports up to 18.1.0"). Empty when none.
std::string ExtractSupportedFirmware(std::string_view release_notes);

// Supported firmware of the release tagged version (with or without a leading
// "v"). Notes that name none inherit from the nearest older release that does.
// out is kUnknownFirmware when the release is not listed or nothing is named.
Result LookupSupportedFirmware(IReleaseIndex& index,
                               const ReleaseSource& source,
                               const std::string& version,
                               std::string& out);

} // namespace packsmith
