#pragma once

#include <string_view>

namespace packsmith {

// Shell-style match ('*', '?', '[...]'), case-insensitive, no escapes. An
// unclosed '[' matches itself.
bool GlobMatch(std::string_view pattern, std::string_view name);

} // namespace packsmith
