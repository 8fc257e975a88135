#pragma once

#include "util/result.hpp"

#include <string>

namespace packsmith {

// Zips every regular file and directory below src_dir into out_path, in
// sorted path order. The zip is written next to out_path and renamed into
// place once complete.
Result WriteZipFromDirectory(const std::string& src_dir, const std::string& out_path);

} // namespace packsmith
