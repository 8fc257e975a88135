#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace packsmith {

class FileReader final : public IReader {
public:
    static Result Open(std::string path, FileReader &out);

    std::optional<std::uint64_t> TotalSize() const override;
    ssize_t Read(std::span<std::uint8_t> out) override;

    const std::string& Path() const { return path_; }

private:
    std::string path_;
    Fd fd_;
    std::optional<std::uint64_t> size_;
};

// Reads a whole (small) file, e.g. a JSON document.
Result ReadFileToString(const std::string& path, std::string& out);

} // namespace packsmith
