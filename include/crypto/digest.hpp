#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace packsmith {

enum class DigestAlgorithm {
    Sha1,
    Sha256,
};

std::string DigestHex(DigestAlgorithm algo, std::span<const std::uint8_t> data);
std::string DigestHex(DigestAlgorithm algo, std::string_view data);
Result DigestHexFile(DigestAlgorithm algo, const std::string& path, std::string& out_hex);

class DigestHasher {
public:
    explicit DigestHasher(DigestAlgorithm algo);
    DigestHasher(const DigestHasher&) = delete;
    DigestHasher& operator=(const DigestHasher&) = delete;
    DigestHasher(DigestHasher&&) noexcept;
    DigestHasher& operator=(DigestHasher&&) noexcept;
    ~DigestHasher();

    void Update(std::span<const std::uint8_t> data);
    // Empty string when the digest could not be computed.
    std::string FinalHex();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace packsmith
