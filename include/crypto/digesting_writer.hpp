#pragma once

#include "crypto/digest.hpp"
#include "io/io.hpp"

#include <string>

namespace packsmith {

// Forwards to another writer while hashing what passes through.
class DigestingWriter final : public IWriter {
  public:
    DigestingWriter(IWriter& inner, DigestAlgorithm algo) : inner_(inner), hasher_(algo) {}

    Result WriteAll(std::span<const std::uint8_t> in) override {
        hasher_.Update(in);
        return inner_.WriteAll(in);
    }

    Result FsyncNow() override { return inner_.FsyncNow(); }

    std::string FinalHex() { return hasher_.FinalHex(); }

  private:
    IWriter& inner_;
    DigestHasher hasher_;
};

} // namespace packsmith
