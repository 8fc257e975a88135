#pragma once

#include "io/io.hpp"

#include <cstdint>
#include <span>
#include <string>

namespace packsmith {

class MemoryWriter final : public IWriter {
  public:
    explicit MemoryWriter(std::uint64_t limit = 64 * 1024 * 1024ULL) : limit_(limit) {}

    Result WriteAll(std::span<const std::uint8_t> in) override {
        if (data_.size() + in.size() > limit_) {
            return Result::Fail(ErrorKind::Io, "in-memory response exceeds limit");
        }
        data_.append(reinterpret_cast<const char*>(in.data()), in.size());
        return Result::Ok();
    }

    Result FsyncNow() override { return Result::Ok(); }

    const std::string& Data() const { return data_; }

  private:
    std::string data_;
    std::uint64_t limit_ = 0;
};

} // namespace packsmith
