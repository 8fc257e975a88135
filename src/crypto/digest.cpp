#include "crypto/digest.hpp"

#include "io/file_reader.hpp"

#include <openssl/evp.h>

#include <vector>

namespace packsmith {

namespace {

std::string HexEncode(std::span<const std::uint8_t> bytes) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(bytes.size() * 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        out[i * 2] = kHex[(bytes[i] >> 4) & 0xF];
        out[i * 2 + 1] = kHex[bytes[i] & 0xF];
    }
    return out;
}

const EVP_MD* MdFor(DigestAlgorithm algo) {
    switch (algo) {
        case DigestAlgorithm::Sha1:   return EVP_sha1();
        case DigestAlgorithm::Sha256: return EVP_sha256();
    }
    return nullptr;
}

class EvpCtx final {
public:
    EvpCtx() : ctx_(EVP_MD_CTX_new()) {}
    EvpCtx(const EvpCtx&) = delete;
    EvpCtx& operator=(const EvpCtx&) = delete;
    ~EvpCtx() {
        if (ctx_) EVP_MD_CTX_free(ctx_);
    }

    EVP_MD_CTX* get() const { return ctx_; }
    bool ok() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_ = nullptr;
};

bool InitDigest(EvpCtx& ctx, DigestAlgorithm algo) {
    const EVP_MD* md = MdFor(algo);
    return ctx.ok() && md && EVP_DigestInit_ex(ctx.get(), md, nullptr) == 1;
}

bool UpdateDigest(EvpCtx& ctx, std::span<const std::uint8_t> data) {
    if (data.empty()) return true;
    return EVP_DigestUpdate(ctx.get(), data.data(), data.size()) == 1;
}

std::string FinalDigestHex(EvpCtx& ctx) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1) return {};
    return HexEncode(std::span<const std::uint8_t>(digest, len));
}

} // namespace

struct DigestHasher::Impl {
    EvpCtx ctx;
    bool initialized = false;
    bool finalized = false;
};

DigestHasher::DigestHasher(DigestAlgorithm algo) : impl_(std::make_unique<Impl>()) {
    if (InitDigest(impl_->ctx, algo)) {
        impl_->initialized = true;
    }
}

DigestHasher::DigestHasher(DigestHasher&&) noexcept = default;
DigestHasher& DigestHasher::operator=(DigestHasher&&) noexcept = default;
DigestHasher::~DigestHasher() = default;

void DigestHasher::Update(std::span<const std::uint8_t> data) {
    if (!impl_ || !impl_->initialized || impl_->finalized) return;
    if (!UpdateDigest(impl_->ctx, data)) {
        impl_->finalized = true;
    }
}

std::string DigestHasher::FinalHex() {
    if (!impl_ || !impl_->initialized || impl_->finalized) return {};
    impl_->finalized = true;
    return FinalDigestHex(impl_->ctx);
}

std::string DigestHex(DigestAlgorithm algo, std::span<const std::uint8_t> data) {
    EvpCtx ctx;
    if (!InitDigest(ctx, algo)) return {};
    if (!UpdateDigest(ctx, data)) return {};
    return FinalDigestHex(ctx);
}

std::string DigestHex(DigestAlgorithm algo, std::string_view data) {
    return DigestHex(algo, std::span<const std::uint8_t>(
                               reinterpret_cast<const std::uint8_t*>(data.data()), data.size()));
}

Result DigestHexFile(DigestAlgorithm algo, const std::string& path, std::string& out_hex) {
    FileReader reader;
    auto r = FileReader::Open(path, reader);
    if (!r.is_ok()) return r;

    DigestHasher hasher(algo);
    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) return Result::Fail(ErrorKind::Io, "read failed while hashing " + path);
        hasher.Update(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
    }

    out_hex = hasher.FinalHex();
    if (out_hex.empty()) return Result::Fail(ErrorKind::Io, "digest failed for " + path);
    return Result::Ok();
}

} // namespace packsmith
