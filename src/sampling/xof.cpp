#include "xof.hpp"
#include "../core/side_channel.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace pqlattice {
namespace sampling {

namespace {

constexpr size_t SHAKE128_RATE = 168;
constexpr size_t SHAKE256_RATE = 136;

using CtxPtr = std::unique_ptr<EVP_MD_CTX, void (*)(EVP_MD_CTX*)>;

CtxPtr absorb(const EVP_MD* md, std::initializer_list<ByteView> parts) {
    CtxPtr ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("Failed to create EVP_MD_CTX");
    }
    if (md == nullptr || EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1) {
        throw std::runtime_error("Failed to initialize digest");
    }
    for (const auto& part : parts) {
        if (part.size > 0 && EVP_DigestUpdate(ctx.get(), part.data, part.size) != 1) {
            throw std::runtime_error("Failed to update digest");
        }
    }
    return ctx;
}

} // anonymous namespace

Digest hash(std::initializer_list<ByteView> parts) {
    CtxPtr ctx = absorb(EVP_sha3_256(), parts);
    Digest out{};
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &out_len) != 1 || out_len != out.size()) {
        throw std::runtime_error("Failed to finalize SHA3-256");
    }
    return out;
}

std::vector<uint8_t> shake256(std::initializer_list<ByteView> parts, size_t out_len) {
    CtxPtr ctx = absorb(EVP_shake256(), parts);
    std::vector<uint8_t> out(out_len);
    if (EVP_DigestFinalXOF(ctx.get(), out.data(), out.size()) != 1) {
        throw std::runtime_error("Failed to finalize SHAKE256");
    }
    return out;
}

Xof::Xof(XofKind kind, std::initializer_list<ByteView> parts) {
    const EVP_MD* md = (kind == XofKind::Shake128) ? EVP_shake128() : EVP_shake256();
    CtxPtr ctx = absorb(md, parts);
    absorbed_.reset(ctx.release());
    refill(kind == XofKind::Shake128 ? 4 * SHAKE128_RATE : 4 * SHAKE256_RATE);
}

Xof::~Xof() {
    side_channel::secure_wipe(buffer_);
}

void Xof::squeeze(uint8_t* out, size_t len) {
    if (position_ + len > buffer_.size()) {
        refill(position_ + len);
    }
    std::memcpy(out, buffer_.data() + position_, len);
    position_ += len;
}

// Finalizing a copy of the absorbed state yields a longer prefix of the same
// stream, so earlier output stays valid.
void Xof::refill(size_t needed) {
    size_t target = std::max(needed, buffer_.size() * 2);
    CtxPtr copy(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!copy || EVP_MD_CTX_copy_ex(copy.get(), absorbed_.get()) != 1) {
        throw std::runtime_error("Failed to copy XOF state");
    }
    std::vector<uint8_t> out(target);
    if (EVP_DigestFinalXOF(copy.get(), out.data(), out.size()) != 1) {
        throw std::runtime_error("Failed to squeeze XOF");
    }
    buffer_.swap(out);
    side_channel::secure_wipe(out);
}

} // namespace sampling
} // namespace pqlattice
