/**
 * @file xof.hpp
 * @brief Hash and extendable-output functions (OpenSSL EVP)
 *
 * hash()      SHA3-256, 32-byte digest
 * shake256()  fixed-length SHAKE256 output
 * Xof         SHAKE128 / SHAKE256 byte stream of unbounded length
 *
 * All inputs are concatenations of byte strings; ByteView lets callers pass
 * vectors, arrays and raw buffers without copying.
 *
 * @version 1.0.0
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <vector>

#include <openssl/evp.h>

namespace pqlattice {
namespace sampling {

using Digest = std::array<uint8_t, 32>;
using Seed = std::array<uint8_t, 32>;

/**
 * @brief Non-owning view of a byte string
 */
struct ByteView {
    const uint8_t* data;
    size_t size;

    ByteView(const uint8_t* d, size_t n) : data(d), size(n) {}
    ByteView(const std::vector<uint8_t>& v) : data(v.data()), size(v.size()) {}
    template<size_t Len>
    ByteView(const std::array<uint8_t, Len>& a) : data(a.data()), size(Len) {}
};

enum class XofKind : uint8_t {
    Shake128,
    Shake256
};

/**
 * @brief SHA3-256 of the concatenated parts
 * @throws std::runtime_error if the digest cannot be computed
 */
Digest hash(std::initializer_list<ByteView> parts);

/**
 * @brief SHAKE256 of the concatenated parts, out_len bytes
 * @throws std::runtime_error if the digest cannot be computed
 */
std::vector<uint8_t> shake256(std::initializer_list<ByteView> parts, size_t out_len);

/**
 * @brief Streaming XOF reader
 *
 * Absorbs its input once; squeeze() returns successive bytes of the output
 * stream. Output is independent of how reads are split.
 */
class Xof {
public:
    Xof(XofKind kind, std::initializer_list<ByteView> parts);
    ~Xof();

    Xof(const Xof&) = delete;
    Xof& operator=(const Xof&) = delete;
    Xof(Xof&&) noexcept = default;
    Xof& operator=(Xof&&) noexcept = default;

    void squeeze(uint8_t* out, size_t len);

    uint8_t next_byte() {
        if (position_ == buffer_.size()) {
            refill(position_ + 1);
        }
        return buffer_[position_++];
    }

private:
    struct CtxDeleter {
        void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
    };

    void refill(size_t needed);

    std::unique_ptr<EVP_MD_CTX, CtxDeleter> absorbed_;
    std::vector<uint8_t> buffer_;
    size_t position_ = 0;
};

} // namespace sampling
} // namespace pqlattice
