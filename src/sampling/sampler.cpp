#include "sampler.hpp"
#include "../core/errors.hpp"
#include "../core/side_channel.hpp"

#include <string>
#include <vector>

namespace pqlattice {
namespace sampling {

using ring::N;
using ring::Poly;

namespace {

// Little-endian bit reader over an XOF stream
class BitReader {
public:
    explicit BitReader(Xof& xof) : xof_(xof) {}

    uint32_t take(unsigned bits) {
        while (filled_ < bits) {
            acc_ |= static_cast<uint64_t>(xof_.next_byte()) << filled_;
            filled_ += 8;
        }
        uint32_t v = static_cast<uint32_t>(acc_ & ((1ULL << bits) - 1));
        acc_ >>= bits;
        filled_ -= bits;
        return v;
    }

private:
    Xof& xof_;
    uint64_t acc_ = 0;
    unsigned filled_ = 0;
};

unsigned ceil_log2(uint32_t v) {
    unsigned bits = 0;
    while ((1ULL << bits) < v) {
        bits++;
    }
    return bits;
}

} // anonymous namespace

Poly expand_uniform(const ring::Ring& ring, const Seed& seed, uint8_t i, uint8_t j) {
    const uint8_t domain[2] = {j, i};
    Xof xof(XofKind::Shake128, {ByteView(seed), ByteView(domain, sizeof(domain))});

    const uint32_t q = ring.q();
    Poly p(ring::Domain::Transform);
    size_t filled = 0;
    uint8_t buf[3];

    if (q < (1u << 12)) {
        while (filled < N) {
            xof.squeeze(buf, 3);
            uint32_t d1 = (static_cast<uint32_t>(buf[0]) |
                           (static_cast<uint32_t>(buf[1]) << 8)) & 0xFFF;
            uint32_t d2 = (static_cast<uint32_t>(buf[1]) >> 4) |
                          (static_cast<uint32_t>(buf[2]) << 4);
            if (d1 < q) {
                p[filled++] = d1;
            }
            if (d2 < q && filled < N) {
                p[filled++] = d2;
            }
        }
    } else {
        while (filled < N) {
            xof.squeeze(buf, 3);
            uint32_t t = (static_cast<uint32_t>(buf[0]) |
                          (static_cast<uint32_t>(buf[1]) << 8) |
                          (static_cast<uint32_t>(buf[2]) << 16)) & 0x7FFFFF;
            if (t < q) {
                p[filled++] = t;
            }
        }
    }
    return p;
}

ring::PolyMatrix expand_matrix(const ring::Ring& ring, const Seed& seed, size_t rows, size_t cols) {
    if (rows == 0 || cols == 0 || rows > 255 || cols > 255) {
        throw InvalidParameterError("matrix dimensions " + std::to_string(rows) + "x" +
                                    std::to_string(cols) + " out of range");
    }
    ring::PolyMatrix a(rows);
    for (size_t i = 0; i < rows; i++) {
        a[i].reserve(cols);
        for (size_t j = 0; j < cols; j++) {
            a[i].push_back(expand_uniform(ring, seed, static_cast<uint8_t>(i),
                                          static_cast<uint8_t>(j)));
        }
    }
    return a;
}

Poly sample_cbd(const ring::Ring& ring, const Seed& seed, uint8_t nonce, unsigned eta) {
    if (eta < 1 || eta > 8) {
        throw InvalidParameterError("CBD parameter eta=" + std::to_string(eta) +
                                    " out of range");
    }
    Xof xof(XofKind::Shake256, {ByteView(seed), ByteView(&nonce, 1)});
    BitReader reader(xof);

    int32_t values[N];
    for (size_t i = 0; i < N; i++) {
        uint32_t bits = reader.take(2 * eta);
        int32_t a = 0;
        int32_t b = 0;
        for (unsigned k = 0; k < eta; k++) {
            a += static_cast<int32_t>((bits >> k) & 1);
            b += static_cast<int32_t>((bits >> (eta + k)) & 1);
        }
        values[i] = a - b;
    }
    Poly p = ring.from_signed(values);
    side_channel::secure_zero_memory(values, sizeof(values));
    return p;
}

Poly sample_uniform_gamma(const ring::Ring& ring, const Seed& seed, uint16_t nonce,
                          uint32_t gamma) {
    if (gamma < 2 || gamma > (1u << 24)) {
        throw InvalidParameterError("uniform bound " + std::to_string(gamma) + " out of range");
    }
    const uint8_t domain[2] = {static_cast<uint8_t>(nonce & 0xFF),
                               static_cast<uint8_t>(nonce >> 8)};
    Xof xof(XofKind::Shake256, {ByteView(seed), ByteView(domain, sizeof(domain))});
    BitReader reader(xof);

    const unsigned bits = ceil_log2(gamma);
    Poly p;
    size_t filled = 0;
    while (filled < N) {
        uint32_t candidate = reader.take(bits);
        if (candidate < gamma) {
            p[filled++] = ring.reduce(candidate);
        }
    }
    return p;
}

Poly sample_in_ball(const ring::Ring& ring, const Seed& seed, unsigned tau) {
    if (tau < 1 || tau > 64) {
        throw InvalidParameterError("challenge weight tau=" + std::to_string(tau) +
                                    " out of range");
    }
    Xof xof(XofKind::Shake256, {ByteView(seed)});

    uint8_t sign_bytes[8];
    xof.squeeze(sign_bytes, sizeof(sign_bytes));
    uint64_t signs = 0;
    for (size_t i = 0; i < 8; i++) {
        signs |= static_cast<uint64_t>(sign_bytes[i]) << (8 * i);
    }

    Poly c;
    for (size_t i = N - tau; i < N; i++) {
        size_t j;
        do {
            j = xof.next_byte();
        } while (j > i);
        c[i] = c[j];
        c[j] = (signs & 1) ? ring.q() - 1 : 1;
        signs >>= 1;
    }
    return c;
}

} // namespace sampling
} // namespace pqlattice
