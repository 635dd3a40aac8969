#include "packing.hpp"
#include "../core/errors.hpp"

namespace pqlattice {
namespace ring {

void pack_bits(const Poly& p, unsigned width, std::vector<uint8_t>& out) {
    uint64_t acc = 0;
    unsigned filled = 0;
    uint32_t mask = (width >= 32) ? 0xFFFFFFFFu : ((1u << width) - 1);
    for (size_t i = 0; i < N; i++) {
        acc |= static_cast<uint64_t>(p[i] & mask) << filled;
        filled += width;
        while (filled >= 8) {
            out.push_back(static_cast<uint8_t>(acc));
            acc >>= 8;
            filled -= 8;
        }
    }
}

Poly unpack_bits(const uint8_t* in, unsigned width, uint32_t limit, Domain domain) {
    Poly p(domain);
    uint64_t acc = 0;
    unsigned filled = 0;
    size_t pos = 0;
    uint32_t mask = (width >= 32) ? 0xFFFFFFFFu : ((1u << width) - 1);
    uint32_t out_of_range = 0;
    for (size_t i = 0; i < N; i++) {
        while (filled < width) {
            acc |= static_cast<uint64_t>(in[pos++]) << filled;
            filled += 8;
        }
        uint32_t v = static_cast<uint32_t>(acc) & mask;
        acc >>= width;
        filled -= width;
        out_of_range |= (limit - 1 - v) >> 31;
        p[i] = v;
    }
    if (out_of_range) {
        throw MalformedInputError("coefficient out of range for " + std::to_string(width) +
                                  "-bit field");
    }
    return p;
}

void pack_offset(const Ring& ring, const Poly& p, unsigned width, uint32_t offset,
                 std::vector<uint8_t>& out) {
    Poly shifted;
    for (size_t i = 0; i < N; i++) {
        shifted[i] = static_cast<uint32_t>(static_cast<int64_t>(offset) - ring.centered(p[i]));
    }
    pack_bits(shifted, width, out);
}

Poly unpack_offset(const Ring& ring, const uint8_t* in, unsigned width, uint32_t offset,
                   uint32_t max_field) {
    Poly fields = unpack_bits(in, width, max_field + 1);
    Poly p;
    for (size_t i = 0; i < N; i++) {
        p[i] = ring.reduce(static_cast<int64_t>(offset) - fields[i]);
    }
    return p;
}

void pack_bits(const PolyVec& v, unsigned width, std::vector<uint8_t>& out) {
    for (const auto& p : v) {
        pack_bits(p, width, out);
    }
}

PolyVec unpack_bits(const uint8_t* in, size_t count, unsigned width, uint32_t limit,
                    Domain domain) {
    PolyVec v;
    v.reserve(count);
    for (size_t i = 0; i < count; i++) {
        v.push_back(unpack_bits(in + i * packed_bytes(width), width, limit, domain));
    }
    return v;
}

} // namespace ring
} // namespace pqlattice
