#include "rounding.hpp"
#include "../../core/errors.hpp"

#include <string>

namespace pqlattice {
namespace pqc {
namespace dilithium {

namespace {

constexpr uint32_t GAMMA2_88 = (Q - 1) / 88;
constexpr uint32_t GAMMA2_32 = (Q - 1) / 32;

} // anonymous namespace

Split power2round(uint32_t a, unsigned d) {
    int32_t x = static_cast<int32_t>(a);
    int32_t high = (x + (1 << (d - 1)) - 1) >> d;
    int32_t low = x - (high << d);
    return Split{static_cast<uint32_t>(high), low};
}

Split decompose(uint32_t a, uint32_t gamma2) {
    int32_t x = static_cast<int32_t>(a);
    int32_t high = (x + 127) >> 7;
    if (gamma2 == GAMMA2_32) {
        high = (high * 1025 + (1 << 21)) >> 22;
        high &= 15;
    } else if (gamma2 == GAMMA2_88) {
        high = (high * 11275 + (1 << 23)) >> 24;
        high ^= ((43 - high) >> 31) & high;
    } else {
        throw InvalidParameterError("decompose: unsupported gamma2 " + std::to_string(gamma2));
    }

    int32_t low = x - high * 2 * static_cast<int32_t>(gamma2);
    low -= ((static_cast<int32_t>((Q - 1) / 2) - low) >> 31) & static_cast<int32_t>(Q);
    return Split{static_cast<uint32_t>(high), low};
}

uint32_t make_hint(uint32_t z, uint32_t r, uint32_t gamma2) {
    uint32_t sum = r + z;
    sum -= Q;
    sum += Q & (static_cast<uint32_t>(0) - (sum >> 31));
    uint32_t diff = high_bits(r, gamma2) ^ high_bits(sum, gamma2);
    return (diff | (static_cast<uint32_t>(0) - diff)) >> 31;
}

uint32_t use_hint(uint32_t hint, uint32_t r, uint32_t gamma2) {
    Split s = decompose(r, gamma2);
    if (hint == 0) {
        return s.high;
    }
    uint32_t m = (Q - 1) / (2 * gamma2);
    if (s.low > 0) {
        return (s.high + 1) % m;
    }
    return (s.high + m - 1) % m;
}

} // namespace dilithium
} // namespace pqc
} // namespace pqlattice
