/**
 * @file rounding.hpp
 * @brief High/low-order decomposition and hints for q = 8380417
 *
 * All functions take canonical representatives in [0, q) and are branch-free
 * apart from use_hint, which branches on the public hint bit.
 *
 * @version 1.0.0
 */

#pragma once

#include <cstdint>

namespace pqlattice {
namespace pqc {
namespace dilithium {

constexpr uint32_t Q = 8380417;

struct Split {
    uint32_t high;
    int32_t low;
};

/**
 * @brief a = high * 2^d + low with low in (-2^(d-1), 2^(d-1)]
 */
Split power2round(uint32_t a, unsigned d);

/**
 * @brief a = high * 2*gamma2 + low with low in (-gamma2, gamma2]
 *
 * When a - low = q - 1 the high part wraps to 0 and low is decremented,
 * so high always lies in [0, (q-1)/(2*gamma2)).
 *
 * @throws InvalidParameterError unless gamma2 is (q-1)/88 or (q-1)/32
 */
Split decompose(uint32_t a, uint32_t gamma2);

inline uint32_t high_bits(uint32_t a, uint32_t gamma2) { return decompose(a, gamma2).high; }
inline int32_t low_bits(uint32_t a, uint32_t gamma2) { return decompose(a, gamma2).low; }

/**
 * @brief 1 if adding z to r changes its high bits
 */
uint32_t make_hint(uint32_t z, uint32_t r, uint32_t gamma2);

/**
 * @brief Recover high_bits(r + z) from r and the hint bit
 */
uint32_t use_hint(uint32_t hint, uint32_t r, uint32_t gamma2);

} // namespace dilithium
} // namespace pqc
} // namespace pqlattice
