/**
 * @file packing.hpp
 * @brief Little-endian bit packing of ring elements
 *
 * Coefficient i occupies bits [i*w, (i+1)*w) of the output, least significant
 * bit first. A packed element is always 32*w bytes.
 *
 * @version 1.0.0
 */

#pragma once

#include "poly.hpp"
#include "ring.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace pqlattice {
namespace ring {

inline size_t packed_bytes(unsigned width) { return N * width / 8; }

/**
 * @brief Append the coefficients of p at `width` bits each
 * @note Coefficients must already fit in `width` bits
 */
void pack_bits(const Poly& p, unsigned width, std::vector<uint8_t>& out);

/**
 * @brief Decode one element of `width`-bit coefficients
 * @param in Buffer holding at least packed_bytes(width) bytes
 * @param limit Exclusive upper bound; a larger value raises MalformedInputError
 */
Poly unpack_bits(const uint8_t* in, unsigned width, uint32_t limit, Domain domain = Domain::Normal);

/**
 * @brief Append offset - centered(c) for each coefficient
 *
 * Used for signed coefficients in [offset - 2^width + 1, offset].
 */
void pack_offset(const Ring& ring, const Poly& p, unsigned width, uint32_t offset,
                 std::vector<uint8_t>& out);

/**
 * @brief Inverse of pack_offset; fields above max_field raise MalformedInputError
 */
Poly unpack_offset(const Ring& ring, const uint8_t* in, unsigned width, uint32_t offset,
                   uint32_t max_field);

void pack_bits(const PolyVec& v, unsigned width, std::vector<uint8_t>& out);

PolyVec unpack_bits(const uint8_t* in, size_t count, unsigned width, uint32_t limit,
                    Domain domain = Domain::Normal);

} // namespace ring
} // namespace pqlattice
