/**
 * @file sampler.hpp
 * @brief Deterministic seed-driven sampling of ring elements
 *
 * Every sampler is a pure function of its seed and nonce. Rejection loops
 * branch only on public XOF output (matrix expansion, challenge) or on values
 * that are rejected and never used; centered-binomial sampling is branch-free.
 *
 * @version 1.0.0
 */

#pragma once

#include "xof.hpp"
#include "../ring/poly.hpp"
#include "../ring/ring.hpp"

#include <cstddef>
#include <cstdint>

namespace pqlattice {
namespace sampling {

/**
 * @brief Uniform element for matrix cell (i, j), transform domain
 *
 * Streams SHAKE128(seed || j || i) three bytes at a time. Rings with q below
 * 2^12 take two 12-bit candidates per triple, others one 23-bit candidate.
 * Candidates >= q are discarded.
 */
ring::Poly expand_uniform(const ring::Ring& ring, const Seed& seed, uint8_t i, uint8_t j);

/**
 * @brief rows x cols matrix of expand_uniform cells
 * @throws InvalidParameterError if a dimension exceeds 255
 */
ring::PolyMatrix expand_matrix(const ring::Ring& ring, const Seed& seed, size_t rows, size_t cols);

/**
 * @brief Centered binomial element with coefficients in [-eta, eta]
 *
 * SHAKE256(seed || nonce); each coefficient consumes 2*eta bits.
 *
 * @throws InvalidParameterError unless 1 <= eta <= 8
 */
ring::Poly sample_cbd(const ring::Ring& ring, const Seed& seed, uint8_t nonce, unsigned eta);

/**
 * @brief Uniform element with coefficients in [0, gamma)
 *
 * SHAKE256(seed || nonce_lo || nonce_hi), ceil(log2 gamma)-bit candidates,
 * candidates >= gamma discarded.
 *
 * @throws InvalidParameterError unless 2 <= gamma <= 2^24
 */
ring::Poly sample_uniform_gamma(const ring::Ring& ring, const Seed& seed, uint16_t nonce,
                                uint32_t gamma);

/**
 * @brief Challenge with exactly tau coefficients in {-1, +1}
 *
 * The first 8 bytes of SHAKE256(seed) supply signs; positions come from a
 * Fisher-Yates walk over the remaining stream.
 *
 * @throws InvalidParameterError unless 1 <= tau <= 64
 */
ring::Poly sample_in_ball(const ring::Ring& ring, const Seed& seed, unsigned tau);

} // namespace sampling
} // namespace pqlattice
