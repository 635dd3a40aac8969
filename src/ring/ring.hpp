/**
 * @file ring.hpp
 * @brief Modular polynomial-ring arithmetic over Z_q[x]/(x^256 + 1)
 *
 * A Ring is built once per modulus and shared read-only afterwards. Two rings
 * are provided:
 *
 *   kyber():     q = 3329,    root 17 (order 256),   7 NTT layers, degree-2 leaves
 *   dilithium(): q = 8380417, root 1753 (order 512), 8 NTT layers, degree-1 leaves
 *
 * Scalar arithmetic is branch-free and keeps every result canonical in
 * [0, q). Multiplication goes through Montgomery reduction (R = 2^32) and
 * never divides by q at runtime; twiddle factors are held in Montgomery form.
 *
 * @version 1.0.0
 */

#pragma once

#include "poly.hpp"
#include "../core/side_channel.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace pqlattice {
namespace ring {

class Ring {
public:
    /**
     * @brief Build a ring and derive its twiddle factors
     *
     * @param q Odd modulus below 2^23
     * @param root Primitive 2^(layers+1)-th root of unity mod q
     * @param layers Number of NTT butterfly layers (7 or 8)
     * @param name Human-readable name used in diagnostics
     * @throws InvalidParameterError if root does not have the required order
     */
    Ring(uint32_t q, uint32_t root, unsigned layers, std::string name);

    static const Ring& kyber();
    static const Ring& dilithium();

    uint32_t q() const { return q_; }
    unsigned layers() const { return layers_; }
    size_t leaf_size() const { return N >> layers_; }
    const std::string& name() const { return name_; }

    // ------------------------------------------------------------------
    // Scalar arithmetic, canonical in and out
    // ------------------------------------------------------------------

    uint32_t add(uint32_t a, uint32_t b) const { return csub(a + b); }
    uint32_t sub(uint32_t a, uint32_t b) const { return csub(a + q_ - b); }
    uint32_t neg(uint32_t a) const { return csub(q_ - a); }
    uint32_t mul(uint32_t a, uint32_t b) const {
        return mont_mul(mont_mul(a, b), r2_);
    }

    /**
     * @brief Canonical representative of x mod q
     * @note Requires |x| < q * 2^31
     */
    uint32_t reduce(int64_t x) const;

    /**
     * @brief Centered representative in [-(q-1)/2, (q-1)/2]
     */
    int32_t centered(uint32_t a) const {
        uint32_t over = side_channel::ct_mask(((q_ >> 1) - a) >> 31);
        return static_cast<int32_t>(a) - static_cast<int32_t>(q_ & over);
    }

    /**
     * @brief round(2^d * x / q) mod 2^d
     * @throws InvalidParameterError if d is 0 or above max_compress_bits()
     */
    uint32_t compress(uint32_t x, unsigned d) const;

    /**
     * @brief round(q * y / 2^d)
     */
    uint32_t decompress(uint32_t y, unsigned d) const;

    unsigned max_compress_bits() const { return max_compress_bits_; }

    // ------------------------------------------------------------------
    // Ring elements
    // ------------------------------------------------------------------

    Poly add(const Poly& a, const Poly& b) const;
    Poly sub(const Poly& a, const Poly& b) const;
    Poly neg(const Poly& a) const;
    Poly scale(const Poly& a, uint32_t c) const;

    /**
     * @brief In-place forward NTT (Cooley-Tukey)
     * @throws DomainMismatchError if p is already in the transform domain
     */
    void ntt(Poly& p) const;

    /**
     * @brief In-place inverse NTT (Gentleman-Sande), scaled by (2^layers)^-1
     * @throws DomainMismatchError if p is in the normal domain
     */
    void inverse_ntt(Poly& p) const;

    /**
     * @brief Product of two transform-domain elements
     *
     * Coefficient-wise for degree-1 leaves; for degree-2 leaves each pair
     * (a[2i], a[2i+1]) is multiplied modulo x^2 - gamma_i.
     */
    Poly pointwise(const Poly& a, const Poly& b) const;

    /**
     * @brief a * b in the ring via transform, pointwise product and inverse
     */
    Poly multiply(const Poly& a, const Poly& b) const;

    /**
     * @brief a * b by direct negacyclic convolution, O(n^2)
     */
    Poly multiply_schoolbook(const Poly& a, const Poly& b) const;

    Poly compress(const Poly& a, unsigned d) const;
    Poly decompress(const Poly& a, unsigned d) const;

    /**
     * @brief max |centered(c)| over all coefficients
     */
    uint32_t infinity_norm(const Poly& a) const;

    /**
     * @brief Element from small signed coefficients
     */
    Poly from_signed(const int32_t* values, Domain d = Domain::Normal) const;

    // ------------------------------------------------------------------
    // Module vectors and matrices
    // ------------------------------------------------------------------

    PolyVec add(const PolyVec& a, const PolyVec& b) const;
    PolyVec sub(const PolyVec& a, const PolyVec& b) const;
    void ntt(PolyVec& v) const;
    void inverse_ntt(PolyVec& v) const;
    uint32_t infinity_norm(const PolyVec& v) const;

    /**
     * @brief sum_i a[i] * b[i] in the transform domain
     * @throws InvalidParameterError on length mismatch
     */
    Poly inner_product(const PolyVec& a, const PolyVec& b) const;

    /**
     * @brief Row `row` of M*v, or of M^T*v when transpose is set
     */
    Poly row_product(const PolyMatrix& m, const PolyVec& v, size_t row, bool transpose) const;

    /**
     * @brief M*v or M^T*v, transform domain throughout
     * @throws InvalidParameterError on dimension mismatch
     */
    PolyVec matrix_vector(const PolyMatrix& m, const PolyVec& v, bool transpose) const;

    /**
     * @brief Rows of M*v (or columns of M when transposed)
     * @throws InvalidParameterError if m is empty, ragged, or does not match v
     */
    size_t output_rows(const PolyMatrix& m, const PolyVec& v, bool transpose) const;

private:
    uint32_t csub(uint32_t a) const {
        a -= q_;
        return a + (q_ & side_channel::ct_mask(a >> 31));
    }

    uint32_t montgomery_reduce(uint64_t a) const;

    uint32_t mont_mul(uint32_t a, uint32_t b_mont) const {
        return montgomery_reduce(static_cast<uint64_t>(a) * b_mont);
    }

    uint32_t q_;
    unsigned layers_;
    std::string name_;
    uint32_t qinv_neg_;          // -q^-1 mod 2^32
    uint32_t r2_;                // 2^64 mod q
    uint32_t ninv_mont_;         // (2^layers)^-1, Montgomery form
    uint64_t recip_;             // ceil(2^48 / q)
    unsigned max_compress_bits_;
    std::vector<uint32_t> zetas_;  // root^bitrev(i), Montgomery form
};

/**
 * @brief Throws DomainMismatchError unless both operands share a domain
 */
void require_same_domain(const Poly& a, const Poly& b, const char* operation);

/**
 * @brief Throws DomainMismatchError unless p is in domain d
 */
void require_domain(const Poly& p, Domain d, const char* operation);

} // namespace ring
} // namespace pqlattice
