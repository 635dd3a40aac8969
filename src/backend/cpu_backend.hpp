/**
 * @file cpu_backend.hpp
 * @brief Reference CPU backend
 *
 * Terminates the dispatch chain and defines the expected output for every
 * other backend. Matrix rows may be spread across worker threads; each row
 * is computed by exactly one worker, so results do not depend on the
 * thread count.
 *
 * @version 1.0.0
 */

#pragma once

#include "backend.hpp"
#include "cpu_features.hpp"

namespace pqlattice {
namespace backend {

class CpuBackend : public RingBackend {
public:
    /**
     * @param threads Worker threads for matrix products (1..256)
     * @throws BackendInitializationError if threads is out of range
     */
    explicit CpuBackend(unsigned threads = 1);

    BackendKind kind() const override { return BackendKind::CpuSimd; }
    std::string name() const override;

    void ntt_transform(const ring::Ring& ring, ring::PolyVec& v) const override;
    void inverse_ntt_transform(const ring::Ring& ring, ring::PolyVec& v) const override;

    ring::PolyVec lattice_multiply(const ring::Ring& ring, const ring::PolyMatrix& m,
                                   const ring::PolyVec& v, bool transpose) const override;

    ring::Poly polynomial_multiply(const ring::Ring& ring, const ring::Poly& a,
                                   const ring::Poly& b) const override;

    ring::PolyMatrix sample(const ring::Ring& ring, const sampling::Seed& seed,
                            size_t rows, size_t cols) const override;

    SimdLevel simd_level() const { return simd_; }
    unsigned threads() const { return threads_; }

private:
    unsigned threads_;
    SimdLevel simd_;
};

} // namespace backend
} // namespace pqlattice
