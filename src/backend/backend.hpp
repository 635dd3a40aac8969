/**
 * @file backend.hpp
 * @brief Capability interface implemented by every ring-arithmetic backend
 *
 * The CPU reference backend is always available. Accelerator backends
 * (GPU, tensor units) are plugins registered through BackendRegistry; their
 * output must be bit-identical to the CPU reference for every input.
 *
 * @version 1.0.0
 */

#pragma once

#include "../ring/poly.hpp"
#include "../ring/ring.hpp"
#include "../sampling/xof.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace pqlattice {
namespace backend {

/**
 * @brief Backend family, in increasing selection priority
 */
enum class BackendKind : uint8_t {
    CpuSimd = 0,
    Gpu = 1,
    TensorAccelerator = 2
};

inline const char* backend_kind_name(BackendKind kind) {
    switch (kind) {
        case BackendKind::CpuSimd: return "cpu-simd";
        case BackendKind::Gpu: return "gpu";
        case BackendKind::TensorAccelerator: return "tensor-accelerator";
        default: return "unknown";
    }
}

inline int backend_priority(BackendKind kind) {
    return static_cast<int>(kind);
}

/**
 * @brief Abstract ring backend
 */
class RingBackend {
public:
    virtual ~RingBackend() = default;

    virtual BackendKind kind() const = 0;

    /**
     * @brief Human-readable name including device details
     */
    virtual std::string name() const = 0;

    /**
     * @brief Forward NTT of every element of v, in place
     * @throws DomainMismatchError if an element is already transformed
     */
    virtual void ntt_transform(const ring::Ring& ring, ring::PolyVec& v) const = 0;

    /**
     * @brief Inverse NTT of every element of v, in place
     * @throws DomainMismatchError if an element is in the normal domain
     */
    virtual void inverse_ntt_transform(const ring::Ring& ring, ring::PolyVec& v) const = 0;

    /**
     * @brief M*v (or M^T*v) over transform-domain operands
     * @throws InvalidParameterError on dimension mismatch
     */
    virtual ring::PolyVec lattice_multiply(const ring::Ring& ring, const ring::PolyMatrix& m,
                                           const ring::PolyVec& v, bool transpose) const = 0;

    /**
     * @brief Product of two transform-domain elements
     */
    virtual ring::Poly polynomial_multiply(const ring::Ring& ring, const ring::Poly& a,
                                           const ring::Poly& b) const = 0;

    /**
     * @brief Expand a rows x cols uniform matrix from a public seed
     */
    virtual ring::PolyMatrix sample(const ring::Ring& ring, const sampling::Seed& seed,
                                    size_t rows, size_t cols) const = 0;

    /**
     * @brief sum_i a[i] * b[i], transform domain
     */
    ring::Poly inner_product(const ring::Ring& ring, const ring::PolyVec& a,
                             const ring::PolyVec& b) const {
        return lattice_multiply(ring, ring::PolyMatrix{a}, b, false).front();
    }
};

} // namespace backend
} // namespace pqlattice
