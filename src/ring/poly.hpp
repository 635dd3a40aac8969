/**
 * @file poly.hpp
 * @brief Ring elements of Z_q[x]/(x^256 + 1) and module vectors over them
 *
 * @version 1.0.0
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace pqlattice {
namespace ring {

constexpr size_t N = 256;

/**
 * @brief Representation a polynomial is currently held in
 */
enum class Domain : uint8_t {
    Normal = 0,      ///< Coefficient representation
    Transform = 1    ///< NTT representation
};

inline const char* domain_name(Domain d) {
    return d == Domain::Transform ? "transform" : "normal";
}

/**
 * @brief Polynomial with 256 coefficients in [0, q)
 */
struct Poly {
    std::array<uint32_t, N> coeffs{};
    Domain domain = Domain::Normal;

    Poly() = default;
    explicit Poly(Domain d) : domain(d) {}

    uint32_t& operator[](size_t i) { return coeffs[i]; }
    const uint32_t& operator[](size_t i) const { return coeffs[i]; }

    bool operator==(const Poly& other) const {
        return domain == other.domain && coeffs == other.coeffs;
    }
    bool operator!=(const Poly& other) const { return !(*this == other); }
};

using PolyVec = std::vector<Poly>;

// Row-major: matrix[i][j] is row i, column j
using PolyMatrix = std::vector<PolyVec>;

inline PolyVec make_polyvec(size_t length, Domain d = Domain::Normal) {
    return PolyVec(length, Poly(d));
}

} // namespace ring
} // namespace pqlattice
