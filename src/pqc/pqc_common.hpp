/**
 * @file pqc_common.hpp
 * @brief Helpers shared by the Kyber and Dilithium implementations
 *
 * @version 1.0.0
 */

#pragma once

#include "../core/side_channel.hpp"
#include "../ring/poly.hpp"

#include <cstdint>
#include <vector>

namespace pqlattice {
namespace pqc {

inline void wipe(ring::Poly& p) {
    side_channel::secure_zero_memory(p.coeffs.data(), sizeof(p.coeffs));
}

inline void wipe(ring::PolyVec& v) {
    for (auto& p : v) {
        wipe(p);
    }
}

inline void append(std::vector<uint8_t>& out, const uint8_t* data, size_t len) {
    out.insert(out.end(), data, data + len);
}

} // namespace pqc
} // namespace pqlattice
