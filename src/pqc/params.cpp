/**
 * @file params.cpp
 * @brief Parameter tables
 */

#include "params.hpp"
#include "../core/errors.hpp"

namespace pqlattice {
namespace pqc {

namespace {

constexpr uint32_t KYBER_Q = 3329;
constexpr uint32_t DILITHIUM_Q = 8380417;

const KyberParams KYBER_TABLE[] = {
    {KyberLevel::KYBER_512,  "Kyber-512",  256, 2, KYBER_Q, 3, 2, 10, 4},
    {KyberLevel::KYBER_768,  "Kyber-768",  256, 3, KYBER_Q, 2, 2, 10, 4},
    {KyberLevel::KYBER_1024, "Kyber-1024", 256, 4, KYBER_Q, 2, 2, 11, 5},
};

const DilithiumParams DILITHIUM_TABLE[] = {
    {DilithiumLevel::DILITHIUM_2, "Dilithium2", 256, 4, 4, DILITHIUM_Q, 13, 2, 39, 78,
     1u << 17, (DILITHIUM_Q - 1) / 88, 80},
    {DilithiumLevel::DILITHIUM_3, "Dilithium3", 256, 6, 5, DILITHIUM_Q, 13, 4, 49, 196,
     1u << 19, (DILITHIUM_Q - 1) / 32, 55},
    {DilithiumLevel::DILITHIUM_5, "Dilithium5", 256, 8, 7, DILITHIUM_Q, 13, 2, 60, 120,
     1u << 19, (DILITHIUM_Q - 1) / 32, 75},
};

} // anonymous namespace

const KyberParams& KyberParams::get(KyberLevel level) {
    return get(static_cast<int>(level));
}

const KyberParams& KyberParams::get(int level) {
    for (const auto& p : KYBER_TABLE) {
        if (static_cast<int>(p.level) == level) {
            return p;
        }
    }
    throw InvalidParameterError("unsupported Kyber level " + std::to_string(level) +
                                " (expected 512, 768 or 1024)");
}

const DilithiumParams& DilithiumParams::get(DilithiumLevel level) {
    return get(static_cast<int>(level));
}

const DilithiumParams& DilithiumParams::get(int level) {
    for (const auto& p : DILITHIUM_TABLE) {
        if (static_cast<int>(p.level) == level) {
            return p;
        }
    }
    throw InvalidParameterError("unsupported Dilithium level " + std::to_string(level) +
                                " (expected 2, 3 or 5)");
}

} // namespace pqc
} // namespace pqlattice
