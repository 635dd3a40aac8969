/**
 * @file params.hpp
 * @brief Parameter sets for the Kyber KEM and the Dilithium signature scheme
 *
 * Callers select a named security level; the numeric tuple behind it is part
 * of the public contract and never changes for the lifetime of a key.
 *
 * Kyber (n = 256, q = 3329):
 *   Level 512:  k=2, eta1=3, eta2=2, du=10, dv=4
 *   Level 768:  k=3, eta1=2, eta2=2, du=10, dv=4
 *   Level 1024: k=4, eta1=2, eta2=2, du=11, dv=5
 *
 * Dilithium (n = 256, q = 8380417, d = 13):
 *   Level 2: (k,l)=(4,4), eta=2, tau=39, gamma1=2^17, gamma2=(q-1)/88, omega=80
 *   Level 3: (k,l)=(6,5), eta=4, tau=49, gamma1=2^19, gamma2=(q-1)/32, omega=55
 *   Level 5: (k,l)=(8,7), eta=2, tau=60, gamma1=2^19, gamma2=(q-1)/32, omega=75
 *
 * @version 1.0.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace pqlattice {
namespace pqc {

constexpr size_t SEED_BYTES = 32;
constexpr size_t SHARED_SECRET_BYTES = 32;

/**
 * @brief Kyber security level, named by lattice dimension
 */
enum class KyberLevel : uint16_t {
    KYBER_512 = 512,
    KYBER_768 = 768,
    KYBER_1024 = 1024
};

/**
 * @brief Dilithium security level, named by NIST category
 */
enum class DilithiumLevel : uint8_t {
    DILITHIUM_2 = 2,
    DILITHIUM_3 = 3,
    DILITHIUM_5 = 5
};

/**
 * @brief Kyber parameter set
 */
struct KyberParams {
    KyberLevel level;
    const char* name;
    size_t n;           ///< Ring degree
    size_t k;           ///< Module rank
    uint32_t q;         ///< Modulus
    unsigned eta1;      ///< CBD parameter for secret and ephemeral vectors
    unsigned eta2;      ///< CBD parameter for encryption noise
    unsigned du;        ///< Bits per compressed coefficient of u
    unsigned dv;        ///< Bits per compressed coefficient of v

    size_t polyvec_bytes() const { return k * 384; }
    size_t public_key_bytes() const { return polyvec_bytes() + SEED_BYTES; }
    size_t secret_key_bytes() const {
        return polyvec_bytes() + public_key_bytes() + 2 * SEED_BYTES;
    }
    size_t ciphertext_bytes() const { return 32 * (k * du + dv); }

    /**
     * @brief Look up a parameter set
     * @throws InvalidParameterError for an unsupported level
     */
    static const KyberParams& get(KyberLevel level);
    static const KyberParams& get(int level);
};

/**
 * @brief Dilithium parameter set
 */
struct DilithiumParams {
    DilithiumLevel level;
    const char* name;
    size_t n;           ///< Ring degree
    size_t k;           ///< Rows of A
    size_t l;           ///< Columns of A
    uint32_t q;         ///< Modulus
    unsigned d;         ///< Dropped bits of t
    unsigned eta;       ///< Secret coefficient bound
    unsigned tau;       ///< Nonzero coefficients of the challenge
    uint32_t beta;      ///< tau * eta
    uint32_t gamma1;    ///< Range of the masking vector y
    uint32_t gamma2;    ///< Low-order rounding range
    unsigned omega;     ///< Maximum hint weight

    unsigned eta_bits() const { return eta <= 2 ? 3 : 4; }
    unsigned z_bits() const { return gamma1 == (1u << 17) ? 18 : 20; }
    unsigned w1_bits() const { return gamma2 == (q - 1) / 88 ? 6 : 4; }

    size_t public_key_bytes() const { return SEED_BYTES + k * 320; }
    size_t secret_key_bytes() const {
        return public_key_bytes() + SEED_BYTES + (l + k) * 32 * eta_bits() + k * 416;
    }
    size_t signature_bytes() const {
        return SEED_BYTES + l * 32 * z_bits() + omega + k;
    }

    /**
     * @brief Look up a parameter set
     * @throws InvalidParameterError for an unsupported level
     */
    static const DilithiumParams& get(DilithiumLevel level);
    static const DilithiumParams& get(int level);
};

} // namespace pqc
} // namespace pqlattice
