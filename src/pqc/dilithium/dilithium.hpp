/**
 * @file dilithium.hpp
 * @brief Dilithium signatures (Fiat-Shamir with aborts over R_q^(k x l))
 *
 *   keygen:  rho, rho', K = H(zeta || 0), H(zeta || 1), H(zeta || 2)
 *            t = A*s1 + s2, (t1, t0) = power2round(t, d)
 *   sign:    mu = H(pk || M), rho'' = H(K || mu)
 *            y = gamma1 - U[0, 2*gamma1),  w1 = high_bits(A*y)
 *            c_tilde = H(mu || w1), z = y + c*s1, h = make_hint(-c*t0, w - c*s2 + c*t0)
 *            restart on any norm or hint-weight bound violation
 *   verify:  w1' = use_hint(h, A*z - c*t1*2^d), accept iff c_tilde = H(mu || w1')
 *
 * Encodings:
 *   pk  = rho || pack10(t1)
 *   sk  = pk || K || pack_eta(s1) || pack_eta(s2) || pack13(t0)
 *   sig = c_tilde || pack_gamma1(z) || hint (omega + k bytes)
 *
 * The hint is encoded as the list of set positions of each polynomial
 * followed by k running totals.
 *
 * @version 1.0.0
 */

#pragma once

#include "../params.hpp"
#include "../../backend/context.hpp"
#include "../../ring/poly.hpp"
#include "../../sampling/xof.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace pqlattice {
namespace pqc {
namespace dilithium {

struct PublicKey {
    DilithiumLevel level = DilithiumLevel::DILITHIUM_3;
    sampling::Seed rho{};
    ring::PolyVec t1;           ///< High part of t, coefficients < 2^10

    std::vector<uint8_t> encode() const;

    /**
     * @throws MalformedInputError on wrong length
     */
    static PublicKey decode(DilithiumLevel level, const std::vector<uint8_t>& bytes);
};

/**
 * @brief Secret key; secret vectors and K are wiped on destruction
 */
struct SecretKey {
    DilithiumLevel level = DilithiumLevel::DILITHIUM_3;
    ring::PolyVec s1;           ///< l elements, coefficients in [-eta, eta]
    ring::PolyVec s2;           ///< k elements, coefficients in [-eta, eta]
    ring::PolyVec t0;           ///< k elements, low part of t
    sampling::Seed key{};       ///< Signing seed K
    std::shared_ptr<const PublicKey> public_key;

    SecretKey() = default;
    ~SecretKey();

    SecretKey(const SecretKey&) = delete;
    SecretKey& operator=(const SecretKey&) = delete;
    SecretKey(SecretKey&&) noexcept = default;
    SecretKey& operator=(SecretKey&&) noexcept = default;

    std::vector<uint8_t> encode() const;

    /**
     * @throws MalformedInputError on wrong length or out-of-range secret
     *         coefficients
     */
    static SecretKey decode(DilithiumLevel level, const std::vector<uint8_t>& bytes);
};

struct KeyPair {
    std::shared_ptr<const PublicKey> public_key;
    SecretKey secret_key;
};

struct Signature {
    sampling::Digest c_tilde{};
    ring::PolyVec z;            ///< l elements
    ring::PolyVec h;            ///< k elements of 0/1 hint bits

    /**
     * @throws InvalidParameterError if the shape does not match the level or
     *         the hint is heavier than omega
     */
    std::vector<uint8_t> encode(DilithiumLevel level) const;

    /**
     * @throws MalformedInputError on wrong length or a non-canonical hint
     */
    static Signature decode(DilithiumLevel level, const std::vector<uint8_t>& bytes);
};

/**
 * @throws InvalidParameterError for an unsupported level
 */
KeyPair keygen(const Context& ctx, DilithiumLevel level);

/**
 * @brief Deterministic key generation from a 32-byte seed
 */
KeyPair keygen_from_seed(const Context& ctx, DilithiumLevel level, const sampling::Seed& zeta);

/**
 * @brief Sign a message (deterministic in sk and message)
 * @throws SigningExhaustedError after Config::max_sign_iterations attempts
 */
Signature sign(const Context& ctx, const SecretKey& sk, const std::vector<uint8_t>& message);

/**
 * @brief Check a signature; never throws on a malformed signature
 */
bool verify(const Context& ctx, const PublicKey& pk, const std::vector<uint8_t>& message,
            const Signature& signature);

/**
 * @brief Number of set hint bits
 */
size_t hint_weight(const ring::PolyVec& h);

} // namespace dilithium
} // namespace pqc
} // namespace pqlattice
