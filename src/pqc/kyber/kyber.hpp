/**
 * @file kyber.hpp
 * @brief Kyber key-encapsulation mechanism over the module lattice R_q^k
 *
 * H = SHA3-256, PRF and implicit-rejection hash = SHAKE256.
 *
 *   keygen:       t = A*s + e                    (transform domain)
 *   encapsulate:  coins = H(m || H(pk))
 *                 c = Enc(pk, m; coins), secret = H(m || H(c))
 *   decapsulate:  m' = Dec(s, c), c' = Enc(pk, m'; H(m' || H(pk)))
 *                 secret = c == c' ? H(m' || H(c)) : SHAKE256(z || c)
 *
 * Decapsulation never reports failure for a correctly sized ciphertext:
 * a mismatch yields the implicit-rejection value, selected in constant time.
 *
 * Encodings:
 *   pk = pack12(t) || rho                      384k + 32 bytes
 *   sk = pack12(s) || pk || H(pk) || z         768k + 96 bytes
 *   c  = pack_du(compress(u)) || pack_dv(compress(v))
 *
 * @version 1.0.0
 */

#pragma once

#include "../params.hpp"
#include "../../backend/context.hpp"
#include "../../ring/poly.hpp"
#include "../../sampling/xof.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <vector>

namespace pqlattice {
namespace pqc {
namespace kyber {

using SharedSecret = std::array<uint8_t, SHARED_SECRET_BYTES>;

struct PublicKey {
    KyberLevel level = KyberLevel::KYBER_768;
    ring::PolyVec t;            ///< Transform domain
    sampling::Seed rho{};       ///< Matrix seed

    std::vector<uint8_t> encode() const;

    /**
     * @throws MalformedInputError on wrong length or a coefficient >= q
     */
    static PublicKey decode(KyberLevel level, const std::vector<uint8_t>& bytes);
};

/**
 * @brief Secret key; the secret vector and rejection seed are wiped on
 *        destruction
 */
struct SecretKey {
    KyberLevel level = KyberLevel::KYBER_768;
    ring::PolyVec s;                        ///< Transform domain
    sampling::Seed z{};                     ///< Implicit-rejection seed
    std::shared_ptr<const PublicKey> public_key;
    sampling::Digest public_key_hash{};     ///< H(encode(pk))

    SecretKey() = default;
    ~SecretKey();

    SecretKey(const SecretKey&) = delete;
    SecretKey& operator=(const SecretKey&) = delete;
    SecretKey(SecretKey&&) noexcept = default;
    SecretKey& operator=(SecretKey&&) noexcept = default;

    std::vector<uint8_t> encode() const;

    /**
     * @throws MalformedInputError on wrong length, a coefficient >= q, or an
     *         embedded public-key hash that does not match
     */
    static SecretKey decode(KyberLevel level, const std::vector<uint8_t>& bytes);
};

struct KeyPair {
    std::shared_ptr<const PublicKey> public_key;
    SecretKey secret_key;
};

struct Encapsulation {
    std::vector<uint8_t> ciphertext;
    SharedSecret shared_secret{};
};

/**
 * @brief Generate a key pair from fresh randomness
 * @throws InvalidParameterError for an unsupported level
 */
KeyPair keygen(const Context& ctx, KyberLevel level);

/**
 * @brief Deterministic key generation from explicit seeds
 */
KeyPair keygen_from_seeds(const Context& ctx, KyberLevel level, const sampling::Seed& rho,
                          const sampling::Seed& sigma, const sampling::Seed& z);

/**
 * @brief Encapsulate a fresh shared secret to pk
 */
Encapsulation encapsulate(const Context& ctx, const PublicKey& pk);

/**
 * @brief Deterministic encapsulation of message m
 */
Encapsulation encapsulate_with_message(const Context& ctx, const PublicKey& pk,
                                       const sampling::Seed& m);

/**
 * @brief Recover the shared secret, or the implicit-rejection value
 * @throws MalformedInputError if the ciphertext has the wrong length
 */
SharedSecret decapsulate(const Context& ctx, const SecretKey& sk,
                         const std::vector<uint8_t>& ciphertext);

} // namespace kyber
} // namespace pqc
} // namespace pqlattice
