/**
 * @file kem_interface.hpp
 * @brief Byte-level interface for Key Encapsulation Mechanisms (KEM)
 *
 * Wraps the Kyber parameter sets behind one interface that only deals in
 * serialized keys, ciphertexts and 32-byte shared secrets.
 *
 * @version 1.0.0
 */

#pragma once

#include "../../backend/context.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace pqlattice {
namespace pqc {

/**
 * @brief KEM algorithm type
 */
enum class KEMType : uint8_t {
    KYBER_512 = 0,      ///< NIST category 1
    KYBER_768 = 1,      ///< NIST category 3 (recommended)
    KYBER_1024 = 2      ///< NIST category 5
};

/**
 * @brief Convert KEM type to string
 */
inline const char* kem_type_to_string(KEMType type) {
    switch (type) {
        case KEMType::KYBER_512: return "Kyber-512";
        case KEMType::KYBER_768: return "Kyber-768";
        case KEMType::KYBER_1024: return "Kyber-1024";
        default: return "Unknown";
    }
}

/**
 * @brief KEM key pair structure
 *
 * Secret keys are automatically zeroed on destruction.
 */
struct KEMKeyPair {
    std::vector<uint8_t> public_key;     ///< Public key (can be shared)
    std::vector<uint8_t> secret_key;     ///< Secret key (must be protected)
    KEMType type;                         ///< Algorithm type
    std::chrono::system_clock::time_point created_at;  ///< Creation timestamp

    /**
     * @brief Destructor - securely wipes secret key
     */
    ~KEMKeyPair();

    // Disable copy (secret keys should not be copied)
    KEMKeyPair(const KEMKeyPair&) = delete;
    KEMKeyPair& operator=(const KEMKeyPair&) = delete;

    // Allow move
    KEMKeyPair(KEMKeyPair&&) noexcept = default;
    KEMKeyPair& operator=(KEMKeyPair&&) noexcept = default;

    KEMKeyPair() : type(KEMType::KYBER_768), created_at(std::chrono::system_clock::now()) {}
};

/**
 * @brief KEM ciphertext structure
 */
struct KEMCiphertext {
    std::vector<uint8_t> ciphertext;     ///< Encapsulated shared secret
    KEMType type;                         ///< Algorithm type

    KEMCiphertext() : type(KEMType::KYBER_768) {}
};

/**
 * @brief KEM shared secret structure
 *
 * Always 32 bytes. Automatically zeroed on destruction.
 */
struct KEMSharedSecret {
    std::array<uint8_t, 32> secret;      ///< 32-byte shared secret
    KEMType type;                         ///< Algorithm type that produced this secret

    /**
     * @brief Destructor - securely wipes secret
     */
    ~KEMSharedSecret();

    // Disable copy
    KEMSharedSecret(const KEMSharedSecret&) = delete;
    KEMSharedSecret& operator=(const KEMSharedSecret&) = delete;

    // Allow move
    KEMSharedSecret(KEMSharedSecret&&) noexcept = default;
    KEMSharedSecret& operator=(KEMSharedSecret&&) noexcept = default;

    KEMSharedSecret() : type(KEMType::KYBER_768) { secret.fill(0); }
};

/**
 * @brief Abstract KEM interface
 */
class KEMInterface {
public:
    virtual ~KEMInterface() = default;

    /**
     * @brief Generate a new KEM keypair
     */
    virtual KEMKeyPair generate_keypair() = 0;

    /**
     * @brief Encapsulate a shared secret (sender side)
     *
     * @param public_key Receiver's encoded public key
     * @return Pair of (ciphertext, shared_secret)
     * @throws MalformedInputError if public_key does not decode
     */
    virtual std::pair<KEMCiphertext, KEMSharedSecret>
        encapsulate(const std::vector<uint8_t>& public_key) = 0;

    /**
     * @brief Decapsulate a shared secret (receiver side)
     *
     * A well-formed but wrong ciphertext does not raise; it yields the
     * implicit-rejection secret.
     *
     * @throws InvalidParameterError if the ciphertext belongs to another type
     * @throws MalformedInputError if ciphertext or secret_key has the wrong size
     */
    virtual KEMSharedSecret decapsulate(
        const KEMCiphertext& ciphertext,
        const std::vector<uint8_t>& secret_key) = 0;

    virtual KEMType get_type() const = 0;
    virtual size_t public_key_size() const = 0;
    virtual size_t secret_key_size() const = 0;
    virtual size_t ciphertext_size() const = 0;

    /**
     * @brief Get algorithm name (human-readable)
     */
    virtual std::string algorithm_name() const = 0;
};

/**
 * @brief Create a KEM instance bound to an execution context
 *
 * @throws InvalidParameterError if type is not recognized
 */
std::unique_ptr<KEMInterface> create_kem(KEMType type,
                                         const Context& ctx = Context::process_default());

} // namespace pqc
} // namespace pqlattice
