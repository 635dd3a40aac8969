/**
 * @file sig_interface.hpp
 * @brief Byte-level interface for signature schemes
 *
 * Mirrors KEMInterface: keys and signatures travel as encoded byte strings.
 * Verification answers true or false and never raises for a signature or
 * public key that fails to decode.
 *
 * @version 1.0.0
 */

#pragma once

#include "../../backend/context.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace pqlattice {
namespace pqc {

/**
 * @brief Signature algorithm type
 */
enum class SignatureType : uint8_t {
    DILITHIUM_2 = 0,    ///< NIST category 2
    DILITHIUM_3 = 1,    ///< NIST category 3 (recommended)
    DILITHIUM_5 = 2     ///< NIST category 5
};

inline const char* signature_type_to_string(SignatureType type) {
    switch (type) {
        case SignatureType::DILITHIUM_2: return "Dilithium2";
        case SignatureType::DILITHIUM_3: return "Dilithium3";
        case SignatureType::DILITHIUM_5: return "Dilithium5";
        default: return "Unknown";
    }
}

/**
 * @brief Signing key pair; the secret key is zeroed on destruction
 */
struct SigKeyPair {
    std::vector<uint8_t> public_key;
    std::vector<uint8_t> secret_key;
    SignatureType type;
    std::chrono::system_clock::time_point created_at;

    ~SigKeyPair();

    SigKeyPair(const SigKeyPair&) = delete;
    SigKeyPair& operator=(const SigKeyPair&) = delete;
    SigKeyPair(SigKeyPair&&) noexcept = default;
    SigKeyPair& operator=(SigKeyPair&&) noexcept = default;

    SigKeyPair() : type(SignatureType::DILITHIUM_3), created_at(std::chrono::system_clock::now()) {}
};

class SignatureInterface {
public:
    virtual ~SignatureInterface() = default;

    virtual SigKeyPair generate_keypair() = 0;

    /**
     * @throws MalformedInputError if secret_key does not decode
     * @throws SigningExhaustedError if the rejection loop hits its cap
     */
    virtual std::vector<uint8_t> sign(const std::vector<uint8_t>& message,
                                      const std::vector<uint8_t>& secret_key) = 0;

    /**
     * @return false for an invalid or undecodable signature or public key
     */
    virtual bool verify(const std::vector<uint8_t>& message,
                        const std::vector<uint8_t>& signature,
                        const std::vector<uint8_t>& public_key) = 0;

    virtual SignatureType get_type() const = 0;
    virtual size_t public_key_size() const = 0;
    virtual size_t secret_key_size() const = 0;
    virtual size_t signature_size() const = 0;
    virtual std::string algorithm_name() const = 0;
};

/**
 * @throws InvalidParameterError if type is not recognized
 */
std::unique_ptr<SignatureInterface> create_signature(
    SignatureType type, const Context& ctx = Context::process_default());

} // namespace pqc
} // namespace pqlattice
