/**
 * @file kem_interface.cpp
 * @brief Implementation of KEM interface utilities
 */

#include "kem_interface.hpp"
#include "../../core/side_channel.hpp"

namespace pqlattice {
namespace pqc {

// KEMKeyPair destructor - securely wipe secret key
KEMKeyPair::~KEMKeyPair() {
    side_channel::secure_wipe(secret_key);
}

// KEMSharedSecret destructor - securely wipe shared secret
KEMSharedSecret::~KEMSharedSecret() {
    side_channel::secure_wipe(secret);
}

} // namespace pqc
} // namespace pqlattice
