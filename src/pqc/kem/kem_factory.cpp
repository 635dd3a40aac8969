/**
 * @file kem_factory.cpp
 * @brief KEM factory implementation
 */

#include "kem_factory.hpp"
#include "../kyber/kyber.hpp"
#include "../../core/errors.hpp"
#include "../../core/side_channel.hpp"

#include <cstring>
#include <memory>

namespace pqlattice {
namespace pqc {

/**
 * @brief Kyber behind the byte-level KEM interface
 */
class KyberKEM : public KEMInterface {
private:
    KEMType type_;
    const KyberParams& params_;
    Context ctx_;

public:
    KyberKEM(KEMType type, const Context& ctx)
        : type_(type), params_(KyberParams::get(KEMFactory::level_of(type))), ctx_(ctx) {}

    KEMKeyPair generate_keypair() override {
        kyber::KeyPair generated = kyber::keygen(ctx_, params_.level);

        KEMKeyPair kp;
        kp.type = type_;
        kp.created_at = std::chrono::system_clock::now();
        kp.public_key = generated.public_key->encode();
        kp.secret_key = generated.secret_key.encode();
        return kp;
    }

    std::pair<KEMCiphertext, KEMSharedSecret>
    encapsulate(const std::vector<uint8_t>& public_key) override {
        kyber::PublicKey pk = kyber::PublicKey::decode(params_.level, public_key);
        kyber::Encapsulation enc = kyber::encapsulate(ctx_, pk);

        KEMCiphertext ct;
        ct.type = type_;
        ct.ciphertext = std::move(enc.ciphertext);

        KEMSharedSecret ss;
        ss.type = type_;
        std::memcpy(ss.secret.data(), enc.shared_secret.data(), ss.secret.size());
        side_channel::secure_wipe(enc.shared_secret);

        return {std::move(ct), std::move(ss)};
    }

    KEMSharedSecret decapsulate(
        const KEMCiphertext& ciphertext,
        const std::vector<uint8_t>& secret_key) override {

        if (ciphertext.type != type_) {
            throw InvalidParameterError(std::string("ciphertext type ") +
                                        kem_type_to_string(ciphertext.type) +
                                        " does not match " + kem_type_to_string(type_));
        }
        kyber::SecretKey sk = kyber::SecretKey::decode(params_.level, secret_key);

        KEMSharedSecret ss;
        ss.type = type_;
        ss.secret = kyber::decapsulate(ctx_, sk, ciphertext.ciphertext);
        return ss;
    }

    KEMType get_type() const override { return type_; }
    size_t public_key_size() const override { return params_.public_key_bytes(); }
    size_t secret_key_size() const override { return params_.secret_key_bytes(); }
    size_t ciphertext_size() const override { return params_.ciphertext_bytes(); }
    std::string algorithm_name() const override { return params_.name; }
};

/**
 * @brief Create KEM instance of specified type
 */
std::unique_ptr<KEMInterface> create_kem(KEMType type, const Context& ctx) {
    return std::make_unique<KyberKEM>(type, ctx);
}

std::unique_ptr<KEMInterface> KEMFactory::create(KEMType type) const {
    return create_kem(type, ctx_);
}

KyberLevel KEMFactory::level_of(KEMType type) {
    switch (type) {
        case KEMType::KYBER_512: return KyberLevel::KYBER_512;
        case KEMType::KYBER_768: return KyberLevel::KYBER_768;
        case KEMType::KYBER_1024: return KyberLevel::KYBER_1024;
        default:
            throw InvalidParameterError("unknown KEM type " +
                                        std::to_string(static_cast<int>(type)));
    }
}

bool KEMFactory::is_available(KEMType type) {
    switch (type) {
        case KEMType::KYBER_512:
        case KEMType::KYBER_768:
        case KEMType::KYBER_1024:
            return true;
        default:
            return false;
    }
}

std::string KEMFactory::get_description(KEMType type) {
    if (!is_available(type)) {
        return "Unknown KEM type";
    }
    const auto& p = KyberParams::get(level_of(type));
    return std::string(p.name) + ": module rank " + std::to_string(p.k) +
           ", pk " + std::to_string(p.public_key_bytes()) + "B, ct " +
           std::to_string(p.ciphertext_bytes()) + "B, shared secret 32B";
}

} // namespace pqc
} // namespace pqlattice
