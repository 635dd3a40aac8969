/**
 * @file sig_interface.cpp
 * @brief Dilithium behind the byte-level signature interface
 */

#include "sig_interface.hpp"
#include "../dilithium/dilithium.hpp"
#include "../params.hpp"
#include "../../core/errors.hpp"
#include "../../core/side_channel.hpp"

#include <string>

namespace pqlattice {
namespace pqc {

SigKeyPair::~SigKeyPair() {
    side_channel::secure_wipe(secret_key);
}

namespace {

DilithiumLevel level_of(SignatureType type) {
    switch (type) {
        case SignatureType::DILITHIUM_2: return DilithiumLevel::DILITHIUM_2;
        case SignatureType::DILITHIUM_3: return DilithiumLevel::DILITHIUM_3;
        case SignatureType::DILITHIUM_5: return DilithiumLevel::DILITHIUM_5;
        default:
            throw InvalidParameterError("unknown signature type " +
                                        std::to_string(static_cast<int>(type)));
    }
}

class DilithiumScheme : public SignatureInterface {
private:
    SignatureType type_;
    const DilithiumParams& params_;
    Context ctx_;

public:
    DilithiumScheme(SignatureType type, const Context& ctx)
        : type_(type), params_(DilithiumParams::get(level_of(type))), ctx_(ctx) {}

    SigKeyPair generate_keypair() override {
        dilithium::KeyPair generated = dilithium::keygen(ctx_, params_.level);

        SigKeyPair kp;
        kp.type = type_;
        kp.created_at = std::chrono::system_clock::now();
        kp.public_key = generated.public_key->encode();
        kp.secret_key = generated.secret_key.encode();
        return kp;
    }

    std::vector<uint8_t> sign(const std::vector<uint8_t>& message,
                              const std::vector<uint8_t>& secret_key) override {
        dilithium::SecretKey sk = dilithium::SecretKey::decode(params_.level, secret_key);
        return dilithium::sign(ctx_, sk, message).encode(params_.level);
    }

    bool verify(const std::vector<uint8_t>& message,
                const std::vector<uint8_t>& signature,
                const std::vector<uint8_t>& public_key) override {
        dilithium::PublicKey pk;
        dilithium::Signature sig;
        try {
            pk = dilithium::PublicKey::decode(params_.level, public_key);
            sig = dilithium::Signature::decode(params_.level, signature);
        } catch (const MalformedInputError& e) {
            ctx_.log(std::string(params_.name) + " verification rejected input: " + e.what());
            return false;
        }
        return dilithium::verify(ctx_, pk, message, sig);
    }

    SignatureType get_type() const override { return type_; }
    size_t public_key_size() const override { return params_.public_key_bytes(); }
    size_t secret_key_size() const override { return params_.secret_key_bytes(); }
    size_t signature_size() const override { return params_.signature_bytes(); }
    std::string algorithm_name() const override { return params_.name; }
};

} // anonymous namespace

std::unique_ptr<SignatureInterface> create_signature(SignatureType type, const Context& ctx) {
    return std::make_unique<DilithiumScheme>(type, ctx);
}

} // namespace pqc
} // namespace pqlattice
