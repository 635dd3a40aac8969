/**
 * @file test_factories.cpp
 * @brief Byte-level KEM and signature interfaces
 */

#include <catch2/catch.hpp>
#include "../../src/backend/context.hpp"
#include "../../src/core/errors.hpp"
#include "../../src/pqc/kem/kem_factory.hpp"
#include "../../src/pqc/sig/sig_interface.hpp"

#include <string>
#include <vector>

using namespace pqlattice;
using namespace pqlattice::pqc;

namespace {

Context quiet_cpu() {
    Config cfg = Config::defaults();
    cfg.verbose_logging = false;
    return Context::cpu(cfg);
}

} // namespace

TEST_CASE("KEM Factory", "[factory][kem]") {
    Context ctx = quiet_cpu();
    KEMFactory factory(ctx);

    SECTION("Every Type Round Trips") {
        for (auto type : {KEMType::KYBER_512, KEMType::KYBER_768, KEMType::KYBER_1024}) {
            REQUIRE(KEMFactory::is_available(type));
            auto kem = factory.create(type);
            INFO(kem->algorithm_name());
            REQUIRE(kem->get_type() == type);
            REQUIRE(kem->algorithm_name() == kem_type_to_string(type));

            auto kp = kem->generate_keypair();
            REQUIRE(kp.public_key.size() == kem->public_key_size());
            REQUIRE(kp.secret_key.size() == kem->secret_key_size());
            REQUIRE(kp.type == type);

            auto enc = kem->encapsulate(kp.public_key);
            REQUIRE(enc.first.ciphertext.size() == kem->ciphertext_size());
            REQUIRE(enc.first.type == type);

            auto ss = kem->decapsulate(enc.first, kp.secret_key);
            REQUIRE(ss.secret == enc.second.secret);
        }
    }

    SECTION("Mismatched Ciphertext Type") {
        auto kem512 = factory.create(KEMType::KYBER_512);
        auto kem768 = factory.create(KEMType::KYBER_768);
        auto kp = kem768->generate_keypair();
        auto enc = kem768->encapsulate(kp.public_key);
        REQUIRE_THROWS_AS(kem512->decapsulate(enc.first, kp.secret_key), InvalidParameterError);
    }

    SECTION("Malformed Keys") {
        auto kem = factory.create(KEMType::KYBER_768);
        std::vector<uint8_t> short_pk(100, 0);
        REQUIRE_THROWS_AS(kem->encapsulate(short_pk), MalformedInputError);

        auto kp = kem->generate_keypair();
        auto enc = kem->encapsulate(kp.public_key);
        std::vector<uint8_t> short_sk(kp.secret_key.begin(), kp.secret_key.end() - 1);
        REQUIRE_THROWS_AS(kem->decapsulate(enc.first, short_sk), MalformedInputError);
    }

    SECTION("Descriptions") {
        REQUIRE(KEMFactory::get_description(KEMType::KYBER_1024).find("Kyber-1024") != std::string::npos);
        REQUIRE(KEMFactory::level_of(KEMType::KYBER_512) == KyberLevel::KYBER_512);
        REQUIRE_THROWS_AS(KEMFactory::level_of(static_cast<KEMType>(9)), InvalidParameterError);
        REQUIRE_FALSE(KEMFactory::is_available(static_cast<KEMType>(9)));
        REQUIRE_THROWS_AS(factory.create(static_cast<KEMType>(9)), InvalidParameterError);
    }

    SECTION("Free Function Uses Given Context") {
        auto kem = create_kem(KEMType::KYBER_512, ctx);
        REQUIRE(kem->algorithm_name() == "Kyber-512");
    }
}

TEST_CASE("Signature Factory", "[factory][sig]") {
    Context ctx = quiet_cpu();
    const std::vector<uint8_t> msg = {'h', 'e', 'l', 'l', 'o'};

    SECTION("Every Type Round Trips") {
        for (auto type : {SignatureType::DILITHIUM_2, SignatureType::DILITHIUM_3,
                          SignatureType::DILITHIUM_5}) {
            auto scheme = create_signature(type, ctx);
            INFO(scheme->algorithm_name());
            REQUIRE(scheme->get_type() == type);
            REQUIRE(scheme->algorithm_name() == signature_type_to_string(type));

            auto kp = scheme->generate_keypair();
            REQUIRE(kp.public_key.size() == scheme->public_key_size());
            REQUIRE(kp.secret_key.size() == scheme->secret_key_size());

            auto sig = scheme->sign(msg, kp.secret_key);
            REQUIRE(sig.size() == scheme->signature_size());
            REQUIRE(scheme->verify(msg, sig, kp.public_key));

            std::vector<uint8_t> other = msg;
            other.push_back('!');
            REQUIRE_FALSE(scheme->verify(other, sig, kp.public_key));
        }
    }

    SECTION("Malformed Inputs Verify As False") {
        auto scheme = create_signature(SignatureType::DILITHIUM_2, ctx);
        auto kp = scheme->generate_keypair();
        auto sig = scheme->sign(msg, kp.secret_key);

        std::vector<uint8_t> truncated(sig.begin(), sig.end() - 1);
        REQUIRE_FALSE(scheme->verify(msg, truncated, kp.public_key));
        REQUIRE_FALSE(scheme->verify(msg, sig, std::vector<uint8_t>(10, 0)));
        REQUIRE_FALSE(scheme->verify(msg, std::vector<uint8_t>(), kp.public_key));

        std::vector<uint8_t> flipped = sig;
        flipped[0] ^= 0x01;
        REQUIRE_FALSE(scheme->verify(msg, flipped, kp.public_key));
    }

    SECTION("Malformed Secret Key Throws") {
        auto scheme = create_signature(SignatureType::DILITHIUM_3, ctx);
        REQUIRE_THROWS_AS(scheme->sign(msg, std::vector<uint8_t>(32, 0)), MalformedInputError);
    }

    SECTION("Unknown Type") {
        REQUIRE_THROWS_AS(create_signature(static_cast<SignatureType>(7), ctx), InvalidParameterError);
    }
}
