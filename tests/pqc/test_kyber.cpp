/**
 * @file test_kyber.cpp
 * @brief Kyber key generation, encapsulation and implicit rejection
 */

#include <catch2/catch.hpp>
#include "../../src/backend/context.hpp"
#include "../../src/core/errors.hpp"
#include "../../src/pqc/kyber/kyber.hpp"
#include "../../src/pqc/params.hpp"
#include "../../src/sampling/xof.hpp"

#include <vector>

using namespace pqlattice;
using namespace pqlattice::pqc;

namespace {

sampling::Seed seed_of(uint8_t fill) {
    sampling::Seed s;
    s.fill(fill);
    return s;
}

Context quiet_cpu(unsigned threads = 1) {
    Config cfg = Config::defaults();
    cfg.verbose_logging = false;
    cfg.cpu_threads = threads;
    return Context::cpu(cfg);
}

} // namespace

TEST_CASE("Kyber Parameter Sets", "[kyber][params]") {
    SECTION("Sizes") {
        REQUIRE(KyberParams::get(KyberLevel::KYBER_512).public_key_bytes() == 800);
        REQUIRE(KyberParams::get(KyberLevel::KYBER_512).secret_key_bytes() == 1632);
        REQUIRE(KyberParams::get(KyberLevel::KYBER_512).ciphertext_bytes() == 768);
        REQUIRE(KyberParams::get(KyberLevel::KYBER_768).public_key_bytes() == 1184);
        REQUIRE(KyberParams::get(KyberLevel::KYBER_768).secret_key_bytes() == 2400);
        REQUIRE(KyberParams::get(KyberLevel::KYBER_768).ciphertext_bytes() == 1088);
        REQUIRE(KyberParams::get(KyberLevel::KYBER_1024).public_key_bytes() == 1568);
        REQUIRE(KyberParams::get(KyberLevel::KYBER_1024).secret_key_bytes() == 3168);
        REQUIRE(KyberParams::get(KyberLevel::KYBER_1024).ciphertext_bytes() == 1568);
    }

    SECTION("Lookup By Number") {
        REQUIRE(KyberParams::get(768).k == 3);
        REQUIRE_THROWS_AS(KyberParams::get(600), InvalidParameterError);
    }
}

TEST_CASE("Kyber Round Trip", "[kyber][kem]") {
    Context ctx = quiet_cpu();

    SECTION("Every Level") {
        for (auto level : {KyberLevel::KYBER_512, KyberLevel::KYBER_768, KyberLevel::KYBER_1024}) {
            const auto& params = KyberParams::get(level);
            INFO(params.name);

            kyber::KeyPair kp = kyber::keygen(ctx, level);
            REQUIRE(kp.public_key->encode().size() == params.public_key_bytes());
            REQUIRE(kp.secret_key.encode().size() == params.secret_key_bytes());

            kyber::Encapsulation enc = kyber::encapsulate(ctx, *kp.public_key);
            REQUIRE(enc.ciphertext.size() == params.ciphertext_bytes());

            kyber::SharedSecret ss = kyber::decapsulate(ctx, kp.secret_key, enc.ciphertext);
            REQUIRE(ss == enc.shared_secret);
        }
    }

    SECTION("Many Trials At Kyber-768") {
        kyber::KeyPair kp = kyber::keygen(ctx, KyberLevel::KYBER_768);
        int failures = 0;
        for (int trial = 0; trial < 1000; trial++) {
            kyber::Encapsulation enc = kyber::encapsulate(ctx, *kp.public_key);
            if (kyber::decapsulate(ctx, kp.secret_key, enc.ciphertext) != enc.shared_secret) {
                failures++;
            }
        }
        REQUIRE(failures == 0);
    }

    SECTION("Fresh Encapsulations Differ") {
        kyber::KeyPair kp = kyber::keygen(ctx, KyberLevel::KYBER_512);
        kyber::Encapsulation a = kyber::encapsulate(ctx, *kp.public_key);
        kyber::Encapsulation b = kyber::encapsulate(ctx, *kp.public_key);
        REQUIRE(a.ciphertext != b.ciphertext);
        REQUIRE(a.shared_secret != b.shared_secret);
    }
}

TEST_CASE("Kyber Determinism", "[kyber][deterministic]") {
    Context ctx = quiet_cpu();

    SECTION("Seeded Key Generation") {
        auto a = kyber::keygen_from_seeds(ctx, KyberLevel::KYBER_768, seed_of(1), seed_of(2), seed_of(3));
        auto b = kyber::keygen_from_seeds(ctx, KyberLevel::KYBER_768, seed_of(1), seed_of(2), seed_of(3));
        REQUIRE(a.public_key->encode() == b.public_key->encode());
        REQUIRE(a.secret_key.encode() == b.secret_key.encode());

        auto c = kyber::keygen_from_seeds(ctx, KyberLevel::KYBER_768, seed_of(1), seed_of(4), seed_of(3));
        REQUIRE(a.public_key->encode() != c.public_key->encode());
    }

    SECTION("Thread Count Does Not Change Keys Or Ciphertexts") {
        Context pooled = quiet_cpu(4);
        auto a = kyber::keygen_from_seeds(ctx, KyberLevel::KYBER_1024, seed_of(5), seed_of(6), seed_of(7));
        auto b = kyber::keygen_from_seeds(pooled, KyberLevel::KYBER_1024, seed_of(5), seed_of(6), seed_of(7));
        REQUIRE(a.secret_key.encode() == b.secret_key.encode());

        auto ea = kyber::encapsulate_with_message(ctx, *a.public_key, seed_of(8));
        auto eb = kyber::encapsulate_with_message(pooled, *b.public_key, seed_of(8));
        REQUIRE(ea.ciphertext == eb.ciphertext);
        REQUIRE(ea.shared_secret == eb.shared_secret);
    }

    SECTION("Message Encapsulation") {
        auto kp = kyber::keygen_from_seeds(ctx, KyberLevel::KYBER_512, seed_of(9), seed_of(10), seed_of(11));
        auto a = kyber::encapsulate_with_message(ctx, *kp.public_key, seed_of(12));
        auto b = kyber::encapsulate_with_message(ctx, *kp.public_key, seed_of(12));
        REQUIRE(a.ciphertext == b.ciphertext);
        REQUIRE(a.shared_secret == b.shared_secret);
        REQUIRE(kyber::decapsulate(ctx, kp.secret_key, a.ciphertext) == a.shared_secret);
    }
}

TEST_CASE("Kyber Implicit Rejection", "[kyber][rejection]") {
    Context ctx = quiet_cpu();
    auto kp = kyber::keygen_from_seeds(ctx, KyberLevel::KYBER_768, seed_of(21), seed_of(22), seed_of(23));
    auto enc = kyber::encapsulate_with_message(ctx, *kp.public_key, seed_of(24));

    SECTION("Tampered Ciphertext Yields Rejection Secret") {
        std::vector<uint8_t> tampered = enc.ciphertext;
        tampered[10] ^= 0x01;

        kyber::SharedSecret first = kyber::decapsulate(ctx, kp.secret_key, tampered);
        kyber::SharedSecret second = kyber::decapsulate(ctx, kp.secret_key, tampered);
        REQUIRE(first != enc.shared_secret);
        REQUIRE(first == second);

        sampling::Seed z = seed_of(23);
        std::vector<uint8_t> expected = sampling::shake256(
            {sampling::ByteView(z), sampling::ByteView(tampered)}, SHARED_SECRET_BYTES);
        REQUIRE(std::vector<uint8_t>(first.begin(), first.end()) == expected);
    }

    SECTION("Different Tampering Gives Different Secrets") {
        std::vector<uint8_t> t1 = enc.ciphertext;
        std::vector<uint8_t> t2 = enc.ciphertext;
        t1[0] ^= 0x80;
        t2[t2.size() - 1] ^= 0x80;
        REQUIRE(kyber::decapsulate(ctx, kp.secret_key, t1) != kyber::decapsulate(ctx, kp.secret_key, t2));
    }

    SECTION("Wrong Secret Key Does Not Agree") {
        auto other = kyber::keygen_from_seeds(ctx, KyberLevel::KYBER_768, seed_of(31), seed_of(32), seed_of(33));
        REQUIRE(kyber::decapsulate(ctx, other.secret_key, enc.ciphertext) != enc.shared_secret);
    }

    SECTION("Wrong Length Is Malformed") {
        std::vector<uint8_t> shorter(enc.ciphertext.begin(), enc.ciphertext.end() - 1);
        REQUIRE_THROWS_AS(kyber::decapsulate(ctx, kp.secret_key, shorter), MalformedInputError);

        std::vector<uint8_t> longer = enc.ciphertext;
        longer.push_back(0);
        REQUIRE_THROWS_AS(kyber::decapsulate(ctx, kp.secret_key, longer), MalformedInputError);
    }
}

TEST_CASE("Kyber Key Encodings", "[kyber][encoding]") {
    Context ctx = quiet_cpu();
    auto kp = kyber::keygen_from_seeds(ctx, KyberLevel::KYBER_512, seed_of(41), seed_of(42), seed_of(43));

    SECTION("Decoded Keys Interoperate") {
        auto pk = kyber::PublicKey::decode(KyberLevel::KYBER_512, kp.public_key->encode());
        auto sk = kyber::SecretKey::decode(KyberLevel::KYBER_512, kp.secret_key.encode());
        REQUIRE(pk.rho == seed_of(41));
        REQUIRE(sk.z == seed_of(43));

        auto enc = kyber::encapsulate(ctx, pk);
        REQUIRE(kyber::decapsulate(ctx, sk, enc.ciphertext) == enc.shared_secret);
        REQUIRE(kyber::decapsulate(ctx, kp.secret_key, enc.ciphertext) == enc.shared_secret);
    }

    SECTION("Wrong Length") {
        std::vector<uint8_t> pk = kp.public_key->encode();
        pk.pop_back();
        REQUIRE_THROWS_AS(kyber::PublicKey::decode(KyberLevel::KYBER_512, pk), MalformedInputError);
        REQUIRE_THROWS_AS(kyber::PublicKey::decode(KyberLevel::KYBER_768, kp.public_key->encode()),
                          MalformedInputError);
    }

    SECTION("Coefficient Not Below Modulus") {
        std::vector<uint8_t> pk = kp.public_key->encode();
        pk[0] = 0xFF;
        pk[1] |= 0x0F;
        REQUIRE_THROWS_AS(kyber::PublicKey::decode(KyberLevel::KYBER_512, pk), MalformedInputError);
    }

    SECTION("Embedded Public Key Hash Checked") {
        const auto& params = KyberParams::get(KyberLevel::KYBER_512);
        std::vector<uint8_t> sk = kp.secret_key.encode();
        sk[params.polyvec_bytes() + params.public_key_bytes()] ^= 0x01;
        REQUIRE_THROWS_AS(kyber::SecretKey::decode(KyberLevel::KYBER_512, sk), MalformedInputError);
    }
}
