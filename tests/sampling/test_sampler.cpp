/**
 * @file test_sampler.cpp
 * @brief Deterministic samplers over SHAKE
 */

#include <catch2/catch.hpp>
#include "../../src/core/errors.hpp"
#include "../../src/sampling/sampler.hpp"
#include "../../src/sampling/xof.hpp"

#include <cstdlib>
#include <vector>

using namespace pqlattice;
using namespace pqlattice::sampling;
using pqlattice::ring::Ring;
using pqlattice::ring::Poly;
using pqlattice::ring::Domain;
using pqlattice::ring::N;

namespace {

Seed make_seed(uint8_t fill) {
    Seed s;
    for (size_t i = 0; i < s.size(); i++) {
        s[i] = static_cast<uint8_t>(fill + i);
    }
    return s;
}

} // namespace

TEST_CASE("Hash Functions", "[sampling][xof]") {
    SECTION("SHA3-256 Of Empty Input") {
        // FIPS 202 known answer
        const uint8_t expected[4] = {0xa7, 0xff, 0xc6, 0xf8};
        Digest d = hash({});
        for (size_t i = 0; i < 4; i++) {
            REQUIRE(d[i] == expected[i]);
        }
    }

    SECTION("Hash Sees Concatenation Only") {
        std::vector<uint8_t> ab = {'a', 'b'};
        std::vector<uint8_t> a = {'a'};
        std::vector<uint8_t> b = {'b'};
        REQUIRE(hash({ByteView(ab)}) == hash({ByteView(a), ByteView(b)}));
    }

    SECTION("Squeeze Split Does Not Matter") {
        Seed seed = make_seed(1);
        Xof one(XofKind::Shake128, {ByteView(seed)});
        Xof two(XofKind::Shake128, {ByteView(seed)});

        std::vector<uint8_t> whole(1000);
        one.squeeze(whole.data(), whole.size());

        std::vector<uint8_t> pieces(1000);
        two.squeeze(pieces.data(), 1);
        two.squeeze(pieces.data() + 1, 168);
        two.squeeze(pieces.data() + 169, 500);
        for (size_t i = 669; i < 1000; i++) {
            pieces[i] = two.next_byte();
        }
        REQUIRE(whole == pieces);
    }

    SECTION("SHAKE256 Prefix Property") {
        Seed seed = make_seed(9);
        auto short_out = shake256({ByteView(seed)}, 32);
        auto long_out = shake256({ByteView(seed)}, 200);
        REQUIRE(std::vector<uint8_t>(long_out.begin(), long_out.begin() + 32) == short_out);
    }
}

TEST_CASE("Uniform Matrix Expansion", "[sampling][uniform]") {
    Seed seed = make_seed(7);

    SECTION("Coefficients Below Modulus") {
        for (const Ring* r : {&Ring::kyber(), &Ring::dilithium()}) {
            Poly p = expand_uniform(*r, seed, 1, 2);
            REQUIRE(p.domain == Domain::Transform);
            for (size_t i = 0; i < N; i++) {
                REQUIRE(p[i] < r->q());
            }
        }
    }

    SECTION("Cells Are Distinct And Reproducible") {
        const Ring& r = Ring::kyber();
        auto a = expand_matrix(r, seed, 3, 3);
        auto b = expand_matrix(r, seed, 3, 3);
        REQUIRE(a == b);
        REQUIRE(a[0][1] != a[1][0]);
        REQUIRE(a[1][2] == expand_uniform(r, seed, 1, 2));
    }

    SECTION("Different Seed Gives Different Matrix") {
        const Ring& r = Ring::dilithium();
        REQUIRE(expand_matrix(r, seed, 2, 2) != expand_matrix(r, make_seed(8), 2, 2));
    }

    SECTION("Dimension Limits") {
        REQUIRE_THROWS_AS(expand_matrix(Ring::kyber(), seed, 0, 3), InvalidParameterError);
        REQUIRE_THROWS_AS(expand_matrix(Ring::kyber(), seed, 256, 1), InvalidParameterError);
    }
}

TEST_CASE("Centered Binomial Sampling", "[sampling][cbd]") {
    Seed seed = make_seed(3);

    SECTION("Bounded By Eta") {
        for (unsigned eta : {2u, 3u, 4u}) {
            for (const Ring* r : {&Ring::kyber(), &Ring::dilithium()}) {
                Poly p = sample_cbd(*r, seed, 0, eta);
                REQUIRE(p.domain == Domain::Normal);
                REQUIRE(r->infinity_norm(p) <= eta);
            }
        }
    }

    SECTION("Mean Near Zero") {
        const Ring& r = Ring::kyber();
        int64_t sum = 0;
        size_t count = 0;
        for (unsigned nonce = 0; nonce < 16; nonce++) {
            Poly p = sample_cbd(r, seed, static_cast<uint8_t>(nonce), 2);
            for (size_t i = 0; i < N; i++) {
                sum += r.centered(p[i]);
                count++;
            }
        }
        double mean = static_cast<double>(sum) / static_cast<double>(count);
        INFO("mean = " << mean);
        REQUIRE(std::abs(mean) < 0.15);
    }

    SECTION("Nonce Separates Outputs") {
        const Ring& r = Ring::kyber();
        REQUIRE(sample_cbd(r, seed, 5, 2) == sample_cbd(r, seed, 5, 2));
        REQUIRE(sample_cbd(r, seed, 5, 2) != sample_cbd(r, seed, 6, 2));
    }

    SECTION("Eta Range") {
        REQUIRE_THROWS_AS(sample_cbd(Ring::kyber(), seed, 0, 0), InvalidParameterError);
        REQUIRE_THROWS_AS(sample_cbd(Ring::kyber(), seed, 0, 9), InvalidParameterError);
    }
}

TEST_CASE("Bounded Uniform Sampling", "[sampling][gamma]") {
    const Ring& r = Ring::dilithium();
    Seed seed = make_seed(11);

    SECTION("Power Of Two Bound") {
        const uint32_t gamma = 1u << 18;
        Poly p = sample_uniform_gamma(r, seed, 300, gamma);
        for (size_t i = 0; i < N; i++) {
            REQUIRE(p[i] < gamma);
        }
    }

    SECTION("Non Power Of Two Bound") {
        Poly p = sample_uniform_gamma(r, seed, 0, 5);
        bool saw_top = false;
        for (size_t i = 0; i < N; i++) {
            REQUIRE(p[i] < 5);
            saw_top |= (p[i] == 4);
        }
        REQUIRE(saw_top);
    }

    SECTION("Sixteen-Bit Nonce") {
        REQUIRE(sample_uniform_gamma(r, seed, 0x0100, 1u << 17) !=
                sample_uniform_gamma(r, seed, 0x0001, 1u << 17));
    }

    SECTION("Bound Range") {
        REQUIRE_THROWS_AS(sample_uniform_gamma(r, seed, 0, 1), InvalidParameterError);
        REQUIRE_THROWS_AS(sample_uniform_gamma(r, seed, 0, (1u << 24) + 1), InvalidParameterError);
    }
}

TEST_CASE("Challenge Sampling", "[sampling][ball]") {
    const Ring& r = Ring::dilithium();

    SECTION("Exactly Tau Nonzero Signs") {
        for (unsigned tau : {1u, 39u, 49u, 60u, 64u}) {
            Poly c = sample_in_ball(r, make_seed(static_cast<uint8_t>(tau)), tau);
            unsigned weight = 0;
            for (size_t i = 0; i < N; i++) {
                if (c[i] != 0) {
                    REQUIRE((c[i] == 1 || c[i] == r.q() - 1));
                    weight++;
                }
            }
            REQUIRE(weight == tau);
        }
    }

    SECTION("Deterministic In Seed") {
        REQUIRE(sample_in_ball(r, make_seed(2), 49) == sample_in_ball(r, make_seed(2), 49));
        REQUIRE(sample_in_ball(r, make_seed(2), 49) != sample_in_ball(r, make_seed(4), 49));
    }

    SECTION("Tau Range") {
        REQUIRE_THROWS_AS(sample_in_ball(r, make_seed(0), 0), InvalidParameterError);
        REQUIRE_THROWS_AS(sample_in_ball(r, make_seed(0), 65), InvalidParameterError);
    }
}
