/**
 * @file test_ring.cpp
 * @brief Modular arithmetic, NTT, compression and packing
 */

#include <catch2/catch.hpp>
#include "../../src/core/errors.hpp"
#include "../../src/ring/packing.hpp"
#include "../../src/ring/ring.hpp"

#include <cstdlib>
#include <random>
#include <vector>

using namespace pqlattice;
using namespace pqlattice::ring;

namespace {

Poly random_poly(const Ring& r, std::mt19937& rng) {
    std::uniform_int_distribution<uint32_t> dist(0, r.q() - 1);
    Poly p;
    for (size_t i = 0; i < N; i++) {
        p[i] = dist(rng);
    }
    return p;
}

} // namespace

TEST_CASE("Scalar Arithmetic", "[ring][scalar]") {
    const Ring* rings[] = {&Ring::kyber(), &Ring::dilithium()};

    SECTION("Reduce Signed Values") {
        for (const Ring* r : rings) {
            const uint32_t q = r->q();
            REQUIRE(r->reduce(0) == 0);
            REQUIRE(r->reduce(-1) == q - 1);
            REQUIRE(r->reduce(static_cast<int64_t>(q)) == 0);
            REQUIRE(r->reduce(static_cast<int64_t>(q) * 1000 + 5) == 5);
            REQUIRE(r->reduce(-static_cast<int64_t>(q) * 1000 - 5) == q - 5);
        }
    }

    SECTION("Add Sub Mul") {
        for (const Ring* r : rings) {
            const uint32_t q = r->q();
            REQUIRE(r->add(q - 1, 1) == 0);
            REQUIRE(r->sub(0, 1) == q - 1);
            REQUIRE(r->neg(0) == 0);
            REQUIRE(r->neg(1) == q - 1);
            REQUIRE(r->mul(q - 1, q - 1) == 1);
            REQUIRE(r->mul(2, (q + 1) / 2) == 1);
        }
    }

    SECTION("Add Sub Agree With Plain Modulo") {
        const Ring& r = Ring::kyber();
        const uint32_t q = r.q();
        for (uint32_t a = 0; a < q; a += 7) {
            for (uint32_t b = 0; b < q; b += 13) {
                REQUIRE(r.add(a, b) == (a + b) % q);
                REQUIRE(r.sub(a, b) == (a + q - b) % q);
            }
        }
    }

    SECTION("Centered Representative") {
        for (const Ring* r : rings) {
            const uint32_t q = r->q();
            REQUIRE(r->centered(0) == 0);
            REQUIRE(r->centered(q - 1) == -1);
            REQUIRE(r->centered((q - 1) / 2) == static_cast<int32_t>((q - 1) / 2));
            REQUIRE(r->centered((q + 1) / 2) == -static_cast<int32_t>((q - 1) / 2));
        }
    }
}

TEST_CASE("Ring Construction", "[ring][params]") {
    SECTION("Known Rings") {
        REQUIRE(Ring::kyber().q() == 3329);
        REQUIRE(Ring::kyber().leaf_size() == 2);
        REQUIRE(Ring::dilithium().q() == 8380417);
        REQUIRE(Ring::dilithium().leaf_size() == 1);
    }

    SECTION("Reject Root Of Wrong Order") {
        REQUIRE_THROWS_AS(Ring(3329, 1, 7, "bad-root"), InvalidParameterError);
    }

    SECTION("Reject Even Modulus") {
        REQUIRE_THROWS_AS(Ring(3328, 17, 7, "even"), InvalidParameterError);
    }
}

TEST_CASE("NTT", "[ring][ntt]") {
    std::mt19937 rng(0x5eed);
    const Ring* rings[] = {&Ring::kyber(), &Ring::dilithium()};

    SECTION("Round Trip") {
        for (const Ring* r : rings) {
            for (int trial = 0; trial < 20; trial++) {
                Poly a = random_poly(*r, rng);
                Poly t = a;
                r->ntt(t);
                REQUIRE(t.domain == Domain::Transform);
                r->inverse_ntt(t);
                REQUIRE(t == a);
            }
        }
    }

    SECTION("Matches Schoolbook Product") {
        for (const Ring* r : rings) {
            for (int trial = 0; trial < 5; trial++) {
                Poly a = random_poly(*r, rng);
                Poly b = random_poly(*r, rng);
                REQUIRE(r->multiply(a, b) == r->multiply_schoolbook(a, b));
            }
        }
    }

    SECTION("x^255 * x Wraps To -1") {
        for (const Ring* r : rings) {
            Poly a, b;
            a[255] = 1;
            b[1] = 1;
            Poly c = r->multiply(a, b);
            REQUIRE(c[0] == r->q() - 1);
            for (size_t i = 1; i < N; i++) {
                REQUIRE(c[i] == 0);
            }
        }
    }

    SECTION("Transform Is Linear") {
        for (const Ring* r : rings) {
            Poly a = random_poly(*r, rng);
            Poly b = random_poly(*r, rng);
            Poly sum = r->add(a, b);
            r->ntt(a);
            r->ntt(b);
            r->ntt(sum);
            REQUIRE(r->add(a, b) == sum);
        }
    }
}

TEST_CASE("Domain Tracking", "[ring][domain]") {
    const Ring& r = Ring::kyber();
    Poly normal;
    Poly transformed(Domain::Transform);

    REQUIRE_THROWS_AS(r.add(normal, transformed), DomainMismatchError);
    REQUIRE_THROWS_AS(r.sub(transformed, normal), DomainMismatchError);
    REQUIRE_THROWS_AS(r.ntt(transformed), DomainMismatchError);
    REQUIRE_THROWS_AS(r.inverse_ntt(normal), DomainMismatchError);
    REQUIRE_THROWS_AS(r.pointwise(normal, transformed), DomainMismatchError);
    REQUIRE_THROWS_AS(r.compress(transformed, 4), DomainMismatchError);

    SECTION("Vector And Matrix Shapes") {
        PolyVec v = make_polyvec(3, Domain::Transform);
        PolyVec w = make_polyvec(2, Domain::Transform);
        REQUIRE_THROWS_AS(r.add(v, w), InvalidParameterError);
        REQUIRE_THROWS_AS(r.inner_product(v, w), InvalidParameterError);

        PolyMatrix m(2, make_polyvec(3, Domain::Transform));
        REQUIRE(r.matrix_vector(m, v, false).size() == 2);
        REQUIRE(r.matrix_vector(m, w, true).size() == 3);
        REQUIRE_THROWS_AS(r.matrix_vector(m, w, false), InvalidParameterError);
        REQUIRE_THROWS_AS(r.matrix_vector(PolyMatrix{}, v, false), InvalidParameterError);
    }
}

TEST_CASE("Compression", "[ring][compress]") {
    const Ring& r = Ring::kyber();
    const uint32_t q = r.q();

    SECTION("Error Bound") {
        for (unsigned d = 1; d <= r.max_compress_bits(); d++) {
            const uint32_t bound = (q + (1u << (d + 1)) - 1) >> (d + 1);
            for (uint32_t x = 0; x < q; x++) {
                uint32_t c = r.compress(x, d);
                REQUIRE(c < (1u << d));
                uint32_t y = r.decompress(c, d);
                REQUIRE(static_cast<uint32_t>(std::abs(r.centered(r.sub(y, x)))) <= bound);
            }
        }
    }

    SECTION("Decompress Then Compress Is Identity") {
        for (unsigned d : {1u, 4u, 5u, 10u, 11u}) {
            for (uint32_t y = 0; y < (1u << d); y++) {
                REQUIRE(r.compress(r.decompress(y, d), d) == y);
            }
        }
    }

    SECTION("Unsupported Widths") {
        REQUIRE_THROWS_AS(r.compress(1, 0), InvalidParameterError);
        REQUIRE_THROWS_AS(r.compress(1, r.max_compress_bits() + 1), InvalidParameterError);
    }
}

TEST_CASE("Infinity Norm", "[ring][norm]") {
    const Ring& r = Ring::dilithium();
    int32_t values[N] = {};
    values[3] = -17;
    values[100] = 12;
    Poly p = r.from_signed(values);
    REQUIRE(r.infinity_norm(p) == 17);

    PolyVec v{p, r.neg(p)};
    v[1][7] = r.reduce(40);
    REQUIRE(r.infinity_norm(v) == 40);

    SECTION("Largest Value First And Extremes") {
        int32_t extreme[N] = {};
        const int32_t half = static_cast<int32_t>((r.q() - 1) / 2);
        extreme[0] = -half;
        extreme[1] = 5;
        extreme[N - 1] = half - 1;
        REQUIRE(r.infinity_norm(r.from_signed(extreme)) == static_cast<uint32_t>(half));

        PolyVec w{r.from_signed(extreme), p};
        REQUIRE(r.infinity_norm(w) == static_cast<uint32_t>(half));
    }
}

TEST_CASE("Bit Packing", "[ring][packing]") {
    const Ring& r = Ring::kyber();
    std::mt19937 rng(42);

    SECTION("Twelve-Bit Round Trip") {
        Poly a = random_poly(r, rng);
        std::vector<uint8_t> bytes;
        pack_bits(a, 12, bytes);
        REQUIRE(bytes.size() == packed_bytes(12));
        REQUIRE(bytes.size() == 384);
        REQUIRE(unpack_bits(bytes.data(), 12, r.q()) == a);
    }

    SECTION("Reject Coefficient Above Limit") {
        Poly a;
        a[17] = 4000;
        std::vector<uint8_t> bytes;
        pack_bits(a, 12, bytes);
        REQUIRE_THROWS_AS(unpack_bits(bytes.data(), 12, r.q()), MalformedInputError);
        REQUIRE(unpack_bits(bytes.data(), 12, 4096)[17] == 4000);
    }

    SECTION("Offset Encoding Of Signed Values") {
        const Ring& d = Ring::dilithium();
        int32_t values[N];
        for (size_t i = 0; i < N; i++) {
            values[i] = static_cast<int32_t>(i % 9) - 4;
        }
        Poly s = d.from_signed(values);
        std::vector<uint8_t> bytes;
        pack_offset(d, s, 4, 4, bytes);
        REQUIRE(bytes.size() == 128);
        REQUIRE(unpack_offset(d, bytes.data(), 4, 4, 8) == s);

        bytes[0] = 0x0F;
        REQUIRE_THROWS_AS(unpack_offset(d, bytes.data(), 4, 4, 8), MalformedInputError);
    }

    SECTION("Vector Packing") {
        PolyVec v{random_poly(r, rng), random_poly(r, rng), random_poly(r, rng)};
        for (auto& p : v) {
            p.domain = Domain::Transform;
        }
        std::vector<uint8_t> bytes;
        pack_bits(v, 12, bytes);
        REQUIRE(bytes.size() == 3 * 384);
        REQUIRE(unpack_bits(bytes.data(), 3, 12, r.q(), Domain::Transform) == v);
    }
}
