#include "dilithium.hpp"
#include "rounding.hpp"
#include "../pqc_common.hpp"
#include "../../core/errors.hpp"
#include "../../core/side_channel.hpp"
#include "../../ring/packing.hpp"
#include "../../ring/ring.hpp"
#include "../../sampling/sampler.hpp"

#include <cstring>
#include <string>

namespace pqlattice {
namespace pqc {
namespace dilithium {

using ring::Poly;
using ring::PolyVec;
using sampling::ByteView;
using sampling::Digest;
using sampling::Seed;

namespace {

constexpr unsigned T1_BITS = 10;
constexpr unsigned T0_BITS = 13;
constexpr uint32_t T0_OFFSET = 1u << 12;

const ring::Ring& dilithium_ring() {
    return ring::Ring::dilithium();
}

uint32_t ct_max(uint32_t a, uint32_t b) {
    uint32_t greater = static_cast<uint32_t>(0) - ((a - b) >> 31);
    return a ^ ((a ^ b) & greater);
}

uint32_t low_bits_norm(const PolyVec& r, uint32_t gamma2) {
    uint32_t m = 0;
    for (const auto& p : r) {
        for (size_t j = 0; j < ring::N; j++) {
            int32_t low = low_bits(p[j], gamma2);
            int32_t sign = low >> 31;
            m = ct_max(m, static_cast<uint32_t>((low ^ sign) - sign));
        }
    }
    return m;
}

PolyVec high_bits(const PolyVec& w, uint32_t gamma2) {
    PolyVec out(w.size());
    for (size_t i = 0; i < w.size(); i++) {
        for (size_t j = 0; j < ring::N; j++) {
            out[i][j] = dilithium::high_bits(w[i][j], gamma2);
        }
    }
    return out;
}

// c_hat * v_hat[i] for every i, transform domain
PolyVec multiply_by(const Context& ctx, const Poly& c_hat, const PolyVec& v_hat) {
    PolyVec out;
    out.reserve(v_hat.size());
    for (const auto& p : v_hat) {
        out.push_back(ctx.backend().polynomial_multiply(dilithium_ring(), c_hat, p));
    }
    return out;
}

Poly challenge(const Context& ctx, const DilithiumParams& params, const Digest& c_tilde) {
    PolyVec c{sampling::sample_in_ball(dilithium_ring(), c_tilde, params.tau)};
    ctx.backend().ntt_transform(dilithium_ring(), c);
    return c[0];
}

std::vector<uint8_t> encode_w1(const DilithiumParams& params, const PolyVec& w1) {
    std::vector<uint8_t> out;
    out.reserve(params.k * ring::packed_bytes(params.w1_bits()));
    ring::pack_bits(w1, params.w1_bits(), out);
    return out;
}

void require_shape(const DilithiumParams& params, size_t actual, size_t expected,
                   const char* what) {
    if (actual != expected) {
        throw InvalidParameterError(std::string(what) + " has " + std::to_string(actual) +
                                    " elements, " + params.name + " expects " +
                                    std::to_string(expected));
    }
}

// Secret key vectors moved to the transform domain for signing
struct TransformedKey {
    PolyVec s1_hat;
    PolyVec s2_hat;
    PolyVec t0_hat;

    ~TransformedKey() {
        wipe(s1_hat);
        wipe(s2_hat);
        wipe(t0_hat);
    }
};

// Per-attempt intermediates, wiped whether the attempt is accepted or not
struct SigningAttempt {
    PolyVec y;
    PolyVec y_hat;
    PolyVec w;
    PolyVec z;
    PolyVec cs1;
    PolyVec cs2;
    PolyVec r;
    PolyVec ct0;

    ~SigningAttempt() {
        wipe(y);
        wipe(y_hat);
        wipe(w);
        wipe(z);
        wipe(cs1);
        wipe(cs2);
        wipe(r);
        wipe(ct0);
    }
};

} // anonymous namespace

size_t hint_weight(const PolyVec& h) {
    size_t weight = 0;
    for (const auto& p : h) {
        for (size_t j = 0; j < ring::N; j++) {
            weight += p[j];
        }
    }
    return weight;
}

// ============================================================================
// Encodings
// ============================================================================

std::vector<uint8_t> PublicKey::encode() const {
    const auto& params = DilithiumParams::get(level);
    require_shape(params, t1.size(), params.k, "public key t1");
    std::vector<uint8_t> out;
    out.reserve(params.public_key_bytes());
    append(out, rho.data(), rho.size());
    ring::pack_bits(t1, T1_BITS, out);
    return out;
}

PublicKey PublicKey::decode(DilithiumLevel level, const std::vector<uint8_t>& bytes) {
    const auto& params = DilithiumParams::get(level);
    if (bytes.size() != params.public_key_bytes()) {
        throw MalformedInputError(std::string(params.name) + " public key",
                                  params.public_key_bytes(), bytes.size());
    }
    PublicKey pk;
    pk.level = level;
    std::memcpy(pk.rho.data(), bytes.data(), pk.rho.size());
    pk.t1 = ring::unpack_bits(bytes.data() + pk.rho.size(), params.k, T1_BITS, 1u << T1_BITS);
    return pk;
}

SecretKey::~SecretKey() {
    wipe(s1);
    wipe(s2);
    wipe(t0);
    side_channel::secure_wipe(key);
}

std::vector<uint8_t> SecretKey::encode() const {
    const auto& params = DilithiumParams::get(level);
    const auto& ring = dilithium_ring();
    require_shape(params, s1.size(), params.l, "secret key s1");
    require_shape(params, s2.size(), params.k, "secret key s2");
    require_shape(params, t0.size(), params.k, "secret key t0");
    if (!public_key) {
        throw InvalidParameterError("secret key has no public key attached");
    }

    std::vector<uint8_t> out = public_key->encode();
    out.reserve(params.secret_key_bytes());
    append(out, key.data(), key.size());
    for (const auto& p : s1) {
        ring::pack_offset(ring, p, params.eta_bits(), params.eta, out);
    }
    for (const auto& p : s2) {
        ring::pack_offset(ring, p, params.eta_bits(), params.eta, out);
    }
    for (const auto& p : t0) {
        ring::pack_offset(ring, p, T0_BITS, T0_OFFSET, out);
    }
    return out;
}

SecretKey SecretKey::decode(DilithiumLevel level, const std::vector<uint8_t>& bytes) {
    const auto& params = DilithiumParams::get(level);
    const auto& ring = dilithium_ring();
    if (bytes.size() != params.secret_key_bytes()) {
        throw MalformedInputError(std::string(params.name) + " secret key",
                                  params.secret_key_bytes(), bytes.size());
    }
    const uint8_t* p = bytes.data();

    SecretKey sk;
    sk.level = level;
    std::vector<uint8_t> pk_bytes(p, p + params.public_key_bytes());
    sk.public_key = std::make_shared<const PublicKey>(PublicKey::decode(level, pk_bytes));
    p += params.public_key_bytes();

    std::memcpy(sk.key.data(), p, sk.key.size());
    p += sk.key.size();

    const size_t eta_bytes = ring::packed_bytes(params.eta_bits());
    for (size_t i = 0; i < params.l; i++, p += eta_bytes) {
        sk.s1.push_back(ring::unpack_offset(ring, p, params.eta_bits(), params.eta, 2 * params.eta));
    }
    for (size_t i = 0; i < params.k; i++, p += eta_bytes) {
        sk.s2.push_back(ring::unpack_offset(ring, p, params.eta_bits(), params.eta, 2 * params.eta));
    }
    const size_t t0_bytes = ring::packed_bytes(T0_BITS);
    for (size_t i = 0; i < params.k; i++, p += t0_bytes) {
        sk.t0.push_back(ring::unpack_offset(ring, p, T0_BITS, T0_OFFSET, (1u << T0_BITS) - 1));
    }
    return sk;
}

std::vector<uint8_t> Signature::encode(DilithiumLevel level) const {
    const auto& params = DilithiumParams::get(level);
    const auto& ring = dilithium_ring();
    require_shape(params, z.size(), params.l, "signature z");
    require_shape(params, h.size(), params.k, "signature hint");

    std::vector<uint8_t> out;
    out.reserve(params.signature_bytes());
    append(out, c_tilde.data(), c_tilde.size());
    for (const auto& p : z) {
        ring::pack_offset(ring, p, params.z_bits(), params.gamma1, out);
    }

    std::vector<uint8_t> hint(params.omega + params.k, 0);
    size_t index = 0;
    for (size_t i = 0; i < params.k; i++) {
        for (size_t j = 0; j < ring::N; j++) {
            if (h[i][j] == 0) {
                continue;
            }
            if (index >= params.omega) {
                throw InvalidParameterError("hint weight exceeds omega=" +
                                            std::to_string(params.omega));
            }
            hint[index++] = static_cast<uint8_t>(j);
        }
        hint[params.omega + i] = static_cast<uint8_t>(index);
    }
    append(out, hint.data(), hint.size());
    return out;
}

Signature Signature::decode(DilithiumLevel level, const std::vector<uint8_t>& bytes) {
    const auto& params = DilithiumParams::get(level);
    const auto& ring = dilithium_ring();
    if (bytes.size() != params.signature_bytes()) {
        throw MalformedInputError(std::string(params.name) + " signature",
                                  params.signature_bytes(), bytes.size());
    }
    const uint8_t* p = bytes.data();

    Signature sig;
    std::memcpy(sig.c_tilde.data(), p, sig.c_tilde.size());
    p += sig.c_tilde.size();

    const size_t z_bytes = ring::packed_bytes(params.z_bits());
    for (size_t i = 0; i < params.l; i++, p += z_bytes) {
        sig.z.push_back(ring::unpack_offset(ring, p, params.z_bits(), params.gamma1,
                                            (1u << params.z_bits()) - 1));
    }

    // Positions must be strictly increasing per polynomial, totals
    // non-decreasing and bounded by omega, unused slots zero
    const uint8_t* hint = p;
    sig.h = ring::make_polyvec(params.k);
    size_t index = 0;
    for (size_t i = 0; i < params.k; i++) {
        size_t total = hint[params.omega + i];
        if (total < index || total > params.omega) {
            throw MalformedInputError("hint totals are not canonical");
        }
        for (size_t j = index; j < total; j++) {
            if (j > index && hint[j] <= hint[j - 1]) {
                throw MalformedInputError("hint positions are not strictly increasing");
            }
            sig.h[i][hint[j]] = 1;
        }
        index = total;
    }
    for (size_t j = index; j < params.omega; j++) {
        if (hint[j] != 0) {
            throw MalformedInputError("unused hint slots are not zero");
        }
    }
    return sig;
}

// ============================================================================
// Signature operations
// ============================================================================

KeyPair keygen_from_seed(const Context& ctx, DilithiumLevel level, const Seed& zeta) {
    const auto& params = DilithiumParams::get(level);
    const auto& ring = dilithium_ring();
    const auto& be = ctx.backend();

    const uint8_t domain[3] = {0, 1, 2};
    Seed rho = sampling::hash({ByteView(zeta), ByteView(&domain[0], 1)});
    Seed rho_prime = sampling::hash({ByteView(zeta), ByteView(&domain[1], 1)});
    Seed key = sampling::hash({ByteView(zeta), ByteView(&domain[2], 1)});

    ring::PolyMatrix a = be.sample(ring, rho, params.k, params.l);

    PolyVec s1;
    PolyVec s2;
    for (size_t i = 0; i < params.l; i++) {
        s1.push_back(sampling::sample_cbd(ring, rho_prime, static_cast<uint8_t>(i), params.eta));
    }
    for (size_t i = 0; i < params.k; i++) {
        s2.push_back(sampling::sample_cbd(ring, rho_prime, static_cast<uint8_t>(params.l + i),
                                          params.eta));
    }

    PolyVec s1_hat = s1;
    be.ntt_transform(ring, s1_hat);
    PolyVec t = be.lattice_multiply(ring, a, s1_hat, false);
    be.inverse_ntt_transform(ring, t);
    t = ring.add(t, s2);

    auto pk = std::make_shared<PublicKey>();
    pk->level = level;
    pk->rho = rho;
    pk->t1 = ring::make_polyvec(params.k);

    SecretKey sk;
    sk.level = level;
    sk.t0 = ring::make_polyvec(params.k);
    for (size_t i = 0; i < params.k; i++) {
        for (size_t j = 0; j < ring::N; j++) {
            Split split = power2round(t[i][j], params.d);
            pk->t1[i][j] = split.high;
            sk.t0[i][j] = ring.reduce(split.low);
        }
    }
    sk.s1 = std::move(s1);
    sk.s2 = std::move(s2);
    sk.key = key;
    sk.public_key = pk;

    wipe(s1_hat);
    wipe(t);
    side_channel::secure_wipe(rho_prime);
    side_channel::secure_wipe(key);

    std::vector<uint8_t> pk_bytes = pk->encode();
    ctx.log(std::string(params.name) + " keypair generated (pk=" +
            std::to_string(pk_bytes.size()) + "B, sk=" +
            std::to_string(params.secret_key_bytes()) + "B)");

    proof::CorrectnessClaim claim;
    claim.subject = "dilithium.keygen";
    claim.statement = "t1*2^d + t0 = A*s1 + s2 with s1, s2 bounded by eta";
    claim.parameter_set = params.name;
    claim.fingerprint = sampling::hash({ByteView(pk_bytes)});
    ctx.export_claim(claim);

    return KeyPair{pk, std::move(sk)};
}

KeyPair keygen(const Context& ctx, DilithiumLevel level) {
    DilithiumParams::get(level);

    Seed zeta;
    side_channel::secure_random_fill(zeta.data(), zeta.size());
    KeyPair kp = keygen_from_seed(ctx, level, zeta);
    side_channel::secure_wipe(zeta);
    return kp;
}

Signature sign(const Context& ctx, const SecretKey& sk, const std::vector<uint8_t>& message) {
    const auto& params = DilithiumParams::get(sk.level);
    const auto& ring = dilithium_ring();
    const auto& be = ctx.backend();
    require_shape(params, sk.s1.size(), params.l, "secret key s1");
    require_shape(params, sk.s2.size(), params.k, "secret key s2");
    require_shape(params, sk.t0.size(), params.k, "secret key t0");
    if (!sk.public_key) {
        throw InvalidParameterError("secret key has no public key attached");
    }

    std::vector<uint8_t> pk_bytes = sk.public_key->encode();
    Digest mu = sampling::hash({ByteView(pk_bytes), ByteView(message)});
    Seed rho2 = sampling::hash({ByteView(sk.key), ByteView(mu)});

    ring::PolyMatrix a = be.sample(ring, sk.public_key->rho, params.k, params.l);

    TransformedKey tk;
    tk.s1_hat = sk.s1;
    tk.s2_hat = sk.s2;
    tk.t0_hat = sk.t0;
    be.ntt_transform(ring, tk.s1_hat);
    be.ntt_transform(ring, tk.s2_hat);
    be.ntt_transform(ring, tk.t0_hat);

    Poly gamma1_poly;
    gamma1_poly.coeffs.fill(params.gamma1);

    const uint32_t z_bound = params.gamma1 - params.beta;
    const uint32_t low_bound = params.gamma2 - params.beta;
    const uint32_t max_attempts = ctx.config().max_sign_iterations;

    uint32_t attempt = 0;
    for (; attempt < max_attempts; attempt++) {
        // Mask nonces are 16 bits wide and must never repeat
        if (static_cast<uint64_t>(attempt + 1) * params.l > 65536) {
            break;
        }

        SigningAttempt s;
        for (size_t i = 0; i < params.l; i++) {
            uint16_t nonce = static_cast<uint16_t>(attempt * params.l + i);
            s.y.push_back(ring.sub(gamma1_poly, sampling::sample_uniform_gamma(
                                                    ring, rho2, nonce, 2 * params.gamma1)));
        }
        s.y_hat = s.y;
        be.ntt_transform(ring, s.y_hat);
        s.w = be.lattice_multiply(ring, a, s.y_hat, false);
        be.inverse_ntt_transform(ring, s.w);

        std::vector<uint8_t> w1_bytes = encode_w1(params, high_bits(s.w, params.gamma2));
        Digest c_tilde = sampling::hash({ByteView(mu), ByteView(w1_bytes)});
        Poly c_hat = challenge(ctx, params, c_tilde);

        s.cs1 = multiply_by(ctx, c_hat, tk.s1_hat);
        be.inverse_ntt_transform(ring, s.cs1);
        s.z = ring.add(s.y, s.cs1);
        if (ring.infinity_norm(s.z) >= z_bound) {
            continue;
        }

        s.cs2 = multiply_by(ctx, c_hat, tk.s2_hat);
        be.inverse_ntt_transform(ring, s.cs2);
        s.r = ring.sub(s.w, s.cs2);
        if (low_bits_norm(s.r, params.gamma2) >= low_bound) {
            continue;
        }

        s.ct0 = multiply_by(ctx, c_hat, tk.t0_hat);
        be.inverse_ntt_transform(ring, s.ct0);
        if (ring.infinity_norm(s.ct0) >= params.gamma2) {
            continue;
        }

        PolyVec r_plus = ring.add(s.r, s.ct0);
        PolyVec h = ring::make_polyvec(params.k);
        for (size_t i = 0; i < params.k; i++) {
            for (size_t j = 0; j < ring::N; j++) {
                h[i][j] = make_hint(ring.neg(s.ct0[i][j]), r_plus[i][j], params.gamma2);
            }
        }
        wipe(r_plus);
        if (hint_weight(h) > params.omega) {
            continue;
        }

        side_channel::secure_wipe(rho2);
        ctx.log(std::string(params.name) + " signature produced after " +
                std::to_string(attempt + 1) + " attempt(s) (sig=" +
                std::to_string(params.signature_bytes()) + "B)");
        return Signature{c_tilde, std::move(s.z), std::move(h)};
    }

    side_channel::secure_wipe(rho2);
    throw SigningExhaustedError(attempt);
}

bool verify(const Context& ctx, const PublicKey& pk, const std::vector<uint8_t>& message,
            const Signature& signature) {
    const auto& params = DilithiumParams::get(pk.level);
    const auto& ring = dilithium_ring();
    const auto& be = ctx.backend();

    if (pk.t1.size() != params.k || signature.z.size() != params.l ||
        signature.h.size() != params.k) {
        return false;
    }
    for (const auto& p : signature.z) {
        if (p.domain != ring::Domain::Normal) {
            return false;
        }
        for (size_t j = 0; j < ring::N; j++) {
            if (p[j] >= ring.q()) {
                return false;
            }
        }
    }
    for (const auto& p : signature.h) {
        for (size_t j = 0; j < ring::N; j++) {
            if (p[j] > 1) {
                return false;
            }
        }
    }
    for (const auto& p : pk.t1) {
        if (p.domain != ring::Domain::Normal) {
            return false;
        }
    }
    if (ring.infinity_norm(signature.z) >= params.gamma1 - params.beta) {
        return false;
    }
    if (hint_weight(signature.h) > params.omega) {
        return false;
    }

    std::vector<uint8_t> pk_bytes = pk.encode();
    Digest mu = sampling::hash({ByteView(pk_bytes), ByteView(message)});

    ring::PolyMatrix a = be.sample(ring, pk.rho, params.k, params.l);
    Poly c_hat = challenge(ctx, params, signature.c_tilde);

    PolyVec z_hat = signature.z;
    be.ntt_transform(ring, z_hat);
    PolyVec az = be.lattice_multiply(ring, a, z_hat, false);

    PolyVec t1_hat;
    t1_hat.reserve(params.k);
    for (const auto& p : pk.t1) {
        t1_hat.push_back(ring.scale(p, 1u << params.d));
    }
    be.ntt_transform(ring, t1_hat);

    PolyVec w = ring.sub(az, multiply_by(ctx, c_hat, t1_hat));
    be.inverse_ntt_transform(ring, w);

    PolyVec w1 = ring::make_polyvec(params.k);
    for (size_t i = 0; i < params.k; i++) {
        for (size_t j = 0; j < ring::N; j++) {
            w1[i][j] = use_hint(signature.h[i][j], w[i][j], params.gamma2);
        }
    }

    std::vector<uint8_t> w1_bytes = encode_w1(params, w1);
    Digest expected = sampling::hash({ByteView(mu), ByteView(w1_bytes)});
    bool valid = side_channel::constant_time_compare(expected.data(), signature.c_tilde.data(),
                                                     expected.size());
    ctx.log(std::string(params.name) + " verification: " + (valid ? "valid" : "invalid"));
    return valid;
}

} // namespace dilithium
} // namespace pqc
} // namespace pqlattice
