#include "kyber.hpp"
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
namespace kyber {

using ring::Poly;
using ring::PolyVec;
using sampling::ByteView;
using sampling::Digest;
using sampling::Seed;

namespace {

constexpr unsigned COEFF_BITS = 12;

const ring::Ring& kyber_ring() {
    return ring::Ring::kyber();
}

Poly message_to_poly(const Seed& m) {
    Poly bits;
    for (size_t i = 0; i < ring::N; i++) {
        bits[i] = (m[i / 8] >> (i % 8)) & 1;
    }
    Poly p = kyber_ring().decompress(bits, 1);
    wipe(bits);
    return p;
}

Seed poly_to_message(const Poly& w) {
    Poly bits = kyber_ring().compress(w, 1);
    Seed m{};
    for (size_t i = 0; i < ring::N; i++) {
        m[i / 8] |= static_cast<uint8_t>(bits[i] << (i % 8));
    }
    wipe(bits);
    return m;
}

void require_rank(const KyberParams& params, size_t actual, const char* what) {
    if (actual != params.k) {
        throw InvalidParameterError(std::string(what) + " has rank " + std::to_string(actual) +
                                    ", " + params.name + " expects " + std::to_string(params.k));
    }
}

// Deterministic public-key encryption of a 32-byte message
std::vector<uint8_t> encrypt(const Context& ctx, const KyberParams& params, const PublicKey& pk,
                             const Seed& m, const Seed& coins) {
    const auto& ring = kyber_ring();
    const auto& be = ctx.backend();
    const size_t k = params.k;

    ring::PolyMatrix a = be.sample(ring, pk.rho, k, k);

    PolyVec r;
    PolyVec e1;
    for (size_t i = 0; i < k; i++) {
        r.push_back(sampling::sample_cbd(ring, coins, static_cast<uint8_t>(i), params.eta1));
    }
    for (size_t i = 0; i < k; i++) {
        e1.push_back(sampling::sample_cbd(ring, coins, static_cast<uint8_t>(k + i), params.eta2));
    }
    Poly e2 = sampling::sample_cbd(ring, coins, static_cast<uint8_t>(2 * k), params.eta2);

    be.ntt_transform(ring, r);

    PolyVec u = be.lattice_multiply(ring, a, r, true);
    be.inverse_ntt_transform(ring, u);
    u = ring.add(u, e1);

    PolyVec tr{be.inner_product(ring, pk.t, r)};
    be.inverse_ntt_transform(ring, tr);
    Poly mp = message_to_poly(m);
    Poly v = ring.add(ring.add(tr[0], e2), mp);

    std::vector<uint8_t> c;
    c.reserve(params.ciphertext_bytes());
    for (const auto& p : u) {
        ring::pack_bits(ring.compress(p, params.du), params.du, c);
    }
    ring::pack_bits(ring.compress(v, params.dv), params.dv, c);

    wipe(r);
    wipe(e1);
    wipe(e2);
    wipe(tr);
    wipe(mp);
    wipe(v);
    wipe(u);
    return c;
}

Seed decrypt(const Context& ctx, const KyberParams& params, const SecretKey& sk,
             const std::vector<uint8_t>& c) {
    const auto& ring = kyber_ring();
    const auto& be = ctx.backend();
    const size_t k = params.k;

    PolyVec u = ring::unpack_bits(c.data(), k, params.du, 1u << params.du);
    for (auto& p : u) {
        p = ring.decompress(p, params.du);
    }
    Poly v = ring.decompress(
        ring::unpack_bits(c.data() + k * ring::packed_bytes(params.du), params.dv, 1u << params.dv),
        params.dv);

    be.ntt_transform(ring, u);
    PolyVec su{be.inner_product(ring, sk.s, u)};
    be.inverse_ntt_transform(ring, su);

    Poly w = ring.sub(v, su[0]);
    Seed m = poly_to_message(w);

    wipe(su);
    wipe(w);
    return m;
}

} // anonymous namespace

// ============================================================================
// Encodings
// ============================================================================

std::vector<uint8_t> PublicKey::encode() const {
    const auto& params = KyberParams::get(level);
    require_rank(params, t.size(), "public key");
    std::vector<uint8_t> out;
    out.reserve(params.public_key_bytes());
    ring::pack_bits(t, COEFF_BITS, out);
    append(out, rho.data(), rho.size());
    return out;
}

PublicKey PublicKey::decode(KyberLevel level, const std::vector<uint8_t>& bytes) {
    const auto& params = KyberParams::get(level);
    if (bytes.size() != params.public_key_bytes()) {
        throw MalformedInputError(std::string(params.name) + " public key",
                                  params.public_key_bytes(), bytes.size());
    }
    PublicKey pk;
    pk.level = level;
    pk.t = ring::unpack_bits(bytes.data(), params.k, COEFF_BITS, kyber_ring().q(),
                             ring::Domain::Transform);
    std::memcpy(pk.rho.data(), bytes.data() + params.polyvec_bytes(), pk.rho.size());
    return pk;
}

SecretKey::~SecretKey() {
    wipe(s);
    side_channel::secure_wipe(z);
}

std::vector<uint8_t> SecretKey::encode() const {
    const auto& params = KyberParams::get(level);
    require_rank(params, s.size(), "secret key");
    if (!public_key) {
        throw InvalidParameterError("secret key has no public key attached");
    }
    std::vector<uint8_t> out;
    out.reserve(params.secret_key_bytes());
    ring::pack_bits(s, COEFF_BITS, out);
    std::vector<uint8_t> pk = public_key->encode();
    append(out, pk.data(), pk.size());
    append(out, public_key_hash.data(), public_key_hash.size());
    append(out, z.data(), z.size());
    return out;
}

SecretKey SecretKey::decode(KyberLevel level, const std::vector<uint8_t>& bytes) {
    const auto& params = KyberParams::get(level);
    if (bytes.size() != params.secret_key_bytes()) {
        throw MalformedInputError(std::string(params.name) + " secret key",
                                  params.secret_key_bytes(), bytes.size());
    }
    const uint8_t* p = bytes.data();

    SecretKey sk;
    sk.level = level;
    sk.s = ring::unpack_bits(p, params.k, COEFF_BITS, kyber_ring().q(), ring::Domain::Transform);
    p += params.polyvec_bytes();

    std::vector<uint8_t> pk_bytes(p, p + params.public_key_bytes());
    p += params.public_key_bytes();
    sk.public_key = std::make_shared<const PublicKey>(PublicKey::decode(level, pk_bytes));

    std::memcpy(sk.public_key_hash.data(), p, sk.public_key_hash.size());
    p += sk.public_key_hash.size();
    Digest recomputed = sampling::hash({ByteView(pk_bytes)});
    if (!side_channel::constant_time_compare(recomputed.data(), sk.public_key_hash.data(),
                                             recomputed.size())) {
        throw MalformedInputError("embedded public-key hash does not match " +
                                  std::string(params.name) + " public key");
    }

    std::memcpy(sk.z.data(), p, sk.z.size());
    return sk;
}

// ============================================================================
// KEM operations
// ============================================================================

KeyPair keygen_from_seeds(const Context& ctx, KyberLevel level, const Seed& rho,
                          const Seed& sigma, const Seed& z) {
    const auto& params = KyberParams::get(level);
    const auto& ring = kyber_ring();
    const auto& be = ctx.backend();
    const size_t k = params.k;

    ring::PolyMatrix a = be.sample(ring, rho, k, k);

    PolyVec s;
    PolyVec e;
    for (size_t i = 0; i < k; i++) {
        s.push_back(sampling::sample_cbd(ring, sigma, static_cast<uint8_t>(i), params.eta1));
    }
    for (size_t i = 0; i < k; i++) {
        e.push_back(sampling::sample_cbd(ring, sigma, static_cast<uint8_t>(k + i), params.eta1));
    }
    be.ntt_transform(ring, s);
    be.ntt_transform(ring, e);

    auto pk = std::make_shared<PublicKey>();
    pk->level = level;
    pk->rho = rho;
    pk->t = ring.add(be.lattice_multiply(ring, a, s, false), e);
    wipe(e);

    SecretKey sk;
    sk.level = level;
    sk.s = std::move(s);
    sk.z = z;
    sk.public_key = pk;
    std::vector<uint8_t> pk_bytes = pk->encode();
    sk.public_key_hash = sampling::hash({ByteView(pk_bytes)});

    ctx.log(std::string(params.name) + " keypair generated (pk=" +
            std::to_string(params.public_key_bytes()) + "B, sk=" +
            std::to_string(params.secret_key_bytes()) + "B)");

    proof::CorrectnessClaim claim;
    claim.subject = "kyber.keygen";
    claim.statement = "t = A*s + e with s, e drawn from CBD(eta1)";
    claim.parameter_set = params.name;
    claim.fingerprint = sk.public_key_hash;
    ctx.export_claim(claim);

    return KeyPair{pk, std::move(sk)};
}

KeyPair keygen(const Context& ctx, KyberLevel level) {
    // Validate before drawing randomness
    KyberParams::get(level);

    Seed rho;
    Seed sigma;
    Seed z;
    side_channel::secure_random_fill(rho.data(), rho.size());
    side_channel::secure_random_fill(sigma.data(), sigma.size());
    side_channel::secure_random_fill(z.data(), z.size());

    KeyPair kp = keygen_from_seeds(ctx, level, rho, sigma, z);

    side_channel::secure_wipe(sigma);
    side_channel::secure_wipe(z);
    return kp;
}

Encapsulation encapsulate_with_message(const Context& ctx, const PublicKey& pk, const Seed& m) {
    const auto& params = KyberParams::get(pk.level);
    require_rank(params, pk.t.size(), "public key");

    std::vector<uint8_t> pk_bytes = pk.encode();
    Digest pk_hash = sampling::hash({ByteView(pk_bytes)});
    Seed coins = sampling::hash({ByteView(m), ByteView(pk_hash)});

    Encapsulation result;
    result.ciphertext = encrypt(ctx, params, pk, m, coins);
    Digest c_hash = sampling::hash({ByteView(result.ciphertext)});
    result.shared_secret = sampling::hash({ByteView(m), ByteView(c_hash)});

    side_channel::secure_wipe(coins);

    ctx.log(std::string(params.name) + " encapsulation: ct=" +
            std::to_string(result.ciphertext.size()) + "B, ss=32B");
    return result;
}

Encapsulation encapsulate(const Context& ctx, const PublicKey& pk) {
    Seed m;
    side_channel::secure_random_fill(m.data(), m.size());
    Encapsulation result = encapsulate_with_message(ctx, pk, m);
    side_channel::secure_wipe(m);
    return result;
}

SharedSecret decapsulate(const Context& ctx, const SecretKey& sk,
                         const std::vector<uint8_t>& ciphertext) {
    const auto& params = KyberParams::get(sk.level);
    require_rank(params, sk.s.size(), "secret key");
    if (!sk.public_key) {
        throw InvalidParameterError("secret key has no public key attached");
    }
    if (ciphertext.size() != params.ciphertext_bytes()) {
        throw MalformedInputError(std::string(params.name) + " ciphertext",
                                  params.ciphertext_bytes(), ciphertext.size());
    }

    Seed m = decrypt(ctx, params, sk, ciphertext);
    Seed coins = sampling::hash({ByteView(m), ByteView(sk.public_key_hash)});
    std::vector<uint8_t> reencrypted = encrypt(ctx, params, *sk.public_key, m, coins);

    Digest c_hash = sampling::hash({ByteView(ciphertext)});
    Digest candidate = sampling::hash({ByteView(m), ByteView(c_hash)});
    std::vector<uint8_t> reject = sampling::shake256({ByteView(sk.z), ByteView(ciphertext)},
                                                     SHARED_SECRET_BYTES);

    bool match = side_channel::constant_time_compare(ciphertext.data(), reencrypted.data(),
                                                     ciphertext.size());
    SharedSecret secret;
    std::memcpy(secret.data(), reject.data(), secret.size());
    side_channel::constant_time_conditional_copy(secret.data(), candidate.data(),
                                                 secret.size(), match);

    side_channel::secure_wipe(m);
    side_channel::secure_wipe(coins);
    side_channel::secure_wipe(candidate);
    side_channel::secure_wipe(reject);

    ctx.log(std::string(params.name) + " decapsulation: ss=32B");
    return secret;
}

} // namespace kyber
} // namespace pqc
} // namespace pqlattice
