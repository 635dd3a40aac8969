#include "ring.hpp"
#include "../core/errors.hpp"

#include <utility>

namespace pqlattice {
namespace ring {

namespace {

// Construction-time only; operands are public constants.
uint64_t pow_mod(uint64_t base, uint64_t exp, uint64_t mod) {
    uint64_t result = 1;
    base %= mod;
    while (exp > 0) {
        if (exp & 1) {
            result = (result * base) % mod;
        }
        base = (base * base) % mod;
        exp >>= 1;
    }
    return result;
}

size_t bit_reverse(size_t value, unsigned bits) {
    size_t r = 0;
    for (unsigned i = 0; i < bits; i++) {
        r = (r << 1) | ((value >> i) & 1);
    }
    return r;
}

unsigned bit_length(uint32_t value) {
    unsigned bits = 0;
    while (value != 0) {
        bits++;
        value >>= 1;
    }
    return bits;
}

void require_same_length(size_t a, size_t b, const char* operation) {
    if (a != b) {
        throw InvalidParameterError(std::string("length mismatch in ") + operation + ": " +
                                    std::to_string(a) + " vs " + std::to_string(b));
    }
}

} // anonymous namespace

void require_same_domain(const Poly& a, const Poly& b, const char* operation) {
    if (a.domain != b.domain) {
        throw DomainMismatchError(std::string(operation) + " (" + domain_name(a.domain) +
                                  " vs " + domain_name(b.domain) + ")");
    }
}

void require_domain(const Poly& p, Domain d, const char* operation) {
    if (p.domain != d) {
        throw DomainMismatchError(std::string(operation) + " (expected " + domain_name(d) +
                                  ", got " + domain_name(p.domain) + ")");
    }
}

Ring::Ring(uint32_t q, uint32_t root, unsigned layers, std::string name)
    : q_(q), layers_(layers), name_(std::move(name)) {
    if (q < 3 || (q & 1) == 0 || q >= (1u << 23)) {
        throw InvalidParameterError("modulus " + std::to_string(q) +
                                    " must be odd and below 2^23");
    }
    if (layers < 7 || layers > 8) {
        throw InvalidParameterError("NTT layer count " + std::to_string(layers) +
                                    " not supported for degree 256");
    }

    // root must have multiplicative order exactly 2^(layers+1)
    uint64_t half_order = 1ULL << layers;
    if (pow_mod(root, half_order, q) != q - 1) {
        throw InvalidParameterError(std::to_string(root) + " is not a primitive " +
                                    std::to_string(half_order * 2) + "-th root of unity mod " +
                                    std::to_string(q));
    }

    // Newton iteration for q^-1 mod 2^32; q*q == 1 mod 8 seeds 3 correct bits
    uint32_t inv = q;
    for (int i = 0; i < 5; i++) {
        inv *= 2u - q * inv;
    }
    qinv_neg_ = 0u - inv;

    uint64_t r = (1ULL << 32) % q;
    r2_ = static_cast<uint32_t>((r * r) % q);

    uint64_t ninv = pow_mod(half_order, q - 2, q);
    ninv_mont_ = static_cast<uint32_t>((ninv << 32) % q);

    recip_ = ((1ULL << 48) + q - 1) / q;

    // Largest d with q^2 * 2^d <= 2^48 keeps the reciprocal division exact
    max_compress_bits_ = 0;
    unsigned qbits = bit_length(q);
    uint64_t q2 = static_cast<uint64_t>(q) * q;
    while (max_compress_bits_ + 1 < qbits &&
           (q2 << (max_compress_bits_ + 1)) <= (1ULL << 48)) {
        max_compress_bits_++;
    }

    zetas_.resize(static_cast<size_t>(half_order));
    for (size_t i = 0; i < zetas_.size(); i++) {
        uint64_t z = pow_mod(root, bit_reverse(i, layers), q);
        zetas_[i] = static_cast<uint32_t>((z << 32) % q);
    }
}

const Ring& Ring::kyber() {
    static const Ring ring(3329, 17, 7, "kyber-q3329");
    return ring;
}

const Ring& Ring::dilithium() {
    static const Ring ring(8380417, 1753, 8, "dilithium-q8380417");
    return ring;
}

uint32_t Ring::montgomery_reduce(uint64_t a) const {
    uint32_t m = static_cast<uint32_t>(a) * qinv_neg_;
    uint64_t t = (a + static_cast<uint64_t>(m) * q_) >> 32;
    return csub(static_cast<uint32_t>(t));
}

uint32_t Ring::reduce(int64_t x) const {
    uint64_t shifted = static_cast<uint64_t>(x + (static_cast<int64_t>(q_) << 31));
    return mont_mul(montgomery_reduce(shifted), r2_);
}

uint32_t Ring::compress(uint32_t x, unsigned d) const {
    if (d == 0 || d > max_compress_bits_) {
        throw InvalidParameterError("compression width " + std::to_string(d) +
                                    " out of range for " + name_);
    }
    uint64_t num = (static_cast<uint64_t>(x) << d) + (q_ >> 1);
    return static_cast<uint32_t>((num * recip_) >> 48) & ((1u << d) - 1);
}

uint32_t Ring::decompress(uint32_t y, unsigned d) const {
    if (d == 0 || d > max_compress_bits_) {
        throw InvalidParameterError("compression width " + std::to_string(d) +
                                    " out of range for " + name_);
    }
    uint64_t num = static_cast<uint64_t>(y & ((1u << d) - 1)) * q_ + (1u << (d - 1));
    return static_cast<uint32_t>(num >> d);
}

Poly Ring::add(const Poly& a, const Poly& b) const {
    require_same_domain(a, b, "add");
    Poly r(a.domain);
    for (size_t i = 0; i < N; i++) {
        r[i] = add(a[i], b[i]);
    }
    return r;
}

Poly Ring::sub(const Poly& a, const Poly& b) const {
    require_same_domain(a, b, "sub");
    Poly r(a.domain);
    for (size_t i = 0; i < N; i++) {
        r[i] = sub(a[i], b[i]);
    }
    return r;
}

Poly Ring::neg(const Poly& a) const {
    Poly r(a.domain);
    for (size_t i = 0; i < N; i++) {
        r[i] = neg(a[i]);
    }
    return r;
}

Poly Ring::scale(const Poly& a, uint32_t c) const {
    uint32_t cc = reduce(static_cast<int64_t>(c));
    Poly r(a.domain);
    for (size_t i = 0; i < N; i++) {
        r[i] = mul(a[i], cc);
    }
    return r;
}

void Ring::ntt(Poly& p) const {
    require_domain(p, Domain::Normal, "ntt");
    auto& a = p.coeffs;
    size_t k = 1;
    for (size_t len = N / 2; len >= leaf_size(); len >>= 1) {
        for (size_t start = 0; start < N; start += 2 * len) {
            uint32_t zeta = zetas_[k++];
            for (size_t j = start; j < start + len; j++) {
                uint32_t t = mont_mul(a[j + len], zeta);
                a[j + len] = sub(a[j], t);
                a[j] = add(a[j], t);
            }
        }
    }
    p.domain = Domain::Transform;
}

void Ring::inverse_ntt(Poly& p) const {
    require_domain(p, Domain::Transform, "inverse_ntt");
    auto& a = p.coeffs;
    size_t k = zetas_.size();
    for (size_t len = leaf_size(); len <= N / 2; len <<= 1) {
        for (size_t start = 0; start < N; start += 2 * len) {
            uint32_t zeta = q_ - zetas_[--k];
            for (size_t j = start; j < start + len; j++) {
                uint32_t t = a[j];
                a[j] = add(t, a[j + len]);
                a[j + len] = mont_mul(sub(t, a[j + len]), zeta);
            }
        }
    }
    for (auto& c : a) {
        c = mont_mul(c, ninv_mont_);
    }
    p.domain = Domain::Normal;
}

Poly Ring::pointwise(const Poly& a, const Poly& b) const {
    require_domain(a, Domain::Transform, "pointwise");
    require_domain(b, Domain::Transform, "pointwise");
    Poly r(Domain::Transform);
    if (leaf_size() == 1) {
        for (size_t i = 0; i < N; i++) {
            r[i] = mul(a[i], b[i]);
        }
        return r;
    }

    // Pair p lives modulo x^2 - gamma_p, gamma_p = +-zeta[2^(layers-1) + p/2]
    size_t half = zetas_.size() / 2;
    for (size_t p = 0; p < N / 2; p++) {
        uint32_t gamma = zetas_[half + p / 2];
        if (p & 1) {
            gamma = q_ - gamma;
        }
        uint32_t a0 = a[2 * p], a1 = a[2 * p + 1];
        uint32_t b0 = b[2 * p], b1 = b[2 * p + 1];
        r[2 * p] = add(mul(a0, b0), mont_mul(mul(a1, b1), gamma));
        r[2 * p + 1] = add(mul(a0, b1), mul(a1, b0));
    }
    return r;
}

Poly Ring::multiply(const Poly& a, const Poly& b) const {
    Poly ta = a;
    Poly tb = b;
    ntt(ta);
    ntt(tb);
    Poly r = pointwise(ta, tb);
    inverse_ntt(r);
    return r;
}

Poly Ring::multiply_schoolbook(const Poly& a, const Poly& b) const {
    require_domain(a, Domain::Normal, "multiply_schoolbook");
    require_domain(b, Domain::Normal, "multiply_schoolbook");
    Poly r;
    for (size_t i = 0; i < N; i++) {
        for (size_t j = 0; j < N; j++) {
            uint32_t prod = mul(a[i], b[j]);
            size_t k = i + j;
            if (k < N) {
                r[k] = add(r[k], prod);
            } else {
                // x^256 = -1
                r[k - N] = sub(r[k - N], prod);
            }
        }
    }
    return r;
}

Poly Ring::compress(const Poly& a, unsigned d) const {
    require_domain(a, Domain::Normal, "compress");
    Poly r;
    for (size_t i = 0; i < N; i++) {
        r[i] = compress(a[i], d);
    }
    return r;
}

Poly Ring::decompress(const Poly& a, unsigned d) const {
    require_domain(a, Domain::Normal, "decompress");
    Poly r;
    for (size_t i = 0; i < N; i++) {
        r[i] = decompress(a[i], d);
    }
    return r;
}

uint32_t Ring::infinity_norm(const Poly& a) const {
    uint32_t m = 0;
    for (size_t i = 0; i < N; i++) {
        int32_t v = centered(a[i]);
        int32_t sign = v >> 31;
        uint32_t abs = static_cast<uint32_t>((v ^ sign) - sign);
        m = side_channel::ct_select_u32(m, abs, (m - abs) >> 31);
    }
    return m;
}

Poly Ring::from_signed(const int32_t* values, Domain d) const {
    Poly r(d);
    for (size_t i = 0; i < N; i++) {
        r[i] = reduce(values[i]);
    }
    return r;
}

PolyVec Ring::add(const PolyVec& a, const PolyVec& b) const {
    require_same_length(a.size(), b.size(), "vector add");
    PolyVec r;
    r.reserve(a.size());
    for (size_t i = 0; i < a.size(); i++) {
        r.push_back(add(a[i], b[i]));
    }
    return r;
}

PolyVec Ring::sub(const PolyVec& a, const PolyVec& b) const {
    require_same_length(a.size(), b.size(), "vector sub");
    PolyVec r;
    r.reserve(a.size());
    for (size_t i = 0; i < a.size(); i++) {
        r.push_back(sub(a[i], b[i]));
    }
    return r;
}

void Ring::ntt(PolyVec& v) const {
    for (auto& p : v) {
        ntt(p);
    }
}

void Ring::inverse_ntt(PolyVec& v) const {
    for (auto& p : v) {
        inverse_ntt(p);
    }
}

uint32_t Ring::infinity_norm(const PolyVec& v) const {
    uint32_t m = 0;
    for (const auto& p : v) {
        uint32_t n = infinity_norm(p);
        m = side_channel::ct_select_u32(m, n, (m - n) >> 31);
    }
    return m;
}

Poly Ring::inner_product(const PolyVec& a, const PolyVec& b) const {
    require_same_length(a.size(), b.size(), "inner product");
    Poly r(Domain::Transform);
    for (size_t i = 0; i < a.size(); i++) {
        r = add(r, pointwise(a[i], b[i]));
    }
    return r;
}

size_t Ring::output_rows(const PolyMatrix& m, const PolyVec& v, bool transpose) const {
    if (m.empty() || m[0].empty()) {
        throw InvalidParameterError("empty matrix");
    }
    size_t cols = m[0].size();
    for (const auto& row : m) {
        require_same_length(row.size(), cols, "matrix row");
    }
    if (transpose) {
        require_same_length(m.size(), v.size(), "transposed matrix-vector product");
        return cols;
    }
    require_same_length(cols, v.size(), "matrix-vector product");
    return m.size();
}

Poly Ring::row_product(const PolyMatrix& m, const PolyVec& v, size_t row, bool transpose) const {
    if (!transpose) {
        return inner_product(m[row], v);
    }
    Poly r(Domain::Transform);
    for (size_t j = 0; j < m.size(); j++) {
        r = add(r, pointwise(m[j][row], v[j]));
    }
    return r;
}

PolyVec Ring::matrix_vector(const PolyMatrix& m, const PolyVec& v, bool transpose) const {
    size_t rows = output_rows(m, v, transpose);
    PolyVec out;
    out.reserve(rows);
    for (size_t i = 0; i < rows; i++) {
        out.push_back(row_product(m, v, i, transpose));
    }
    return out;
}

} // namespace ring
} // namespace pqlattice
