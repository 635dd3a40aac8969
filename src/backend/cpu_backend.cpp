#include "cpu_backend.hpp"
#include "../core/errors.hpp"
#include "../sampling/sampler.hpp"

#include <algorithm>
#include <future>
#include <vector>

namespace pqlattice {
namespace backend {

CpuBackend::CpuBackend(unsigned threads)
    : threads_(threads), simd_(detect_simd_level()) {
    if (threads < 1 || threads > 256) {
        throw BackendInitializationError("cpu", "thread count " + std::to_string(threads) +
                                                " outside 1..256");
    }
}

std::string CpuBackend::name() const {
    return std::string("cpu (simd=") + simd_level_name(simd_) +
           ", threads=" + std::to_string(threads_) + ")";
}

void CpuBackend::ntt_transform(const ring::Ring& ring, ring::PolyVec& v) const {
    ring.ntt(v);
}

void CpuBackend::inverse_ntt_transform(const ring::Ring& ring, ring::PolyVec& v) const {
    ring.inverse_ntt(v);
}

ring::PolyVec CpuBackend::lattice_multiply(const ring::Ring& ring, const ring::PolyMatrix& m,
                                           const ring::PolyVec& v, bool transpose) const {
    size_t rows = ring.output_rows(m, v, transpose);
    size_t workers = std::min<size_t>(threads_, rows);
    if (workers <= 1) {
        return ring.matrix_vector(m, v, transpose);
    }

    ring::PolyVec out(rows);
    std::vector<std::future<void>> tasks;
    tasks.reserve(workers);
    for (size_t w = 0; w < workers; w++) {
        tasks.push_back(std::async(std::launch::async, [&, w] {
            for (size_t row = w; row < rows; row += workers) {
                out[row] = ring.row_product(m, v, row, transpose);
            }
        }));
    }
    // get() rethrows anything a worker raised
    for (auto& task : tasks) {
        task.get();
    }
    return out;
}

ring::Poly CpuBackend::polynomial_multiply(const ring::Ring& ring, const ring::Poly& a,
                                           const ring::Poly& b) const {
    return ring.pointwise(a, b);
}

ring::PolyMatrix CpuBackend::sample(const ring::Ring& ring, const sampling::Seed& seed,
                                    size_t rows, size_t cols) const {
    return sampling::expand_matrix(ring, seed, rows, cols);
}

} // namespace backend
} // namespace pqlattice
