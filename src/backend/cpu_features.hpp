#ifndef PQLATTICE_BACKEND_CPU_FEATURES_HPP
#define PQLATTICE_BACKEND_CPU_FEATURES_HPP

#include <string>

namespace pqlattice {
namespace backend {

/**
 * @brief Widest SIMD extension reported by the processor
 */
enum class SimdLevel {
    None,
    Sse2,
    Avx,
    Avx2,
    Avx512,
    Neon
};

const char* simd_level_name(SimdLevel level);

/**
 * @brief Query CPUID (x86_64) or the auxiliary vector (aarch64 Linux)
 */
SimdLevel detect_simd_level() noexcept;

} // namespace backend
} // namespace pqlattice

#endif // PQLATTICE_BACKEND_CPU_FEATURES_HPP
