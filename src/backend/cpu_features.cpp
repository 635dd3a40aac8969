#include "cpu_features.hpp"

#include <cstdint>

#if defined(__x86_64__) && (defined(__GNUC__) || defined(__clang__))
    #include <cpuid.h>
#endif

#if defined(__aarch64__) && defined(__linux__)
    #include <sys/auxv.h>
    #include <asm/hwcap.h>
#endif

namespace pqlattice {
namespace backend {

const char* simd_level_name(SimdLevel level) {
    switch (level) {
        case SimdLevel::None: return "none";
        case SimdLevel::Sse2: return "sse2";
        case SimdLevel::Avx: return "avx";
        case SimdLevel::Avx2: return "avx2";
        case SimdLevel::Avx512: return "avx512";
        case SimdLevel::Neon: return "neon";
        default: return "unknown";
    }
}

SimdLevel detect_simd_level() noexcept {
#if defined(__x86_64__) && (defined(__GNUC__) || defined(__clang__))
    uint32_t eax = 0, ebx = 0, ecx = 0, edx = 0;
    if (__get_cpuid_max(0, nullptr) < 1) {
        return SimdLevel::None;
    }

    __cpuid_count(1, 0, eax, ebx, ecx, edx);
    bool sse2 = (edx & (1u << 26)) != 0;   // EDX bit 26
    bool avx = (ecx & (1u << 28)) != 0;    // ECX bit 28

    bool avx2 = false;
    bool avx512f = false;
    if (__get_cpuid_max(0, nullptr) >= 7) {
        __cpuid_count(7, 0, eax, ebx, ecx, edx);
        avx2 = (ebx & (1u << 5)) != 0;      // EBX bit 5
        avx512f = (ebx & (1u << 16)) != 0;  // EBX bit 16
    }

    if (avx512f) return SimdLevel::Avx512;
    if (avx2) return SimdLevel::Avx2;
    if (avx) return SimdLevel::Avx;
    if (sse2) return SimdLevel::Sse2;
    return SimdLevel::None;

#elif defined(__aarch64__) && defined(__linux__)
    unsigned long hwcaps = getauxval(AT_HWCAP);
    return (hwcaps & HWCAP_ASIMD) ? SimdLevel::Neon : SimdLevel::None;

#elif defined(__aarch64__) && defined(__APPLE__)
    return SimdLevel::Neon;

#else
    return SimdLevel::None;
#endif
}

} // namespace backend
} // namespace pqlattice
