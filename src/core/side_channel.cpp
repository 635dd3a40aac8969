#include "side_channel.hpp"
#include <sodium.h>
#include <mutex>
#include <stdexcept>

namespace pqlattice {
namespace side_channel {

void ensure_sodium() {
    static std::once_flag once;
    static bool ok = false;
    std::call_once(once, [] { ok = (sodium_init() >= 0); });
    if (!ok) {
        throw std::runtime_error("libsodium initialization failed");
    }
}

bool constant_time_compare(const uint8_t* a, const uint8_t* b, size_t len) {
    if (len == 0) {
        return true;
    }
    // Use libsodium's hardened memcmp
    return sodium_memcmp(a, b, len) == 0;
}

void secure_zero_memory(void* ptr, size_t len) {
    // Use sodium_memzero which is resistant to compiler optimizations
    sodium_memzero(ptr, len);
}

void secure_random_fill(uint8_t* buffer, size_t len) {
    ensure_sodium();
    randombytes_buf(buffer, len);
}

void constant_time_conditional_copy(uint8_t* dst, const uint8_t* src, size_t len, bool condition) {
    uint8_t mask = static_cast<uint8_t>(0) - static_cast<uint8_t>(condition);
    for (size_t i = 0; i < len; i++) {
        dst[i] = static_cast<uint8_t>((dst[i] & ~mask) | (src[i] & mask));
    }
    memory_barrier();
}

} // namespace side_channel
} // namespace pqlattice
