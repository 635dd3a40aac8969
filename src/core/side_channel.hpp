#ifndef PQLATTICE_CORE_SIDE_CHANNEL_HPP
#define PQLATTICE_CORE_SIDE_CHANNEL_HPP

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <vector>

namespace pqlattice {
namespace side_channel {

/**
 * @brief Initialize libsodium once for the process
 * @throws std::runtime_error if libsodium cannot be initialized
 * @note Safe to call repeatedly and from several threads
 */
void ensure_sodium();

/**
 * @brief Constant-time comparison to prevent timing attacks
 * @param a First buffer
 * @param b Second buffer
 * @param len Length of buffers
 * @return true if buffers are equal, false otherwise
 * @note Uses libsodium's hardened memcmp (sodium_memcmp)
 */
bool constant_time_compare(const uint8_t* a, const uint8_t* b, size_t len);

/**
 * @brief Constant-time memory zeroing
 * @param ptr Pointer to memory to zero
 * @param len Length of memory to zero
 * @note Uses sodium_memzero which is resistant to compiler optimizations
 */
void secure_zero_memory(void* ptr, size_t len);

/**
 * @brief Fill a buffer from the operating system CSPRNG (randombytes_buf)
 */
void secure_random_fill(uint8_t* buffer, size_t len);

/**
 * @brief Generate constant-time mask (branchless)
 * @param condition Boolean condition
 * @return 0xFFFFFFFF if true, 0x00000000 if false
 */
inline uint32_t ct_mask(bool condition) {
    return static_cast<uint32_t>(0) - static_cast<uint32_t>(condition);
}

/**
 * @brief Constant-time selection between two values (branchless)
 * @param a First value
 * @param b Second value
 * @param pick_b Select b if true, a if false
 * @return Selected value without branching
 */
inline uint32_t ct_select_u32(uint32_t a, uint32_t b, bool pick_b) {
    uint32_t m = ct_mask(pick_b);
    return (a & ~m) | (b & m);
}

/**
 * @brief Memory barrier to prevent reordering attacks
 */
inline void memory_barrier() {
    std::atomic_thread_fence(std::memory_order_seq_cst);
}

/**
 * @brief Constant-time conditional copy
 * @param dst Destination buffer
 * @param src Source buffer
 * @param len Length of buffers
 * @param condition Copy if true, no-op if false
 */
void constant_time_conditional_copy(uint8_t* dst, const uint8_t* src, size_t len, bool condition);

/**
 * @brief Wipe a vector of trivially copyable values in place
 */
template<typename T>
inline void secure_wipe(std::vector<T>& values) {
    static_assert(std::is_trivially_copyable_v<T>, "T must be trivially copyable");
    if (!values.empty()) {
        secure_zero_memory(values.data(), values.size() * sizeof(T));
    }
}

template<typename T, size_t N>
inline void secure_wipe(std::array<T, N>& values) {
    static_assert(std::is_trivially_copyable_v<T>, "T must be trivially copyable");
    secure_zero_memory(values.data(), sizeof(T) * N);
}

} // namespace side_channel
} // namespace pqlattice

#endif // PQLATTICE_CORE_SIDE_CHANNEL_HPP
