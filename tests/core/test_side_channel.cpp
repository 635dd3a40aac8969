/**
 * @file test_side_channel.cpp
 * @brief Constant-time helpers and secret wiping
 */

#include <catch2/catch.hpp>
#include "../../src/core/side_channel.hpp"
#include <sodium.h>
#include <array>
#include <vector>

using namespace pqlattice::side_channel;

TEST_CASE("Constant-Time Comparison", "[side-channel][ct]") {
    ensure_sodium();

    SECTION("Equal Buffers") {
        std::array<uint8_t, 32> a, b;
        randombytes_buf(a.data(), a.size());
        std::copy(a.begin(), a.end(), b.begin());

        REQUIRE(constant_time_compare(a.data(), b.data(), 32));
    }

    SECTION("Single Bit Difference") {
        std::array<uint8_t, 32> a, b;
        randombytes_buf(a.data(), a.size());
        std::copy(a.begin(), a.end(), b.begin());

        b[16] ^= 0x01;

        REQUIRE_FALSE(constant_time_compare(a.data(), b.data(), 32));
    }

    SECTION("Zero Length Comparison") {
        uint8_t a = 0, b = 0;
        REQUIRE(constant_time_compare(&a, &b, 0));
    }

    SECTION("Large Buffer Comparison") {
        std::vector<uint8_t> a(10240), b(10240);
        randombytes_buf(a.data(), a.size());
        std::copy(a.begin(), a.end(), b.begin());

        REQUIRE(constant_time_compare(a.data(), b.data(), a.size()));

        b[5000] ^= 0xFF;
        REQUIRE_FALSE(constant_time_compare(a.data(), b.data(), a.size()));
    }
}

TEST_CASE("Secure Memory Zeroing", "[side-channel][memory]") {
    SECTION("Zero Memory") {
        std::vector<uint8_t> buffer(1024, 0xFF);

        secure_zero_memory(buffer.data(), buffer.size());

        for (auto b : buffer) {
            REQUIRE(b == 0);
        }
    }

    SECTION("Zero Alignment") {
        for (size_t offset = 0; offset < 16; ++offset) {
            std::vector<uint8_t> buffer(1024 + offset, 0x55);

            secure_zero_memory(buffer.data() + offset, 1024);

            for (size_t i = 0; i < offset; ++i) {
                REQUIRE(buffer[i] == 0x55);
            }
            for (size_t i = offset; i < offset + 1024; ++i) {
                REQUIRE(buffer[i] == 0);
            }
        }
    }

    SECTION("Wipe Coefficient Vector") {
        std::vector<uint32_t> coeffs(256, 3328);
        secure_wipe(coeffs);

        REQUIRE(coeffs.size() == 256);
        for (auto c : coeffs) {
            REQUIRE(c == 0);
        }
    }

    SECTION("Wipe Seed Array") {
        std::array<uint8_t, 32> seed;
        seed.fill(0xA5);
        secure_wipe(seed);

        for (auto b : seed) {
            REQUIRE(b == 0);
        }
    }
}

TEST_CASE("Constant-Time Conditional Copy", "[side-channel][ct-copy]") {
    SECTION("Copy When True") {
        std::array<uint8_t, 32> dst, src;
        dst.fill(0x00);
        src.fill(0xFF);

        constant_time_conditional_copy(dst.data(), src.data(), 32, true);

        for (auto b : dst) {
            REQUIRE(b == 0xFF);
        }
    }

    SECTION("No Copy When False") {
        std::array<uint8_t, 32> dst, src;
        dst.fill(0x00);
        src.fill(0xFF);

        constant_time_conditional_copy(dst.data(), src.data(), 32, false);

        for (auto b : dst) {
            REQUIRE(b == 0x00);
        }
    }

    SECTION("Partial Copy") {
        std::array<uint8_t, 64> dst, src;
        dst.fill(0xAA);
        src.fill(0x55);

        constant_time_conditional_copy(dst.data(), src.data(), 32, true);

        for (size_t i = 0; i < 32; ++i) {
            REQUIRE(dst[i] == 0x55);
        }
        for (size_t i = 32; i < 64; ++i) {
            REQUIRE(dst[i] == 0xAA);
        }
    }
}

TEST_CASE("Secure Random Fill", "[side-channel][random]") {
    SECTION("Multiple Fills Produce Different Data") {
        std::array<uint8_t, 32> buf1{}, buf2{};

        secure_random_fill(buf1.data(), buf1.size());
        secure_random_fill(buf2.data(), buf2.size());

        REQUIRE_FALSE(constant_time_compare(buf1.data(), buf2.data(), 32));
    }

    SECTION("Large Buffer Random Fill") {
        std::vector<uint8_t> buffer(10240);

        secure_random_fill(buffer.data(), buffer.size());

        std::array<int, 256> byte_counts{};
        for (auto b : buffer) {
            byte_counts[b]++;
        }

        int unique_bytes = 0;
        for (auto count : byte_counts) {
            if (count > 0) unique_bytes++;
        }

        REQUIRE(unique_bytes > 250);
    }
}

TEST_CASE("Constant-Time Mask Operations", "[side-channel][ct-ops]") {
    SECTION("CT Mask") {
        REQUIRE(ct_mask(true) == 0xFFFFFFFF);
        REQUIRE(ct_mask(false) == 0x00000000);
    }

    SECTION("CT Select") {
        uint32_t a = 0x12345678;
        uint32_t b = 0xABCDEF00;

        REQUIRE(ct_select_u32(a, b, true) == b);
        REQUIRE(ct_select_u32(a, b, false) == a);
    }
}
