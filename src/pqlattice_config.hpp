/**
 * @file pqlattice_config.hpp
 * @brief Compile-time defaults and runtime configuration for pqlattice
 *
 * Every default can be overridden at build time (-DPQLATTICE_...=value) and,
 * for the runtime Config, from the process environment.
 *
 * @version 1.0.0
 */

#pragma once

#include <cstdint>
#include <cstdlib>
#include <string>

#define PQLATTICE_VERSION_MAJOR 1
#define PQLATTICE_VERSION_MINOR 0
#define PQLATTICE_VERSION_PATCH 0
#define PQLATTICE_VERSION_STRING "1.0.0"

// ============================================================================
// FEATURE FLAGS
// ============================================================================

/**
 * @brief Allow accelerator backends to be selected
 *
 * When disabled, the dispatcher never probes registered accelerators and
 * always settles on the CPU reference backend.
 */
#ifndef PQLATTICE_ENABLE_ACCELERATORS
#define PQLATTICE_ENABLE_ACCELERATORS 1
#endif

/**
 * @brief Require accelerators to pass a known-answer equivalence probe
 *
 * Each candidate backend is run against the CPU reference on a fixed input
 * before it is accepted. A mismatch counts as an initialization failure.
 */
#ifndef PQLATTICE_VALIDATE_ACCELERATORS
#define PQLATTICE_VALIDATE_ACCELERATORS 1
#endif

// ============================================================================
// SECURITY LEVELS
// ============================================================================

// Kyber levels are named by their lattice dimension (k * 256)
#ifndef PQLATTICE_DEFAULT_KYBER_LEVEL
#define PQLATTICE_DEFAULT_KYBER_LEVEL 768
#endif

// Dilithium levels are named by their NIST category
#ifndef PQLATTICE_DEFAULT_DILITHIUM_LEVEL
#define PQLATTICE_DEFAULT_DILITHIUM_LEVEL 3
#endif

// ============================================================================
// PERFORMANCE TUNING
// ============================================================================

/**
 * @brief Worker threads used by the CPU backend for matrix products
 *
 * Rows of a matrix-vector product are independent; results never depend on
 * this value.
 */
#ifndef PQLATTICE_CPU_THREADS
#define PQLATTICE_CPU_THREADS 1
#endif

/**
 * @brief Upper bound on signing attempts
 *
 * The expected number of attempts is below 5 for every parameter set.
 * Hitting the bound indicates a parameter or sampling defect.
 */
#ifndef PQLATTICE_MAX_SIGN_ITERATIONS
#define PQLATTICE_MAX_SIGN_ITERATIONS 1000
#endif

// ============================================================================
// TESTING AND DEBUGGING
// ============================================================================

/**
 * @brief Log keygen / encaps / decaps / sign / verify events to stderr
 *
 * Only sizes and parameter names are logged, never key material.
 */
#ifndef PQLATTICE_VERBOSE_LOGGING
#define PQLATTICE_VERBOSE_LOGGING 0
#endif

// ============================================================================
// NAMESPACE
// ============================================================================

namespace pqlattice {

/**
 * @brief Runtime configuration
 *
 * A plain value: it is copied into each Context and never mutated after the
 * context has been built.
 */
struct Config {
    bool verbose_logging = PQLATTICE_VERBOSE_LOGGING;
    bool enable_accelerators = PQLATTICE_ENABLE_ACCELERATORS;
    bool validate_accelerators = PQLATTICE_VALIDATE_ACCELERATORS;
    unsigned cpu_threads = PQLATTICE_CPU_THREADS;
    uint32_t max_sign_iterations = PQLATTICE_MAX_SIGN_ITERATIONS;

    /**
     * @brief Compile-time defaults
     */
    static Config defaults() { return Config{}; }

    /**
     * @brief Defaults overridden by PQLATTICE_* environment variables
     *
     * Recognized: PQLATTICE_VERBOSE, PQLATTICE_CPU_THREADS,
     * PQLATTICE_MAX_SIGN_ITERATIONS, PQLATTICE_FORCE_CPU.
     * Unparsable values leave the default in place.
     */
    static Config from_environment() {
        Config cfg;
        if (const char* v = std::getenv("PQLATTICE_VERBOSE")) {
            cfg.verbose_logging = parse_flag(v, cfg.verbose_logging);
        }
        if (const char* v = std::getenv("PQLATTICE_FORCE_CPU")) {
            cfg.enable_accelerators = !parse_flag(v, !cfg.enable_accelerators);
        }
        if (const char* v = std::getenv("PQLATTICE_CPU_THREADS")) {
            unsigned long n = parse_number(v, cfg.cpu_threads);
            if (n >= 1 && n <= 256) {
                cfg.cpu_threads = static_cast<unsigned>(n);
            }
        }
        if (const char* v = std::getenv("PQLATTICE_MAX_SIGN_ITERATIONS")) {
            unsigned long n = parse_number(v, cfg.max_sign_iterations);
            if (n >= 1 && n <= 1000000) {
                cfg.max_sign_iterations = static_cast<uint32_t>(n);
            }
        }
        return cfg;
    }

private:
    static bool parse_flag(const std::string& value, bool fallback) {
        if (value == "1" || value == "true" || value == "on" || value == "yes") return true;
        if (value == "0" || value == "false" || value == "off" || value == "no") return false;
        return fallback;
    }

    static unsigned long parse_number(const char* value, unsigned long fallback) {
        char* end = nullptr;
        unsigned long n = std::strtoul(value, &end, 10);
        if (end == value || *end != '\0') {
            return fallback;
        }
        return n;
    }
};

} // namespace pqlattice
