#ifndef PQLATTICE_CORE_ERRORS_HPP
#define PQLATTICE_CORE_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace pqlattice {

/**
 * @brief Base exception for pqlattice errors
 */
class PQCError : public std::runtime_error {
public:
    explicit PQCError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Unsupported security level or mismatched operand dimensions
 */
class InvalidParameterError : public PQCError {
public:
    explicit InvalidParameterError(const std::string& message)
        : PQCError("Invalid parameter: " + message) {}
};

/**
 * @brief Byte string inconsistent with the claimed parameter set
 */
class MalformedInputError : public PQCError {
public:
    MalformedInputError(const std::string& what_kind, size_t expected, size_t actual)
        : PQCError("Malformed " + what_kind + ": expected " +
                   std::to_string(expected) + " bytes, got " +
                   std::to_string(actual) + " bytes") {}

    explicit MalformedInputError(const std::string& message)
        : PQCError("Malformed input: " + message) {}
};

/**
 * @brief Normal-domain and transform-domain operands mixed in one operation
 */
class DomainMismatchError : public PQCError {
public:
    explicit DomainMismatchError(const std::string& operation)
        : PQCError("Domain mismatch in " + operation) {}
};

/**
 * @brief Signing rejection loop ran past its iteration cap
 */
class SigningExhaustedError : public PQCError {
public:
    explicit SigningExhaustedError(uint32_t iterations)
        : PQCError("Signing exhausted after " + std::to_string(iterations) +
                   " attempts"),
          iterations_(iterations) {}

    uint32_t iterations() const { return iterations_; }

private:
    uint32_t iterations_;
};

/**
 * @brief A ring backend could not be brought up
 */
class BackendInitializationError : public PQCError {
public:
    BackendInitializationError(const std::string& backend_name, const std::string& reason)
        : PQCError("Backend " + backend_name + " failed to initialize: " + reason),
          backend_name_(backend_name) {}

    const std::string& backend_name() const { return backend_name_; }

private:
    std::string backend_name_;
};

} // namespace pqlattice

#endif // PQLATTICE_CORE_ERRORS_HPP
