/**
 * @file proof_export.hpp
 * @brief Interface to an external proof-export service
 *
 * The cryptographic core describes what it just computed as a
 * CorrectnessClaim and hands it to whatever exporter the Context carries.
 * The exporter answers with an opaque handle; how (or whether) the claim is
 * proven is the exporter's business.
 *
 * @version 1.0.0
 */

#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace pqlattice {
namespace proof {

/**
 * @brief Statement about one completed operation
 */
struct CorrectnessClaim {
    std::string subject;                    ///< Operation, e.g. "kyber.keygen"
    std::string statement;                  ///< Relation the result satisfies
    std::string parameter_set;              ///< e.g. "Kyber-768"
    std::array<uint8_t, 32> fingerprint{};  ///< SHA3-256 of the public output
};

/**
 * @brief Opaque verification handle returned by an exporter
 */
using CertificateHandle = std::string;

/**
 * @brief Abstract proof exporter
 */
class ProofExporter {
public:
    virtual ~ProofExporter() = default;

    /**
     * @brief Submit a claim
     * @throws std::exception subclasses on exporter failure
     */
    virtual CertificateHandle submit(const CorrectnessClaim& claim) = 0;

    virtual std::string exporter_name() const = 0;
};

} // namespace proof
} // namespace pqlattice
