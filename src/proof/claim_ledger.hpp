#ifndef PQLATTICE_PROOF_CLAIM_LEDGER_HPP
#define PQLATTICE_PROOF_CLAIM_LEDGER_HPP

#include "proof_export.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pqlattice {
namespace proof {

/**
 * @brief One entry of the ledger
 */
struct LedgerRecord {
    uint64_t sequence_number = 0;
    std::chrono::system_clock::time_point timestamp;
    CorrectnessClaim claim;

    // Hash chaining
    std::array<uint8_t, 32> previous_hash{};
    std::array<uint8_t, 32> current_hash{};
};

/**
 * @brief In-process exporter that appends claims to a BLAKE2b hash chain
 *
 * Each record hashes its predecessor's hash together with its own canonical
 * bytes. The returned handle is the hex-encoded record hash.
 */
class ClaimLedger : public ProofExporter {
public:
    ClaimLedger() = default;

    CertificateHandle submit(const CorrectnessClaim& claim) override;
    std::string exporter_name() const override { return "claim-ledger"; }

    /**
     * @brief Re-derive every hash and check the links
     */
    bool verify_chain() const;

    /**
     * @brief Check a detached copy of a chain
     */
    static bool verify_records(const std::vector<LedgerRecord>& records);

    std::vector<LedgerRecord> records() const;
    size_t size() const;
    std::optional<std::array<uint8_t, 32>> last_hash() const;

    static std::string hex_encode(const uint8_t* data, size_t len);

private:
    static std::array<uint8_t, 32> record_hash(const LedgerRecord& record);

    mutable std::mutex mutex_;
    std::vector<LedgerRecord> records_;
};

} // namespace proof
} // namespace pqlattice

#endif // PQLATTICE_PROOF_CLAIM_LEDGER_HPP
