#include "claim_ledger.hpp"
#include "../core/side_channel.hpp"

#include <sodium.h>
#include <stdexcept>

namespace pqlattice {
namespace proof {

namespace {

void append_u64(std::vector<uint8_t>& bytes, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        bytes.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

void append_string(std::vector<uint8_t>& bytes, const std::string& s) {
    bytes.insert(bytes.end(), s.begin(), s.end());
    bytes.push_back(0);
}

} // anonymous namespace

std::array<uint8_t, 32> ClaimLedger::record_hash(const LedgerRecord& record) {
    std::vector<uint8_t> bytes;
    bytes.reserve(256);

    bytes.insert(bytes.end(), record.previous_hash.begin(), record.previous_hash.end());
    append_u64(bytes, record.sequence_number);

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        record.timestamp.time_since_epoch()).count();
    append_u64(bytes, static_cast<uint64_t>(ms));

    append_string(bytes, record.claim.subject);
    append_string(bytes, record.claim.statement);
    append_string(bytes, record.claim.parameter_set);
    bytes.insert(bytes.end(), record.claim.fingerprint.begin(), record.claim.fingerprint.end());

    std::array<uint8_t, 32> hash;
    if (crypto_generichash(hash.data(), hash.size(), bytes.data(), bytes.size(),
                           nullptr, 0) != 0) {
        throw std::runtime_error("BLAKE2b hash failed");
    }
    return hash;
}

CertificateHandle ClaimLedger::submit(const CorrectnessClaim& claim) {
    side_channel::ensure_sodium();

    std::lock_guard<std::mutex> lock(mutex_);
    LedgerRecord record;
    record.sequence_number = records_.size();
    record.timestamp = std::chrono::system_clock::now();
    record.claim = claim;
    if (!records_.empty()) {
        record.previous_hash = records_.back().current_hash;
    }
    record.current_hash = record_hash(record);
    records_.push_back(record);
    return hex_encode(record.current_hash.data(), record.current_hash.size());
}

bool ClaimLedger::verify_records(const std::vector<LedgerRecord>& records) {
    std::array<uint8_t, 32> expected_previous{};
    for (size_t i = 0; i < records.size(); i++) {
        const auto& record = records[i];
        if (record.sequence_number != i) {
            return false;
        }
        if (record.previous_hash != expected_previous) {
            return false;
        }
        if (record_hash(record) != record.current_hash) {
            return false;
        }
        expected_previous = record.current_hash;
    }
    return true;
}

bool ClaimLedger::verify_chain() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return verify_records(records_);
}

std::vector<LedgerRecord> ClaimLedger::records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

size_t ClaimLedger::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

std::optional<std::array<uint8_t, 32>> ClaimLedger::last_hash() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (records_.empty()) {
        return std::nullopt;
    }
    return records_.back().current_hash;
}

std::string ClaimLedger::hex_encode(const uint8_t* data, size_t len) {
    static const char* hex_chars = "0123456789abcdef";
    std::string hex;
    hex.reserve(len * 2);

    for (size_t i = 0; i < len; ++i) {
        hex.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        hex.push_back(hex_chars[data[i] & 0x0F]);
    }

    return hex;
}

} // namespace proof
} // namespace pqlattice
