// REFINDEX - Referendum Record
// Copyright (c) 2024 REFINDEX Developers
// MIT License
//
// The persisted row the indexer keeps for each (network, referendum id).

#ifndef REFINDEX_DB_RECORD_H
#define REFINDEX_DB_RECORD_H

#include "refindex/core/serialize.h"
#include "refindex/core/types.h"
#include "refindex/rpc/json.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace refindex {
namespace db {

// ============================================================================
// Status
// ============================================================================

enum class RefStatus : uint8_t {
    Ongoing = 0,
    Approved = 1,
    Rejected = 2,
    Cancelled = 3,
    TimedOut = 4,
    Killed = 5,
    Cleared = 6,    // Disappeared from chain storage before we saw it finish
    Unknown = 7,
};

const char* RefStatusName(RefStatus status);

/// Terminal chain states plus Cleared
inline bool IsFinalStatus(RefStatus status) {
    return status != RefStatus::Ongoing && status != RefStatus::Unknown;
}

/// Submitter placeholder when the depositor could not be decoded
constexpr const char* UNKNOWN_SUBMITTER = "Unknown";

// ============================================================================
// Proponents
// ============================================================================

enum class ProponentRole : uint8_t {
    Submitter = 0,         // Placed the submission deposit
    DecisionDeposit = 1,   // Placed the decision deposit
};

const char* ProponentRoleName(ProponentRole role);

/// An account that put a deposit behind a referendum
struct Proponent {
    std::string address;    // SS58
    ProponentRole role{ProponentRole::Submitter};
    bool active{true};

    bool operator==(const Proponent& other) const {
        return address == other.address && role == other.role && active == other.active;
    }
    bool operator!=(const Proponent& other) const { return !(*this == other); }
};

// ============================================================================
// Record
// ============================================================================

struct ReferendumRecord {
    NetworkId networkId{0};
    RefId refId{0};

    RefStatus status{RefStatus::Unknown};
    bool finalized{false};

    std::optional<uint16_t> track;
    std::optional<std::string> origin;
    std::optional<std::string> enactment;

    // Phase block numbers, zero until known
    BlockNumber submittedBlock{0};
    BlockNumber decisionStartBlock{0};
    BlockNumber decisionEndBlock{0};
    BlockNumber confirmStartBlock{0};
    BlockNumber confirmEndBlock{0};

    // Tally as decimal strings; empty when never observed
    std::string ayes;
    std::string nays;
    std::string support;
    std::string approval;   // "NN.NN%", empty without votes

    bool approved{false};
    bool inQueue{false};

    std::string submitter{UNKNOWN_SUBMITTER};
    std::string submissionDepositWho;
    std::string submissionDepositAmount;
    std::string decisionDepositWho;
    std::string decisionDepositAmount;

    std::string preimageHash;   // 0x-prefixed, empty when unknown
    uint32_t preimageLen{0};

    // Stored beside the row, one key per address; never serialized with it
    std::vector<Proponent> proponents;

    Timestamp createdAt{0};
    Timestamp updatedAt{0};

    bool operator==(const ReferendumRecord& other) const;
    bool operator!=(const ReferendumRecord& other) const { return !(*this == other); }

    std::string ToString() const;
};

/// Row layout version written ahead of every record
constexpr uint8_t RECORD_VERSION = 1;

template<typename Stream>
void Serialize(Stream& s, const ReferendumRecord& r) {
    Serialize(s, RECORD_VERSION);
    Serialize(s, r.networkId);
    Serialize(s, r.refId);
    Serialize(s, static_cast<uint8_t>(r.status));
    Serialize(s, r.finalized);
    Serialize(s, r.track);
    Serialize(s, r.origin);
    Serialize(s, r.enactment);
    Serialize(s, r.submittedBlock);
    Serialize(s, r.decisionStartBlock);
    Serialize(s, r.decisionEndBlock);
    Serialize(s, r.confirmStartBlock);
    Serialize(s, r.confirmEndBlock);
    Serialize(s, r.ayes);
    Serialize(s, r.nays);
    Serialize(s, r.support);
    Serialize(s, r.approval);
    Serialize(s, r.approved);
    Serialize(s, r.inQueue);
    Serialize(s, r.submitter);
    Serialize(s, r.submissionDepositWho);
    Serialize(s, r.submissionDepositAmount);
    Serialize(s, r.decisionDepositWho);
    Serialize(s, r.decisionDepositAmount);
    Serialize(s, r.preimageHash);
    Serialize(s, r.preimageLen);
    Serialize(s, r.createdAt);
    Serialize(s, r.updatedAt);
}

template<typename Stream>
void Unserialize(Stream& s, ReferendumRecord& r) {
    uint8_t version = 0;
    Unserialize(s, version);
    if (version != RECORD_VERSION) {
        throw std::ios_base::failure("ReferendumRecord: unsupported version " +
                                     std::to_string(version));
    }
    Unserialize(s, r.networkId);
    Unserialize(s, r.refId);
    uint8_t status = 0;
    Unserialize(s, status);
    if (status > static_cast<uint8_t>(RefStatus::Unknown)) {
        throw std::ios_base::failure("ReferendumRecord: bad status " + std::to_string(status));
    }
    r.status = static_cast<RefStatus>(status);
    Unserialize(s, r.finalized);
    Unserialize(s, r.track);
    Unserialize(s, r.origin);
    Unserialize(s, r.enactment);
    Unserialize(s, r.submittedBlock);
    Unserialize(s, r.decisionStartBlock);
    Unserialize(s, r.decisionEndBlock);
    Unserialize(s, r.confirmStartBlock);
    Unserialize(s, r.confirmEndBlock);
    Unserialize(s, r.ayes);
    Unserialize(s, r.nays);
    Unserialize(s, r.support);
    Unserialize(s, r.approval);
    Unserialize(s, r.approved);
    Unserialize(s, r.inQueue);
    Unserialize(s, r.submitter);
    Unserialize(s, r.submissionDepositWho);
    Unserialize(s, r.submissionDepositAmount);
    Unserialize(s, r.decisionDepositWho);
    Unserialize(s, r.decisionDepositAmount);
    Unserialize(s, r.preimageHash);
    Unserialize(s, r.preimageLen);
    Unserialize(s, r.createdAt);
    Unserialize(s, r.updatedAt);
}

/// JSON view used by -dump and downstream consumers
rpc::JSONValue RecordToJSON(const ReferendumRecord& record);

} // namespace db
} // namespace refindex

#endif // REFINDEX_DB_RECORD_H
