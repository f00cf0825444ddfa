// REFINDEX - Referendum Decoder Implementation
// Copyright (c) 2024 REFINDEX Developers
// MIT License

#include "refindex/chain/referendum.h"

#include "refindex/core/serialize.h"
#include "refindex/crypto/blake2b.h"
#include "refindex/util/logging.h"

#include <map>

namespace refindex {
namespace chain {

namespace {

/// An unknown sub-variant inside an otherwise readable payload
class FieldError : public std::runtime_error {
public:
    explicit FieldError(const std::string& msg) : std::runtime_error(msg) {}
};

constexpr uint8_t SYSTEM_ORIGIN_PALLET = 0;

AccountId ReadAccount(DataStream& s) {
    AccountId who;
    Unserialize(s, who);
    return who;
}

Deposit ReadDeposit(DataStream& s) {
    Deposit deposit;
    deposit.who = ReadAccount(s);
    deposit.amount = ser_readdata128(s);
    return deposit;
}

/// SCALE Option: 0 = None, 1 = Some
bool ReadOptionTag(DataStream& s, const char* what) {
    uint8_t tag = ser_readdata8(s);
    if (tag > 1) {
        throw FieldError(std::string("invalid Option tag ") + std::to_string(tag) +
                         " for " + what);
    }
    return tag == 1;
}

std::optional<Deposit> ReadOptionalDeposit(DataStream& s, const char* what) {
    if (!ReadOptionTag(s, what)) {
        return std::nullopt;
    }
    return ReadDeposit(s);
}

std::string ReadOrigin(DataStream& s, uint8_t originsPallet) {
    uint8_t pallet = ser_readdata8(s);
    if (pallet == SYSTEM_ORIGIN_PALLET) {
        uint8_t kind = ser_readdata8(s);
        switch (kind) {
            case 0: return "Root";
            case 1:
                s.Ignore(32);  // signer account
                return "Signed";
            case 2: return "None";
            default:
                throw FieldError("unknown system origin " + std::to_string(kind));
        }
    }
    if (pallet == originsPallet) {
        return OriginsVariantName(ser_readdata8(s));
    }
    throw FieldError("origin from unknown pallet " + std::to_string(pallet));
}

Proposal ReadProposal(DataStream& s) {
    Proposal proposal;
    uint8_t kind = ser_readdata8(s);
    switch (kind) {
        case 0:
            proposal.kind = Proposal::Kind::Legacy;
            Unserialize(s, proposal.hash);
            break;
        case 1: {
            proposal.kind = Proposal::Kind::Inline;
            Bytes call;
            Unserialize(s, call);
            proposal.hash = Blake2b256(call);
            proposal.len = static_cast<uint32_t>(call.size());
            break;
        }
        case 2:
            proposal.kind = Proposal::Kind::Lookup;
            Unserialize(s, proposal.hash);
            proposal.len = ser_readdata32(s);
            break;
        default:
            throw FieldError("unknown Bounded variant " + std::to_string(kind));
    }
    return proposal;
}

std::string ReadEnactment(DataStream& s) {
    uint8_t kind = ser_readdata8(s);
    if (kind > 1) {
        throw FieldError("unknown enactment variant " + std::to_string(kind));
    }
    uint32_t block = ser_readdata32(s);
    return (kind == 0 ? "At(" : "After(") + std::to_string(block) + ")";
}

void DecodeOngoing(DataStream& s, ReferendumInfo& info, const DecodeOptions& options,
                   std::string& field) {
    field = "track";
    info.track = ser_readdata16(s);

    field = "origin";
    info.origin = ReadOrigin(s, options.originsPalletIndex);

    field = "proposal";
    info.proposal = ReadProposal(s);

    field = "enactment";
    info.enactment = ReadEnactment(s);

    field = "submitted";
    info.submitted = ser_readdata32(s);

    field = "submission_deposit";
    info.submissionDeposit = ReadDeposit(s);

    field = "decision_deposit";
    info.decisionDeposit = ReadOptionalDeposit(s, "decision deposit");

    field = "deciding";
    if (ReadOptionTag(s, "deciding")) {
        DecidingStatus deciding;
        deciding.since = ser_readdata32(s);
        if (ReadOptionTag(s, "confirming")) {
            deciding.confirming = ser_readdata32(s);
        }
        info.deciding = deciding;
    }

    field = "tally";
    Tally tally;
    tally.ayes = ser_readdata128(s);
    tally.nays = ser_readdata128(s);
    tally.support = ser_readdata128(s);
    info.tally = tally;

    field = "in_queue";
    uint8_t inQueue = ser_readdata8(s);
    if (inQueue > 1) {
        throw FieldError("invalid bool " + std::to_string(inQueue));
    }
    info.inQueue = inQueue == 1;

    field = "alarm";
    if (ReadOptionTag(s, "alarm")) {
        BlockNumber when = ser_readdata32(s);
        s.Ignore(8);  // scheduler task address (block, index)
        info.alarm = when;
    }
}

void DecodeTerminal(DataStream& s, ReferendumInfo& info, std::string& field) {
    field = "since";
    info.since = ser_readdata32(s);

    if (info.variant == ReferendumVariant::Killed) {
        return;
    }

    field = "submission_deposit";
    info.submissionDeposit = ReadOptionalDeposit(s, "submission deposit");

    field = "decision_deposit";
    info.decisionDeposit = ReadOptionalDeposit(s, "decision deposit");
}

} // namespace

const char* VariantName(ReferendumVariant variant) {
    switch (variant) {
        case ReferendumVariant::Ongoing: return "Ongoing";
        case ReferendumVariant::Approved: return "Approved";
        case ReferendumVariant::Rejected: return "Rejected";
        case ReferendumVariant::Cancelled: return "Cancelled";
        case ReferendumVariant::TimedOut: return "TimedOut";
        case ReferendumVariant::Killed: return "Killed";
    }
    return "Unknown";
}

ReferendumInfo DecodeReferendumInfo(RefId id, const Bytes& raw, const DecodeOptions& options) {
    if (raw.empty()) {
        throw DecodeError("ref " + std::to_string(id) + ": empty ReferendumInfo payload");
    }
    if (raw[0] > static_cast<uint8_t>(ReferendumVariant::Killed)) {
        throw DecodeError("ref " + std::to_string(id) + ": unknown ReferendumInfo variant " +
                          std::to_string(raw[0]));
    }

    ReferendumInfo info;
    info.id = id;
    info.variant = static_cast<ReferendumVariant>(raw[0]);

    DataStream s(raw.data() + 1, raw.size() - 1);
    std::string field;
    try {
        if (info.variant == ReferendumVariant::Ongoing) {
            DecodeOngoing(s, info, options, field);
        } else {
            DecodeTerminal(s, info, field);
        }
        info.complete = true;
    } catch (const std::ios_base::failure&) {
        info.stoppedAt = field;
        LOG_DEBUG(util::LogCategory::DECODE) << "ref " << id << " (" << VariantName(info.variant)
                                             << "): payload ends at " << field;
    } catch (const FieldError& e) {
        info.stoppedAt = field;
        LOG_DEBUG(util::LogCategory::DECODE) << "ref " << id << " (" << VariantName(info.variant)
                                             << "): stopped at " << field << ": " << e.what();
    }

    if (info.complete && !s.empty()) {
        LOG_TRACE(util::LogCategory::DECODE) << "ref " << id << ": " << s.size()
                                             << " trailing bytes ignored";
    }
    return info;
}

uint32_t DecodeReferendumCount(const Bytes& raw) {
    if (raw.size() < 4) {
        throw DecodeError("ReferendumCount needs 4 bytes, got " + std::to_string(raw.size()));
    }
    DataStream s(raw.data(), 4);
    return ser_readdata32(s);
}

// ============================================================================
// Names
// ============================================================================

std::string TrackName(uint16_t track) {
    static const std::map<uint16_t, const char*> names = {
        {0, "Root"},
        {1, "WhitelistedCaller"},
        {2, "WishForChange"},
        {10, "StakingAdmin"},
        {11, "Treasurer"},
        {12, "LeaseAdmin"},
        {13, "FellowshipAdmin"},
        {14, "GeneralAdmin"},
        {15, "AuctionAdmin"},
        {20, "ReferendumCanceller"},
        {21, "ReferendumKiller"},
        {30, "SmallTipper"},
        {31, "BigTipper"},
        {32, "SmallSpender"},
        {33, "MediumSpender"},
        {34, "BigSpender"},
        {1000, "WishForChange"},
    };
    auto it = names.find(track);
    if (it != names.end()) {
        return it->second;
    }
    return "Track<" + std::to_string(track) + ">";
}

std::string OriginsVariantName(uint8_t variant) {
    static const char* const names[] = {
        "StakingAdmin",
        "Treasurer",
        "FellowshipAdmin",
        "GeneralAdmin",
        "AuctionAdmin",
        "LeaseAdmin",
        "ReferendumCanceller",
        "ReferendumKiller",
        "SmallTipper",
        "BigTipper",
        "SmallSpender",
        "MediumSpender",
        "BigSpender",
        "WhitelistedCaller",
        "WishForChange",
    };
    if (variant < sizeof(names) / sizeof(names[0])) {
        return names[variant];
    }
    return "Origin(" + std::to_string(variant) + ")";
}

} // namespace chain
} // namespace refindex
