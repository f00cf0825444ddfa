// REFINDEX - Referendum Decoder
// Copyright (c) 2024 REFINDEX Developers
// MIT License
//
// SCALE decoding of Referenda::ReferendumInfoFor values and the
// ReferendumCount item.
//
// The first byte selects the variant; each variant has one fixed layout:
//
//   0 Ongoing    track u16, origin, proposal Bounded<Call>, enactment,
//                submitted u32, submission deposit, Option<decision deposit>,
//                Option<deciding>, tally (ayes, nays, support: u128),
//                in_queue bool, Option<alarm>
//   1 Approved   since u32, Option<submission deposit>, Option<decision deposit>
//   2 Rejected   same as Approved
//   3 Cancelled  same as Approved
//   4 TimedOut   same as Approved
//   5 Killed     since u32
//
// A field that cannot be read (short buffer, unknown sub-variant) stops
// decoding. That field and every later one stay unset and the partially
// decoded value is still returned; only the tag is mandatory.

#ifndef REFINDEX_CHAIN_REFERENDUM_H
#define REFINDEX_CHAIN_REFERENDUM_H

#include "refindex/chain/storage.h"
#include "refindex/core/types.h"

#include <cstdint>
#include <optional>
#include <string>

namespace refindex {
namespace chain {

// ============================================================================
// Variants
// ============================================================================

enum class ReferendumVariant : uint8_t {
    Ongoing = 0,
    Approved = 1,
    Rejected = 2,
    Cancelled = 3,
    TimedOut = 4,
    Killed = 5,
};

const char* VariantName(ReferendumVariant variant);

inline bool IsTerminal(ReferendumVariant variant) {
    return variant != ReferendumVariant::Ongoing;
}

// ============================================================================
// Decoded Fields
// ============================================================================

struct Deposit {
    AccountId who{};
    U128 amount{0};
};

struct Tally {
    U128 ayes{0};
    U128 nays{0};
    U128 support{0};
};

/// Bounded<Call>: how the proposal is stored
struct Proposal {
    enum class Kind : uint8_t { Legacy = 0, Inline = 1, Lookup = 2 };

    Kind kind{Kind::Legacy};
    Hash256 hash{};     // Inline proposals carry blake2b_256 of the call
    uint32_t len{0};    // Zero when the length is not carried
};

struct DecidingStatus {
    BlockNumber since{0};
    std::optional<BlockNumber> confirming;
};

/**
 * A decoded ReferendumInfoFor value. Fields the variant does not carry, or
 * that were not reached before decoding stopped, are unset.
 */
struct ReferendumInfo {
    RefId id{0};
    ReferendumVariant variant{ReferendumVariant::Ongoing};

    // Ongoing
    std::optional<uint16_t> track;
    std::optional<std::string> origin;
    std::optional<Proposal> proposal;
    std::optional<std::string> enactment;   // "At(n)" or "After(n)"
    std::optional<BlockNumber> submitted;
    std::optional<DecidingStatus> deciding;
    std::optional<Tally> tally;
    std::optional<bool> inQueue;
    std::optional<BlockNumber> alarm;

    // Both layouts
    std::optional<Deposit> submissionDeposit;
    std::optional<Deposit> decisionDeposit;

    // Terminal variants
    std::optional<BlockNumber> since;

    /// True when every field of the variant's layout was read
    bool complete{false};

    /// Name of the field decoding stopped at (empty when complete)
    std::string stoppedAt;
};

struct DecodeOptions {
    /// Pallet index of the governance Origins pallet in the runtime
    uint8_t originsPalletIndex{22};
};

// ============================================================================
// Decoding
// ============================================================================

/**
 * Decode a ReferendumInfoFor value.
 * Throws DecodeError on an empty payload or an unknown variant tag.
 */
ReferendumInfo DecodeReferendumInfo(RefId id, const Bytes& raw,
                                    const DecodeOptions& options = DecodeOptions());

/**
 * Decode the ReferendumCount value (little-endian u32).
 * Throws DecodeError if fewer than 4 bytes are present.
 */
uint32_t DecodeReferendumCount(const Bytes& raw);

// ============================================================================
// Names
// ============================================================================

/// Governance track name, or "Track<N>" when unknown
std::string TrackName(uint16_t track);

/// Variant name in the Origins pallet, or "Origin(N)" when unknown
std::string OriginsVariantName(uint8_t variant);

} // namespace chain
} // namespace refindex

#endif // REFINDEX_CHAIN_REFERENDUM_H
