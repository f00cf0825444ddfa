// REFINDEX - Record Reconciliation
// Copyright (c) 2024 REFINDEX Developers
// MIT License
//
// Turns one chain observation (a decoded ReferendumInfo, or "not found")
// into at most one store write.

#ifndef REFINDEX_INDEXER_RECONCILER_H
#define REFINDEX_INDEXER_RECONCILER_H

#include "refindex/chain/referendum.h"
#include "refindex/db/record.h"
#include "refindex/db/refdb.h"

#include <optional>
#include <string>

namespace refindex {
namespace indexer {

struct RecordContext {
    NetworkId network{0};
    uint16_t ss58Prefix{42};
    Timestamp now{0};
};

/// ayes / (ayes + nays) as "NN.NN%", truncated; empty when nobody voted
std::string FormatApproval(U128 ayes, U128 nays);

db::RefStatus StatusFromVariant(chain::ReferendumVariant variant);

/**
 * Fresh row for a decoded referendum. Terminal variants are finalized with
 * decisionEndBlock = since; Approved also sets confirmEndBlock and approved.
 */
db::ReferendumRecord RecordFromInfo(const chain::ReferendumInfo& info, const RecordContext& ctx);

/// Fresh finalized row for an id the chain no longer knows
db::ReferendumRecord ClearedRecord(NetworkId network, RefId id, Timestamp now);

/**
 * Merge a decoded value into an unfinalized row. Values the decoder could
 * not produce never replace known ones; the tally only moves while Ongoing.
 * @return true if any field changed (updatedAt is then bumped)
 */
bool ApplyDecoded(db::ReferendumRecord& record, const chain::ReferendumInfo& info,
                  const RecordContext& ctx);

/// Mark an unfinalized row Cleared; returns false if it was already final
bool ApplyCleared(db::ReferendumRecord& record, Timestamp now);

// ============================================================================
// Store Reconciliation
// ============================================================================

enum class Outcome {
    Created,
    Updated,
    Cleared,
    Unchanged,
    Finalized,   // Row already final; left alone
    StoreError,
};

const char* OutcomeName(Outcome outcome);

/**
 * Apply one observation to the store.
 * @param info   Decoded value, or nullopt when the chain reported not-found
 * @param error  Output: store failure detail for StoreError
 */
Outcome Reconcile(db::RefStore& store, RefId id,
                  const std::optional<chain::ReferendumInfo>& info,
                  const RecordContext& ctx, std::string* error = nullptr);

} // namespace indexer
} // namespace refindex

#endif // REFINDEX_INDEXER_RECONCILER_H
