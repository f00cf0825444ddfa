// REFINDEX - Record Reconciliation Implementation
// Copyright (c) 2024 REFINDEX Developers
// MIT License

#include "refindex/indexer/reconciler.h"

#include "refindex/core/hex.h"
#include "refindex/crypto/ss58.h"
#include "refindex/util/logging.h"

#include <cstdio>

namespace refindex {
namespace indexer {

namespace {

template<typename T>
bool Assign(T& field, const T& value) {
    if (field == value) {
        return false;
    }
    field = value;
    return true;
}

/// Only a known, non-empty value may replace what is stored
bool AssignKnown(std::string& field, const std::string& value) {
    return !value.empty() && Assign(field, value);
}

bool AssignKnown(BlockNumber& field, BlockNumber value) {
    return value != 0 && Assign(field, value);
}

template<typename T>
bool AssignKnown(std::optional<T>& field, const std::optional<T>& value) {
    return value.has_value() && Assign(field, value);
}

void SetDeposit(const chain::Deposit& deposit, uint16_t prefix,
                std::string& who, std::string& amount) {
    who = EncodeSS58(deposit.who, prefix);
    amount = U128ToString(deposit.amount);
}

/// Append unless the address is already listed
bool AddProponent(std::vector<db::Proponent>& proponents, const db::Proponent& p) {
    for (const auto& existing : proponents) {
        if (existing.address == p.address) {
            return false;
        }
    }
    proponents.push_back(p);
    return true;
}

} // namespace

std::string FormatApproval(U128 ayes, U128 nays) {
    U128 total = ayes + nays;
    if (total == 0 || total < ayes) {
        return "";
    }

    constexpr U128 LIMIT = ~static_cast<U128>(0) / 10000;
    U128 bps = ayes <= LIMIT ? ayes * 10000 / total : ayes / (total / 10000);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%u.%02u%%",
                  static_cast<unsigned>(bps / 100), static_cast<unsigned>(bps % 100));
    return buf;
}

db::RefStatus StatusFromVariant(chain::ReferendumVariant variant) {
    switch (variant) {
        case chain::ReferendumVariant::Ongoing: return db::RefStatus::Ongoing;
        case chain::ReferendumVariant::Approved: return db::RefStatus::Approved;
        case chain::ReferendumVariant::Rejected: return db::RefStatus::Rejected;
        case chain::ReferendumVariant::Cancelled: return db::RefStatus::Cancelled;
        case chain::ReferendumVariant::TimedOut: return db::RefStatus::TimedOut;
        case chain::ReferendumVariant::Killed: return db::RefStatus::Killed;
    }
    return db::RefStatus::Unknown;
}

db::ReferendumRecord RecordFromInfo(const chain::ReferendumInfo& info, const RecordContext& ctx) {
    db::ReferendumRecord r;
    r.networkId = ctx.network;
    r.refId = info.id;
    r.status = StatusFromVariant(info.variant);
    r.finalized = chain::IsTerminal(info.variant);

    r.track = info.track;
    r.origin = info.origin;
    r.enactment = info.enactment;

    if (info.submitted) {
        r.submittedBlock = *info.submitted;
    }
    if (info.deciding) {
        r.decisionStartBlock = info.deciding->since;
        if (info.deciding->confirming) {
            r.confirmStartBlock = *info.deciding->confirming;
        }
    }
    if (info.since) {
        r.decisionEndBlock = *info.since;
        if (info.variant == chain::ReferendumVariant::Approved) {
            r.confirmEndBlock = *info.since;
        }
    }
    r.approved = info.variant == chain::ReferendumVariant::Approved;

    if (info.tally) {
        r.ayes = U128ToString(info.tally->ayes);
        r.nays = U128ToString(info.tally->nays);
        r.support = U128ToString(info.tally->support);
        r.approval = FormatApproval(info.tally->ayes, info.tally->nays);
    }
    if (info.inQueue) {
        r.inQueue = *info.inQueue;
    }

    if (info.submissionDeposit) {
        SetDeposit(*info.submissionDeposit, ctx.ss58Prefix,
                   r.submissionDepositWho, r.submissionDepositAmount);
        r.submitter = r.submissionDepositWho;
    }
    if (info.decisionDeposit) {
        SetDeposit(*info.decisionDeposit, ctx.ss58Prefix,
                   r.decisionDepositWho, r.decisionDepositAmount);
    }

    if (!r.submissionDepositWho.empty()) {
        AddProponent(r.proponents, {r.submissionDepositWho, db::ProponentRole::Submitter, true});
    }
    if (!r.decisionDepositWho.empty()) {
        AddProponent(r.proponents, {r.decisionDepositWho, db::ProponentRole::DecisionDeposit, true});
    }

    if (info.proposal) {
        r.preimageHash = ToPrefixedHex(info.proposal->hash.data(), info.proposal->hash.size());
        r.preimageLen = info.proposal->len;
    }

    r.createdAt = ctx.now;
    r.updatedAt = ctx.now;
    return r;
}

db::ReferendumRecord ClearedRecord(NetworkId network, RefId id, Timestamp now) {
    db::ReferendumRecord r;
    r.networkId = network;
    r.refId = id;
    r.status = db::RefStatus::Cleared;
    r.finalized = true;
    r.submitter = db::UNKNOWN_SUBMITTER;
    r.createdAt = now;
    r.updatedAt = now;
    return r;
}

bool ApplyDecoded(db::ReferendumRecord& record, const chain::ReferendumInfo& info,
                  const RecordContext& ctx) {
    if (record.finalized) {
        return false;
    }

    const db::ReferendumRecord d = RecordFromInfo(info, ctx);
    bool changed = false;

    changed |= Assign(record.status, d.status);
    changed |= Assign(record.finalized, d.finalized);

    changed |= AssignKnown(record.track, d.track);
    changed |= AssignKnown(record.origin, d.origin);
    changed |= AssignKnown(record.enactment, d.enactment);

    changed |= AssignKnown(record.submittedBlock, d.submittedBlock);
    changed |= AssignKnown(record.decisionStartBlock, d.decisionStartBlock);
    changed |= AssignKnown(record.decisionEndBlock, d.decisionEndBlock);
    changed |= AssignKnown(record.confirmStartBlock, d.confirmStartBlock);
    changed |= AssignKnown(record.confirmEndBlock, d.confirmEndBlock);

    if (info.variant == chain::ReferendumVariant::Ongoing && info.tally) {
        changed |= Assign(record.ayes, d.ayes);
        changed |= Assign(record.nays, d.nays);
        changed |= Assign(record.support, d.support);
        changed |= Assign(record.approval, d.approval);
    }
    if (info.inQueue) {
        changed |= Assign(record.inQueue, d.inQueue);
    }
    if (d.approved) {
        changed |= Assign(record.approved, true);
    }

    if (info.submissionDeposit) {
        changed |= AssignKnown(record.submitter, d.submitter);
        changed |= AssignKnown(record.submissionDepositWho, d.submissionDepositWho);
        changed |= AssignKnown(record.submissionDepositAmount, d.submissionDepositAmount);
    }
    if (info.decisionDeposit) {
        changed |= AssignKnown(record.decisionDepositWho, d.decisionDepositWho);
        changed |= AssignKnown(record.decisionDepositAmount, d.decisionDepositAmount);
    }
    for (const auto& p : d.proponents) {
        changed |= AddProponent(record.proponents, p);
    }
    if (info.proposal) {
        changed |= AssignKnown(record.preimageHash, d.preimageHash);
        if (d.preimageLen != 0) {
            changed |= Assign(record.preimageLen, d.preimageLen);
        }
    }

    if (changed) {
        record.updatedAt = ctx.now;
    }
    return changed;
}

bool ApplyCleared(db::ReferendumRecord& record, Timestamp now) {
    if (record.finalized) {
        return false;
    }
    record.status = db::RefStatus::Cleared;
    record.finalized = true;
    record.updatedAt = now;
    return true;
}

// ============================================================================
// Store Reconciliation
// ============================================================================

const char* OutcomeName(Outcome outcome) {
    switch (outcome) {
        case Outcome::Created: return "created";
        case Outcome::Updated: return "updated";
        case Outcome::Cleared: return "cleared";
        case Outcome::Unchanged: return "unchanged";
        case Outcome::Finalized: return "finalized";
        case Outcome::StoreError: return "store error";
    }
    return "unknown";
}

Outcome Reconcile(db::RefStore& store, RefId id,
                  const std::optional<chain::ReferendumInfo>& info,
                  const RecordContext& ctx, std::string* error) {
    auto fail = [&](const db::Status& s) {
        if (error) {
            *error = s.ToString();
        }
        return Outcome::StoreError;
    };

    db::ReferendumRecord existing;
    db::Status s = store.GetRecord(ctx.network, id, existing);
    if (!s.ok() && !s.IsNotFound()) {
        return fail(s);
    }
    const bool exists = s.ok();

    if (exists && existing.finalized) {
        return Outcome::Finalized;
    }

    if (!info) {
        db::ReferendumRecord row = ClearedRecord(ctx.network, id, ctx.now);
        if (exists) {
            row = existing;
            ApplyCleared(row, ctx.now);
        }
        s = store.UpsertRecord(row);
        if (!s.ok()) {
            return fail(s);
        }
        LOG_INFO(util::LogCategory::INDEXER) << "net " << ctx.network << " ref #" << id
                                             << " cleared";
        return Outcome::Cleared;
    }

    if (!exists) {
        db::ReferendumRecord row = RecordFromInfo(*info, ctx);
        s = store.UpsertRecord(row);
        if (!s.ok()) {
            return fail(s);
        }
        LOG_INFO(util::LogCategory::INDEXER) << "Created " << row.ToString()
                                             << ", submitter " << row.submitter;
        return Outcome::Created;
    }

    db::ReferendumRecord row = existing;
    if (!ApplyDecoded(row, *info, ctx)) {
        return Outcome::Unchanged;
    }
    s = store.UpsertRecord(row);
    if (!s.ok()) {
        return fail(s);
    }
    if (row.finalized) {
        LOG_INFO(util::LogCategory::INDEXER) << "net " << ctx.network << " ref #" << id
                                             << " finalized as " << db::RefStatusName(row.status);
    } else {
        LOG_DEBUG(util::LogCategory::INDEXER) << "Updated " << row.ToString();
    }
    return Outcome::Updated;
}

} // namespace indexer
} // namespace refindex
