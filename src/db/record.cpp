// REFINDEX - Referendum Record Implementation
// Copyright (c) 2024 REFINDEX Developers
// MIT License

#include "refindex/db/record.h"

#include <sstream>
#include <tuple>

namespace refindex {
namespace db {

namespace {

auto Tie(const ReferendumRecord& r) {
    return std::tie(r.networkId, r.refId, r.status, r.finalized, r.track, r.origin,
                    r.enactment, r.submittedBlock, r.decisionStartBlock, r.decisionEndBlock,
                    r.confirmStartBlock, r.confirmEndBlock, r.ayes, r.nays, r.support,
                    r.approval, r.approved, r.inQueue, r.submitter, r.submissionDepositWho,
                    r.submissionDepositAmount, r.decisionDepositWho, r.decisionDepositAmount,
                    r.preimageHash, r.preimageLen, r.proponents, r.createdAt, r.updatedAt);
}

rpc::JSONValue OptionalString(const std::optional<std::string>& value) {
    return value ? rpc::JSONValue(*value) : rpc::JSONValue();
}

rpc::JSONValue Deposit(const std::string& who, const std::string& amount) {
    if (who.empty()) {
        return rpc::JSONValue();
    }
    rpc::JSONValue deposit;
    deposit["who"] = who;
    deposit["amount"] = amount;
    return deposit;
}

} // namespace

const char* RefStatusName(RefStatus status) {
    switch (status) {
        case RefStatus::Ongoing: return "Ongoing";
        case RefStatus::Approved: return "Approved";
        case RefStatus::Rejected: return "Rejected";
        case RefStatus::Cancelled: return "Cancelled";
        case RefStatus::TimedOut: return "TimedOut";
        case RefStatus::Killed: return "Killed";
        case RefStatus::Cleared: return "Cleared";
        case RefStatus::Unknown: return "Unknown";
    }
    return "Unknown";
}

const char* ProponentRoleName(ProponentRole role) {
    switch (role) {
        case ProponentRole::Submitter: return "submitter";
        case ProponentRole::DecisionDeposit: return "decision_deposit";
    }
    return "unknown";
}

bool ReferendumRecord::operator==(const ReferendumRecord& other) const {
    return Tie(*this) == Tie(other);
}

std::string ReferendumRecord::ToString() const {
    std::ostringstream ss;
    ss << "Ref(net=" << networkId << ", id=" << refId
       << ", status=" << RefStatusName(status)
       << (finalized ? ", finalized" : "");
    if (track) {
        ss << ", track=" << *track;
    }
    if (!ayes.empty()) {
        ss << ", ayes=" << ayes << ", nays=" << nays;
    }
    ss << ")";
    return ss.str();
}

rpc::JSONValue RecordToJSON(const ReferendumRecord& r) {
    rpc::JSONValue json;
    json["network_id"] = r.networkId;
    json["ref_id"] = r.refId;
    json["status"] = RefStatusName(r.status);
    json["finalized"] = r.finalized;
    json["track"] = r.track ? rpc::JSONValue(static_cast<int>(*r.track)) : rpc::JSONValue();
    json["origin"] = OptionalString(r.origin);
    json["enactment"] = OptionalString(r.enactment);

    json["submitted_block"] = r.submittedBlock;
    json["decision_start_block"] = r.decisionStartBlock;
    json["decision_end_block"] = r.decisionEndBlock;
    json["confirm_start_block"] = r.confirmStartBlock;
    json["confirm_end_block"] = r.confirmEndBlock;

    rpc::JSONValue tally;
    tally["ayes"] = r.ayes;
    tally["nays"] = r.nays;
    tally["support"] = r.support;
    json["tally"] = tally;
    json["approval"] = r.approval;
    json["approved"] = r.approved;
    json["in_queue"] = r.inQueue;

    json["submitter"] = r.submitter;
    json["submission_deposit"] = Deposit(r.submissionDepositWho, r.submissionDepositAmount);
    json["decision_deposit"] = Deposit(r.decisionDepositWho, r.decisionDepositAmount);

    json["preimage_hash"] = r.preimageHash.empty() ? rpc::JSONValue()
                                                   : rpc::JSONValue(r.preimageHash);
    json["preimage_len"] = r.preimageLen;

    rpc::JSONValue::Array proponents;
    for (const auto& p : r.proponents) {
        rpc::JSONValue entry;
        entry["address"] = p.address;
        entry["role"] = ProponentRoleName(p.role);
        entry["active"] = p.active;
        proponents.push_back(std::move(entry));
    }
    json["proponents"] = rpc::JSONValue(std::move(proponents));

    json["created_at"] = r.createdAt;
    json["updated_at"] = r.updatedAt;
    return json;
}

} // namespace db
} // namespace refindex
