// REFINDEX - Referendum Store Implementation
// Copyright (c) 2024 REFINDEX Developers
// MIT License

#include "refindex/db/refdb.h"

#include "refindex/util/logging.h"

namespace refindex {
namespace db {

namespace {

constexpr char RECORD_PREFIX = 'r';
constexpr char UNFINALIZED_PREFIX = 'u';
constexpr char PROPONENT_PREFIX = 'p';

/// prefix byte plus two big-endian u32
constexpr size_t KEY_SIZE = 9;

void AppendBE32(std::string& out, uint32_t value) {
    out.push_back(static_cast<char>((value >> 24) & 0xff));
    out.push_back(static_cast<char>((value >> 16) & 0xff));
    out.push_back(static_cast<char>((value >> 8) & 0xff));
    out.push_back(static_cast<char>(value & 0xff));
}

uint32_t ReadBE32(const char* p) {
    const auto* u = reinterpret_cast<const unsigned char*>(p);
    return (static_cast<uint32_t>(u[0]) << 24) |
           (static_cast<uint32_t>(u[1]) << 16) |
           (static_cast<uint32_t>(u[2]) << 8) |
           static_cast<uint32_t>(u[3]);
}

std::string NetworkPrefix(char kind, NetworkId network) {
    std::string prefix(1, kind);
    AppendBE32(prefix, network);
    return prefix;
}

std::string MakeKey(char kind, NetworkId network, RefId id) {
    std::string key = NetworkPrefix(kind, network);
    AppendBE32(key, id);
    return key;
}

/// Smallest key greater than every key starting with prefix ("" if none)
std::string PrefixUpperBound(std::string prefix) {
    while (!prefix.empty()) {
        auto& last = reinterpret_cast<unsigned char&>(prefix.back());
        if (last != 0xff) {
            ++last;
            return prefix;
        }
        prefix.pop_back();
    }
    return prefix;
}

/// Ids of every key under prefix, ascending
Status CollectIds(Database& db, const std::string& prefix, std::vector<RefId>& ids) {
    auto it = db.NewIterator();
    for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next()) {
        Slice key = it->key();
        if (key.size() != KEY_SIZE) {
            return Status::Corruption("malformed index key of " + std::to_string(key.size()) +
                                      " bytes");
        }
        ids.push_back(ReadBE32(key.data() + 5));
    }
    return it->status();
}

std::string EncodeProponent(const Proponent& p) {
    std::string value;
    value.push_back(static_cast<char>(p.role));
    value.push_back(p.active ? 1 : 0);
    return value;
}

bool DecodeProponent(const Slice& value, Proponent& p) {
    if (value.size() != 2) {
        return false;
    }
    uint8_t role = static_cast<uint8_t>(value.data()[0]);
    if (role > static_cast<uint8_t>(ProponentRole::DecisionDeposit)) {
        return false;
    }
    p.role = static_cast<ProponentRole>(role);
    p.active = value.data()[1] != 0;
    return true;
}

} // namespace

DatabaseRefStore::DatabaseRefStore(std::unique_ptr<Database> db)
    : db_(std::move(db)) {}

std::string DatabaseRefStore::RecordKey(NetworkId network, RefId id) {
    return MakeKey(RECORD_PREFIX, network, id);
}

std::string DatabaseRefStore::UnfinalizedKey(NetworkId network, RefId id) {
    return MakeKey(UNFINALIZED_PREFIX, network, id);
}

std::string DatabaseRefStore::ProponentKey(NetworkId network, RefId id,
                                           const std::string& address) {
    return MakeKey(PROPONENT_PREFIX, network, id) + address;
}

Status DatabaseRefStore::ListProponents(NetworkId network, RefId id,
                                        std::vector<Proponent>& proponents) {
    proponents.clear();
    const std::string prefix = MakeKey(PROPONENT_PREFIX, network, id);

    auto it = db_->NewIterator();
    for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next()) {
        Proponent p;
        p.address = it->key().ToString().substr(KEY_SIZE);
        if (p.address.empty() || !DecodeProponent(it->value(), p)) {
            return Status::Corruption("malformed proponent of " + std::to_string(network) + "/" +
                                      std::to_string(id));
        }
        proponents.push_back(std::move(p));
    }
    return it->status();
}

Status DatabaseRefStore::GetMaxRefID(NetworkId network, std::optional<RefId>& maxId) {
    maxId.reset();
    const std::string prefix = NetworkPrefix(RECORD_PREFIX, network);
    const std::string upper = PrefixUpperBound(prefix);

    auto it = db_->NewIterator();
    it->Seek(upper);
    if (it->Valid()) {
        it->Prev();
    } else {
        it->SeekToLast();
    }

    if (it->Valid() && it->key().starts_with(prefix)) {
        if (it->key().size() != KEY_SIZE) {
            return Status::Corruption("malformed record key");
        }
        maxId = ReadBE32(it->key().data() + 5);
    }
    return it->status();
}

Status DatabaseRefStore::GetUnfinalizedRefIDs(NetworkId network, std::vector<RefId>& ids) {
    ids.clear();
    return CollectIds(*db_, NetworkPrefix(UNFINALIZED_PREFIX, network), ids);
}

Status DatabaseRefStore::GetRecord(NetworkId network, RefId id, ReferendumRecord& record) {
    std::string value;
    Status s = db_->Get(RecordKey(network, id), &value);
    if (!s.ok()) {
        return s;
    }
    if (!DeserializeFromString(value, record)) {
        return Status::Corruption("unreadable record " + std::to_string(network) + "/" +
                                  std::to_string(id));
    }
    return ListProponents(network, id, record.proponents);
}

Status DatabaseRefStore::UpsertRecord(const ReferendumRecord& record) {
    std::lock_guard<std::mutex> lock(writeMutex_);

    ReferendumRecord row = record;
    ReferendumRecord existing;
    Status s = GetRecord(record.networkId, record.refId, existing);
    if (s.ok()) {
        if (existing.finalized) {
            return Status::InvalidArgument("record " + std::to_string(record.networkId) + "/" +
                                           std::to_string(record.refId) + " is finalized");
        }
        row.createdAt = existing.createdAt;
    } else if (!s.IsNotFound()) {
        return s;
    }

    WriteBatch batch;
    batch.Put(RecordKey(row.networkId, row.refId), SerializeToString(row));
    if (row.finalized) {
        batch.Delete(UnfinalizedKey(row.networkId, row.refId));
    } else {
        batch.Put(UnfinalizedKey(row.networkId, row.refId), Slice());
    }
    for (const auto& p : row.proponents) {
        batch.Put(ProponentKey(row.networkId, row.refId, p.address), EncodeProponent(p));
    }

    s = db_->Write(&batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Upsert of " << row.ToString() << " failed: "
                                         << s.ToString();
        return s;
    }
    ++writes_;
    return Status::Ok();
}

bool DatabaseRefStore::ExistsRecord(NetworkId network, RefId id) {
    return db_->Exists(RecordKey(network, id));
}

Status DatabaseRefStore::ListRecords(NetworkId network, std::vector<ReferendumRecord>& records) {
    records.clear();
    const std::string prefix = NetworkPrefix(RECORD_PREFIX, network);

    auto it = db_->NewIterator();
    for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next()) {
        if (it->key().size() != KEY_SIZE) {
            return Status::Corruption("malformed record key");
        }
        ReferendumRecord record;
        if (!DeserializeFromString(it->value().ToString(), record)) {
            return Status::Corruption("unreadable record at id " +
                                      std::to_string(ReadBE32(it->key().data() + 5)));
        }
        records.push_back(std::move(record));
    }
    Status s = it->status();
    if (!s.ok()) {
        return s;
    }
    for (auto& record : records) {
        s = ListProponents(network, record.refId, record.proponents);
        if (!s.ok()) {
            return s;
        }
    }
    return Status::Ok();
}

} // namespace db
} // namespace refindex
