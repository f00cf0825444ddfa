// REFINDEX - Referendum Store
// Copyright (c) 2024 REFINDEX Developers
// MIT License
//
// Persisted referendum rows, keyed by (network, id), with an index of the
// rows that are not yet finalized.
//
// Key layout on the underlying Database:
//
//   'r' | network (u32 BE) | ref (u32 BE)  ->  serialized ReferendumRecord
//   'u' | network (u32 BE) | ref (u32 BE)  ->  empty (unfinalized index)
//   'p' | network (u32 BE) | ref (u32 BE) | address  ->  role, active
//
// Big-endian ids keep each network's rows in id order, so the highest id is
// one reverse seek away.

#ifndef REFINDEX_DB_REFDB_H
#define REFINDEX_DB_REFDB_H

#include "refindex/db/database.h"
#include "refindex/db/record.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace refindex {
namespace db {

// ============================================================================
// Store Interface
// ============================================================================

/**
 * What the indexer needs from persistence. Implementations must be safe for
 * concurrent calls on distinct ids.
 */
class RefStore {
public:
    virtual ~RefStore() = default;

    /**
     * Highest stored id for the network.
     * @param maxId Output: unset when the network has no rows
     */
    virtual Status GetMaxRefID(NetworkId network, std::optional<RefId>& maxId) = 0;

    /// Ids of every row with finalized == false, ascending
    virtual Status GetUnfinalizedRefIDs(NetworkId network, std::vector<RefId>& ids) = 0;

    /// NotFound when the row does not exist
    virtual Status GetRecord(NetworkId network, RefId id, ReferendumRecord& record) = 0;

    /**
     * Create or replace a row. A finalized row is never modified: the call
     * fails with InvalidArgument. The first createdAt of a row is kept.
     * Proponents are added in the same write; stored ones are never removed.
     */
    virtual Status UpsertRecord(const ReferendumRecord& record) = 0;

    virtual bool ExistsRecord(NetworkId network, RefId id) = 0;

    /// Every row of the network in id order
    virtual Status ListRecords(NetworkId network, std::vector<ReferendumRecord>& records) = 0;
};

// ============================================================================
// Database-backed Store
// ============================================================================

class DatabaseRefStore : public RefStore {
public:
    explicit DatabaseRefStore(std::unique_ptr<Database> db);

    DatabaseRefStore(const DatabaseRefStore&) = delete;
    DatabaseRefStore& operator=(const DatabaseRefStore&) = delete;

    Status GetMaxRefID(NetworkId network, std::optional<RefId>& maxId) override;
    Status GetUnfinalizedRefIDs(NetworkId network, std::vector<RefId>& ids) override;
    Status GetRecord(NetworkId network, RefId id, ReferendumRecord& record) override;
    Status UpsertRecord(const ReferendumRecord& record) override;
    bool ExistsRecord(NetworkId network, RefId id) override;
    Status ListRecords(NetworkId network, std::vector<ReferendumRecord>& records) override;

    /// Proponent rows of one referendum, in address order
    Status ListProponents(NetworkId network, RefId id, std::vector<Proponent>& proponents);

    /// Committed upserts since construction
    uint64_t WriteCount() const { return writes_.load(); }

    Database& GetDatabase() { return *db_; }

    // === Keys (exposed for tests) ===

    static std::string RecordKey(NetworkId network, RefId id);
    static std::string UnfinalizedKey(NetworkId network, RefId id);
    static std::string ProponentKey(NetworkId network, RefId id, const std::string& address);

private:
    std::unique_ptr<Database> db_;

    /// Serializes the read-check-write of UpsertRecord
    std::mutex writeMutex_;

    std::atomic<uint64_t> writes_{0};
};

} // namespace db
} // namespace refindex

#endif // REFINDEX_DB_REFDB_H
