// REFINDEX - Database Backends
// Copyright (c) 2024 REFINDEX Developers
// MIT License
//
// LevelDB implementation of the database interface, plus an in-memory
// implementation for tests and the -inmemory daemon mode.

#ifndef REFINDEX_DB_LEVELDB_H
#define REFINDEX_DB_LEVELDB_H

#include "refindex/db/database.h"

#include <leveldb/cache.h>
#include <leveldb/db.h>
#include <leveldb/filter_policy.h>
#include <leveldb/write_batch.h>

#include <map>
#include <memory>
#include <mutex>

namespace refindex {
namespace db {

// ============================================================================
// LevelDB Database Implementation
// ============================================================================

class LevelDBDatabase : public Database {
public:
    /// Takes ownership of db, cache and filter
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                    const leveldb::FilterPolicy* filter,
                    const std::filesystem::path& path);

    ~LevelDBDatabase() override;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;

    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;

    Status Delete(const WriteOptions& options, const Slice& key) override;

    Status Write(const WriteOptions& options, WriteBatch* batch) override;

    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    std::string GetStats() const override;

    const std::filesystem::path& GetPath() const { return path_; }

    static Status ConvertStatus(const leveldb::Status& s);

private:
    // Declaration order matters: the DB must close before its cache and filter
    std::unique_ptr<const leveldb::FilterPolicy> filterPolicy_;
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<leveldb::DB> db_;
    std::filesystem::path path_;
};

// ============================================================================
// In-Memory Database
// ============================================================================

/**
 * std::map-backed database. Iterators work on a snapshot taken when they
 * are created, so concurrent writers never invalidate them.
 */
class MemoryDatabase : public Database {
public:
    MemoryDatabase() = default;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;

    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;

    Status Delete(const WriteOptions& options, const Slice& key) override;

    Status Write(const WriteOptions& options, WriteBatch* batch) override;

    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    size_t Size() const;

    void Clear();

    /// Number of successful Put/Delete/Write calls (tests count writes)
    uint64_t WriteCount() const;

private:
    std::map<std::string, std::string> data_;
    uint64_t writes_{0};
    mutable std::mutex mutex_;
};

} // namespace db
} // namespace refindex

#endif // REFINDEX_DB_LEVELDB_H
