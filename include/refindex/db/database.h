// REFINDEX - Database Abstraction Layer
// Copyright (c) 2024 REFINDEX Developers
// MIT License
//
// Abstract ordered key-value store. The record store sits on top of this;
// LevelDB backs it on disk and MemoryDatabase backs tests and -inmemory.

#ifndef REFINDEX_DB_DATABASE_H
#define REFINDEX_DB_DATABASE_H

#include "refindex/core/serialize.h"
#include "refindex/core/types.h"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace refindex {
namespace db {

// ============================================================================
// Database Status - Result of database operations
// ============================================================================

class Status {
public:
    enum Code {
        OK = 0,
        NOT_FOUND = 1,
        CORRUPTION = 2,
        NOT_SUPPORTED = 3,
        INVALID_ARGUMENT = 4,
        IO_ERROR = 5,
    };

    Status() : code_(OK) {}
    Status(Code code, const std::string& msg = "") : code_(code), message_(msg) {}

    static Status Ok() { return Status(); }
    static Status NotFound(const std::string& msg = "") { return Status(NOT_FOUND, msg); }
    static Status Corruption(const std::string& msg = "") { return Status(CORRUPTION, msg); }
    static Status NotSupported(const std::string& msg = "") { return Status(NOT_SUPPORTED, msg); }
    static Status InvalidArgument(const std::string& msg = "") { return Status(INVALID_ARGUMENT, msg); }
    static Status IOError(const std::string& msg = "") { return Status(IO_ERROR, msg); }

    bool ok() const { return code_ == OK; }
    bool IsNotFound() const { return code_ == NOT_FOUND; }
    bool IsCorruption() const { return code_ == CORRUPTION; }
    bool IsIOError() const { return code_ == IO_ERROR; }
    bool IsInvalidArgument() const { return code_ == INVALID_ARGUMENT; }

    Code code() const { return code_; }
    const std::string& message() const { return message_; }

    std::string ToString() const;

private:
    Code code_;
    std::string message_;
};

// ============================================================================
// Slice - A reference to a byte range
// ============================================================================

/**
 * Non-owning view of a byte range; the buffer must outlive the Slice.
 */
class Slice {
public:
    Slice() : data_(""), size_(0) {}
    Slice(const char* d, size_t n) : data_(d), size_(n) {}
    Slice(const std::string& s) : data_(s.data()), size_(s.size()) {}
    Slice(const std::vector<uint8_t>& v)
        : data_(reinterpret_cast<const char*>(v.data())), size_(v.size()) {}
    Slice(const char* s) : data_(s), size_(std::strlen(s)) {}

    const char* data() const { return data_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    char operator[](size_t n) const { return data_[n]; }

    std::string ToString() const { return std::string(data_, size_); }

    bool starts_with(const Slice& prefix) const {
        return size_ >= prefix.size_ && std::memcmp(data_, prefix.data_, prefix.size_) == 0;
    }

    int compare(const Slice& b) const {
        size_t minLen = std::min(size_, b.size_);
        int r = minLen == 0 ? 0 : std::memcmp(data_, b.data_, minLen);
        if (r == 0) {
            if (size_ < b.size_) r = -1;
            else if (size_ > b.size_) r = +1;
        }
        return r;
    }

    bool operator==(const Slice& b) const { return compare(b) == 0; }
    bool operator!=(const Slice& b) const { return !(*this == b); }

private:
    const char* data_;
    size_t size_;
};

// ============================================================================
// Database Options
// ============================================================================

struct Options {
    /// Create the database if it doesn't exist
    bool create_if_missing = true;

    /// Verify internal consistency aggressively
    bool paranoid_checks = false;

    /// Write buffer size (default 4MB)
    size_t write_buffer_size = 4 * 1024 * 1024;

    /// Maximum number of open files
    int max_open_files = 256;

    /// LRU cache size for blocks (default 8MB)
    size_t block_cache_size = 8 * 1024 * 1024;

    /// Snappy compression
    bool compression = true;

    /// Bloom filter bits per key (0 to disable)
    int bloom_filter_bits = 10;
};

struct ReadOptions {
    bool verify_checksums = false;
    bool fill_cache = true;
};

struct WriteOptions {
    /// Sync write to disk before returning
    bool sync = false;
};

// ============================================================================
// WriteBatch - Atomic batch of write operations
// ============================================================================

class WriteBatch {
public:
    WriteBatch() = default;

    void Put(const Slice& key, const Slice& value) {
        operations_.emplace_back(key.ToString(), value.ToString());
    }

    void Delete(const Slice& key) {
        operations_.emplace_back(key.ToString(), std::nullopt);
    }

    void Clear() { operations_.clear(); }

    size_t Count() const { return operations_.size(); }

    bool Empty() const { return operations_.empty(); }

    /// Visit operations in insertion order; a nullopt value is a delete
    template<typename Func>
    void Iterate(Func&& func) const {
        for (const auto& [key, value] : operations_) {
            func(key, value);
        }
    }

private:
    std::vector<std::pair<std::string, std::optional<std::string>>> operations_;
};

// ============================================================================
// Iterator - Database iterator interface
// ============================================================================

class Iterator {
public:
    virtual ~Iterator() = default;

    virtual bool Valid() const = 0;

    virtual void SeekToFirst() = 0;

    virtual void SeekToLast() = 0;

    /// Position at the first key >= target
    virtual void Seek(const Slice& target) = 0;

    virtual void Next() = 0;

    virtual void Prev() = 0;

    virtual Slice key() const = 0;

    virtual Slice value() const = 0;

    virtual Status status() const = 0;
};

// ============================================================================
// Database - Abstract database interface
// ============================================================================

/**
 * Ordered key-value store. Implementations are safe for concurrent use.
 */
class Database {
public:
    virtual ~Database() = default;

    virtual Status Get(const ReadOptions& options, const Slice& key, std::string* value) = 0;

    Status Get(const Slice& key, std::string* value) {
        return Get(ReadOptions(), key, value);
    }

    virtual Status Put(const WriteOptions& options, const Slice& key, const Slice& value) = 0;

    Status Put(const Slice& key, const Slice& value) {
        return Put(WriteOptions(), key, value);
    }

    virtual Status Delete(const WriteOptions& options, const Slice& key) = 0;

    Status Delete(const Slice& key) {
        return Delete(WriteOptions(), key);
    }

    /// Apply a batch of writes atomically
    virtual Status Write(const WriteOptions& options, WriteBatch* batch) = 0;

    Status Write(WriteBatch* batch) {
        return Write(WriteOptions(), batch);
    }

    virtual std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) = 0;

    std::unique_ptr<Iterator> NewIterator() {
        return NewIterator(ReadOptions());
    }

    virtual bool Exists(const Slice& key) {
        std::string value;
        return Get(key, &value).ok();
    }

    /// Engine statistics for diagnostics (may be empty)
    virtual std::string GetStats() const { return ""; }
};

// ============================================================================
// Database Factory Functions
// ============================================================================

/**
 * Open (creating if allowed) a LevelDB database at path.
 * @return Pair of (status, database pointer); the pointer is null on failure
 */
std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options = Options());

/// Delete every file of the database at path
Status DestroyDatabase(const std::filesystem::path& path);

// ============================================================================
// Serialization Helpers
// ============================================================================

template<typename T>
std::string SerializeToString(const T& obj) {
    DataStream ss;
    Serialize(ss, obj);
    return std::string(reinterpret_cast<const char*>(ss.data()), ss.size());
}

/**
 * Deserialize an object from a byte string.
 * @return false on truncated or malformed input, or trailing bytes
 */
template<typename T>
bool DeserializeFromString(const std::string& data, T& obj) {
    try {
        DataStream ss(reinterpret_cast<const uint8_t*>(data.data()), data.size());
        Unserialize(ss, obj);
        return ss.empty();
    } catch (const std::ios_base::failure&) {
        return false;
    }
}

} // namespace db
} // namespace refindex

#endif // REFINDEX_DB_DATABASE_H
