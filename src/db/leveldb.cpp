// REFINDEX - LevelDB Backend Implementation
// Copyright (c) 2024 REFINDEX Developers
// MIT License

#include "refindex/db/leveldb.h"

namespace refindex {
namespace db {

namespace {

class LevelDBIterator : public Iterator {
public:
    explicit LevelDBIterator(leveldb::Iterator* iter) : iter_(iter) {}

    bool Valid() const override { return iter_->Valid(); }

    void SeekToFirst() override { iter_->SeekToFirst(); }
    void SeekToLast() override { iter_->SeekToLast(); }
    void Seek(const Slice& target) override {
        iter_->Seek(leveldb::Slice(target.data(), target.size()));
    }

    void Next() override { iter_->Next(); }
    void Prev() override { iter_->Prev(); }

    Slice key() const override {
        leveldb::Slice k = iter_->key();
        return Slice(k.data(), k.size());
    }

    Slice value() const override {
        leveldb::Slice v = iter_->value();
        return Slice(v.data(), v.size());
    }

    Status status() const override {
        return LevelDBDatabase::ConvertStatus(iter_->status());
    }

private:
    std::unique_ptr<leveldb::Iterator> iter_;
};

leveldb::ReadOptions MakeReadOptions(const ReadOptions& opts) {
    leveldb::ReadOptions lo;
    lo.verify_checksums = opts.verify_checksums;
    lo.fill_cache = opts.fill_cache;
    return lo;
}

leveldb::WriteOptions MakeWriteOptions(const WriteOptions& opts) {
    leveldb::WriteOptions lo;
    lo.sync = opts.sync;
    return lo;
}

} // namespace

LevelDBDatabase::LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                                 const leveldb::FilterPolicy* filter,
                                 const std::filesystem::path& path)
    : filterPolicy_(filter), cache_(cache), db_(db), path_(path) {}

LevelDBDatabase::~LevelDBDatabase() = default;

Status LevelDBDatabase::ConvertStatus(const leveldb::Status& s) {
    if (s.ok()) return Status::Ok();
    if (s.IsNotFound()) return Status::NotFound(s.ToString());
    if (s.IsCorruption()) return Status::Corruption(s.ToString());
    if (s.IsIOError()) return Status::IOError(s.ToString());
    if (s.IsNotSupportedError()) return Status::NotSupported(s.ToString());
    if (s.IsInvalidArgument()) return Status::InvalidArgument(s.ToString());
    return Status::IOError(s.ToString());
}

Status LevelDBDatabase::Get(const ReadOptions& options, const Slice& key, std::string* value) {
    return ConvertStatus(db_->Get(MakeReadOptions(options),
                                  leveldb::Slice(key.data(), key.size()), value));
}

Status LevelDBDatabase::Put(const WriteOptions& options, const Slice& key, const Slice& value) {
    return ConvertStatus(db_->Put(MakeWriteOptions(options),
                                  leveldb::Slice(key.data(), key.size()),
                                  leveldb::Slice(value.data(), value.size())));
}

Status LevelDBDatabase::Delete(const WriteOptions& options, const Slice& key) {
    return ConvertStatus(db_->Delete(MakeWriteOptions(options),
                                     leveldb::Slice(key.data(), key.size())));
}

Status LevelDBDatabase::Write(const WriteOptions& options, WriteBatch* batch) {
    leveldb::WriteBatch lb;
    batch->Iterate([&lb](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            lb.Put(key, *value);
        } else {
            lb.Delete(key);
        }
    });
    return ConvertStatus(db_->Write(MakeWriteOptions(options), &lb));
}

std::unique_ptr<Iterator> LevelDBDatabase::NewIterator(const ReadOptions& options) {
    return std::make_unique<LevelDBIterator>(db_->NewIterator(MakeReadOptions(options)));
}

std::string LevelDBDatabase::GetStats() const {
    std::string stats;
    if (!db_->GetProperty("leveldb.stats", &stats)) {
        return "";
    }
    return stats;
}

// ============================================================================
// Database Factory Functions
// ============================================================================

std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options)
{
    if (options.create_if_missing) {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec) {
            return {Status::IOError("Cannot create " + path.string() + ": " + ec.message()),
                    nullptr};
        }
    }

    leveldb::Options lo;
    lo.create_if_missing = options.create_if_missing;
    lo.paranoid_checks = options.paranoid_checks;
    lo.write_buffer_size = options.write_buffer_size;
    lo.max_open_files = options.max_open_files;
    lo.compression = options.compression ? leveldb::kSnappyCompression
                                         : leveldb::kNoCompression;

    std::unique_ptr<leveldb::Cache> cache;
    if (options.block_cache_size > 0) {
        cache.reset(leveldb::NewLRUCache(options.block_cache_size));
        lo.block_cache = cache.get();
    }

    std::unique_ptr<const leveldb::FilterPolicy> filter;
    if (options.bloom_filter_bits > 0) {
        filter.reset(leveldb::NewBloomFilterPolicy(options.bloom_filter_bits));
        lo.filter_policy = filter.get();
    }

    leveldb::DB* raw = nullptr;
    leveldb::Status s = leveldb::DB::Open(lo, path.string(), &raw);
    if (!s.ok()) {
        return {LevelDBDatabase::ConvertStatus(s), nullptr};
    }

    return {Status::Ok(),
            std::make_unique<LevelDBDatabase>(raw, cache.release(), filter.release(), path)};
}

Status DestroyDatabase(const std::filesystem::path& path) {
    return LevelDBDatabase::ConvertStatus(leveldb::DestroyDB(path.string(), leveldb::Options()));
}

} // namespace db
} // namespace refindex
