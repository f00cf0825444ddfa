// REFINDEX - Storage Addressing
// Copyright (c) 2024 REFINDEX Developers
// MIT License
//
// Computes chain storage keys without a round trip:
//
//   twox128(pallet) ++ twox128(item) [++ hasher(key)]...
//
// where twox128 is xxHash64 with seeds 0 and 1 concatenated little-endian,
// and the default map hasher is Blake2_128Concat (blake2b_128(key) ++ key).

#ifndef REFINDEX_CHAIN_STORAGE_H
#define REFINDEX_CHAIN_STORAGE_H

#include "refindex/core/types.h"

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace refindex {
namespace chain {

/// A payload or storage key that does not match the expected layout
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& msg) : std::runtime_error(msg) {}
};

// ============================================================================
// Hashers
// ============================================================================

enum class StorageHasher {
    Blake2_128Concat,   // blake2b_128(key) ++ key
    Twox64Concat,       // twox64(key) ++ key
    Identity            // key
};

/// Apply hasher to key and append the result to out
void AppendHashedKey(Bytes& out, StorageHasher hasher, const Bytes& key);

/// Number of hash bytes the hasher places before the raw key
size_t HasherPrefixLength(StorageHasher hasher);

// ============================================================================
// Addressing
// ============================================================================

/// Address of a plain storage value, also the prefix of a map
Bytes DeriveAddress(const std::string& pallet, const std::string& item);

/// Address of one entry of a single-key map
Bytes DeriveAddress(const std::string& pallet, const std::string& item,
                    const Bytes& key,
                    StorageHasher hasher = StorageHasher::Blake2_128Concat);

/// Address of one entry of a multi-key map (double map, n-map)
Bytes DeriveAddress(const std::string& pallet, const std::string& item,
                    const std::vector<std::pair<StorageHasher, Bytes>>& keys);

/// SCALE (little-endian) encoding of a u32 key
Bytes EncodeU32Key(uint32_t value);

// ============================================================================
// Referenda Pallet
// ============================================================================

constexpr const char* REFERENDA_PALLET = "Referenda";
constexpr const char* REFERENDUM_INFO_ITEM = "ReferendumInfoFor";
constexpr const char* REFERENDUM_COUNT_ITEM = "ReferendumCount";

/// 16 + 16 prefix bytes, 16 hash bytes, 4 id bytes
constexpr size_t REFERENDUM_INFO_KEY_SIZE = 52;

/// Common prefix of every ReferendumInfoFor entry
Bytes ReferendumInfoPrefix();

/// ReferendumInfoFor(id), hashed with Blake2_128Concat
Bytes ReferendumInfoKey(RefId id);

/// ReferendumCount storage value
Bytes ReferendumCountKey();

/**
 * Recover the referendum id from a full ReferendumInfoFor key.
 * Throws DecodeError if the key has the wrong length or prefix, or if its
 * hash bytes do not match the trailing id.
 */
RefId RefIdFromKey(const Bytes& key);

} // namespace chain
} // namespace refindex

#endif // REFINDEX_CHAIN_STORAGE_H
