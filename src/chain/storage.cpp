// REFINDEX - Storage Addressing Implementation
// Copyright (c) 2024 REFINDEX Developers
// MIT License

#include "refindex/chain/storage.h"

#include "refindex/core/hex.h"
#include "refindex/crypto/blake2b.h"
#include "refindex/crypto/twox.h"

#include <algorithm>

namespace refindex {
namespace chain {

void AppendHashedKey(Bytes& out, StorageHasher hasher, const Bytes& key) {
    switch (hasher) {
        case StorageHasher::Blake2_128Concat: {
            auto hash = Blake2b128(key);
            out.insert(out.end(), hash.begin(), hash.end());
            break;
        }
        case StorageHasher::Twox64Concat: {
            auto hash = Twox64(key.data(), key.size());
            out.insert(out.end(), hash.begin(), hash.end());
            break;
        }
        case StorageHasher::Identity:
            break;
    }
    out.insert(out.end(), key.begin(), key.end());
}

size_t HasherPrefixLength(StorageHasher hasher) {
    switch (hasher) {
        case StorageHasher::Blake2_128Concat: return 16;
        case StorageHasher::Twox64Concat: return 8;
        case StorageHasher::Identity: return 0;
    }
    return 0;
}

Bytes DeriveAddress(const std::string& pallet, const std::string& item) {
    Bytes out;
    out.reserve(32);
    auto palletHash = Twox128(pallet);
    auto itemHash = Twox128(item);
    out.insert(out.end(), palletHash.begin(), palletHash.end());
    out.insert(out.end(), itemHash.begin(), itemHash.end());
    return out;
}

Bytes DeriveAddress(const std::string& pallet, const std::string& item,
                    const Bytes& key, StorageHasher hasher) {
    Bytes out = DeriveAddress(pallet, item);
    AppendHashedKey(out, hasher, key);
    return out;
}

Bytes DeriveAddress(const std::string& pallet, const std::string& item,
                    const std::vector<std::pair<StorageHasher, Bytes>>& keys) {
    Bytes out = DeriveAddress(pallet, item);
    for (const auto& [hasher, key] : keys) {
        AppendHashedKey(out, hasher, key);
    }
    return out;
}

Bytes EncodeU32Key(uint32_t value) {
    return Bytes{
        static_cast<Byte>(value),
        static_cast<Byte>(value >> 8),
        static_cast<Byte>(value >> 16),
        static_cast<Byte>(value >> 24),
    };
}

// ============================================================================
// Referenda Pallet
// ============================================================================

Bytes ReferendumInfoPrefix() {
    return DeriveAddress(REFERENDA_PALLET, REFERENDUM_INFO_ITEM);
}

Bytes ReferendumInfoKey(RefId id) {
    return DeriveAddress(REFERENDA_PALLET, REFERENDUM_INFO_ITEM, EncodeU32Key(id));
}

Bytes ReferendumCountKey() {
    return DeriveAddress(REFERENDA_PALLET, REFERENDUM_COUNT_ITEM);
}

RefId RefIdFromKey(const Bytes& key) {
    if (key.size() != REFERENDUM_INFO_KEY_SIZE) {
        throw DecodeError("ReferendumInfoFor key has " + std::to_string(key.size()) +
                          " bytes, expected " + std::to_string(REFERENDUM_INFO_KEY_SIZE));
    }

    static const Bytes prefix = ReferendumInfoPrefix();
    if (!std::equal(prefix.begin(), prefix.end(), key.begin())) {
        throw DecodeError("Key is not under ReferendumInfoFor: " + ToPrefixedHex(key));
    }

    Bytes idBytes(key.end() - 4, key.end());
    auto expected = Blake2b128(idBytes);
    if (!std::equal(expected.begin(), expected.end(), key.begin() + prefix.size())) {
        throw DecodeError("ReferendumInfoFor key hash mismatch: " + ToPrefixedHex(key));
    }

    return static_cast<RefId>(idBytes[0]) |
           (static_cast<RefId>(idBytes[1]) << 8) |
           (static_cast<RefId>(idBytes[2]) << 16) |
           (static_cast<RefId>(idBytes[3]) << 24);
}

} // namespace chain
} // namespace refindex
