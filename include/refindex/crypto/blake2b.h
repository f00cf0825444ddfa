// REFINDEX - BLAKE2b Hash Function
// Copyright (c) 2024 REFINDEX Developers
// MIT License
//
// BLAKE2b implementation following RFC 7693 (unkeyed, variable digest length)

#ifndef REFINDEX_CRYPTO_BLAKE2B_H
#define REFINDEX_CRYPTO_BLAKE2B_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>
#include "refindex/core/types.h"

namespace refindex {

/// BLAKE2b hasher class
/// Provides incremental hashing with a digest length chosen at construction
class Blake2b {
public:
    /// Maximum output size in bytes
    static constexpr size_t MAX_OUTPUT_SIZE = 64;

    /// Block size in bytes
    static constexpr size_t BLOCK_SIZE = 128;

    /// @param outputSize Digest length in bytes, 1..64. Throws std::invalid_argument otherwise.
    explicit Blake2b(size_t outputSize = MAX_OUTPUT_SIZE);

    /// Write data to the hasher
    Blake2b& Write(const Byte* data, size_t len);

    Blake2b& Write(const std::vector<Byte>& data) {
        return Write(data.data(), data.size());
    }

    /// Finalize the hash; writes OutputSize() bytes to hash
    void Finalize(Byte* hash);

    /// Reset hasher to initial state (same digest length)
    Blake2b& Reset();

    size_t OutputSize() const { return outputSize_; }

private:
    uint64_t state_[8];
    Byte buffer_[BLOCK_SIZE];
    size_t bufferLen_;

    /// 128-bit byte counter
    uint64_t counter_[2];

    size_t outputSize_;

    void Compress(const Byte block[BLOCK_SIZE], bool last);
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// 16-byte digest used by the Blake2_128Concat storage hasher
std::array<Byte, 16> Blake2b128(const Byte* data, size_t len);

inline std::array<Byte, 16> Blake2b128(const std::vector<Byte>& data) {
    return Blake2b128(data.data(), data.size());
}

/// 32-byte digest (call and preimage hashes)
Hash256 Blake2b256(const Byte* data, size_t len);

inline Hash256 Blake2b256(const std::vector<Byte>& data) {
    return Blake2b256(data.data(), data.size());
}

/// 64-byte digest (address checksums)
std::array<Byte, 64> Blake2b512(const Byte* data, size_t len);

inline std::array<Byte, 64> Blake2b512(const std::vector<Byte>& data) {
    return Blake2b512(data.data(), data.size());
}

} // namespace refindex

#endif // REFINDEX_CRYPTO_BLAKE2B_H
