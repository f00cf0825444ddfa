// REFINDEX - BLAKE2b Implementation
// Copyright (c) 2024 REFINDEX Developers
// MIT License
//
// BLAKE2b implementation following RFC 7693
// Reference: https://www.rfc-editor.org/rfc/rfc7693

#include "refindex/crypto/blake2b.h"
#include <cstring>
#include <stdexcept>

namespace refindex {

// ============================================================================
// BLAKE2b Constants
// ============================================================================

namespace {

/// Initialization vector (same words as the SHA-512 IV)
constexpr uint64_t BLAKE2B_IV[8] = {
    0x6a09e667f3bcc908ULL, 0xbb67ae8584caa73bULL,
    0x3c6ef372fe94f82bULL, 0xa54ff53a5f1d36f1ULL,
    0x510e527fade682d1ULL, 0x9b05688c2b3e6c1fULL,
    0x1f83d9abfb41bd6bULL, 0x5be0cd19137e2179ULL
};

/// Message word permutation per round
constexpr uint8_t SIGMA[12][16] = {
    { 0,  1,  2,  3,  4,  5,  6,  7,  8,  9, 10, 11, 12, 13, 14, 15},
    {14, 10,  4,  8,  9, 15, 13,  6,  1, 12,  0,  2, 11,  7,  5,  3},
    {11,  8, 12,  0,  5,  2, 15, 13, 10, 14,  3,  6,  7,  1,  9,  4},
    { 7,  9,  3,  1, 13, 12, 11, 14,  2,  6,  5, 10,  4,  0, 15,  8},
    { 9,  0,  5,  7,  2,  4, 10, 15, 14,  1, 11, 12,  6,  8,  3, 13},
    { 2, 12,  6, 10,  0, 11,  8,  3,  4, 13,  7,  5, 15, 14,  1,  9},
    {12,  5,  1, 15, 14, 13,  4, 10,  0,  7,  6,  3,  9,  2,  8, 11},
    {13, 11,  7, 14, 12,  1,  3,  9,  5,  0, 15,  4,  8,  6,  2, 10},
    { 6, 15, 14,  9, 11,  3,  0,  8, 12,  2, 13,  7,  1,  4, 10,  5},
    {10,  2,  8,  4,  7,  6,  1,  5, 15, 11,  9, 14,  3, 12, 13,  0},
    { 0,  1,  2,  3,  4,  5,  6,  7,  8,  9, 10, 11, 12, 13, 14, 15},
    {14, 10,  4,  8,  9, 15, 13,  6,  1, 12,  0,  2, 11,  7,  5,  3}
};

// ============================================================================
// Helper Functions
// ============================================================================

inline uint64_t ROTR64(uint64_t x, int n) {
    return (x >> n) | (x << (64 - n));
}

inline uint64_t ReadLE64(const Byte* p) {
    return static_cast<uint64_t>(p[0]) |
           (static_cast<uint64_t>(p[1]) << 8) |
           (static_cast<uint64_t>(p[2]) << 16) |
           (static_cast<uint64_t>(p[3]) << 24) |
           (static_cast<uint64_t>(p[4]) << 32) |
           (static_cast<uint64_t>(p[5]) << 40) |
           (static_cast<uint64_t>(p[6]) << 48) |
           (static_cast<uint64_t>(p[7]) << 56);
}

/// Mixing function G
inline void G(uint64_t v[16], int a, int b, int c, int d, uint64_t x, uint64_t y) {
    v[a] = v[a] + v[b] + x;
    v[d] = ROTR64(v[d] ^ v[a], 32);
    v[c] = v[c] + v[d];
    v[b] = ROTR64(v[b] ^ v[c], 24);
    v[a] = v[a] + v[b] + y;
    v[d] = ROTR64(v[d] ^ v[a], 16);
    v[c] = v[c] + v[d];
    v[b] = ROTR64(v[b] ^ v[c], 63);
}

} // namespace

// ============================================================================
// Blake2b Class Implementation
// ============================================================================

Blake2b::Blake2b(size_t outputSize) : outputSize_(outputSize) {
    if (outputSize == 0 || outputSize > MAX_OUTPUT_SIZE) {
        throw std::invalid_argument("Blake2b: output size must be between 1 and 64");
    }
    Reset();
}

Blake2b& Blake2b::Reset() {
    std::memcpy(state_, BLAKE2B_IV, sizeof(state_));
    // Parameter block: digest length, no key, fanout 1, depth 1
    state_[0] ^= 0x01010000ULL ^ static_cast<uint64_t>(outputSize_);
    std::memset(buffer_, 0, sizeof(buffer_));
    bufferLen_ = 0;
    counter_[0] = 0;
    counter_[1] = 0;
    return *this;
}

void Blake2b::Compress(const Byte block[BLOCK_SIZE], bool last) {
    uint64_t m[16];
    uint64_t v[16];

    for (int i = 0; i < 16; ++i) {
        m[i] = ReadLE64(block + 8 * i);
    }
    for (int i = 0; i < 8; ++i) {
        v[i] = state_[i];
        v[i + 8] = BLAKE2B_IV[i];
    }

    v[12] ^= counter_[0];
    v[13] ^= counter_[1];
    if (last) {
        v[14] = ~v[14];
    }

    for (int r = 0; r < 12; ++r) {
        const uint8_t* s = SIGMA[r];
        G(v, 0, 4,  8, 12, m[s[0]],  m[s[1]]);
        G(v, 1, 5,  9, 13, m[s[2]],  m[s[3]]);
        G(v, 2, 6, 10, 14, m[s[4]],  m[s[5]]);
        G(v, 3, 7, 11, 15, m[s[6]],  m[s[7]]);
        G(v, 0, 5, 10, 15, m[s[8]],  m[s[9]]);
        G(v, 1, 6, 11, 12, m[s[10]], m[s[11]]);
        G(v, 2, 7,  8, 13, m[s[12]], m[s[13]]);
        G(v, 3, 4,  9, 14, m[s[14]], m[s[15]]);
    }

    for (int i = 0; i < 8; ++i) {
        state_[i] ^= v[i] ^ v[i + 8];
    }
}

Blake2b& Blake2b::Write(const Byte* data, size_t len) {
    if (data == nullptr || len == 0) {
        return *this;
    }

    while (len > 0) {
        // The final block must go through Compress(last=true), so a full
        // buffer is only flushed once more input is known to follow.
        if (bufferLen_ == BLOCK_SIZE) {
            counter_[0] += BLOCK_SIZE;
            if (counter_[0] < BLOCK_SIZE) {
                ++counter_[1];
            }
            Compress(buffer_, false);
            bufferLen_ = 0;
        }

        size_t take = BLOCK_SIZE - bufferLen_;
        if (take > len) {
            take = len;
        }
        std::memcpy(buffer_ + bufferLen_, data, take);
        bufferLen_ += take;
        data += take;
        len -= take;
    }

    return *this;
}

void Blake2b::Finalize(Byte* hash) {
    counter_[0] += bufferLen_;
    if (counter_[0] < bufferLen_) {
        ++counter_[1];
    }

    std::memset(buffer_ + bufferLen_, 0, BLOCK_SIZE - bufferLen_);
    Compress(buffer_, true);

    for (size_t i = 0; i < outputSize_; ++i) {
        hash[i] = static_cast<Byte>(state_[i / 8] >> (8 * (i % 8)));
    }
}

// ============================================================================
// Convenience Functions
// ============================================================================

std::array<Byte, 16> Blake2b128(const Byte* data, size_t len) {
    std::array<Byte, 16> out;
    Blake2b(16).Write(data, len).Finalize(out.data());
    return out;
}

Hash256 Blake2b256(const Byte* data, size_t len) {
    Hash256 out;
    Blake2b(32).Write(data, len).Finalize(out.data());
    return out;
}

std::array<Byte, 64> Blake2b512(const Byte* data, size_t len) {
    std::array<Byte, 64> out;
    Blake2b(64).Write(data, len).Finalize(out.data());
    return out;
}

} // namespace refindex
