// REFINDEX - Twox Storage Hashers Implementation
// Copyright (c) 2024 REFINDEX Developers
// MIT License

#include "refindex/crypto/twox.h"

namespace refindex {

namespace {

constexpr uint64_t PRIME64_1 = 0x9E3779B185EBCA87ULL;
constexpr uint64_t PRIME64_2 = 0xC2B2AE3D27D4EB4FULL;
constexpr uint64_t PRIME64_3 = 0x165667B19E3779F9ULL;
constexpr uint64_t PRIME64_4 = 0x85EBCA77C2B2AE63ULL;
constexpr uint64_t PRIME64_5 = 0x27D4EB2F165667C5ULL;

inline uint64_t ROTL64(uint64_t x, int r) {
    return (x << r) | (x >> (64 - r));
}

inline uint64_t ReadLE64(const Byte* p) {
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i) {
        v = (v << 8) | p[i];
    }
    return v;
}

inline uint32_t ReadLE32(const Byte* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

inline void WriteLE64(Byte* p, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        p[i] = static_cast<Byte>(v >> (8 * i));
    }
}

inline uint64_t Round(uint64_t acc, uint64_t lane) {
    acc += lane * PRIME64_2;
    acc = ROTL64(acc, 31);
    return acc * PRIME64_1;
}

inline uint64_t MergeRound(uint64_t acc, uint64_t val) {
    acc ^= Round(0, val);
    return acc * PRIME64_1 + PRIME64_4;
}

} // namespace

uint64_t TwoxHash64(const Byte* data, size_t len, uint64_t seed) {
    const Byte* p = data;
    const Byte* end = data + len;
    uint64_t h;

    if (len >= 32) {
        uint64_t v1 = seed + PRIME64_1 + PRIME64_2;
        uint64_t v2 = seed + PRIME64_2;
        uint64_t v3 = seed;
        uint64_t v4 = seed - PRIME64_1;

        const Byte* limit = end - 32;
        do {
            v1 = Round(v1, ReadLE64(p));
            v2 = Round(v2, ReadLE64(p + 8));
            v3 = Round(v3, ReadLE64(p + 16));
            v4 = Round(v4, ReadLE64(p + 24));
            p += 32;
        } while (p <= limit);

        h = ROTL64(v1, 1) + ROTL64(v2, 7) + ROTL64(v3, 12) + ROTL64(v4, 18);
        h = MergeRound(h, v1);
        h = MergeRound(h, v2);
        h = MergeRound(h, v3);
        h = MergeRound(h, v4);
    } else {
        h = seed + PRIME64_5;
    }

    h += static_cast<uint64_t>(len);

    while (p + 8 <= end) {
        h ^= Round(0, ReadLE64(p));
        h = ROTL64(h, 27) * PRIME64_1 + PRIME64_4;
        p += 8;
    }

    if (p + 4 <= end) {
        h ^= static_cast<uint64_t>(ReadLE32(p)) * PRIME64_1;
        h = ROTL64(h, 23) * PRIME64_2 + PRIME64_3;
        p += 4;
    }

    while (p < end) {
        h ^= static_cast<uint64_t>(*p) * PRIME64_5;
        h = ROTL64(h, 11) * PRIME64_1;
        ++p;
    }

    // Avalanche
    h ^= h >> 33;
    h *= PRIME64_2;
    h ^= h >> 29;
    h *= PRIME64_3;
    h ^= h >> 32;

    return h;
}

std::array<Byte, 8> Twox64(const Byte* data, size_t len) {
    std::array<Byte, 8> out;
    WriteLE64(out.data(), TwoxHash64(data, len, 0));
    return out;
}

std::array<Byte, 16> Twox128(const Byte* data, size_t len) {
    std::array<Byte, 16> out;
    WriteLE64(out.data(), TwoxHash64(data, len, 0));
    WriteLE64(out.data() + 8, TwoxHash64(data, len, 1));
    return out;
}

} // namespace refindex
