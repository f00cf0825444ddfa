// REFINDEX - Twox Storage Hashers
// Copyright (c) 2024 REFINDEX Developers
// MIT License
//
// Non-cryptographic 64-bit hash (xxHash64 algorithm) and the twox64/twox128
// storage hashers built from it. Used only to spread storage keys, never
// for security.

#ifndef REFINDEX_CRYPTO_TWOX_H
#define REFINDEX_CRYPTO_TWOX_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "refindex/core/types.h"

namespace refindex {

/// 64-bit xxHash64 of data with the given seed
uint64_t TwoxHash64(const Byte* data, size_t len, uint64_t seed);

/// twox64: hash with seed 0, little-endian
std::array<Byte, 8> Twox64(const Byte* data, size_t len);

/// twox128: seed 0 digest followed by seed 1 digest, each little-endian
std::array<Byte, 16> Twox128(const Byte* data, size_t len);

inline std::array<Byte, 16> Twox128(const std::string& str) {
    return Twox128(reinterpret_cast<const Byte*>(str.data()), str.size());
}

inline std::array<Byte, 16> Twox128(const std::vector<Byte>& data) {
    return Twox128(data.data(), data.size());
}

} // namespace refindex

#endif // REFINDEX_CRYPTO_TWOX_H
