// REFINDEX - Core Types Header
// Copyright (c) 2024 REFINDEX Developers
// MIT License
//
// Fundamental types shared by the chain, storage and indexer layers.

#ifndef REFINDEX_CORE_TYPES_H
#define REFINDEX_CORE_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace refindex {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Owned byte buffer (storage keys, raw payloads)
using Bytes = std::vector<Byte>;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// Chain block number
using BlockNumber = uint32_t;

/// Network identifier (small integer, configured per chain)
using NetworkId = uint32_t;

/// Referendum index assigned by the chain
using RefId = uint32_t;

/// 32-byte hash (blake2b-256 output, block hashes)
using Hash256 = std::array<Byte, 32>;

/// Raw 32-byte account public key
using AccountId = std::array<Byte, 32>;

/// Unsigned 128-bit balance as carried by the chain
using U128 = unsigned __int128;

/// Decimal rendering of a 128-bit value
std::string U128ToString(U128 value);

/// Parse a decimal string; returns false on empty input, junk or overflow
bool ParseU128(const std::string& str, U128& out);

} // namespace refindex

#endif // REFINDEX_CORE_TYPES_H
