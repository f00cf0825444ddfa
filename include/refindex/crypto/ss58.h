// REFINDEX - SS58 Address Encoding
// Copyright (c) 2024 REFINDEX Developers
// MIT License

#ifndef REFINDEX_CRYPTO_SS58_H
#define REFINDEX_CRYPTO_SS58_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "refindex/core/types.h"

namespace refindex {

/// Generic substrate address prefix
constexpr uint16_t SS58_GENERIC_PREFIX = 42;

/// Highest prefix representable in the one-byte form
constexpr uint16_t SS58_MAX_SIMPLE_PREFIX = 63;

/// Encode raw bytes as Base58 (bitcoin alphabet)
std::string EncodeBase58(const std::vector<uint8_t>& data);

/// Decode Base58; returns std::nullopt on invalid characters
std::optional<std::vector<uint8_t>> DecodeBase58(const std::string& str);

/**
 * Encode an account as an SS58 address:
 * base58(prefix || account || blake2b512("SS58PRE" || prefix || account)[0..2]).
 *
 * Prefixes 0..63 use the one-byte form, 64..16383 the two-byte form.
 * Throws std::invalid_argument for prefixes above 16383.
 */
std::string EncodeSS58(const AccountId& account, uint16_t prefix = SS58_GENERIC_PREFIX);

/// Decode an SS58 address back to its account; verifies the checksum.
/// On success prefix receives the network prefix.
std::optional<AccountId> DecodeSS58(const std::string& address, uint16_t* prefix = nullptr);

} // namespace refindex

#endif // REFINDEX_CRYPTO_SS58_H
