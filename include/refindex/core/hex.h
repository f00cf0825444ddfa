// REFINDEX - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 REFINDEX Developers
// MIT License

#ifndef REFINDEX_CORE_HEX_H
#define REFINDEX_CORE_HEX_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace refindex {

/// Convert bytes to lowercase hex (no prefix)
std::string BytesToHex(const uint8_t* data, size_t len);
std::string BytesToHex(const std::vector<uint8_t>& data);

template<size_t N>
std::string BytesToHex(const std::array<uint8_t, N>& data) {
    return BytesToHex(data.data(), N);
}

/// Convert hex string to bytes. Throws std::invalid_argument on bad input.
std::vector<uint8_t> HexToBytes(const std::string& hex);

/// Check if string is valid hex (even length, hex digits only)
bool IsValidHex(const std::string& str);

/**
 * Node-style hex: "0x" followed by lowercase digits.
 * An empty buffer renders as "0x".
 */
std::string ToPrefixedHex(const uint8_t* data, size_t len);
std::string ToPrefixedHex(const std::vector<uint8_t>& data);

/// Parse hex with an optional "0x" prefix. "0x" alone yields an empty vector.
/// Throws std::invalid_argument on bad input.
std::vector<uint8_t> FromPrefixedHex(const std::string& hex);

} // namespace refindex

#endif // REFINDEX_CORE_HEX_H
