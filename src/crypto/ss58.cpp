// REFINDEX - SS58 Address Encoding Implementation
// Copyright (c) 2024 REFINDEX Developers
// MIT License

#include "refindex/crypto/ss58.h"
#include "refindex/crypto/blake2b.h"

#include <cstring>
#include <stdexcept>

namespace refindex {

// ============================================================================
// Base58 Implementation
// ============================================================================

namespace {

const char* BASE58_ALPHABET = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

const int8_t BASE58_MAP[256] = {
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1, 0, 1, 2, 3, 4, 5, 6,  7, 8,-1,-1,-1,-1,-1,-1,
    -1, 9,10,11,12,13,14,15, 16,-1,17,18,19,20,21,-1,
    22,23,24,25,26,27,28,29, 30,31,32,-1,-1,-1,-1,-1,
    -1,33,34,35,36,37,38,39, 40,41,42,43,-1,44,45,46,
    47,48,49,50,51,52,53,54, 55,56,57,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
};

constexpr char SS58_CONTEXT[] = "SS58PRE";
constexpr size_t SS58_CHECKSUM_SIZE = 2;

std::vector<uint8_t> EncodePrefix(uint16_t prefix) {
    if (prefix <= SS58_MAX_SIMPLE_PREFIX) {
        return {static_cast<uint8_t>(prefix)};
    }
    if (prefix > 0x3FFF) {
        throw std::invalid_argument("SS58 prefix out of range: " + std::to_string(prefix));
    }
    uint8_t first = static_cast<uint8_t>(((prefix & 0x00FC) >> 2) | 0x40);
    uint8_t second = static_cast<uint8_t>((prefix >> 8) | ((prefix & 0x0003) << 6));
    return {first, second};
}

std::array<uint8_t, 64> Checksum(const std::vector<uint8_t>& body) {
    Blake2b hasher(64);
    hasher.Write(reinterpret_cast<const Byte*>(SS58_CONTEXT), sizeof(SS58_CONTEXT) - 1);
    hasher.Write(body.data(), body.size());
    std::array<uint8_t, 64> out;
    hasher.Finalize(out.data());
    return out;
}

} // namespace

std::string EncodeBase58(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        return "";
    }

    // Count leading zeros
    size_t zeroes = 0;
    while (zeroes < data.size() && data[zeroes] == 0) {
        ++zeroes;
    }

    // log(256) / log(58), rounded up
    size_t capacity = (data.size() - zeroes) * 138 / 100 + 1;
    std::vector<uint8_t> b58(capacity);
    size_t length = 0;

    for (size_t i = zeroes; i < data.size(); ++i) {
        int carry = data[i];
        size_t j = 0;
        for (auto it = b58.rbegin(); (carry != 0 || j < length) && it != b58.rend(); ++it, ++j) {
            carry += 256 * (*it);
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        length = j;
    }

    auto it = b58.begin() + (b58.size() - length);
    while (it != b58.end() && *it == 0) {
        ++it;
    }

    std::string str;
    str.reserve(zeroes + (b58.end() - it));
    str.assign(zeroes, '1');
    while (it != b58.end()) {
        str += BASE58_ALPHABET[*it++];
    }

    return str;
}

std::optional<std::vector<uint8_t>> DecodeBase58(const std::string& str) {
    size_t zeroes = 0;
    while (zeroes < str.size() && str[zeroes] == '1') {
        ++zeroes;
    }

    size_t capacity = (str.size() - zeroes) * 733 / 1000 + 1;
    std::vector<uint8_t> b256(capacity);
    size_t length = 0;

    for (size_t i = zeroes; i < str.size(); ++i) {
        int carry = BASE58_MAP[static_cast<uint8_t>(str[i])];
        if (carry < 0) {
            return std::nullopt;
        }
        size_t j = 0;
        for (auto it = b256.rbegin(); (carry != 0 || j < length) && it != b256.rend(); ++it, ++j) {
            carry += 58 * (*it);
            *it = static_cast<uint8_t>(carry % 256);
            carry /= 256;
        }
        length = j;
    }

    auto it = b256.begin() + (b256.size() - length);
    while (it != b256.end() && *it == 0) {
        ++it;
    }

    std::vector<uint8_t> result;
    result.reserve(zeroes + (b256.end() - it));
    result.assign(zeroes, 0x00);
    while (it != b256.end()) {
        result.push_back(*it++);
    }

    return result;
}

// ============================================================================
// SS58
// ============================================================================

std::string EncodeSS58(const AccountId& account, uint16_t prefix) {
    std::vector<uint8_t> body = EncodePrefix(prefix);
    body.insert(body.end(), account.begin(), account.end());

    auto hash = Checksum(body);
    body.insert(body.end(), hash.begin(), hash.begin() + SS58_CHECKSUM_SIZE);

    return EncodeBase58(body);
}

std::optional<AccountId> DecodeSS58(const std::string& address, uint16_t* prefix) {
    auto raw = DecodeBase58(address);
    if (!raw || raw->empty()) {
        return std::nullopt;
    }
    const std::vector<uint8_t>& data = *raw;

    size_t prefixLen = (data[0] & 0x40) ? 2 : 1;
    if (data.size() != prefixLen + 32 + SS58_CHECKSUM_SIZE) {
        return std::nullopt;
    }

    uint16_t decodedPrefix;
    if (prefixLen == 1) {
        decodedPrefix = data[0];
    } else {
        uint8_t lower = static_cast<uint8_t>((data[0] << 2) | (data[1] >> 6));
        uint8_t upper = data[1] & 0x3F;
        decodedPrefix = static_cast<uint16_t>(lower | (upper << 8));
    }

    std::vector<uint8_t> body(data.begin(), data.end() - SS58_CHECKSUM_SIZE);
    auto hash = Checksum(body);
    if (std::memcmp(hash.data(), data.data() + body.size(), SS58_CHECKSUM_SIZE) != 0) {
        return std::nullopt;
    }

    AccountId account;
    std::memcpy(account.data(), data.data() + prefixLen, account.size());
    if (prefix) {
        *prefix = decodedPrefix;
    }
    return account;
}

} // namespace refindex
