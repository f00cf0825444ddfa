// REFINDEX - Core Types, Hex and Serialization Tests
// Copyright (c) 2024 REFINDEX Developers
// MIT License

#include <gtest/gtest.h>

#include "refindex/core/hex.h"
#include "refindex/core/serialize.h"
#include "refindex/core/types.h"

#include <optional>
#include <stdexcept>

using namespace refindex;

// ============================================================================
// U128
// ============================================================================

TEST(U128Test, ToStringSmallValues) {
    EXPECT_EQ(U128ToString(0), "0");
    EXPECT_EQ(U128ToString(7), "7");
    EXPECT_EQ(U128ToString(10000000000ULL), "10000000000");
}

TEST(U128Test, ToStringBeyond64Bits) {
    U128 value = static_cast<U128>(1) << 64;
    EXPECT_EQ(U128ToString(value), "18446744073709551616");

    U128 max = ~static_cast<U128>(0);
    EXPECT_EQ(U128ToString(max), "340282366920938463463374607431768211455");
}

TEST(U128Test, ParseRoundTrip) {
    U128 out = 0;
    ASSERT_TRUE(ParseU128("340282366920938463463374607431768211455", out));
    EXPECT_EQ(out, ~static_cast<U128>(0));
}

TEST(U128Test, ParseRejectsJunkAndOverflow) {
    U128 out = 0;
    EXPECT_FALSE(ParseU128("", out));
    EXPECT_FALSE(ParseU128("12a", out));
    EXPECT_FALSE(ParseU128("-1", out));
    EXPECT_FALSE(ParseU128("340282366920938463463374607431768211456", out));
}

// ============================================================================
// Hex
// ============================================================================

TEST(HexTest, BytesToHexLowercase) {
    std::vector<uint8_t> data = {0x00, 0xab, 0xFF, 0x10};
    EXPECT_EQ(BytesToHex(data), "00abff10");
}

TEST(HexTest, HexToBytesAcceptsUppercase) {
    auto bytes = HexToBytes("DEADbeef");
    ASSERT_EQ(bytes.size(), 4u);
    EXPECT_EQ(bytes[0], 0xde);
    EXPECT_EQ(bytes[3], 0xef);
}

TEST(HexTest, HexToBytesRejectsBadInput) {
    EXPECT_THROW(HexToBytes("abc"), std::invalid_argument);
    EXPECT_THROW(HexToBytes("zz"), std::invalid_argument);
}

TEST(HexTest, PrefixedHex) {
    std::vector<uint8_t> empty;
    EXPECT_EQ(ToPrefixedHex(empty), "0x");
    EXPECT_EQ(ToPrefixedHex(std::vector<uint8_t>{0x01, 0x02}), "0x0102");

    EXPECT_TRUE(FromPrefixedHex("0x").empty());
    EXPECT_EQ(FromPrefixedHex("0x0102"), (std::vector<uint8_t>{0x01, 0x02}));
    EXPECT_EQ(FromPrefixedHex("0102"), (std::vector<uint8_t>{0x01, 0x02}));
    EXPECT_THROW(FromPrefixedHex("0x1"), std::invalid_argument);
}

TEST(HexTest, IsValidHex) {
    EXPECT_TRUE(IsValidHex(""));
    EXPECT_TRUE(IsValidHex("00ff"));
    EXPECT_FALSE(IsValidHex("0"));
    EXPECT_FALSE(IsValidHex("0g"));
}

// ============================================================================
// DataStream and Fixed-Width Integers
// ============================================================================

TEST(SerializeTest, IntegersAreLittleEndian) {
    DataStream s;
    ser_writedata16(s, 0x0102);
    ser_writedata32(s, 0x03040506);
    EXPECT_EQ(s.Data(), (std::vector<uint8_t>{0x02, 0x01, 0x06, 0x05, 0x04, 0x03}));

    EXPECT_EQ(ser_readdata16(s), 0x0102);
    EXPECT_EQ(ser_readdata32(s), 0x03040506u);
    EXPECT_TRUE(s.empty());
}

TEST(SerializeTest, U128IsTwoLittleEndianHalves) {
    DataStream s;
    U128 value = (static_cast<U128>(2) << 64) | 1;
    ser_writedata128(s, value);
    ASSERT_EQ(s.size(), 16u);
    EXPECT_EQ(s.Data()[0], 0x01);
    EXPECT_EQ(s.Data()[8], 0x02);
    EXPECT_EQ(ser_readdata128(s), value);
}

TEST(SerializeTest, ShortReadThrows) {
    std::vector<uint8_t> data = {0x01, 0x02, 0x03};
    DataStream s(data);
    EXPECT_THROW(ser_readdata32(s), std::ios_base::failure);
}

TEST(SerializeTest, IgnoreSkipsAndChecksBounds) {
    std::vector<uint8_t> data = {0x01, 0x02, 0x03};
    DataStream s(data);
    s.Ignore(2);
    EXPECT_EQ(ser_readdata8(s), 0x03);
    EXPECT_THROW(s.Ignore(1), std::ios_base::failure);
}

// ============================================================================
// Compact Encoding
// ============================================================================

namespace {

std::vector<uint8_t> EncodeCompact(uint64_t value) {
    DataStream s;
    WriteCompact(s, value);
    return s.Data();
}

} // namespace

TEST(CompactTest, ModeBoundaries) {
    EXPECT_EQ(EncodeCompact(0), (std::vector<uint8_t>{0x00}));
    EXPECT_EQ(EncodeCompact(1), (std::vector<uint8_t>{0x04}));
    EXPECT_EQ(EncodeCompact(63), (std::vector<uint8_t>{0xfc}));
    EXPECT_EQ(EncodeCompact(64), (std::vector<uint8_t>{0x01, 0x01}));
    EXPECT_EQ(EncodeCompact(16383), (std::vector<uint8_t>{0xfd, 0xff}));
    EXPECT_EQ(EncodeCompact(16384), (std::vector<uint8_t>{0x02, 0x00, 0x01, 0x00}));
    EXPECT_EQ(EncodeCompact(1u << 30), (std::vector<uint8_t>{0x03, 0x00, 0x00, 0x00, 0x40}));
}

TEST(CompactTest, DecodesEveryMode) {
    for (uint64_t value : {0ULL, 63ULL, 64ULL, 16383ULL, 16384ULL, (1ULL << 30) - 1,
                           1ULL << 30, 1ULL << 40}) {
        DataStream s(EncodeCompact(value));
        EXPECT_EQ(ReadCompact(s), value) << "value " << value;
        EXPECT_TRUE(s.empty());
    }
}

TEST(CompactTest, ReadCompactSizeRejectsHugeLengths) {
    DataStream s(EncodeCompact(MAX_SIZE + 1));
    EXPECT_THROW(ReadCompactSize(s), std::ios_base::failure);
}

// ============================================================================
// Strings and Optionals
// ============================================================================

TEST(SerializeTest, StringHasCompactLengthPrefix) {
    DataStream s;
    Serialize(s, std::string("abc"));
    EXPECT_EQ(s.Data(), (std::vector<uint8_t>{0x0c, 'a', 'b', 'c'}));

    std::string out;
    Unserialize(s, out);
    EXPECT_EQ(out, "abc");
}

TEST(SerializeTest, OptionalPresenceByte) {
    DataStream s;
    Serialize(s, std::optional<uint32_t>());
    Serialize(s, std::optional<uint32_t>(7));
    EXPECT_EQ(s.size(), 1u + 1u + 4u);

    std::optional<uint32_t> a;
    std::optional<uint32_t> b;
    Unserialize(s, a);
    Unserialize(s, b);
    EXPECT_FALSE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(*b, 7u);
}

TEST(SerializeTest, OptionalRejectsBadTag) {
    std::vector<uint8_t> data = {0x02};
    DataStream s(data);
    std::optional<uint8_t> value;
    EXPECT_THROW(Unserialize(s, value), std::ios_base::failure);
}
