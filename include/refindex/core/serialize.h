// REFINDEX - Serialization Header
// Copyright (c) 2024 REFINDEX Developers
// MIT License
//
// Little-endian serialization primitives shared by the chain decoder and the
// record store. Length prefixes use the SCALE compact integer encoding so the
// same stream type reads payloads straight off the chain.

#ifndef REFINDEX_CORE_SERIALIZE_H
#define REFINDEX_CORE_SERIALIZE_H

#include "refindex/core/types.h"
#include "refindex/core/hex.h"
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ios>
#include <optional>
#include <string>
#include <vector>

namespace refindex {

// ============================================================================
// Constants
// ============================================================================

/// Maximum size for length-prefixed objects to prevent memory exhaustion
static constexpr uint64_t MAX_SIZE = 0x02000000;  // 32 MB

// ============================================================================
// Endianness Helpers (Always Little-Endian for serialization)
// ============================================================================

// glibc's <endian.h> defines these names as function-like macros.
#undef htole16
#undef htole32
#undef htole64
#undef le16toh
#undef le32toh
#undef le64toh

namespace detail {

inline uint16_t htole16(uint16_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap16(host);
#else
    return host;
#endif
}

inline uint32_t htole32(uint32_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap32(host);
#else
    return host;
#endif
}

inline uint64_t htole64(uint64_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap64(host);
#else
    return host;
#endif
}

inline uint16_t le16toh(uint16_t little) { return htole16(little); }
inline uint32_t le32toh(uint32_t little) { return htole32(little); }
inline uint64_t le64toh(uint64_t little) { return htole64(little); }

} // namespace detail

// ============================================================================
// DataStream - In-memory byte buffer for serialization
// ============================================================================

class DataStream {
public:
    using value_type = uint8_t;
    using size_type = std::size_t;

private:
    std::vector<uint8_t> data_;
    size_type read_pos_ = 0;

public:
    DataStream() = default;

    explicit DataStream(const std::vector<uint8_t>& data) : data_(data), read_pos_(0) {}

    explicit DataStream(std::vector<uint8_t>&& data) : data_(std::move(data)), read_pos_(0) {}

    DataStream(const uint8_t* data, size_type len) : data_(data, data + len), read_pos_(0) {}

    // ========================================================================
    // Size and Position
    // ========================================================================

    /// Returns unread bytes remaining
    size_type size() const noexcept { return data_.size() - read_pos_; }

    /// Total buffer size (including read bytes)
    size_type TotalSize() const noexcept { return data_.size(); }

    /// Number of bytes consumed so far
    size_type Position() const noexcept { return read_pos_; }

    bool empty() const noexcept { return size() == 0; }

    void clear() {
        data_.clear();
        read_pos_ = 0;
    }

    /// Get pointer to unread data
    const uint8_t* data() const noexcept { return data_.data() + read_pos_; }

    /// Whole buffer, read bytes included
    const std::vector<uint8_t>& Data() const noexcept { return data_; }

    // ========================================================================
    // Write Operations
    // ========================================================================

    void Write(const uint8_t* src, size_type len) {
        data_.insert(data_.end(), src, src + len);
    }

    void Write(const char* src, size_type len) {
        Write(reinterpret_cast<const uint8_t*>(src), len);
    }

    // ========================================================================
    // Read Operations
    // ========================================================================

    void Read(uint8_t* dst, size_type len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream::Read(): end of data");
        }
        if (len > 0) {
            std::memcpy(dst, data_.data() + read_pos_, len);
        }
        read_pos_ += len;
    }

    void Read(char* dst, size_type len) {
        Read(reinterpret_cast<uint8_t*>(dst), len);
    }

    /// Skip n bytes
    void Ignore(size_type n) {
        if (n > size()) {
            throw std::ios_base::failure("DataStream::Ignore(): end of data");
        }
        read_pos_ += n;
    }

    /// Rewind read position to beginning
    void Rewind() {
        read_pos_ = 0;
    }

    std::string ToHex() const;

    template<typename T>
    DataStream& operator<<(const T& obj);

    template<typename T>
    DataStream& operator>>(T& obj);
};

// ============================================================================
// Low-Level Serialization Functions
// ============================================================================

template<typename Stream>
inline void ser_writedata8(Stream& s, uint8_t obj) {
    s.Write(&obj, 1);
}

template<typename Stream>
inline void ser_writedata16(Stream& s, uint16_t obj) {
    obj = detail::htole16(obj);
    s.Write(reinterpret_cast<const uint8_t*>(&obj), 2);
}

template<typename Stream>
inline void ser_writedata32(Stream& s, uint32_t obj) {
    obj = detail::htole32(obj);
    s.Write(reinterpret_cast<const uint8_t*>(&obj), 4);
}

template<typename Stream>
inline void ser_writedata64(Stream& s, uint64_t obj) {
    obj = detail::htole64(obj);
    s.Write(reinterpret_cast<const uint8_t*>(&obj), 8);
}

template<typename Stream>
inline uint8_t ser_readdata8(Stream& s) {
    uint8_t obj;
    s.Read(&obj, 1);
    return obj;
}

template<typename Stream>
inline uint16_t ser_readdata16(Stream& s) {
    uint16_t obj;
    s.Read(reinterpret_cast<uint8_t*>(&obj), 2);
    return detail::le16toh(obj);
}

template<typename Stream>
inline uint32_t ser_readdata32(Stream& s) {
    uint32_t obj;
    s.Read(reinterpret_cast<uint8_t*>(&obj), 4);
    return detail::le32toh(obj);
}

template<typename Stream>
inline uint64_t ser_readdata64(Stream& s) {
    uint64_t obj;
    s.Read(reinterpret_cast<uint8_t*>(&obj), 8);
    return detail::le64toh(obj);
}

/// 128-bit value as two little-endian 64-bit halves, low half first
template<typename Stream>
inline void ser_writedata128(Stream& s, U128 obj) {
    ser_writedata64(s, static_cast<uint64_t>(obj));
    ser_writedata64(s, static_cast<uint64_t>(obj >> 64));
}

template<typename Stream>
inline U128 ser_readdata128(Stream& s) {
    uint64_t lo = ser_readdata64(s);
    uint64_t hi = ser_readdata64(s);
    return (static_cast<U128>(hi) << 64) | lo;
}

// ============================================================================
// Compact Integer Encoding
// ============================================================================
// The two low bits of the first byte select the mode:
//   0b00 -- single byte,  value < 2^6
//   0b01 -- two bytes,    value < 2^14
//   0b10 -- four bytes,   value < 2^30
//   0b11 -- big integer,  (first >> 2) + 4 little-endian bytes follow

template<typename Stream>
void WriteCompact(Stream& s, uint64_t value) {
    if (value < (1u << 6)) {
        ser_writedata8(s, static_cast<uint8_t>(value << 2));
    } else if (value < (1u << 14)) {
        ser_writedata16(s, static_cast<uint16_t>((value << 2) | 0x01));
    } else if (value < (1u << 30)) {
        ser_writedata32(s, static_cast<uint32_t>((value << 2) | 0x02));
    } else {
        uint8_t bytes = 0;
        for (uint64_t v = value; v != 0; v >>= 8) {
            ++bytes;
        }
        if (bytes < 4) bytes = 4;
        ser_writedata8(s, static_cast<uint8_t>(((bytes - 4) << 2) | 0x03));
        for (uint8_t i = 0; i < bytes; ++i) {
            ser_writedata8(s, static_cast<uint8_t>(value >> (8 * i)));
        }
    }
}

template<typename Stream>
uint64_t ReadCompact(Stream& s) {
    uint8_t first = ser_readdata8(s);
    switch (first & 0x03) {
        case 0x00:
            return first >> 2;
        case 0x01: {
            uint8_t second = ser_readdata8(s);
            return ((static_cast<uint64_t>(second) << 8) | first) >> 2;
        }
        case 0x02: {
            uint8_t rest[3];
            s.Read(rest, 3);
            uint32_t raw = static_cast<uint32_t>(first) |
                           (static_cast<uint32_t>(rest[0]) << 8) |
                           (static_cast<uint32_t>(rest[1]) << 16) |
                           (static_cast<uint32_t>(rest[2]) << 24);
            return raw >> 2;
        }
        default: {
            size_t bytes = static_cast<size_t>(first >> 2) + 4;
            if (bytes > 8) {
                throw std::ios_base::failure("ReadCompact(): value exceeds 64 bits");
            }
            uint64_t value = 0;
            for (size_t i = 0; i < bytes; ++i) {
                value |= static_cast<uint64_t>(ser_readdata8(s)) << (8 * i);
            }
            return value;
        }
    }
}

/// Compact length prefix with a sanity bound
template<typename Stream>
uint64_t ReadCompactSize(Stream& s) {
    uint64_t size = ReadCompact(s);
    if (size > MAX_SIZE) {
        throw std::ios_base::failure("ReadCompactSize(): size too large");
    }
    return size;
}

// ============================================================================
// Serialize/Unserialize for Basic Types
// ============================================================================

template<typename Stream>
inline void Serialize(Stream& s, uint8_t a) { ser_writedata8(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint8_t& a) { a = ser_readdata8(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint16_t a) { ser_writedata16(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint16_t& a) { a = ser_readdata16(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint32_t a) { ser_writedata32(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint32_t& a) { a = ser_readdata32(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint64_t a) { ser_writedata64(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint64_t& a) { a = ser_readdata64(s); }

template<typename Stream>
inline void Serialize(Stream& s, int64_t a) { ser_writedata64(s, static_cast<uint64_t>(a)); }

template<typename Stream>
inline void Unserialize(Stream& s, int64_t& a) { a = static_cast<int64_t>(ser_readdata64(s)); }

template<typename Stream>
inline void Serialize(Stream& s, bool a) { ser_writedata8(s, a ? 1 : 0); }

template<typename Stream>
inline void Unserialize(Stream& s, bool& a) { a = (ser_readdata8(s) != 0); }

// ============================================================================
// Serialize/Unserialize for Strings, Byte Vectors and Byte Arrays
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const std::string& str) {
    WriteCompact(s, str.size());
    if (!str.empty()) {
        s.Write(str.data(), str.size());
    }
}

template<typename Stream>
void Unserialize(Stream& s, std::string& str) {
    uint64_t size = ReadCompactSize(s);
    str.resize(size);
    if (size > 0) {
        s.Read(&str[0], size);
    }
}

template<typename Stream>
void Serialize(Stream& s, const std::vector<uint8_t>& v) {
    WriteCompact(s, v.size());
    if (!v.empty()) {
        s.Write(v.data(), v.size());
    }
}

template<typename Stream>
void Unserialize(Stream& s, std::vector<uint8_t>& v) {
    uint64_t size = ReadCompactSize(s);
    v.resize(size);
    if (size > 0) {
        s.Read(v.data(), size);
    }
}

template<typename Stream, size_t N>
void Serialize(Stream& s, const std::array<uint8_t, N>& arr) {
    s.Write(arr.data(), N);
}

template<typename Stream, size_t N>
void Unserialize(Stream& s, std::array<uint8_t, N>& arr) {
    s.Read(arr.data(), N);
}

// ============================================================================
// Serialize/Unserialize for Optional Values
// ============================================================================
// One presence byte (0 = None, 1 = Some) followed by the value.

template<typename Stream, typename T>
void Serialize(Stream& s, const std::optional<T>& opt) {
    if (opt) {
        ser_writedata8(s, 1);
        Serialize(s, *opt);
    } else {
        ser_writedata8(s, 0);
    }
}

template<typename Stream, typename T>
void Unserialize(Stream& s, std::optional<T>& opt) {
    uint8_t tag = ser_readdata8(s);
    if (tag == 0) {
        opt.reset();
    } else if (tag == 1) {
        T value{};
        Unserialize(s, value);
        opt = std::move(value);
    } else {
        throw std::ios_base::failure("Unserialize(): invalid option tag");
    }
}

// ============================================================================
// DataStream Operator Implementations
// ============================================================================

template<typename T>
DataStream& DataStream::operator<<(const T& obj) {
    Serialize(*this, obj);
    return *this;
}

template<typename T>
DataStream& DataStream::operator>>(T& obj) {
    Unserialize(*this, obj);
    return *this;
}

} // namespace refindex

#endif // REFINDEX_CORE_SERIALIZE_H
