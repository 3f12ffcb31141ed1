/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "jsb/jsb_byte_writer.h"

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace fm::jsb {

namespace marker {
constexpr std::uint8_t kInt32 = 0x02;
constexpr std::uint8_t kInt64 = 0x03;
constexpr std::uint8_t kUInt32 = 0x04;
constexpr std::uint8_t kUInt64 = 0x05;
constexpr std::uint8_t kLongString = 0x08;
constexpr std::uint8_t kArray = 0x09;
constexpr std::uint8_t kShortStringFirst = 0x80;
constexpr std::uint8_t kShortStringLast = 0x8F;
constexpr std::uint8_t kObject = 0xC9;
constexpr std::uint8_t kObjectAlt = 0x99;
constexpr std::uint8_t kVersionObject = 0x5A;
constexpr std::array<std::uint8_t, 4> kKeySentinels = {0x2A, 0x4A, 0x5A, 0x6A};
}  // namespace marker

constexpr std::size_t kMaxKeyLength = 96;

inline bool is_key_sentinel(std::uint8_t b) {
    for (const auto s : marker::kKeySentinels) {
        if (s == b) {
            return true;
        }
    }
    return false;
}

inline bool is_string_marker(std::uint8_t b) {
    return b == marker::kLongString || (b >= marker::kShortStringFirst && b <= marker::kShortStringLast);
}

// A byte range [first, last] whose marker carries the value itself:
// value = marker - base, negated when `negative` is set.
struct TinyRange {
    std::uint8_t first = 0;
    std::uint8_t last = 0;
    std::uint8_t base = 0;
    bool negative = false;
};

// Markers with the top bit set and low nibble == sentinel.
struct NibbleRule {
    enum class Source : std::uint8_t { Marker, NextByte };

    std::uint8_t sentinel = 0x02;
    std::uint8_t mask = 0x7F;
    int shift = 4;
    Source source = Source::Marker;
};

// Integer decoding rules differ per record shape, so every shape carries its own.
struct IntRule {
    bool fixed_signed = true;
    bool int32_as_unsigned = false;
    bool fixed_unsigned = false;
    std::optional<NibbleRule> nibble;
    std::vector<TinyRange> tiny;
    bool varint_fallback = false;

    static IntRule fixed();
    static IntRule coefficient();
    static IntRule lookup();
    static IntRule version();
    static IntRule indicator();
};

enum class IntEncoding : std::uint8_t {
    Int32,
    Int64,
    UInt32,
    UInt64,
    Nibble,
    TinyPositive,
    TinyNegative,
    Varint,
};

const char* int_encoding_name(IntEncoding enc);

struct DecodedInt {
    std::int64_t value = 0;
    std::size_t next = 0;
    IntEncoding encoding = IntEncoding::Int32;
};

struct DecodedString {
    std::string value;
    std::size_t next = 0;
};

// Throws CodecError(UnknownMarker) when no rule matches, TruncatedOrCorrupt when
// the value runs past the buffer.
DecodedInt decode_int(std::span<const std::uint8_t> buf, std::size_t pos, const IntRule& rule);
std::optional<DecodedInt>
try_decode_int(std::span<const std::uint8_t> buf, std::size_t pos, const IntRule& rule);

DecodedString decode_string(std::span<const std::uint8_t> buf, std::size_t pos);
std::string lossy_utf8(std::span<const std::uint8_t> bytes);

DecodedInt decode_zigzag_varint(std::span<const std::uint8_t> buf, std::size_t pos);
std::int64_t zigzag_decode(std::uint64_t raw);
std::uint64_t zigzag_encode(std::int64_t value);

void encode_zigzag_varint(ByteWriter& w, std::int64_t value);
void encode_int(ByteWriter& w, std::int64_t value, const IntRule& rule);
void write_key_header(ByteWriter& w, std::string_view key);
void write_string(ByteWriter& w, std::string_view text);
std::string key_header_bytes(std::string_view key);

}  // namespace fm::jsb
