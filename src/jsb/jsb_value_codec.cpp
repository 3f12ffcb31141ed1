/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "jsb/jsb_value_codec.h"

#include "jsb/jsb_byte_reader.h"
#include "jsb/jsb_errors.h"

#include <cstdio>
#include <limits>
#include <stdexcept>

namespace fm::jsb {
namespace {
std::string hex_byte(std::uint8_t b) {
    char tmp[8];
    std::snprintf(tmp, sizeof(tmp), "0x%02X", static_cast<unsigned>(b));
    return tmp;
}

std::size_t last_index(std::span<const std::uint8_t> buf) {
    return buf.empty() ? 0 : buf.size() - 1;
}

std::optional<DecodedInt>
decode_varint_impl(std::span<const std::uint8_t> buf, std::size_t pos, bool strict) {
    std::uint64_t raw = 0;
    int shift = 0;
    std::size_t p = pos;
    for (int i = 0; i < 10; i++) {
        if (p >= buf.size()) {
            if (strict) {
                throw_codec_error(
                    ErrorKind::TruncatedOrCorrupt, "varint runs past end of buffer", buf,
                    last_index(buf)
                );
            }
            return std::nullopt;
        }
        const std::uint8_t b = buf[p++];
        raw |= static_cast<std::uint64_t>(b & 0x7Fu) << shift;
        if ((b & 0x80u) == 0) {
            DecodedInt out{};
            out.value = zigzag_decode(raw);
            out.next = p;
            out.encoding = IntEncoding::Varint;
            return out;
        }
        shift += 7;
    }
    if (strict) {
        throw_codec_error(ErrorKind::TruncatedOrCorrupt, "varint longer than 10 bytes", buf, pos);
    }
    return std::nullopt;
}

std::optional<DecodedInt> decode_int_impl(
    std::span<const std::uint8_t> buf,
    std::size_t pos,
    const IntRule& rule,
    bool strict
) {
    const auto fail = [&](ErrorKind kind, const std::string& msg, std::size_t at) {
        if (strict) {
            throw_codec_error(kind, msg, buf, at);
        }
        return std::optional<DecodedInt>{};
    };

    if (pos >= buf.size()) {
        return fail(
            ErrorKind::TruncatedOrCorrupt, "integer marker past end of buffer", last_index(buf)
        );
    }
    const std::uint8_t tag = buf[pos];
    const std::size_t avail = buf.size() - pos - 1;

    if (rule.fixed_signed && (tag == marker::kInt32 || tag == marker::kInt64)) {
        const std::size_t width = tag == marker::kInt32 ? 4 : 8;
        if (avail < width) {
            return fail(ErrorKind::TruncatedOrCorrupt, "fixed-width integer truncated", pos);
        }
        ByteReader r(buf, pos + 1);
        DecodedInt out{};
        if (tag == marker::kInt32) {
            if (rule.int32_as_unsigned) {
                out.value = static_cast<std::int64_t>(r.read_u32_le());
                out.encoding = IntEncoding::UInt32;
            } else {
                out.value = r.read_i32_le();
                out.encoding = IntEncoding::Int32;
            }
        } else {
            out.value = r.read_i64_le();
            out.encoding = IntEncoding::Int64;
        }
        out.next = r.position();
        return out;
    }

    if (rule.fixed_unsigned && (tag == marker::kUInt32 || tag == marker::kUInt64)) {
        const std::size_t width = tag == marker::kUInt32 ? 4 : 8;
        if (avail < width) {
            return fail(ErrorKind::TruncatedOrCorrupt, "fixed-width integer truncated", pos);
        }
        ByteReader r(buf, pos + 1);
        DecodedInt out{};
        if (tag == marker::kUInt32) {
            out.value = static_cast<std::int64_t>(r.read_u32_le());
            out.encoding = IntEncoding::UInt32;
        } else {
            // values above INT64_MAX keep their bit pattern
            out.value = static_cast<std::int64_t>(r.read_u64_le());
            out.encoding = IntEncoding::UInt64;
        }
        out.next = r.position();
        return out;
    }

    if (rule.nibble.has_value() && (tag & 0x80u) != 0
        && (tag & 0x0Fu) == rule.nibble->sentinel) {
        DecodedInt out{};
        out.encoding = IntEncoding::Nibble;
        if (rule.nibble->source == NibbleRule::Source::NextByte) {
            if (avail < 1) {
                return fail(ErrorKind::TruncatedOrCorrupt, "1-byte integer truncated", pos);
            }
            out.value = buf[pos + 1];
            out.next = pos + 2;
        } else {
            out.value = (tag & rule.nibble->mask) >> rule.nibble->shift;
            out.next = pos + 1;
        }
        return out;
    }

    for (const auto& range : rule.tiny) {
        if (tag < range.first || tag > range.last) {
            continue;
        }
        const std::int64_t v = static_cast<std::int64_t>(tag) - range.base;
        DecodedInt out{};
        out.value = range.negative ? -v : v;
        out.next = pos + 1;
        out.encoding = range.negative ? IntEncoding::TinyNegative : IntEncoding::TinyPositive;
        return out;
    }

    if (rule.varint_fallback) {
        return decode_varint_impl(buf, pos, strict);
    }

    return fail(ErrorKind::UnknownMarker, "unrecognised integer marker " + hex_byte(tag), pos);
}

void append_utf8(std::string& out, std::span<const std::uint8_t> bytes, std::size_t pos, int len) {
    for (int i = 0; i < len; i++) {
        out.push_back(static_cast<char>(bytes[pos + static_cast<std::size_t>(i)]));
    }
}

int utf8_sequence_length(std::span<const std::uint8_t> bytes, std::size_t pos) {
    const std::uint8_t b0 = bytes[pos];
    if (b0 < 0x80) {
        return 1;
    }
    int len = 0;
    std::uint8_t lo = 0x80;
    std::uint8_t hi = 0xBF;
    if (b0 >= 0xC2 && b0 <= 0xDF) {
        len = 2;
    } else if (b0 >= 0xE0 && b0 <= 0xEF) {
        len = 3;
        if (b0 == 0xE0) {
            lo = 0xA0;
        } else if (b0 == 0xED) {
            hi = 0x9F;
        }
    } else if (b0 >= 0xF0 && b0 <= 0xF4) {
        len = 4;
        if (b0 == 0xF0) {
            lo = 0x90;
        } else if (b0 == 0xF4) {
            hi = 0x8F;
        }
    } else {
        return 0;
    }
    if (pos + static_cast<std::size_t>(len) > bytes.size()) {
        return 0;
    }
    const std::uint8_t b1 = bytes[pos + 1];
    if (b1 < lo || b1 > hi) {
        return 0;
    }
    for (int i = 2; i < len; i++) {
        const std::uint8_t b = bytes[pos + static_cast<std::size_t>(i)];
        if (b < 0x80 || b > 0xBF) {
            return 0;
        }
    }
    return len;
}
}  // namespace

IntRule IntRule::fixed() {
    return IntRule{};
}

IntRule IntRule::coefficient() {
    IntRule r{};
    r.tiny = {
        TinyRange{0x80, 0xBF, 0x80, false},
        TinyRange{0xC0, 0xFF, 0xC0, true},
    };
    r.varint_fallback = true;
    return r;
}

IntRule IntRule::lookup() {
    IntRule r{};
    r.fixed_unsigned = true;
    r.nibble = NibbleRule{0x02, 0x7F, 4, NibbleRule::Source::Marker};
    r.tiny = {TinyRange{0x80, 0xFF, 0x80, false}};
    return r;
}

IntRule IntRule::version() {
    IntRule r{};
    r.tiny = {
        TinyRange{0x80, 0xBF, 0x80, false},
        TinyRange{0xC0, 0xFF, 0xC0, false},
    };
    return r;
}

IntRule IntRule::indicator() {
    IntRule r{};
    r.int32_as_unsigned = true;
    r.nibble = NibbleRule{0x02, 0xFF, 0, NibbleRule::Source::NextByte};
    return r;
}

const char* int_encoding_name(IntEncoding enc) {
    switch (enc) {
        case IntEncoding::Int32:
            return "i32";
        case IntEncoding::Int64:
            return "i64";
        case IntEncoding::UInt32:
            return "u32";
        case IntEncoding::UInt64:
            return "u64";
        case IntEncoding::Nibble:
            return "nibble";
        case IntEncoding::TinyPositive:
            return "tiny+";
        case IntEncoding::TinyNegative:
            return "tiny-";
        case IntEncoding::Varint:
            return "var";
    }
    return "?";
}

DecodedInt decode_int(std::span<const std::uint8_t> buf, std::size_t pos, const IntRule& rule) {
    return *decode_int_impl(buf, pos, rule, true);
}

std::optional<DecodedInt>
try_decode_int(std::span<const std::uint8_t> buf, std::size_t pos, const IntRule& rule) {
    return decode_int_impl(buf, pos, rule, false);
}

DecodedInt decode_zigzag_varint(std::span<const std::uint8_t> buf, std::size_t pos) {
    return *decode_varint_impl(buf, pos, true);
}

std::int64_t zigzag_decode(std::uint64_t raw) {
    return static_cast<std::int64_t>((raw >> 1) ^ (~(raw & 1u) + 1u));
}

std::uint64_t zigzag_encode(std::int64_t value) {
    const auto u = static_cast<std::uint64_t>(value);
    return (u << 1) ^ (value < 0 ? std::numeric_limits<std::uint64_t>::max() : 0u);
}

DecodedString decode_string(std::span<const std::uint8_t> buf, std::size_t pos) {
    ByteReader r(buf, pos);
    const std::uint8_t tag = r.read_u8();
    std::size_t len = 0;
    if (tag == marker::kLongString) {
        len = r.read_u32_le();
    } else if (tag >= marker::kShortStringFirst && tag <= marker::kShortStringLast) {
        len = tag & 0x0Fu;
    } else {
        throw_codec_error(ErrorKind::UnknownMarker, "not a string marker: " + hex_byte(tag), buf, pos);
    }
    const auto bytes = r.read_bytes(len);
    return DecodedString{lossy_utf8(bytes), r.position()};
}

std::string lossy_utf8(std::span<const std::uint8_t> bytes) {
    std::string out;
    out.reserve(bytes.size());
    std::size_t pos = 0;
    while (pos < bytes.size()) {
        const int len = utf8_sequence_length(bytes, pos);
        if (len == 0) {
            out += "\xEF\xBF\xBD";
            pos++;
            continue;
        }
        append_utf8(out, bytes, pos, len);
        pos += static_cast<std::size_t>(len);
    }
    return out;
}

void encode_zigzag_varint(ByteWriter& w, std::int64_t value) {
    std::uint64_t raw = zigzag_encode(value);
    while (raw >= 0x80u) {
        w.write_u8(static_cast<std::uint8_t>((raw & 0x7Fu) | 0x80u));
        raw >>= 7;
    }
    w.write_u8(static_cast<std::uint8_t>(raw));
}

void encode_int(ByteWriter& w, std::int64_t value, const IntRule& rule) {
    const auto accept = [&](const std::vector<std::uint8_t>& cand) {
        const auto d = try_decode_int(cand, 0, rule);
        return d.has_value() && d->value == value && d->next == cand.size();
    };
    const auto emit = [&](const std::vector<std::uint8_t>& cand) {
        w.write_bytes(cand);
    };

    for (int m = 0; m <= 0xFF; m++) {
        const std::vector<std::uint8_t> cand{static_cast<std::uint8_t>(m)};
        if (accept(cand)) {
            return emit(cand);
        }
    }
    if (rule.nibble.has_value() && rule.nibble->source == NibbleRule::Source::NextByte
        && value >= 0 && value <= 0xFF) {
        const std::vector<std::uint8_t> cand{
            static_cast<std::uint8_t>(0x80u | rule.nibble->sentinel),
            static_cast<std::uint8_t>(value)
        };
        if (accept(cand)) {
            return emit(cand);
        }
    }
    if (rule.varint_fallback) {
        ByteWriter tmp(16);
        encode_zigzag_varint(tmp, value);
        if (accept(tmp.bytes())) {
            return emit(tmp.bytes());
        }
    }

    std::vector<ByteWriter> fixed;
    if (rule.fixed_signed) {
        ByteWriter w32(8);
        w32.write_u8(marker::kInt32);
        w32.write_u32_le(static_cast<std::uint32_t>(value));
        fixed.push_back(w32);
        ByteWriter w64(16);
        w64.write_u8(marker::kInt64);
        w64.write_i64_le(value);
        fixed.push_back(w64);
    }
    if (rule.fixed_unsigned) {
        ByteWriter w32(8);
        w32.write_u8(marker::kUInt32);
        w32.write_u32_le(static_cast<std::uint32_t>(value));
        fixed.push_back(w32);
        ByteWriter w64(16);
        w64.write_u8(marker::kUInt64);
        w64.write_i64_le(value);
        fixed.push_back(w64);
    }
    for (const auto& cand : fixed) {
        if (accept(cand.bytes())) {
            return emit(cand.bytes());
        }
    }
    throw CodecError(
        ErrorKind::ValueOutOfRange,
        "value " + std::to_string(value) + " has no encoding under this integer rule",
        w.position()
    );
}

void write_key_header(ByteWriter& w, std::string_view key) {
    if (key.empty() || key.size() > kMaxKeyLength) {
        throw std::invalid_argument("key length must be in [1..96]: " + std::string(key));
    }
    const auto len = static_cast<std::uint8_t>(key.size());
    if (is_key_sentinel(len)) {
        w.write_u8(marker::kKeySentinels[0]);
    }
    w.write_u8(len);
    w.write_text(key);
}

std::string key_header_bytes(std::string_view key) {
    ByteWriter w(key.size() + 2);
    write_key_header(w, key);
    const auto& b = w.bytes();
    return std::string(b.begin(), b.end());
}

void write_string(ByteWriter& w, std::string_view text) {
    if (text.size() <= 0x0F) {
        w.write_u8(static_cast<std::uint8_t>(marker::kShortStringFirst | text.size()));
    } else {
        w.write_u8(marker::kLongString);
        w.write_u32_le(static_cast<std::uint32_t>(text.size()));
    }
    w.write_text(text);
}

}  // namespace fm::jsb
