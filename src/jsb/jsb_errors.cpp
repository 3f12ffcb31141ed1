/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "jsb/jsb_errors.h"

#include <algorithm>
#include <utility>
#include <cstdio>

namespace fm::jsb {
namespace {
std::string compose_what(
    ErrorKind kind,
    const std::string& message,
    std::size_t offset,
    const std::string& context
) {
    std::string out = std::string(error_kind_name(kind)) + " at " + hex_offset(offset) + ": "
                      + message;
    if (!context.empty()) {
        out += "\n";
        out += context;
    }
    return out;
}
}  // namespace

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::TokenMismatch:
            return "TokenMismatch";
        case ErrorKind::UnknownMarker:
            return "UnknownMarker";
        case ErrorKind::TruncatedOrCorrupt:
            return "TruncatedOrCorrupt";
        case ErrorKind::InvalidOffsets:
            return "InvalidOffsets";
        case ErrorKind::ValueOutOfRange:
            return "ValueOutOfRange";
    }
    return "Unknown";
}

std::string hex_offset(std::size_t offset) {
    char tmp[24];
    std::snprintf(tmp, sizeof(tmp), "0x%08llX", static_cast<unsigned long long>(offset));
    return tmp;
}

std::string hex_context(std::span<const std::uint8_t> buf, std::size_t pos, std::size_t window) {
    static const char hexdig[] = "0123456789ABCDEF";
    if (buf.empty()) {
        return {};
    }
    const std::size_t lo = (pos > window ? pos - window : 0) & ~static_cast<std::size_t>(0xF);
    const std::size_t hi = std::min(buf.size(), pos + window);

    std::string out;
    for (std::size_t row = lo; row < hi; row += 16) {
        const std::size_t end = std::min(hi, row + 16);
        out.push_back(pos >= row && pos < row + 16 ? '>' : ' ');
        out += " " + hex_offset(row) + ": ";
        for (std::size_t i = row; i < row + 16; i++) {
            if (i < end) {
                out.push_back(hexdig[(buf[i] >> 4) & 0xF]);
                out.push_back(hexdig[buf[i] & 0xF]);
            } else {
                out += "  ";
            }
            out.push_back(' ');
        }
        out.push_back(' ');
        for (std::size_t i = row; i < end; i++) {
            const std::uint8_t b = buf[i];
            out.push_back(b >= 32 && b <= 126 ? static_cast<char>(b) : '.');
        }
        out.push_back('\n');
    }
    return out;
}

CodecError::CodecError(
    ErrorKind kind,
    const std::string& message,
    std::size_t offset,
    std::string context
)
    : std::runtime_error(compose_what(kind, message, offset, context)),
      _kind(kind),
      _offset(offset),
      _context(std::move(context)),
      _message(message) {}

void throw_codec_error(
    ErrorKind kind,
    const std::string& message,
    std::span<const std::uint8_t> buf,
    std::size_t offset
) {
    throw CodecError(kind, message, offset, hex_context(buf, offset));
}

}  // namespace fm::jsb
