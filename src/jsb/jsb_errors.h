/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>

namespace fm::jsb {

enum class ErrorKind : std::uint8_t {
    TokenMismatch,
    UnknownMarker,
    TruncatedOrCorrupt,
    InvalidOffsets,
    ValueOutOfRange,
};

const char* error_kind_name(ErrorKind kind);

// Hex/ASCII window of +-`window` bytes around `pos`, 16 bytes per row. The row
// holding `pos` is flagged with '>'.
std::string hex_context(std::span<const std::uint8_t> buf, std::size_t pos, std::size_t window = 32);

class CodecError : public std::runtime_error {
   public:
    CodecError(
        ErrorKind kind,
        const std::string& message,
        std::size_t offset,
        std::string context = {}
    );

    ErrorKind kind() const { return _kind; }
    std::size_t offset() const { return _offset; }
    const std::string& context() const { return _context; }
    const std::string& message() const { return _message; }

   private:
    ErrorKind _kind;
    std::size_t _offset;
    std::string _context;
    std::string _message;
};

[[noreturn]] void throw_codec_error(
    ErrorKind kind,
    const std::string& message,
    std::span<const std::uint8_t> buf,
    std::size_t offset
);

std::string hex_offset(std::size_t offset);

}  // namespace fm::jsb
