/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace fm::jsb {

enum class TokenKind : std::uint8_t { Int32, Int64, String, Control };

const char* token_kind_name(TokenKind kind);

struct Token {
    std::string key;
    TokenKind kind = TokenKind::Control;
    std::int64_t int_value = 0;
    std::string str_value;
    std::uint8_t marker = 0;
    std::size_t key_offset = 0;
    std::size_t cursor = 0;

    bool is_int() const { return kind == TokenKind::Int32 || kind == TokenKind::Int64; }
    std::string describe_value() const;
};

struct TokenStreamOptions {
    bool unsigned_markers = false;
};

// Lazy key/value walk over [start, stop). Abandon the stream and construct a new
// one at another offset to resynchronise.
class TokenStream {
   public:
    TokenStream(
        std::span<const std::uint8_t> buf,
        std::size_t start,
        std::size_t stop,
        TokenStreamOptions options = {}
    );

    std::optional<Token> next();

    std::size_t position() const { return _pos; }
    std::size_t stop() const { return _stop; }
    std::size_t skipped_bytes() const { return _skipped; }

   private:
    std::span<const std::uint8_t> _buf;
    std::size_t _pos;
    std::size_t _stop;
    TokenStreamOptions _options;
    std::size_t _skipped = 0;
};

}  // namespace fm::jsb
