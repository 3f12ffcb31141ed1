/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "jsb/jsb_token_stream.h"

#include "jsb/jsb_byte_reader.h"
#include "jsb/jsb_errors.h"
#include "jsb/jsb_value_codec.h"
#include "utils/log.h"

#include <cstdio>

namespace fm::jsb {

const char* token_kind_name(TokenKind kind) {
    switch (kind) {
        case TokenKind::Int32:
            return "i32";
        case TokenKind::Int64:
            return "i64";
        case TokenKind::String:
            return "str";
        case TokenKind::Control:
            return "ctl";
    }
    return "?";
}

std::string Token::describe_value() const {
    switch (kind) {
        case TokenKind::Int32:
        case TokenKind::Int64:
            return std::to_string(int_value);
        case TokenKind::String:
            return "\"" + str_value + "\"";
        case TokenKind::Control: {
            char tmp[16];
            std::snprintf(tmp, sizeof(tmp), "<m0x%02X>", static_cast<unsigned>(marker));
            return tmp;
        }
    }
    return {};
}

TokenStream::TokenStream(
    std::span<const std::uint8_t> buf,
    std::size_t start,
    std::size_t stop,
    TokenStreamOptions options
)
    : _buf(buf), _pos(start), _stop(stop), _options(options) {
    if (stop > buf.size() || start > stop) {
        throw CodecError(
            ErrorKind::InvalidOffsets,
            "token stream bounds [" + hex_offset(start) + ", " + hex_offset(stop)
                + ") outside buffer of " + std::to_string(buf.size()) + " bytes",
            start
        );
    }
}

std::optional<Token> TokenStream::next() {
    while (_pos < _stop && _stop - _pos >= 2) {
        const std::size_t header_at = _pos;
        const std::uint8_t mark = _buf[_pos];

        std::size_t klen = 0;
        std::size_t text_at = 0;
        if (is_key_sentinel(mark)) {
            klen = _buf[_pos + 1];
            text_at = _pos + 2;
        } else {
            klen = mark;
            text_at = _pos + 1;
        }
        if (klen == 0 || klen > kMaxKeyLength || text_at + klen >= _buf.size()) {
            _pos = header_at + 1;
            _skipped++;
            continue;
        }

        Token tok{};
        tok.key = lossy_utf8(_buf.subspan(text_at, klen));
        tok.key_offset = text_at;

        const std::size_t marker_at = text_at + klen;
        tok.marker = _buf[marker_at];
        ByteReader r(_buf, marker_at + 1);

        switch (tok.marker) {
            case marker::kInt32:
                tok.kind = TokenKind::Int32;
                tok.int_value = r.read_i32_le();
                break;
            case marker::kInt64:
                tok.kind = TokenKind::Int64;
                tok.int_value = r.read_i64_le();
                break;
            case marker::kUInt32:
            case marker::kUInt64:
                if (!_options.unsigned_markers) {
                    tok.kind = TokenKind::Control;
                    break;
                }
                tok.kind = TokenKind::Int64;
                tok.int_value = tok.marker == marker::kUInt32
                                    ? static_cast<std::int64_t>(r.read_u32_le())
                                    : static_cast<std::int64_t>(r.read_u64_le());
                break;
            default:
                if (is_string_marker(tok.marker)) {
                    auto s = decode_string(_buf, marker_at);
                    tok.kind = TokenKind::String;
                    tok.str_value = std::move(s.value);
                    r.seek(s.next);
                } else {
                    tok.kind = TokenKind::Control;
                }
                break;
        }

        tok.cursor = r.position();
        _pos = tok.cursor;
        return tok;
    }
    if (_skipped > 0) {
        FM_LOG_DEBUG("token stream ended at %s after skipping %zu noise byte(s)",
                     hex_offset(_pos).c_str(), _skipped);
    }
    return std::nullopt;
}

}  // namespace fm::jsb
