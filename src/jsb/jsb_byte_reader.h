/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "jsb/jsb_errors.h"

#include <cstdint>
#include <span>
#include <string>

namespace fm::jsb {
class ByteReader {
   public:
    explicit ByteReader(std::span<const std::uint8_t> data, std::size_t pos = 0)
        : _data(data), _pos(pos) {}

    std::size_t position() const { return _pos; }
    std::size_t size() const { return _data.size(); }
    std::span<const std::uint8_t> data() const { return _data; }

    std::uint8_t peek_u8() const {
        require(1, "u8");
        return _data[_pos];
    }

    std::uint8_t read_u8() {
        require(1, "u8");
        return _data[_pos++];
    }

    std::uint32_t read_u32_le() {
        require(4, "u32");
        std::uint32_t v = 0;
        for (int i = 0; i < 4; i++) {
            v |= static_cast<std::uint32_t>(_data[_pos + static_cast<std::size_t>(i)]) << (8 * i);
        }
        _pos += 4;
        return v;
    }

    std::uint64_t read_u64_le() {
        require(8, "u64");
        std::uint64_t v = 0;
        for (int i = 0; i < 8; i++) {
            v |= static_cast<std::uint64_t>(_data[_pos + static_cast<std::size_t>(i)]) << (8 * i);
        }
        _pos += 8;
        return v;
    }

    std::int32_t read_i32_le() { return static_cast<std::int32_t>(read_u32_le()); }
    std::int64_t read_i64_le() { return static_cast<std::int64_t>(read_u64_le()); }

    std::span<const std::uint8_t> read_bytes(std::size_t count) {
        require(count, "byte run");
        const auto out = _data.subspan(_pos, count);
        _pos += count;
        return out;
    }

    void seek(std::size_t pos) {
        if (pos > _data.size()) {
            throw_codec_error(
                ErrorKind::InvalidOffsets, "seek past end of buffer", _data, _data.size()
            );
        }
        _pos = pos;
    }

   private:
    void require(std::size_t count, const char* what) const {
        if (_pos > _data.size() || count > _data.size() - _pos) {
            throw_codec_error(
                ErrorKind::TruncatedOrCorrupt,
                std::string("unexpected end of buffer while reading ") + what, _data,
                _pos < _data.size() ? _pos : (_data.empty() ? 0 : _data.size() - 1)
            );
        }
    }

    std::span<const std::uint8_t> _data;
    std::size_t _pos;
};
}  // namespace fm::jsb
