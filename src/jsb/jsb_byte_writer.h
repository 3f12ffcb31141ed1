/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace fm::jsb {
class ByteWriter {
   public:
    explicit ByteWriter(std::size_t initial_bytes = 256) { buf_.reserve(initial_bytes); }

    std::size_t position() const { return buf_.size(); }

    void write_u8(std::uint8_t v) { buf_.push_back(v); }

    void write_u32_le(std::uint32_t v) {
        for (int i = 0; i < 4; i++) {
            buf_.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFFu));
        }
    }

    void write_u64_le(std::uint64_t v) {
        for (int i = 0; i < 8; i++) {
            buf_.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFFu));
        }
    }

    void write_i32_le(std::int32_t v) { write_u32_le(static_cast<std::uint32_t>(v)); }
    void write_i64_le(std::int64_t v) { write_u64_le(static_cast<std::uint64_t>(v)); }

    void write_bytes(std::span<const std::uint8_t> bytes) {
        buf_.insert(buf_.end(), bytes.begin(), bytes.end());
    }

    void write_text(std::string_view text) {
        for (char c : text) {
            buf_.push_back(static_cast<std::uint8_t>(c));
        }
    }

    const std::vector<std::uint8_t>& bytes() const { return buf_; }
    std::vector<std::uint8_t> to_bytes() const { return buf_; }

   private:
    std::vector<std::uint8_t> buf_;
};
}  // namespace fm::jsb
