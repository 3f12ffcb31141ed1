/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "jsb/jsb_byte_writer.h"
#include "jsb/jsb_value_codec.h"

#include <cstdint>
#include <initializer_list>
#include <string_view>
#include <vector>

namespace fm::jsb::test {

// Writes container fragments with the codec's own encoders. Methods that emit a
// key return the offset of the key text, which is what anchors and offset
// tables point at.
class ContainerBuilder {
   public:
    std::size_t key(std::string_view name) {
        write_key_header(w_, name);
        return w_.position() - name.size();
    }

    std::size_t i32(std::string_view name, std::int32_t v) {
        const auto at = key(name);
        w_.write_u8(marker::kInt32);
        w_.write_i32_le(v);
        return at;
    }

    std::size_t i64(std::string_view name, std::int64_t v) {
        const auto at = key(name);
        w_.write_u8(marker::kInt64);
        w_.write_i64_le(v);
        return at;
    }

    std::size_t str(std::string_view name, std::string_view v) {
        const auto at = key(name);
        write_string(w_, v);
        return at;
    }

    std::size_t object(std::string_view name, std::uint8_t container = marker::kObject) {
        const auto at = key(name);
        w_.write_u8(container);
        return at;
    }

    std::size_t array(std::string_view name, std::uint32_t count) {
        const auto at = key(name);
        w_.write_u8(marker::kArray);
        w_.write_u32_le(count);
        return at;
    }

    // Key text with no length header, as found in offset-table files.
    std::size_t bare_u32(std::string_view name, std::uint32_t v) {
        const auto at = w_.position();
        w_.write_text(name);
        w_.write_u8(marker::kInt32);
        w_.write_u32_le(v);
        return at;
    }

    std::size_t bare_u8(std::string_view name, std::uint8_t v) {
        const auto at = w_.position();
        w_.write_text(name);
        w_.write_u8(0x92);
        w_.write_u8(v);
        return at;
    }

    void integer(std::int64_t v, const IntRule& rule) { encode_int(w_, v, rule); }
    void text(std::string_view s) { w_.write_text(s); }
    void raw(std::initializer_list<std::uint8_t> bytes) {
        for (const auto b : bytes) {
            w_.write_u8(b);
        }
    }
    void u32(std::uint32_t v) { w_.write_u32_le(v); }

    std::size_t position() const { return w_.position(); }
    std::vector<std::uint8_t> bytes() const { return w_.to_bytes(); }

   private:
    ByteWriter w_;
};

}  // namespace fm::jsb::test
