/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "jsb/jsb_copy_decoder.h"

#include "jsb/jsb_errors.h"
#include "jsb/jsb_value_codec.h"
#include "utils/log.h"

#include <set>

namespace fm::jsb {

static bool is_key_char(std::uint8_t c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
}

std::size_t find_indicator(std::span<const std::uint8_t> buf, std::size_t pos) {
    while (pos < buf.size() && is_key_char(buf[pos])) {
        pos++;
    }
    return pos;
}

std::optional<std::int64_t> decode_copy_value(std::span<const std::uint8_t> buf, std::size_t key_offset) {
    const std::size_t ind = find_indicator(buf, key_offset);
    if (ind >= buf.size()) {
        return std::nullopt;
    }
    const auto d = try_decode_int(buf, ind, IntRule::indicator());
    // copies only carry the 4-byte and 1-byte forms
    if (!d.has_value() || d->encoding == IntEncoding::Int64) {
        return std::nullopt;
    }
    return d->value;
}

std::vector<FieldValues> decode_copies(std::span<const std::uint8_t> buf, const OffsetTable& table) {
    validate_offsets(table, buf);
    std::vector<FieldValues> copies(table.copy_count());
    for (const auto& [field, offsets] : table.fields) {
        if (table.is_ignored(field)) {
            continue;
        }
        for (std::size_t copy = 0; copy < offsets.size(); copy++) {
            const std::size_t off = offsets[copy];
            const auto v = decode_copy_value(buf, off);
            if (!v.has_value()) {
                FM_LOG_DEBUG("%s copy %zu @%s: no integer indicator", field.c_str(), copy, hex_offset(off).c_str());
                continue;
            }
            copies[copy][field] = *v;
        }
    }
    return copies;
}

nlohmann::ordered_json ordered_fields(const FieldValues& values, const std::vector<std::string>& order) {
    auto out = nlohmann::ordered_json::object();
    std::set<std::string> placed;
    for (const auto& k : order) {
        const auto it = values.find(k);
        if (it != values.end() && placed.insert(k).second) {
            out[k] = it->second;
        }
    }
    for (const auto& [k, v] : values) {
        if (placed.find(k) == placed.end()) {
            out[k] = v;
        }
    }
    return out;
}

}  // namespace fm::jsb
