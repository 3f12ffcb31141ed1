/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace fm::jsb {

// Field name -> absolute offsets of the first byte of the key text, one per
// redundant copy stored in the file.
struct OffsetTable {
    std::string name;
    std::map<std::string, std::vector<std::size_t>> fields;
    std::set<std::string> ignored;
    std::vector<std::string> order;
    std::optional<std::string> digest;
    std::size_t declared_copies = 0;

    const std::vector<std::size_t>* find(std::string_view field) const;
    bool is_ignored(std::string_view field) const;
    std::size_t copy_count() const;
};

// Accepts a JSON integer or a "0x..." / decimal string.
std::size_t parse_offset_value(const nlohmann::ordered_json& v);

OffsetTable offset_table_from_json(const nlohmann::ordered_json& j);
OffsetTable load_offset_table(const std::filesystem::path& path);

// Throws CodecError(InvalidOffsets) when an occurrence (key text plus
// `trailing` bytes) does not fit the buffer.
void validate_offsets(
    const OffsetTable& table,
    std::span<const std::uint8_t> buf,
    std::size_t trailing = 1
);

}  // namespace fm::jsb
