/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "jsb/jsb_offset_table.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace fm::jsb {

using FieldValues = std::map<std::string, std::int64_t>;

// First byte at/after `pos` outside [A-Za-z0-9_].
std::size_t find_indicator(std::span<const std::uint8_t> buf, std::size_t pos);

std::optional<std::int64_t> decode_copy_value(std::span<const std::uint8_t> buf, std::size_t key_offset);

// One map per redundant copy. Fields that cannot be decoded at a given copy are
// absent from that copy's map.
std::vector<FieldValues> decode_copies(std::span<const std::uint8_t> buf, const OffsetTable& table);

nlohmann::ordered_json ordered_fields(const FieldValues& values, const std::vector<std::string>& order);

}  // namespace fm::jsb
