/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <vector>

namespace fm::jsb {

// Keys of a weights container are located by prefix rather than by structure.
struct WeightsLayout {
    std::vector<std::string> prefixes;
    std::string version_prefix;
    std::string season_terminator;
    std::string group_prefix;
    std::string strip_prefix;
    std::string misc_group = "MISC";
    std::set<std::int64_t> dropped_years;
    std::vector<std::uint8_t> next_key_bytes;
    std::uint8_t nested_marker = 0x0A;
    std::size_t nested_skip = 5;
    std::size_t max_key_chars = 96;

    static WeightsLayout match_engine();
};

struct KeyedInt {
    std::string key;
    std::optional<std::int64_t> value;
    std::size_t offset = 0;
};

std::vector<KeyedInt> scan_prefixed_keys(std::span<const std::uint8_t> buf, const WeightsLayout& layout);

// {"WEIGHTS": [{"ME_VERSION": {...}, "<group>": {"<weight>": n, ...}, ...}, ...]}
nlohmann::ordered_json group_weights(const std::vector<KeyedInt>& pairs, const WeightsLayout& layout);

}  // namespace fm::jsb
