/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "jsb/jsb_weights.h"

#include "jsb/jsb_byte_reader.h"
#include "jsb/jsb_errors.h"
#include "utils/log.h"

#include <algorithm>
#include <string_view>

namespace fm::jsb {
namespace {
bool is_weight_key_char(std::uint8_t c) {
    return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == ':';
}

bool starts_with_at(std::span<const std::uint8_t> buf, std::size_t pos, std::string_view text) {
    if (pos > buf.size() || buf.size() - pos < text.size()) {
        return false;
    }
    for (std::size_t i = 0; i < text.size(); i++) {
        if (buf[pos + i] != static_cast<std::uint8_t>(text[i])) {
            return false;
        }
    }
    return true;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return !prefix.empty() && s.rfind(prefix, 0) == 0;
}

std::string strip(const std::string& s, const std::string& prefix) {
    return starts_with(s, prefix) ? s.substr(prefix.size()) : s;
}

// Tries the key at `pos` with `prefix`, longest tail first. Returns the match
// end on success.
std::optional<std::size_t> match_key(
    std::span<const std::uint8_t> buf,
    std::size_t pos,
    const std::string& prefix,
    const WeightsLayout& layout,
    KeyedInt& out
) {
    const std::size_t tail_at = pos + prefix.size();
    std::size_t run = 0;
    while (run < layout.max_key_chars && tail_at + run < buf.size() && is_weight_key_char(buf[tail_at + run])) {
        run++;
    }
    for (std::size_t n = run; n >= 1; n--) {
        const std::size_t after = tail_at + n;
        if (after >= buf.size()) {
            continue;
        }
        const std::uint8_t b = buf[after];
        out.key.assign(reinterpret_cast<const char*>(buf.data() + pos), prefix.size() + n);
        out.offset = pos;
        out.value.reset();
        if (b == 0x02 && buf.size() - after - 1 >= 4) {
            ByteReader r(buf, after + 1);
            out.value = r.read_i32_le();
            return r.position();
        }
        if (b == layout.nested_marker && buf.size() - after - 1 >= layout.nested_skip) {
            return after + 1 + layout.nested_skip;
        }
        if (std::find(layout.next_key_bytes.begin(), layout.next_key_bytes.end(), b)
            != layout.next_key_bytes.end()) {
            return after;
        }
    }
    return std::nullopt;
}
}  // namespace

WeightsLayout WeightsLayout::match_engine() {
    WeightsLayout l{};
    l.prefixes = {"TEAM_PICKING_STYLE::", "simatchshared::TSF_", "ME_PACK_VERSION_"};
    l.version_prefix = "ME_PACK_VERSION_";
    l.season_terminator = "ME_PACK_VERSION_YEAR";
    l.group_prefix = "TEAM_PICKING_STYLE::";
    l.strip_prefix = "simatchshared::";
    l.dropped_years = {23};
    l.next_key_bytes = {0x82, 0x5A, 0x6A, 0x00};
    return l;
}

std::vector<KeyedInt> scan_prefixed_keys(std::span<const std::uint8_t> buf, const WeightsLayout& layout) {
    std::vector<KeyedInt> out;
    std::size_t pos = 0;
    while (pos < buf.size()) {
        std::optional<std::size_t> end;
        KeyedInt kv{};
        for (const auto& prefix : layout.prefixes) {
            if (!starts_with_at(buf, pos, prefix)) {
                continue;
            }
            end = match_key(buf, pos, prefix, layout, kv);
            if (end.has_value()) {
                break;
            }
        }
        if (!end.has_value()) {
            pos++;
            continue;
        }
        // version fields without an inline value default to 0, the year stays unknown
        if (!kv.value.has_value() && starts_with(kv.key, layout.version_prefix)
            && kv.key != layout.season_terminator) {
            kv.value = 0;
        }
        FM_LOG_DEBUG(
            "weights @%s: %s = %s", hex_offset(kv.offset).c_str(), kv.key.c_str(),
            kv.value.has_value() ? std::to_string(*kv.value).c_str() : "-"
        );
        out.push_back(std::move(kv));
        pos = *end;
    }
    FM_LOG_INFO("Found %zu prefixed key(s)", out.size());
    return out;
}

nlohmann::ordered_json group_weights(const std::vector<KeyedInt>& pairs, const WeightsLayout& layout) {
    using json = nlohmann::ordered_json;

    std::vector<json> blocks;
    json version = json::object();
    json* block = nullptr;
    std::optional<std::string> group;

    const auto open_block = [&]() {
        json b = json::object();
        b["ME_VERSION"] = version;
        blocks.push_back(std::move(b));
        block = &blocks.back();
        version = json::object();
        group.reset();
    };

    for (const auto& kv : pairs) {
        if (starts_with(kv.key, layout.version_prefix)) {
            version[kv.key] = kv.value.has_value() ? json(*kv.value) : json(nullptr);
            if (kv.key == layout.season_terminator) {
                open_block();
            }
            continue;
        }
        if (starts_with(kv.key, layout.group_prefix)) {
            if (block == nullptr) {
                open_block();
            }
            group = strip(kv.key, layout.group_prefix);
            (*block)[*group] = json::object();
            continue;
        }
        if (block == nullptr) {
            open_block();
        }
        if (!group.has_value()) {
            group = layout.misc_group;
            (*block)[*group] = json::object();
        }
        if (kv.value.has_value()) {
            (*block)[*group][strip(kv.key, layout.strip_prefix)] = *kv.value;
        }
    }

    json seasons = json::array();
    for (auto& b : blocks) {
        auto& ver = b["ME_VERSION"];
        if (!ver.contains(layout.season_terminator) || ver[layout.season_terminator].is_null()) {
            ver[layout.season_terminator] = 0;
        }
        const auto year = ver[layout.season_terminator].get<std::int64_t>();
        if (layout.dropped_years.count(year) != 0) {
            FM_LOG_DEBUG("weights: dropping season with year %lld", static_cast<long long>(year));
            continue;
        }
        seasons.push_back(std::move(b));
    }
    FM_LOG_INFO("Grouped weights into %zu season(s)", seasons.size());

    json out = json::object();
    out["WEIGHTS"] = std::move(seasons);
    return out;
}

}  // namespace fm::jsb
