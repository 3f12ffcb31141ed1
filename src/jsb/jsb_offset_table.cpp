/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "jsb/jsb_offset_table.h"

#include "jsb/jsb_errors.h"
#include "utils/fs_utils.h"
#include "utils/log.h"

#include <algorithm>
#include <stdexcept>

namespace fm::jsb {

const std::vector<std::size_t>* OffsetTable::find(std::string_view field) const {
    const auto it = fields.find(std::string(field));
    if (it == fields.end()) {
        return nullptr;
    }
    return &it->second;
}

bool OffsetTable::is_ignored(std::string_view field) const {
    return ignored.find(std::string(field)) != ignored.end();
}

std::size_t OffsetTable::copy_count() const {
    std::size_t n = declared_copies;
    for (const auto& [name, offsets] : fields) {
        n = std::max(n, offsets.size());
    }
    return n;
}

std::size_t parse_offset_value(const nlohmann::ordered_json& v) {
    if (v.is_number_unsigned()) {
        return v.get<std::size_t>();
    }
    if (v.is_number_integer()) {
        const auto i = v.get<std::int64_t>();
        if (i < 0) {
            throw std::runtime_error("Negative offset: " + std::to_string(i));
        }
        return static_cast<std::size_t>(i);
    }
    if (v.is_string()) {
        const auto s = v.get<std::string>();
        std::size_t used = 0;
        unsigned long long parsed = 0;
        try {
            parsed = std::stoull(s, &used, 0);
        } catch (const std::exception&) {
            throw std::runtime_error("Malformed offset: " + s);
        }
        if (used != s.size()) {
            throw std::runtime_error("Malformed offset: " + s);
        }
        return static_cast<std::size_t>(parsed);
    }
    throw std::runtime_error("Offset must be an integer or hex string: " + v.dump());
}

OffsetTable offset_table_from_json(const nlohmann::ordered_json& j) {
    if (!j.is_object() || !j.contains("fields") || !j.at("fields").is_object()) {
        throw std::runtime_error("Offset table needs a \"fields\" object");
    }
    OffsetTable table{};
    table.name = j.value("name", std::string{});
    if (j.contains("copies")) {
        table.declared_copies = parse_offset_value(j.at("copies"));
    }
    if (j.contains("blake3") && j.at("blake3").is_string()) {
        table.digest = j.at("blake3").get<std::string>();
    }
    if (j.contains("ignored")) {
        for (const auto& k : j.at("ignored")) {
            table.ignored.insert(k.get<std::string>());
        }
    }
    if (j.contains("order")) {
        for (const auto& k : j.at("order")) {
            table.order.push_back(k.get<std::string>());
        }
    }
    for (const auto& [field, occ] : j.at("fields").items()) {
        std::vector<std::size_t> offsets;
        if (occ.is_array() || occ.is_object()) {
            for (const auto& v : occ) {
                offsets.push_back(parse_offset_value(v));
            }
        } else {
            offsets.push_back(parse_offset_value(occ));
        }
        if (offsets.empty()) {
            FM_LOG_WARN("Offset table %s: field %s has no offsets", table.name.c_str(), field.c_str());
        }
        table.fields.emplace(field, std::move(offsets));
    }
    return table;
}

OffsetTable load_offset_table(const std::filesystem::path& path) {
    auto table = offset_table_from_json(fs_utils::read_json_file(path));
    if (table.name.empty()) {
        table.name = path.stem().string();
    }
    FM_LOG_DEBUG(
        "Loaded offset table %s: %zu fields, %zu copies", table.name.c_str(), table.fields.size(),
        table.copy_count()
    );
    return table;
}

void validate_offsets(
    const OffsetTable& table,
    std::span<const std::uint8_t> buf,
    std::size_t trailing
) {
    for (const auto& [field, offsets] : table.fields) {
        for (const auto off : offsets) {
            if (off >= buf.size() || buf.size() - off < field.size() + trailing) {
                throw CodecError(
                    ErrorKind::InvalidOffsets,
                    "offset of field '" + field + "' lies outside the " + std::to_string(buf.size())
                        + "-byte buffer",
                    off
                );
            }
        }
    }
}

}  // namespace fm::jsb
