/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "jsb/jsb_shape.h"

#include "jsb/jsb_offset_table.h"
#include "utils/fs_utils.h"

#include <stdexcept>
#include <utility>

namespace fm::jsb {

const char* shape_kind_name(ShapeKind kind) {
    switch (kind) {
        case ShapeKind::FixedRowTable:
            return "fixed-row table";
        case ShapeKind::BlockArray:
            return "block array";
        case ShapeKind::IndexTable:
            return "index table";
        case ShapeKind::Scalar:
            return "scalar";
        case ShapeKind::KeyedObject:
            return "keyed object";
    }
    return "?";
}

ShapeDescriptor fixed_row_table(std::string key, std::size_t rows, std::vector<FieldSpec> fields) {
    ShapeDescriptor s{};
    s.kind = ShapeKind::FixedRowTable;
    s.key = std::move(key);
    s.row_count = rows;
    s.fields = std::move(fields);
    s.int_rule = IntRule::fixed();
    s.resync_trailing_control = true;
    return s;
}

ShapeDescriptor block_array(
    std::string key,
    std::string block_field,
    std::string label_field,
    std::string value_field,
    std::size_t block_size
) {
    ShapeDescriptor s{};
    s.kind = ShapeKind::BlockArray;
    s.key = std::move(key);
    s.block_field = std::move(block_field);
    s.block_size = block_size;
    s.name_label = ":" + key_header_bytes(label_field);
    s.value_label = key_header_bytes(value_field);
    s.fields = {{std::move(label_field), FieldKind::String}, {std::move(value_field), FieldKind::Int}};
    s.allow_array_container = true;
    s.int_rule = IntRule::coefficient();
    return s;
}

ShapeDescriptor index_table(std::string key, std::string index_field, std::string value_field) {
    ShapeDescriptor s{};
    s.kind = ShapeKind::IndexTable;
    s.key = std::move(key);
    s.fields = {{std::move(index_field), FieldKind::Int}, {std::move(value_field), FieldKind::Int}};
    s.allow_array_container = true;
    s.int_rule = IntRule::lookup();
    return s;
}

ShapeDescriptor scalar_field(std::string key) {
    ShapeDescriptor s{};
    s.kind = ShapeKind::Scalar;
    s.key = std::move(key);
    s.int_rule = IntRule::fixed();
    return s;
}

ShapeDescriptor keyed_object(std::string key, std::vector<std::string> fields, std::uint8_t container) {
    ShapeDescriptor s{};
    s.kind = ShapeKind::KeyedObject;
    s.key = std::move(key);
    for (auto& f : fields) {
        s.fields.push_back({std::move(f), FieldKind::Int});
    }
    s.object_markers = {container};
    s.int_rule = IntRule::version();
    return s;
}

RecordLayout player_ratings_season_layout() {
    RecordLayout layout{};
    layout.name = "player_ratings_season";
    layout.sections.push_back(
        {"expected_score_data",
         fixed_row_table(
             "expected_score_data", 11,
             {{"name", FieldKind::String},
              {"negative_multiplier", FieldKind::Int},
              {"positive_multiplier", FieldKind::Int}}
         )}
    );
    layout.sections.push_back(
        {"role_data", block_array("role_data", "coefficients", "name", "value", 52)}
    );
    layout.sections.push_back({"role_lookup_data", index_table("role_lookup_data", "index", "role")});
    layout.sections.push_back({"start_value", scalar_field("start_value")});
    layout.sections.push_back(
        {"version",
         keyed_object(
             "version", {"version_major", "version_minor", "version_release", "version_year"},
             marker::kVersionObject
         )}
    );
    return layout;
}

SectionAnchors anchors_from_json(const nlohmann::ordered_json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Section anchors must be a JSON object");
    }
    SectionAnchors out;
    for (const auto& [name, v] : j.items()) {
        out[name] = parse_offset_value(v);
    }
    return out;
}

SectionAnchors load_season_anchors(const std::filesystem::path& path, std::string_view season) {
    const auto j = fs_utils::read_json_file(path);
    if (!j.contains("seasons") || !j.at("seasons").is_object()) {
        throw std::runtime_error("Layout asset has no \"seasons\" object: " + path.string());
    }
    const auto& seasons = j.at("seasons");
    const auto it = seasons.find(std::string(season));
    if (it == seasons.end()) {
        throw std::runtime_error(
            "Season '" + std::string(season) + "' not found in " + path.string()
        );
    }
    return anchors_from_json(*it);
}

std::vector<std::string> list_seasons(const std::filesystem::path& path) {
    const auto j = fs_utils::read_json_file(path);
    std::vector<std::string> out;
    if (j.contains("seasons") && j.at("seasons").is_object()) {
        for (const auto& [name, v] : j.at("seasons").items()) {
            out.push_back(name);
        }
    }
    return out;
}

}  // namespace fm::jsb
