/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "jsb/jsb_value_codec.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace fm::jsb {

enum class ShapeKind : std::uint8_t {
    FixedRowTable,
    BlockArray,
    IndexTable,
    Scalar,
    KeyedObject,
};

const char* shape_kind_name(ShapeKind kind);

enum class FieldKind : std::uint8_t { String, Int };

struct FieldSpec {
    std::string name;
    FieldKind kind = FieldKind::Int;
};

// Describes one record shape. Which members matter depends on `kind`:
//   FixedRowTable  fields, row_count, resync_trailing_control
//   BlockArray     fields (label, value), block_size, block_field, name_label, value_label
//   IndexTable     fields (index, value); labels are the length-prefixed field names
//   Scalar         key only
//   KeyedObject    fields in exact order, object_markers
struct ShapeDescriptor {
    ShapeKind kind = ShapeKind::Scalar;
    std::string key;
    std::vector<FieldSpec> fields;
    std::size_t row_count = 0;
    std::size_t block_size = 0;
    std::string block_field;
    std::string name_label;
    std::string value_label;
    std::vector<std::uint8_t> object_markers{marker::kObject, marker::kObjectAlt};
    bool allow_array_container = false;
    IntRule int_rule = IntRule::fixed();
    bool resync_trailing_control = false;
};

ShapeDescriptor fixed_row_table(std::string key, std::size_t rows, std::vector<FieldSpec> fields);
ShapeDescriptor block_array(
    std::string key,
    std::string block_field,
    std::string label_field,
    std::string value_field,
    std::size_t block_size
);
ShapeDescriptor index_table(std::string key, std::string index_field, std::string value_field);
ShapeDescriptor scalar_field(std::string key);
ShapeDescriptor keyed_object(std::string key, std::vector<std::string> fields, std::uint8_t container);

struct LayoutSection {
    std::string name;
    ShapeDescriptor shape;
};

struct RecordLayout {
    std::string name;
    std::vector<LayoutSection> sections;
};

// Section name -> anchor (first byte of the section's key text).
using SectionAnchors = std::map<std::string, std::size_t>;

RecordLayout player_ratings_season_layout();

SectionAnchors anchors_from_json(const nlohmann::ordered_json& j);
// Reads `seasons.<season>` from a layout asset.
SectionAnchors load_season_anchors(const std::filesystem::path& path, std::string_view season);
std::vector<std::string> list_seasons(const std::filesystem::path& path);

}  // namespace fm::jsb
