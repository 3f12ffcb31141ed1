/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "jsb/jsb_offset_table.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <vector>

namespace fm::jsb {

enum class PatchWarningKind : std::uint8_t {
    OffsetTableMiss,
    KeyTextMismatch,
    IndicatorMismatch,
};

const char* patch_warning_kind_name(PatchWarningKind kind);

struct PatchWarning {
    PatchWarningKind kind = PatchWarningKind::OffsetTableMiss;
    std::string field;
    std::size_t offset = 0;
    std::string message;
};

struct PatchResult {
    std::vector<std::uint8_t> bytes;
    std::vector<PatchWarning> warnings;
    std::size_t writes = 0;
};

using EditMap = std::map<std::string, std::int64_t>;

// Only the fixed 0x02 + u32 encoding is ever rewritten; any other indicator skips
// that occurrence. The returned buffer always has the input's length.
PatchResult patch(std::span<const std::uint8_t> buf, const OffsetTable& table, const EditMap& edits);

EditMap edits_from_json(const nlohmann::ordered_json& j);

}  // namespace fm::jsb
