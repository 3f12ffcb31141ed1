/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "jsb/jsb_patcher.h"

#include "jsb/jsb_errors.h"
#include "jsb/jsb_value_codec.h"
#include "utils/log.h"

#include <algorithm>
#include <cstdio>
#include <limits>
#include <stdexcept>

namespace fm::jsb {

const char* patch_warning_kind_name(PatchWarningKind kind) {
    switch (kind) {
        case PatchWarningKind::OffsetTableMiss:
            return "OffsetTableMiss";
        case PatchWarningKind::KeyTextMismatch:
            return "KeyTextMismatch";
        case PatchWarningKind::IndicatorMismatch:
            return "IndicatorMismatch";
    }
    return "?";
}

static void add_warning(
    PatchResult& res,
    PatchWarningKind kind,
    const std::string& field,
    std::size_t offset,
    std::string message
) {
    FM_LOG_WARN("%s: %s", patch_warning_kind_name(kind), message.c_str());
    res.warnings.push_back({kind, field, offset, std::move(message)});
}

static void check_edit_offsets(
    std::span<const std::uint8_t> buf,
    const std::string& field,
    const std::vector<std::size_t>& offsets
) {
    // key text + indicator + 4 value bytes
    const std::size_t need = field.size() + 1 + 4;
    for (const auto off : offsets) {
        if (off >= buf.size() || buf.size() - off < need) {
            throw CodecError(
                ErrorKind::InvalidOffsets,
                "offset " + hex_offset(off) + " of field '" + field + "' does not fit a "
                    + std::to_string(buf.size()) + "-byte buffer",
                off
            );
        }
    }
}

PatchResult patch(std::span<const std::uint8_t> buf, const OffsetTable& table, const EditMap& edits) {
    // Validate everything first so a bad table or value never leaves a half-patched buffer.
    for (const auto& [field, value] : edits) {
        if (value < 0 || value > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max())) {
            throw CodecError(
                ErrorKind::ValueOutOfRange,
                "edit value " + std::to_string(value) + " for '" + field
                    + "' does not fit an unsigned 32-bit field",
                0
            );
        }
        if (const auto* offsets = table.find(field)) {
            check_edit_offsets(buf, field, *offsets);
        }
    }

    PatchResult res{};
    res.bytes.assign(buf.begin(), buf.end());

    for (const auto& [field, value] : edits) {
        if (table.is_ignored(field)) {
            FM_LOG_DEBUG("patch: %s is ignored by table %s", field.c_str(), table.name.c_str());
            continue;
        }
        const auto* offsets = table.find(field);
        if (offsets == nullptr) {
            add_warning(
                res, PatchWarningKind::OffsetTableMiss, field, 0,
                "'" + field + "' is not in offset table " + table.name + ", skipped"
            );
            continue;
        }

        for (std::size_t copy = 0; copy < offsets->size(); copy++) {
            const std::size_t off = (*offsets)[copy];
            const auto key_at = res.bytes.begin() + static_cast<std::ptrdiff_t>(off);
            if (!std::equal(field.begin(), field.end(), key_at, [](char a, std::uint8_t b) {
                    return static_cast<std::uint8_t>(a) == b;
                })) {
                add_warning(
                    res, PatchWarningKind::KeyTextMismatch, field, off,
                    "'" + field + "' copy " + std::to_string(copy) + " at " + hex_offset(off)
                        + ": key text differs, skipped"
                );
                continue;
            }
            const std::size_t ind_pos = off + field.size();
            const std::uint8_t ind = res.bytes[ind_pos];
            if (ind != marker::kInt32) {
                char tmp[8];
                std::snprintf(tmp, sizeof(tmp), "0x%02X", static_cast<unsigned>(ind));
                add_warning(
                    res, PatchWarningKind::IndicatorMismatch, field, ind_pos,
                    "'" + field + "' copy " + std::to_string(copy) + " at " + hex_offset(ind_pos)
                        + ": indicator " + tmp + " is not a 32-bit integer, skipped"
                );
                continue;
            }
            const auto v = static_cast<std::uint32_t>(value);
            for (std::size_t i = 0; i < 4; i++) {
                res.bytes[ind_pos + 1 + i] = static_cast<std::uint8_t>((v >> (8 * i)) & 0xFFu);
            }
            res.writes++;
            FM_LOG_DEBUG(
                "patch: %s copy %zu @%s = %u", field.c_str(), copy, hex_offset(ind_pos + 1).c_str(), v
            );
        }
    }
    FM_LOG_INFO(
        "Patched %zu occurrence(s), %zu warning(s)", res.writes, res.warnings.size()
    );
    return res;
}

EditMap edits_from_json(const nlohmann::ordered_json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Edits must be a JSON object of field -> integer");
    }
    EditMap out;
    for (const auto& [field, v] : j.items()) {
        if (!v.is_number_integer()) {
            throw std::runtime_error("Edit value for '" + field + "' is not an integer: " + v.dump());
        }
        if (v.is_number_unsigned()
            && v.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            throw std::runtime_error("Edit value for '" + field + "' is too large: " + v.dump());
        }
        out[field] = v.get<std::int64_t>();
    }
    return out;
}

}  // namespace fm::jsb
