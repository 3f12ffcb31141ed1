/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "jsb/jsb_copy_decoder.h"
#include "jsb/jsb_offset_table.h"
#include "jsb/jsb_patcher.h"
#include "jsb/jsb_shape.h"
#include "jsb/jsb_structural_parser.h"
#include "jsb/jsb_verifier.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace fm::jsb {

struct ParserOptions {
    // digest mismatch between file and offset table becomes fatal
    bool strict = false;
};

struct SeasonResult {
    nlohmann::ordered_json record = nlohmann::ordered_json::object();
    ParseReport report;
};

struct CopiesResult {
    std::vector<FieldValues> copies;
    nlohmann::ordered_json json = nlohmann::ordered_json::array();
};

class JsbParser {
   public:
    static SeasonResult DecodeSeasonBytes(
        std::span<const std::uint8_t> bytes,
        const SectionAnchors& anchors,
        std::string_view label = {}
    );

    static CopiesResult DecodeCopies(
        std::span<const std::uint8_t> bytes,
        const OffsetTable& table,
        const ParserOptions& opt = {}
    );

    static nlohmann::ordered_json DecodeWeightsBytes(std::span<const std::uint8_t> bytes);

    static PatchResult PatchBytes(
        std::span<const std::uint8_t> bytes,
        const OffsetTable& table,
        const EditMap& edits,
        const ParserOptions& opt = {}
    );

    static VerifyReport CompareCopies(
        std::span<const std::uint8_t> bytes,
        const OffsetTable& table,
        const ParserOptions& opt = {}
    );
    static VerifyReport VerifyExpected(
        std::span<const std::uint8_t> bytes,
        const OffsetTable& table,
        const FieldValues& expected,
        const ParserOptions& opt = {}
    );

    // Compares the table's stored digest, if any, with the buffer. Returns false
    // on mismatch; throws instead when opt.strict is set.
    static bool CheckDigest(
        std::span<const std::uint8_t> bytes,
        const OffsetTable& table,
        const ParserOptions& opt = {}
    );
};

}  // namespace fm::jsb
