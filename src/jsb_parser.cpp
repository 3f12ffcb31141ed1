/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "jsb_parser.h"

#include "jsb/jsb_fingerprint.h"
#include "jsb/jsb_weights.h"
#include "utils/log.h"

#include <chrono>
#include <stdexcept>
#include <string>

namespace fm::jsb {

SeasonResult JsbParser::DecodeSeasonBytes(
    std::span<const std::uint8_t> bytes,
    const SectionAnchors& anchors,
    std::string_view label
) {
    const auto t0 = std::chrono::steady_clock::now();
    StructuralParser parser(bytes);
    SeasonResult res{};
    res.record = parser.parse_layout(player_ratings_season_layout(), anchors);
    res.report = parser.report();
    const auto t1 = std::chrono::steady_clock::now();
    FM_LOG_DEBUG(
        "Decoded season %s in %lldms (%zu warning(s), %zu resync(s), %zu dropped entr(ies))",
        std::string(label).c_str(),
        static_cast<long long>(std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count()),
        res.report.warnings.size(), res.report.resyncs, res.report.dropped_entries
    );
    return res;
}

CopiesResult JsbParser::DecodeCopies(
    std::span<const std::uint8_t> bytes,
    const OffsetTable& table,
    const ParserOptions& opt
) {
    CheckDigest(bytes, table, opt);
    CopiesResult res{};
    res.copies = decode_copies(bytes, table);
    for (const auto& copy : res.copies) {
        res.json.push_back(ordered_fields(copy, table.order));
    }
    FM_LOG_INFO("Decoded %zu cop(ies) of %s", res.copies.size(), table.name.c_str());
    return res;
}

nlohmann::ordered_json JsbParser::DecodeWeightsBytes(std::span<const std::uint8_t> bytes) {
    const auto layout = WeightsLayout::match_engine();
    return group_weights(scan_prefixed_keys(bytes, layout), layout);
}

PatchResult JsbParser::PatchBytes(
    std::span<const std::uint8_t> bytes,
    const OffsetTable& table,
    const EditMap& edits,
    const ParserOptions& opt
) {
    CheckDigest(bytes, table, opt);
    auto res = patch(bytes, table, edits);
    if (res.bytes.size() != bytes.size()) {
        throw std::logic_error("patch changed the container length");
    }
    return res;
}

VerifyReport JsbParser::CompareCopies(
    std::span<const std::uint8_t> bytes,
    const OffsetTable& table,
    const ParserOptions& opt
) {
    CheckDigest(bytes, table, opt);
    return compare_copies(decode_copies(bytes, table), table.ignored);
}

VerifyReport JsbParser::VerifyExpected(
    std::span<const std::uint8_t> bytes,
    const OffsetTable& table,
    const FieldValues& expected,
    const ParserOptions& opt
) {
    CheckDigest(bytes, table, opt);
    return check_expected(decode_copies(bytes, table), expected);
}

bool JsbParser::CheckDigest(
    std::span<const std::uint8_t> bytes,
    const OffsetTable& table,
    const ParserOptions& opt
) {
    if (!table.digest.has_value()) {
        return true;
    }
    if (matches_digest(bytes, *table.digest)) {
        FM_LOG_DEBUG("BLAKE3 digest matches offset table %s", table.name.c_str());
        return true;
    }
    const std::string msg = "file does not match the BLAKE3 digest of offset table " + table.name
                            + " (got " + fingerprint(bytes) + ")";
    if (opt.strict) {
        throw std::runtime_error(msg);
    }
    FM_LOG_WARN("%s", msg.c_str());
    return false;
}

}  // namespace fm::jsb
