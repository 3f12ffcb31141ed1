/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "jsb/jsb_copy_decoder.h"

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace fm::jsb {

enum class Severity : std::uint8_t { Warning, Failure };

const char* severity_name(Severity s);

struct Discrepancy {
    std::string field;
    Severity severity = Severity::Failure;
    // value per copy, nullopt where the copy lacks the field
    std::vector<std::optional<std::int64_t>> copies;
    std::optional<std::int64_t> expected;
    // copy index pairs that disagree
    std::vector<std::pair<std::size_t, std::size_t>> pairs;
};

struct VerifyReport {
    bool ok = true;
    std::vector<Discrepancy> discrepancies;

    std::size_t count(Severity s) const;
};

// Any disagreeing pair of copies fails the field; ignored fields are never compared.
VerifyReport compare_copies(const std::vector<FieldValues>& copies, const std::set<std::string>& ignored);

// A field passes when at least one copy holds the expected value. Disagreeing
// copies of a passing field are reported as warnings.
VerifyReport check_expected(const std::vector<FieldValues>& copies, const FieldValues& expected);

FieldValues expected_from_json(const nlohmann::ordered_json& j);

}  // namespace fm::jsb
