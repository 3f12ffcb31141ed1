/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "jsb/jsb_verifier.h"

#include "utils/log.h"

#include <limits>
#include <stdexcept>

namespace fm::jsb {
namespace {
std::vector<std::optional<std::int64_t>> values_of(const std::vector<FieldValues>& copies, const std::string& field) {
    std::vector<std::optional<std::int64_t>> out;
    out.reserve(copies.size());
    for (const auto& c : copies) {
        const auto it = c.find(field);
        out.push_back(it == c.end() ? std::nullopt : std::optional<std::int64_t>(it->second));
    }
    return out;
}

std::vector<std::pair<std::size_t, std::size_t>>
disagreeing_pairs(const std::vector<std::optional<std::int64_t>>& values) {
    std::vector<std::pair<std::size_t, std::size_t>> out;
    for (std::size_t i = 0; i < values.size(); i++) {
        for (std::size_t j = i + 1; j < values.size(); j++) {
            if (values[i] != values[j]) {
                out.emplace_back(i, j);
            }
        }
    }
    return out;
}

std::string describe(const Discrepancy& d) {
    std::string out = d.field + ":";
    for (std::size_t i = 0; i < d.copies.size(); i++) {
        out += " obj" + std::to_string(i + 1) + "="
               + (d.copies[i].has_value() ? std::to_string(*d.copies[i]) : std::string("None"));
        out += i + 1 < d.copies.size() ? "," : "";
    }
    if (d.expected.has_value()) {
        out += ", expected=" + std::to_string(*d.expected);
    }
    return out;
}
}  // namespace

const char* severity_name(Severity s) {
    return s == Severity::Warning ? "WARN" : "FAIL";
}

std::size_t VerifyReport::count(Severity s) const {
    std::size_t n = 0;
    for (const auto& d : discrepancies) {
        if (d.severity == s) {
            n++;
        }
    }
    return n;
}

VerifyReport compare_copies(const std::vector<FieldValues>& copies, const std::set<std::string>& ignored) {
    std::set<std::string> fields;
    for (const auto& c : copies) {
        for (const auto& [k, v] : c) {
            fields.insert(k);
        }
    }

    VerifyReport report{};
    for (const auto& field : fields) {
        if (ignored.find(field) != ignored.end()) {
            continue;
        }
        auto values = values_of(copies, field);
        auto pairs = disagreeing_pairs(values);
        if (pairs.empty()) {
            continue;
        }
        Discrepancy d{};
        d.field = field;
        d.severity = Severity::Failure;
        d.copies = std::move(values);
        d.pairs = std::move(pairs);
        FM_LOG_INFO("[DIFF] %s", describe(d).c_str());
        report.discrepancies.push_back(std::move(d));
        report.ok = false;
    }
    FM_LOG_INFO("%s", report.ok ? "Copies identical" : "Copies differ");
    return report;
}

VerifyReport check_expected(const std::vector<FieldValues>& copies, const FieldValues& expected) {
    VerifyReport report{};
    for (const auto& [field, want] : expected) {
        auto values = values_of(copies, field);
        bool matched = false;
        for (const auto& v : values) {
            if (v == want) {
                matched = true;
                break;
            }
        }
        auto pairs = disagreeing_pairs(values);
        if (matched && pairs.empty()) {
            continue;
        }
        Discrepancy d{};
        d.field = field;
        d.severity = matched ? Severity::Warning : Severity::Failure;
        d.copies = std::move(values);
        d.expected = want;
        d.pairs = std::move(pairs);
        FM_LOG_INFO("[%s] %s", severity_name(d.severity), describe(d).c_str());
        if (!matched) {
            report.ok = false;
        }
        report.discrepancies.push_back(std::move(d));
    }
    FM_LOG_INFO(
        "%s (%zu failure(s), %zu warning(s))", report.ok ? "Verification succeeded" : "Verification failed",
        report.count(Severity::Failure), report.count(Severity::Warning)
    );
    return report;
}

FieldValues expected_from_json(const nlohmann::ordered_json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Expected values must be a JSON object of field -> integer");
    }
    FieldValues out;
    for (const auto& [field, v] : j.items()) {
        if (!v.is_number_integer()) {
            throw std::runtime_error("Expected value for '" + field + "' is not an integer: " + v.dump());
        }
        if (v.is_number_unsigned()
            && v.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            throw std::runtime_error("Expected value for '" + field + "' is too large: " + v.dump());
        }
        out[field] = v.get<std::int64_t>();
    }
    return out;
}

}  // namespace fm::jsb
