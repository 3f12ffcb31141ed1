/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "jsb/jsb_errors.h"
#include "jsb/jsb_offset_table.h"
#include "jsb/jsb_shape.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <stdexcept>
#include <vector>

namespace fm::jsb {
namespace {

const std::filesystem::path kDataDir = JSB_PARSER_DATA_DIR;

TEST(OffsetTable, ParseOffsetValue) {
    EXPECT_EQ(parse_offset_value(nlohmann::ordered_json(42)), 42u);
    EXPECT_EQ(parse_offset_value(nlohmann::ordered_json("0x1F")), 31u);
    EXPECT_EQ(parse_offset_value(nlohmann::ordered_json("0x00000B1D")), 0xB1Du);
    EXPECT_EQ(parse_offset_value(nlohmann::ordered_json("100")), 100u);
    EXPECT_THROW(parse_offset_value(nlohmann::ordered_json("0xZZ")), std::runtime_error);
    EXPECT_THROW(parse_offset_value(nlohmann::ordered_json("12abc")), std::runtime_error);
    EXPECT_THROW(parse_offset_value(nlohmann::ordered_json(-1)), std::runtime_error);
    EXPECT_THROW(parse_offset_value(nlohmann::ordered_json(1.5)), std::runtime_error);
}

TEST(OffsetTable, FromJsonAcceptsArraysObjectsAndScalars) {
    const auto j = nlohmann::ordered_json::parse(R"({
        "name": "demo",
        "copies": 2,
        "blake3": "ABCDEF",
        "ignored": ["version_year"],
        "order": ["walk_speed", "run_speed"],
        "fields": {
            "walk_speed": ["0x10", 32],
            "run_speed": {"loc": "0x40", "loc2": "0x80"},
            "version_year": 7
        }
    })");
    const auto t = offset_table_from_json(j);
    EXPECT_EQ(t.name, "demo");
    EXPECT_EQ(t.declared_copies, 2u);
    ASSERT_TRUE(t.digest.has_value());
    EXPECT_EQ(*t.digest, "ABCDEF");
    EXPECT_TRUE(t.is_ignored("version_year"));
    EXPECT_FALSE(t.is_ignored("walk_speed"));
    EXPECT_EQ(t.order, (std::vector<std::string>{"walk_speed", "run_speed"}));

    ASSERT_NE(t.find("walk_speed"), nullptr);
    EXPECT_EQ(*t.find("walk_speed"), (std::vector<std::size_t>{0x10, 32}));
    EXPECT_EQ(*t.find("run_speed"), (std::vector<std::size_t>{0x40, 0x80}));
    EXPECT_EQ(*t.find("version_year"), (std::vector<std::size_t>{7}));
    EXPECT_EQ(t.find("sprint_speed"), nullptr);
    EXPECT_EQ(t.copy_count(), 2u);
}

TEST(OffsetTable, FromJsonRequiresFields) {
    EXPECT_THROW(offset_table_from_json(nlohmann::ordered_json::object()), std::runtime_error);
    EXPECT_THROW(offset_table_from_json(nlohmann::ordered_json::array()), std::runtime_error);
}

TEST(OffsetTable, ValidateOffsets) {
    OffsetTable t{};
    t.fields["ab"] = {0, 2};
    const std::vector<std::uint8_t> buf{'a', 'b', 'a', 'b', 0x02};
    EXPECT_NO_THROW(validate_offsets(t, buf));

    t.fields["ab"].push_back(4);
    try {
        validate_offsets(t, buf);
        FAIL() << "expected InvalidOffsets";
    } catch (const CodecError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidOffsets);
        EXPECT_EQ(e.offset(), 4u);
    }
}

TEST(OffsetTable, ShippedPhysicsTable) {
    const auto t = load_offset_table(kDataDir / "physical_constraints.offsets.json");
    EXPECT_EQ(t.name, "physical_constraints");
    EXPECT_EQ(t.fields.size(), 82u);
    EXPECT_EQ(t.copy_count(), 2u);
    EXPECT_EQ(*t.find("walk_speed"), (std::vector<std::size_t>{0xB08, 0x160B}));
    EXPECT_EQ(*t.find("acceleration_scaler"), (std::vector<std::size_t>{0x16, 0xB1D}));
    EXPECT_TRUE(t.is_ignored("version_major"));
    EXPECT_TRUE(t.is_ignored("version_year"));
    ASSERT_FALSE(t.order.empty());
    EXPECT_EQ(t.order.front(), "very_slow_walk_speed");
    EXPECT_FALSE(t.digest.has_value());
}

TEST(SeasonLayout, ShippedAnchors) {
    const auto path = kDataDir / "player_ratings_data.layout.json";
    const auto fm24 = load_season_anchors(path, "fm24");
    EXPECT_EQ(fm24.at("expected_score_data"), 0x00067725u);
    EXPECT_EQ(fm24.at("role_data"), 0x00067AAEu);
    EXPECT_EQ(fm24.at("version"), 0x000764D6u);

    const auto fm2301 = load_season_anchors(path, "fm2301");
    EXPECT_EQ(fm2301.at("role_lookup_data"), 0x0005932Bu);

    EXPECT_EQ(list_seasons(path), (std::vector<std::string>{"fm24", "fm2302", "fm2301"}));
    EXPECT_THROW(load_season_anchors(path, "fm99"), std::runtime_error);

    // every section of the layout has an anchor, in file order
    const auto layout = player_ratings_season_layout();
    std::size_t prev = 0;
    for (const auto& section : layout.sections) {
        ASSERT_EQ(fm24.count(section.name), 1u) << section.name;
        EXPECT_GT(fm24.at(section.name), prev);
        prev = fm24.at(section.name);
    }
}

TEST(SeasonLayout, MissingFileThrows) {
    EXPECT_THROW(load_season_anchors(kDataDir / "does_not_exist.json", "fm24"), std::runtime_error);
}

}  // namespace
}  // namespace fm::jsb
