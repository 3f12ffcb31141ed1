/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "jsb/jsb_copy_decoder.h"
#include "jsb/jsb_errors.h"
#include "jsb/jsb_patcher.h"
#include "jsb_test_builder.h"

#include <gtest/gtest.h>

#include <vector>

namespace fm::jsb {
namespace {

using test::ContainerBuilder;

struct PhysicsFixture {
    std::vector<std::uint8_t> buf;
    OffsetTable table;
};

// Two copies of each field; the second copy of acceleration uses the 1-byte form.
PhysicsFixture make_physics() {
    ContainerBuilder b;
    b.raw({0xC9, 0x11});
    const auto walk1 = b.bare_u32("walk_speed", 120);
    const auto run1 = b.bare_u32("run_speed", 480);
    const auto acc1 = b.bare_u32("acceleration", 30);
    const auto ver1 = b.bare_u32("version_year", 24);
    b.raw({0x00, 0xC9, 0x11});
    const auto walk2 = b.bare_u32("walk_speed", 120);
    const auto run2 = b.bare_u32("run_speed", 480);
    const auto acc2 = b.bare_u8("acceleration", 30);
    const auto ver2 = b.bare_u32("version_year", 25);
    b.raw({0x00});

    PhysicsFixture f{};
    f.buf = b.bytes();
    f.table.name = "physics_test";
    f.table.declared_copies = 2;
    f.table.fields["walk_speed"] = {walk1, walk2};
    f.table.fields["run_speed"] = {run1, run2};
    f.table.fields["acceleration"] = {acc1, acc2};
    f.table.fields["version_year"] = {ver1, ver2};
    f.table.ignored = {"version_year"};
    return f;
}

TEST(Patcher, WritesEveryOccurrence) {
    const auto f = make_physics();
    const auto original = f.buf;
    const auto res = patch(f.buf, f.table, {{"walk_speed", 150}, {"run_speed", 70000}});

    EXPECT_EQ(res.bytes.size(), f.buf.size());
    EXPECT_EQ(f.buf, original);
    EXPECT_EQ(res.writes, 4u);
    EXPECT_TRUE(res.warnings.empty());

    const auto copies = decode_copies(res.bytes, f.table);
    ASSERT_EQ(copies.size(), 2u);
    EXPECT_EQ(copies[0].at("walk_speed"), 150);
    EXPECT_EQ(copies[1].at("walk_speed"), 150);
    EXPECT_EQ(copies[0].at("run_speed"), 70000);
    EXPECT_EQ(copies[1].at("run_speed"), 70000);
}

TEST(Patcher, IsIdempotent) {
    const auto f = make_physics();
    const EditMap edits{{"walk_speed", 99}, {"acceleration", 31}};
    const auto once = patch(f.buf, f.table, edits);
    const auto twice = patch(once.bytes, f.table, edits);
    EXPECT_EQ(once.bytes, twice.bytes);
}

TEST(Patcher, RewritingDecodedValuesLeavesBufferUnchanged) {
    const auto f = make_physics();
    const auto copies = decode_copies(f.buf, f.table);
    ASSERT_EQ(copies.size(), 2u);
    ASSERT_EQ(copies[1].at("acceleration"), 30);

    const EditMap edits(copies[0].begin(), copies[0].end());
    const auto res = patch(f.buf, f.table, edits);

    EXPECT_EQ(res.bytes, f.buf);
    EXPECT_EQ(res.writes, 5u);
    ASSERT_EQ(res.warnings.size(), 1u);
    EXPECT_EQ(res.warnings[0].kind, PatchWarningKind::IndicatorMismatch);
    EXPECT_EQ(res.warnings[0].field, "acceleration");
}

TEST(Patcher, NonFixedIndicatorIsSkippedWithWarning) {
    const auto f = make_physics();
    const auto res = patch(f.buf, f.table, {{"acceleration", 45}});

    EXPECT_EQ(res.writes, 1u);
    ASSERT_EQ(res.warnings.size(), 1u);
    EXPECT_EQ(res.warnings[0].kind, PatchWarningKind::IndicatorMismatch);
    EXPECT_EQ(res.warnings[0].field, "acceleration");
    EXPECT_NE(res.warnings[0].message.find("acceleration"), std::string::npos);

    const auto copies = decode_copies(res.bytes, f.table);
    EXPECT_EQ(copies[0].at("acceleration"), 45);
    EXPECT_EQ(copies[1].at("acceleration"), 30);
}

TEST(Patcher, UnknownFieldIsOffsetTableMiss) {
    const auto f = make_physics();
    const auto res = patch(f.buf, f.table, {{"sprint_speed", 1}});
    EXPECT_EQ(res.bytes, f.buf);
    EXPECT_EQ(res.writes, 0u);
    ASSERT_EQ(res.warnings.size(), 1u);
    EXPECT_EQ(res.warnings[0].kind, PatchWarningKind::OffsetTableMiss);
    EXPECT_EQ(res.warnings[0].field, "sprint_speed");
}

TEST(Patcher, IgnoredFieldsAreLeftAlone) {
    const auto f = make_physics();
    const auto res = patch(f.buf, f.table, {{"version_year", 30}});
    EXPECT_EQ(res.bytes, f.buf);
    EXPECT_TRUE(res.warnings.empty());
}

TEST(Patcher, KeyTextMismatchSkipsOccurrence) {
    auto f = make_physics();
    f.table.fields["walk_speed"][1] = f.table.fields["run_speed"][1];
    const auto res = patch(f.buf, f.table, {{"walk_speed", 7}});
    EXPECT_EQ(res.writes, 1u);
    ASSERT_EQ(res.warnings.size(), 1u);
    EXPECT_EQ(res.warnings[0].kind, PatchWarningKind::KeyTextMismatch);

    const auto copies = decode_copies(res.bytes, make_physics().table);
    EXPECT_EQ(copies[1].at("run_speed"), 480);
}

TEST(Patcher, OffsetPastEndAbortsBeforeWriting) {
    auto f = make_physics();
    f.table.fields["run_speed"].push_back(f.buf.size() - 3);
    try {
        patch(f.buf, f.table, {{"walk_speed", 1}, {"run_speed", 2}});
        FAIL() << "expected InvalidOffsets";
    } catch (const CodecError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidOffsets);
    }
}

TEST(Patcher, ValuesMustFitUnsigned32) {
    const auto f = make_physics();
    for (const std::int64_t bad : {std::int64_t{-1}, std::int64_t{1} << 32}) {
        try {
            patch(f.buf, f.table, {{"walk_speed", bad}});
            FAIL() << "expected ValueOutOfRange for " << bad;
        } catch (const CodecError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::ValueOutOfRange);
        }
    }
    EXPECT_NO_THROW(patch(f.buf, f.table, {{"walk_speed", 4294967295LL}}));
}

TEST(Patcher, EditsFromJson) {
    const auto edits = edits_from_json(nlohmann::ordered_json{{"walk_speed", 150}, {"run_speed", 0}});
    EXPECT_EQ(edits.size(), 2u);
    EXPECT_EQ(edits.at("walk_speed"), 150);
    EXPECT_THROW(edits_from_json(nlohmann::ordered_json{{"walk_speed", "fast"}}), std::runtime_error);
    EXPECT_THROW(edits_from_json(nlohmann::ordered_json::array()), std::runtime_error);
}

}  // namespace
}  // namespace fm::jsb
