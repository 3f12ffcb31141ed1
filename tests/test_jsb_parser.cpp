/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "jsb/jsb_errors.h"
#include "jsb/jsb_fingerprint.h"
#include "jsb_parser.h"
#include "jsb_test_builder.h"

#include <gtest/gtest.h>

#include <cctype>
#include <stdexcept>
#include <string>
#include <vector>

namespace fm::jsb {
namespace {

using test::ContainerBuilder;

struct Container {
    std::vector<std::uint8_t> buf;
    OffsetTable table;
};

Container make_container() {
    ContainerBuilder b;
    b.raw({0xC9, 0x11});
    const auto walk1 = b.bare_u32("walk_speed", 120);
    const auto run1 = b.bare_u32("run_speed", 480);
    const auto turn1 = b.bare_u32("turn_rate", 9);
    b.raw({0x00, 0xC9, 0x11});
    const auto walk2 = b.bare_u32("walk_speed", 120);
    const auto run2 = b.bare_u32("run_speed", 480);
    const auto turn2 = b.bare_u32("turn_rate", 9);
    b.raw({0x00});

    Container c{};
    c.buf = b.bytes();
    c.table.name = "facade_test";
    c.table.declared_copies = 2;
    c.table.fields["walk_speed"] = {walk1, walk2};
    c.table.fields["run_speed"] = {run1, run2};
    c.table.fields["turn_rate"] = {turn1, turn2};
    c.table.order = {"walk_speed", "run_speed"};
    return c;
}

std::string upper(std::string s) {
    for (auto& ch : s) {
        ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    }
    return s;
}

TEST(Fingerprint, EmptyInputIsBlake3OfNothing) {
    EXPECT_EQ(
        fingerprint(std::vector<std::uint8_t>{}),
        "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262"
    );
}

TEST(Fingerprint, DigestComparisonIgnoresCase) {
    const auto c = make_container();
    const auto hex = fingerprint(c.buf);
    EXPECT_EQ(hex.size(), 64u);
    EXPECT_TRUE(matches_digest(c.buf, hex));
    EXPECT_TRUE(matches_digest(c.buf, upper(hex)));
    EXPECT_FALSE(matches_digest(c.buf, hex.substr(0, 63)));

    auto other = c.buf;
    other.back() ^= 0x01u;
    EXPECT_FALSE(matches_digest(other, hex));
}

TEST(JsbParser, CheckDigestWithoutStoredDigestPasses) {
    const auto c = make_container();
    EXPECT_TRUE(JsbParser::CheckDigest(c.buf, c.table, ParserOptions{true}));
}

TEST(JsbParser, CheckDigestMismatchWarnsOrThrows) {
    auto c = make_container();
    c.table.digest = upper(fingerprint(c.buf));
    EXPECT_TRUE(JsbParser::CheckDigest(c.buf, c.table));

    c.table.digest = std::string(64, '0');
    EXPECT_FALSE(JsbParser::CheckDigest(c.buf, c.table));
    EXPECT_THROW(JsbParser::CheckDigest(c.buf, c.table, ParserOptions{true}), std::runtime_error);
}

TEST(JsbParser, StrictDigestMismatchStopsPatch) {
    auto c = make_container();
    c.table.digest = std::string(64, '0');
    EXPECT_THROW(
        JsbParser::PatchBytes(c.buf, c.table, {{"walk_speed", 1}}, ParserOptions{true}), std::runtime_error
    );

    const auto res = JsbParser::PatchBytes(c.buf, c.table, {{"walk_speed", 1}});
    EXPECT_EQ(res.bytes.size(), c.buf.size());
    EXPECT_EQ(res.writes, 2u);
}

TEST(JsbParser, DecodeCopiesFollowsPresentationOrder) {
    const auto c = make_container();
    const auto res = JsbParser::DecodeCopies(c.buf, c.table);
    ASSERT_EQ(res.copies.size(), 2u);
    ASSERT_EQ(res.json.size(), 2u);

    std::vector<std::string> keys;
    for (auto it = res.json[1].begin(); it != res.json[1].end(); ++it) {
        keys.push_back(it.key());
    }
    EXPECT_EQ(keys, (std::vector<std::string>{"walk_speed", "run_speed", "turn_rate"}));
    EXPECT_EQ(res.json[1]["turn_rate"], 9);
}

TEST(JsbParser, OffsetPastEndFailsVerification) {
    auto c = make_container();
    c.table.fields["walk_speed"][1] = c.buf.size() + 1000;
    try {
        JsbParser::VerifyExpected(c.buf, c.table, {{"walk_speed", 120}});
        FAIL() << "expected InvalidOffsets";
    } catch (const CodecError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidOffsets);
    }
    EXPECT_THROW(JsbParser::CompareCopies(c.buf, c.table), CodecError);
    EXPECT_THROW(JsbParser::DecodeCopies(c.buf, c.table), CodecError);
}

TEST(JsbParser, CompareAndVerifyAgreeingCopies) {
    const auto c = make_container();
    EXPECT_TRUE(JsbParser::CompareCopies(c.buf, c.table).ok);
    const auto report = JsbParser::VerifyExpected(c.buf, c.table, {{"walk_speed", 120}, {"run_speed", 1}});
    EXPECT_FALSE(report.ok);
    EXPECT_EQ(report.count(Severity::Failure), 1u);
}

}  // namespace
}  // namespace fm::jsb
