/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "jsb/jsb_errors.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace fm::jsb {
namespace {

std::vector<std::uint8_t> counting_buffer(std::size_t n) {
    std::vector<std::uint8_t> buf(n);
    for (std::size_t i = 0; i < n; i++) {
        buf[i] = static_cast<std::uint8_t>(i);
    }
    return buf;
}

TEST(Errors, HexOffset) {
    EXPECT_EQ(hex_offset(0x67AAE), "0x00067AAE");
    EXPECT_EQ(hex_offset(0), "0x00000000");
}

TEST(Errors, HexContextMarksTheFaultingRow) {
    const auto buf = counting_buffer(64);
    const auto ctx = hex_context(buf, 20, 8);

    const auto first_nl = ctx.find('\n');
    ASSERT_NE(first_nl, std::string::npos);
    const auto row0 = ctx.substr(0, first_nl);
    const auto row1 = ctx.substr(first_nl + 1, ctx.find('\n', first_nl + 1) - first_nl - 1);

    EXPECT_EQ(row0.rfind("  0x00000000: 00 01 02", 0), 0u);
    EXPECT_EQ(row1.rfind("> 0x00000010: 10 11 12", 0), 0u);
    // window ends at pos + 8
    EXPECT_NE(row1.find("1B "), std::string::npos);
    EXPECT_EQ(row1.find("1C "), std::string::npos);
    EXPECT_EQ(ctx.find("0x00000020"), std::string::npos);
}

TEST(Errors, HexContextRendersAscii) {
    const std::vector<std::uint8_t> buf{'r', 'o', 'l', 'e', 0x00, 0xFF};
    const auto ctx = hex_context(buf, 0);
    EXPECT_NE(ctx.find("role.."), std::string::npos);
    EXPECT_TRUE(hex_context({}, 0).empty());
}

TEST(Errors, ThrowCodecErrorCarriesKindOffsetAndContext) {
    const auto buf = counting_buffer(32);
    try {
        throw_codec_error(ErrorKind::TokenMismatch, "wanted name", buf, 0x14);
        FAIL() << "throw_codec_error returned";
    } catch (const CodecError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TokenMismatch);
        EXPECT_EQ(e.offset(), 0x14u);
        EXPECT_EQ(e.message(), "wanted name");
        EXPECT_FALSE(e.context().empty());
        const std::string what = e.what();
        EXPECT_EQ(what.rfind("TokenMismatch at 0x00000014: wanted name\n", 0), 0u);
    }
}

TEST(Errors, KindNames) {
    EXPECT_STREQ(error_kind_name(ErrorKind::UnknownMarker), "UnknownMarker");
    EXPECT_STREQ(error_kind_name(ErrorKind::TruncatedOrCorrupt), "TruncatedOrCorrupt");
    EXPECT_STREQ(error_kind_name(ErrorKind::InvalidOffsets), "InvalidOffsets");
    EXPECT_STREQ(error_kind_name(ErrorKind::ValueOutOfRange), "ValueOutOfRange");
}

}  // namespace
}  // namespace fm::jsb
