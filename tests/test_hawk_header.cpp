//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_hawk_header.cpp
// Purpose: GoogleTests for the Hawk attribute-list grammar
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

#include "hawkguard/hawk/Header.hpp"

using namespace hawkguard::hawk;

namespace {
const std::string kMac = "6R4rV5iE+NPoym+WwjeHzjAGXUtLNIxmo1vpMofpLAE=";
}

TEST(HawkHeader, ParseTypicalHeader) {
    const std::string v = "id=\"dh37fgj492je\", ts=\"1353832234\", nonce=\"j4h3g2\", ext=\"some-app-ext-data\", mac=\"" + kMac + "\"";
    HawkHeader h; HeaderParseError err;
    ASSERT_TRUE(ParseHawkHeader(v, h, err)) << err.message;
    EXPECT_EQ(h.id, std::string("dh37fgj492je"));
    ASSERT_TRUE(h.ts.has_value());
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::seconds>(h.ts->time_since_epoch()).count(), 1353832234);
    EXPECT_EQ(h.nonce, std::string("j4h3g2"));
    EXPECT_EQ(h.ext, std::string("some-app-ext-data"));
    ASSERT_TRUE(h.mac.has_value());
    EXPECT_EQ(h.mac->size(), 32u);
    EXPECT_EQ(h.mac->front(), 0xE9);
    EXPECT_FALSE(h.hash.has_value());
    EXPECT_FALSE(h.app.has_value());
    EXPECT_FALSE(h.dlg.has_value());
}

TEST(HawkHeader, ParseAllFields) {
    const std::string v = "id=\"a\", ts=\"1\", nonce=\"n\", mac=\"AAEC\", ext=\"e\", hash=\"AQID\", app=\"my-app\", dlg=\"my-dlg\"";
    HawkHeader h; HeaderParseError err;
    ASSERT_TRUE(ParseHawkHeader(v, h, err)) << err.message;
    EXPECT_EQ(h.mac, (std::vector<unsigned char>{ 0x00, 0x01, 0x02 }));
    EXPECT_EQ(h.hash, (std::vector<unsigned char>{ 0x01, 0x02, 0x03 }));
    EXPECT_EQ(h.app, std::string("my-app"));
    EXPECT_EQ(h.dlg, std::string("my-dlg"));
}

TEST(HawkHeader, EmptyInput_EmptyHeader) {
    HawkHeader h; HeaderParseError err;
    ASSERT_TRUE(ParseHawkHeader("", h, err));
    EXPECT_FALSE(h.id.has_value());
    EXPECT_FALSE(h.ts.has_value());
    EXPECT_FALSE(h.mac.has_value());
}

TEST(HawkHeader, SeparatorsAndWhitespaceAreFlexible) {
    HawkHeader h; HeaderParseError err;
    ASSERT_TRUE(ParseHawkHeader("  id = \"a\" ,,  nonce=\"b\"  ", h, err)) << err.message;
    EXPECT_EQ(h.id, std::string("a"));
    EXPECT_EQ(h.nonce, std::string("b"));
}

TEST(HawkHeader, UnknownField_Rejected) {
    HawkHeader h; HeaderParseError err;
    EXPECT_FALSE(ParseHawkHeader("nosuchfield=\"abc\"", h, err));
    EXPECT_EQ(err.kind, ParseErrorKind::InvalidField);
    EXPECT_EQ(err.message, std::string("Invalid Hawk field nosuchfield"));
}

TEST(HawkHeader, FieldNamesAreCaseSensitive) {
    HawkHeader h; HeaderParseError err;
    EXPECT_FALSE(ParseHawkHeader("ID=\"abc\"", h, err));
    EXPECT_EQ(err.message, std::string("Invalid Hawk field ID"));
}

TEST(HawkHeader, SyntaxErrors) {
    HawkHeader h; HeaderParseError err;

    EXPECT_FALSE(ParseHawkHeader("id", h, err));
    EXPECT_EQ(err.kind, ParseErrorKind::Syntax);
    EXPECT_EQ(err.message, std::string("Expected '=' in Hawk header"));

    EXPECT_FALSE(ParseHawkHeader("id=abc", h, err));
    EXPECT_EQ(err.kind, ParseErrorKind::Syntax);
    EXPECT_EQ(err.message, std::string("Expected opening quote in Hawk header"));

    EXPECT_FALSE(ParseHawkHeader("id=\"abc", h, err));
    EXPECT_EQ(err.kind, ParseErrorKind::Syntax);
    EXPECT_EQ(err.message, std::string("Expected closing quote in Hawk header"));
}

TEST(HawkHeader, BadTimestamp_Rejected) {
    HawkHeader h; HeaderParseError err;
    EXPECT_FALSE(ParseHawkHeader("ts=\"soon\"", h, err));
    EXPECT_EQ(err.kind, ParseErrorKind::InvalidTimestamp);
    EXPECT_FALSE(ParseHawkHeader("ts=\"-5\"", h, err));
    EXPECT_EQ(err.kind, ParseErrorKind::InvalidTimestamp);
    EXPECT_FALSE(ParseHawkHeader("ts=\"\"", h, err));
    EXPECT_EQ(err.kind, ParseErrorKind::InvalidTimestamp);
    EXPECT_FALSE(ParseHawkHeader("ts=\"99999999999999999999999\"", h, err));
    EXPECT_EQ(err.kind, ParseErrorKind::InvalidTimestamp);
}

TEST(HawkHeader, BadBase64_Rejected) {
    HawkHeader h; HeaderParseError err;
    EXPECT_FALSE(ParseHawkHeader("mac=\"not base64!\"", h, err));
    EXPECT_EQ(err.kind, ParseErrorKind::InvalidBase64);
    EXPECT_EQ(err.message, std::string("Invalid base64 in Hawk field mac"));
    EXPECT_FALSE(ParseHawkHeader("hash=\"abc\"", h, err));
    EXPECT_EQ(err.kind, ParseErrorKind::InvalidBase64);
    EXPECT_FALSE(ParseHawkHeader("hash=\"a=bc\"", h, err));
    EXPECT_EQ(err.kind, ParseErrorKind::InvalidBase64);
}

TEST(HawkHeader, BackslashInValue_Rejected) {
    HawkHeader h; HeaderParseError err;
    EXPECT_FALSE(ParseHawkHeader("ext=\"a\\b\"", h, err));
    EXPECT_EQ(err.kind, ParseErrorKind::ForbiddenCharacter);
}

TEST(HawkHeader, RepeatedField_LastWins) {
    HawkHeader h; HeaderParseError err;
    ASSERT_TRUE(ParseHawkHeader("id=\"first\", id=\"second\"", h, err));
    EXPECT_EQ(h.id, std::string("second"));
}

TEST(HawkHeader, FormatOrdersFieldsAndEncodesBytes) {
    HawkHeader h;
    h.mac = std::vector<unsigned char>{ 0x00, 0x01, 0x02 };
    h.nonce = "abc";
    h.ts = std::chrono::system_clock::time_point(std::chrono::seconds(1353832234));
    h.id = "xyz";
    std::string attrs, value; HeaderParseError err;
    ASSERT_TRUE(FormatHawkHeader(h, attrs, err)) << err.message;
    EXPECT_EQ(attrs, std::string("id=\"xyz\", ts=\"1353832234\", nonce=\"abc\", mac=\"AAEC\""));
    ASSERT_TRUE(MakeHawkAuthorizationValue(h, value, err)) << err.message;
    EXPECT_EQ(value, std::string("Hawk id=\"xyz\", ts=\"1353832234\", nonce=\"abc\", mac=\"AAEC\""));
}

TEST(HawkHeader, FormattedHeaderParsesBack) {
    HawkHeader h;
    h.id = "xyz";
    h.ext = "data";
    h.hash = std::vector<unsigned char>{ 0xFF, 0xEE };
    std::string attrs; HeaderParseError err;
    ASSERT_TRUE(FormatHawkHeader(h, attrs, err)) << err.message;
    HawkHeader back;
    ASSERT_TRUE(ParseHawkHeader(attrs, back, err)) << err.message;
    EXPECT_EQ(back.id, h.id);
    EXPECT_EQ(back.ext, h.ext);
    EXPECT_EQ(back.hash, h.hash);
}

TEST(HawkHeader, FormatRejectsQuoteThatWouldAddAttributes) {
    HawkHeader h;
    h.id = "victim\", mac=\"AAEC";
    h.ext = "x";
    std::string attrs = "untouched"; HeaderParseError err;
    EXPECT_FALSE(FormatHawkHeader(h, attrs, err));
    EXPECT_EQ(err.kind, ParseErrorKind::ForbiddenCharacter);
    EXPECT_NE(err.message.find("id"), std::string::npos);
    EXPECT_EQ(attrs.find("mac"), std::string::npos);

    std::string value;
    EXPECT_FALSE(MakeHawkAuthorizationValue(h, value, err));
    EXPECT_TRUE(value.empty());
}

TEST(HawkHeader, FormatRejectsBackslashInAnyTextField) {
    std::string attrs; HeaderParseError err;
    HawkHeader withNonce; withNonce.nonce = "a\\b";
    EXPECT_FALSE(FormatHawkHeader(withNonce, attrs, err));
    EXPECT_EQ(err.kind, ParseErrorKind::ForbiddenCharacter);

    HawkHeader withDlg; withDlg.dlg = "d\"";
    EXPECT_FALSE(FormatHawkHeader(withDlg, attrs, err));
    EXPECT_EQ(err.kind, ParseErrorKind::ForbiddenCharacter);
}

TEST(HawkHeader, FormatRejectsTimestampBeforeEpoch) {
    HawkHeader h;
    h.id = "xyz";
    h.ts = std::chrono::system_clock::time_point(std::chrono::seconds(-5));
    std::string attrs; HeaderParseError err;
    EXPECT_FALSE(FormatHawkHeader(h, attrs, err));
    EXPECT_EQ(err.kind, ParseErrorKind::InvalidTimestamp);
    EXPECT_EQ(err.message, std::string("Invalid Hawk timestamp -5"));
}

TEST(Base64, DecodesPaddedInput) {
    EXPECT_EQ(DecodeBase64("YQ=="), (std::vector<unsigned char>{ 'a' }));
    EXPECT_EQ(DecodeBase64("YWI="), (std::vector<unsigned char>{ 'a', 'b' }));
    EXPECT_EQ(DecodeBase64("YWJj"), (std::vector<unsigned char>{ 'a', 'b', 'c' }));
    EXPECT_EQ(EncodeBase64(std::vector<unsigned char>{ 'a' }), std::string("YQ=="));
}

TEST(Base64, RejectsMisplacedPaddingAndWhitespace) {
    EXPECT_FALSE(DecodeBase64("Y===").has_value());
    EXPECT_FALSE(DecodeBase64(" YWJ").has_value());
    EXPECT_FALSE(DecodeBase64("YW=j").has_value());
}
