/**
 * @file test_encoding.cpp
 * @brief Unit tests for base64url encoding and the JSON helpers
 */

#include <gtest/gtest.h>

#include <kcenon/peer_transfer/core/encoding.h>
#include <kcenon/peer_transfer/core/json_utils.h>

#include <string>

namespace kcenon::peer_transfer::test {

// =============================================================================
// base64url Tests
// =============================================================================

class Base64UrlTest : public ::testing::Test {};

TEST_F(Base64UrlTest, EncodesWithoutPadding) {
    EXPECT_EQ(encoding::base64url_encode(""), "");
    EXPECT_EQ(encoding::base64url_encode("f"), "Zg");
    EXPECT_EQ(encoding::base64url_encode("fo"), "Zm8");
    EXPECT_EQ(encoding::base64url_encode("foo"), "Zm9v");
    EXPECT_EQ(encoding::base64url_encode("foobar"), "Zm9vYmFy");
}

TEST_F(Base64UrlTest, UsesUrlSafeAlphabet) {
    // 0xfb 0xff encodes to "+/8=" in standard base64
    std::string data("\xfb\xff", 2);
    auto encoded = encoding::base64url_encode(data);

    EXPECT_EQ(encoded, "-_8");
    EXPECT_EQ(encoded.find_first_of("+/="), std::string::npos);
}

TEST_F(Base64UrlTest, DecodeAcceptsPaddingAndStandardAlphabet) {
    EXPECT_EQ(encoding::base64url_decode("Zm8"), std::optional<std::string>("fo"));
    EXPECT_EQ(encoding::base64url_decode("Zm8="), std::optional<std::string>("fo"));
    EXPECT_EQ(encoding::base64url_decode("+/8="), std::optional<std::string>("\xfb\xff"));
}

TEST_F(Base64UrlTest, DecodeRejectsInvalidCharacters) {
    EXPECT_FALSE(encoding::base64url_decode("Zm9v!"));
    EXPECT_FALSE(encoding::base64url_decode("Z"));
}

TEST_F(Base64UrlTest, BinaryRoundTrip) {
    std::string data;
    for (int i = 0; i < 256; ++i) {
        data.push_back(static_cast<char>(i));
    }
    EXPECT_EQ(encoding::base64url_decode(encoding::base64url_encode(data)),
              std::optional<std::string>(data));
}

// =============================================================================
// JSON Tests
// =============================================================================

class JsonUtilsTest : public ::testing::Test {};

TEST_F(JsonUtilsTest, ParsesFlatObject) {
    auto parsed = json::parse_object(R"({"type":"meta","size":42,"ok":true,"mime":null})");
    ASSERT_TRUE(parsed);

    EXPECT_EQ(parsed->get_string("type"), std::optional<std::string>("meta"));
    EXPECT_EQ(parsed->get_uint("size"), std::optional<uint64_t>(42));
    EXPECT_TRUE(parsed->contains("ok"));
    ASSERT_NE(parsed->find("mime"), nullptr);
    EXPECT_EQ(parsed->find("mime")->type, json::value_type::null);
}

TEST_F(JsonUtilsTest, RejectsNonObjects) {
    EXPECT_FALSE(json::parse_object("[1,2]"));
    EXPECT_FALSE(json::parse_object("\"text\""));
    EXPECT_FALSE(json::parse_object("{\"a\":1"));
    EXPECT_FALSE(json::parse_object("{\"a\":1} trailing"));
    EXPECT_FALSE(json::parse_object(""));
}

TEST_F(JsonUtilsTest, NestedValuesAreSkipped) {
    auto parsed = json::parse_object(R"({"nested":{"a":[1,2,{"b":3}]},"id":"x"})");
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed->find("nested")->type, json::value_type::composite);
    EXPECT_EQ(parsed->get_string("id"), std::optional<std::string>("x"));
}

TEST_F(JsonUtilsTest, UintRejectsFractionsAndNegatives) {
    auto parsed = json::parse_object(R"({"a":1.5,"b":-3,"c":"7"})");
    ASSERT_TRUE(parsed);
    EXPECT_FALSE(parsed->get_uint("a"));
    EXPECT_FALSE(parsed->get_uint("b"));
    EXPECT_FALSE(parsed->get_uint("c"));
}

TEST_F(JsonUtilsTest, DecodesEscapes) {
    auto parsed = json::parse_object(R"({"s":"line\nbreak \"quoted\" \u00e9"})");
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed->get_string("s"), std::optional<std::string>("line\nbreak \"quoted\" \xc3\xa9"));
}

TEST_F(JsonUtilsTest, WriterOutputParsesBack) {
    auto text = json::writer()
                    .add("name", "quote\" and \\ backslash\n")
                    .add("size", uint64_t{123})
                    .add("flag", true)
                    .str();

    auto parsed = json::parse_object(text);
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed->get_string("name"),
              std::optional<std::string>("quote\" and \\ backslash\n"));
    EXPECT_EQ(parsed->get_uint("size"), std::optional<uint64_t>(123));
}

}  // namespace kcenon::peer_transfer::test
