#include "mpu/util/encoding.hpp"

#include <gtest/gtest.h>

using namespace mpu::util;

TEST(EncodingTest, PercentEncodeMatchesUriComponentRules) {
    EXPECT_EQ(percent_encode("abc-_.!~*'()"), "abc-_.!~*'()");
    EXPECT_EQ(percent_encode("a b/c"), "a%20b%2Fc");
    EXPECT_EQ(percent_encode("?&="), "%3F%26%3D");
    EXPECT_EQ(percent_encode("\xC3\xA9"), "%C3%A9");
}

TEST(EncodingTest, PercentDecode) {
    EXPECT_EQ(percent_decode("a%20b%2fc").value_or(""), "a b/c");
    EXPECT_EQ(percent_decode("a+b").value_or(""), "a+b");
    EXPECT_EQ(percent_decode("a+b", true).value_or(""), "a b");
}

TEST(EncodingTest, PercentDecodeRejectsBadEscapes) {
    EXPECT_FALSE(percent_decode("%").has_value());
    EXPECT_FALSE(percent_decode("%4").has_value());
    EXPECT_FALSE(percent_decode("%zz").has_value());
}

TEST(EncodingTest, PercentRoundTripForKeys) {
    const std::string key = "reports/2024 Q1 (final) #2.pdf";
    EXPECT_EQ(percent_decode(percent_encode(key)).value_or(""), key);
}

TEST(EncodingTest, ParseQuery) {
    auto params = parse_query("uploadId=abc%2F1&partNumber=3&flag&name=a+b");

    EXPECT_EQ(params["uploadId"], "abc/1");
    EXPECT_EQ(params["partNumber"], "3");
    EXPECT_EQ(params.count("flag"), 1u);
    EXPECT_EQ(params["flag"], "");
    EXPECT_EQ(params["name"], "a b");
}

TEST(EncodingTest, ParseQueryKeepsMalformedEscapesRaw) {
    auto params = parse_query("a=%zz&&b=1");

    EXPECT_EQ(params["a"], "%zz");
    EXPECT_EQ(params["b"], "1");
    EXPECT_EQ(params.size(), 2u);
}

TEST(EncodingTest, FormatTimestamp) {
    const auto time = std::chrono::system_clock::from_time_t(1714566600) + std::chrono::milliseconds(250);
    EXPECT_EQ(format_timestamp(time), "2024-05-01T12:30:00.250Z");
}

TEST(EncodingTest, ParseTimestamp) {
    auto parsed = parse_timestamp("2024-05-01T12:30:00.250Z");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(format_timestamp(*parsed), "2024-05-01T12:30:00.250Z");

    auto whole_seconds = parse_timestamp("2024-05-01T12:30:00Z");
    ASSERT_TRUE(whole_seconds.has_value());
    EXPECT_EQ(std::chrono::system_clock::to_time_t(*whole_seconds), 1714566600);

    EXPECT_FALSE(parse_timestamp("2024-05-01 12:30:00").has_value());
    EXPECT_FALSE(parse_timestamp("2024-05-01T12:30:00").has_value());
}

TEST(EncodingTest, Fnv1aKnownVectors) {
    EXPECT_EQ(fnv1a_hex(std::string{}), "cbf29ce484222325");
    EXPECT_EQ(fnv1a_hex(std::string{"a"}), "af63dc4c8601ec8c");
}

TEST(EncodingTest, Fnv1aIncrementalMatchesOneShot) {
    const std::string text = "multipart upload";
    Fnv1a hasher;
    hasher.update(reinterpret_cast<const std::uint8_t*>(text.data()), 5);
    hasher.update(reinterpret_cast<const std::uint8_t*>(text.data()) + 5, text.size() - 5);

    EXPECT_EQ(hasher.hex(), fnv1a_hex(text));
}
