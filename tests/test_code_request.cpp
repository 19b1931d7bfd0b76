#include <gtest/gtest.h>

#include <code_request.hpp>

using namespace hamgen;

TEST(CodeRequestTest, PlainCountHasNoPrefix) {
    const auto r = parse_code_request("25");
    EXPECT_EQ(r.prefix, "");
    EXPECT_EQ(r.count, 25u);
}

TEST(CodeRequestTest, PrefixAndCount) {
    const auto r = parse_code_request("AB3:78");
    EXPECT_EQ(r.prefix, "AB3");
    EXPECT_EQ(r.count, 78u);
}

TEST(CodeRequestTest, EmptyPrefixBeforeColon) {
    const auto r = parse_code_request(":5");
    EXPECT_EQ(r.prefix, "");
    EXPECT_EQ(r.count, 5u);
}

TEST(CodeRequestTest, ZeroCountIsAllowed) {
    EXPECT_EQ(parse_code_request("S1:0").count, 0u);
}

TEST(CodeRequestTest, MalformedCountsAreRejected) {
    EXPECT_THROW(parse_code_request(""), std::invalid_argument);
    EXPECT_THROW(parse_code_request("A:"), std::invalid_argument);
    EXPECT_THROW(parse_code_request("ten"), std::invalid_argument);
    EXPECT_THROW(parse_code_request("-1"), std::invalid_argument);
    EXPECT_THROW(parse_code_request("A: 5"), std::invalid_argument);
    EXPECT_THROW(parse_code_request("A:B:3"), std::invalid_argument);
    EXPECT_THROW(parse_code_request("99999999999999999999"), std::invalid_argument);
}

TEST(CodeRequestTest, ListKeepsOrder) {
    const auto rs = parse_code_requests("S0:600,P0:250,S1:100,P1:50");
    ASSERT_EQ(rs.size(), 4u);
    EXPECT_EQ(rs[0].prefix, "S0");
    EXPECT_EQ(rs[0].count, 600u);
    EXPECT_EQ(rs[1].prefix, "P0");
    EXPECT_EQ(rs[2].prefix, "S1");
    EXPECT_EQ(rs[3].prefix, "P1");
    EXPECT_EQ(rs[3].count, 50u);
}

TEST(CodeRequestTest, ListWithEmptyItemIsRejected) {
    EXPECT_THROW(parse_code_requests("A:5,,B:3"), std::invalid_argument);
    EXPECT_THROW(parse_code_requests(""), std::invalid_argument);
}

TEST(CodeRequestTest, ParseUint) {
    EXPECT_EQ(parse_uint("0", "seed"), 0u);
    EXPECT_EQ(parse_uint("18446744073709551615", "seed"), 18446744073709551615ull);
    EXPECT_THROW(parse_uint("18446744073709551616", "seed"), std::invalid_argument);
    EXPECT_THROW(parse_uint("+3", "seed"), std::invalid_argument);
}
