#include "errors.hpp"
#include "util.hpp"
#include <gtest/gtest.h>
#include <cstdlib>
#include <stdexcept>

TEST(UtilTest, ParsesHexQuantities) {
    EXPECT_EQ(util::parse_hex_quantity("0x1b4"), 436);
    EXPECT_EQ(util::parse_hex_quantity("0x0"), 0);
    EXPECT_EQ(util::parse_hex_quantity("0xFF"), 255);
    EXPECT_EQ(util::parse_hex_quantity("12a05f200"), 5000000000);
}

TEST(UtilTest, RejectsMalformedHexQuantities) {
    EXPECT_THROW(util::parse_hex_quantity(""), std::invalid_argument);
    EXPECT_THROW(util::parse_hex_quantity("0x"), std::invalid_argument);
    EXPECT_THROW(util::parse_hex_quantity("0xzz"), std::invalid_argument);
    EXPECT_THROW(util::parse_hex_quantity("0x10000000000000000"), std::invalid_argument);
}

TEST(UtilTest, ConvertsWideHexToDecimal) {
    EXPECT_EQ(util::hex_to_decimal("0x0"), "0");
    EXPECT_EQ(util::hex_to_decimal("0x1b4"), "436");
    EXPECT_EQ(util::hex_to_decimal("0xde0b6b3a7640000"), "1000000000000000000");
    EXPECT_EQ(util::hex_to_decimal("0x10000000000000000"), "18446744073709551616");
    EXPECT_EQ(util::hex_to_decimal("0x3b9aca00"), "1000000000");
    EXPECT_THROW(util::hex_to_decimal("0xg1"), std::invalid_argument);
}

TEST(UtilTest, ScalesRawUnits) {
    EXPECT_DOUBLE_EQ(util::raw_units_to_double("1500000000000000000", 18), 1.5);
    EXPECT_DOUBLE_EQ(util::raw_units_to_double("2000000000", 9), 2.0);
    EXPECT_DOUBLE_EQ(util::raw_units_to_double("0", 18), 0.0);
    EXPECT_THROW(util::raw_units_to_double("", 18), std::invalid_argument);
    EXPECT_THROW(util::raw_units_to_double("-5", 18), std::invalid_argument);
}

TEST(UtilTest, CaseHelpers) {
    EXPECT_EQ(util::to_lower("0xAbCd"), "0xabcd");
    EXPECT_EQ(util::to_upper("eth"), "ETH");
    EXPECT_TRUE(util::starts_with("0xabc", "0x"));
    EXPECT_FALSE(util::starts_with("x", "0x"));
}

TEST(UtilTest, EnvHelpers) {
    setenv("WHALE_UTIL_TEST_INT", "42", 1);
    setenv("WHALE_UTIL_TEST_BAD", "4x2", 1);
    unsetenv("WHALE_UTIL_TEST_MISSING");

    EXPECT_EQ(util::get_env_int("WHALE_UTIL_TEST_INT", 7), 42);
    EXPECT_EQ(util::get_env_int("WHALE_UTIL_TEST_MISSING", 7), 7);
    EXPECT_EQ(util::get_env_var("WHALE_UTIL_TEST_MISSING", "fallback"), "fallback");
    EXPECT_THROW(util::get_env_int("WHALE_UTIL_TEST_BAD", 7), ConfigurationError);
    EXPECT_THROW(util::get_env_double("WHALE_UTIL_TEST_BAD", 1.0), ConfigurationError);

    unsetenv("WHALE_UTIL_TEST_INT");
    unsetenv("WHALE_UTIL_TEST_BAD");
}

TEST(UtilTest, Iso8601Timestamp) {
    std::string ts = util::current_iso8601();
    ASSERT_EQ(ts.size(), 24u);
    EXPECT_EQ(ts[10], 'T');
    EXPECT_EQ(ts.back(), 'Z');
}
