/**
 * epc qr payload - version 1.00
 * SPDX-FileCopyrightText: 2025 psynectic
 * SPDX-License-Identifier: MIT
 *
 * @brief Amount validation and conversion tests
 */

#include <gtest/gtest.h>

#include <cstdint>
#include <string>

#include "epc_amount.hpp"

using namespace epc;

// Test is_valid_amount() boundaries
TEST(AmountTest, AcceptsRange) {
    EXPECT_TRUE(is_valid_amount("0.01"));
    EXPECT_TRUE(is_valid_amount("10.00"));
    EXPECT_TRUE(is_valid_amount("0.50"));
    EXPECT_TRUE(is_valid_amount("999999999.99"));
}

TEST(AmountTest, RejectsZero) {
    EXPECT_FALSE(is_valid_amount("0.00"));
}

TEST(AmountTest, RejectsTenIntegerDigits) {
    EXPECT_FALSE(is_valid_amount("1000000000.00"));
}

TEST(AmountTest, RequiresExactlyTwoDecimals) {
    EXPECT_FALSE(is_valid_amount("1.000"));
    EXPECT_FALSE(is_valid_amount("1.0"));
    EXPECT_FALSE(is_valid_amount("1."));
    EXPECT_FALSE(is_valid_amount("10"));
}

TEST(AmountTest, RejectsForeignCharacters) {
    EXPECT_FALSE(is_valid_amount(""));
    EXPECT_FALSE(is_valid_amount("1,00"));
    EXPECT_FALSE(is_valid_amount("-1.00"));
    EXPECT_FALSE(is_valid_amount("+1.00"));
    EXPECT_FALSE(is_valid_amount(" 1.00"));
    EXPECT_FALSE(is_valid_amount("EUR1.00"));
    EXPECT_FALSE(is_valid_amount("1.0.0"));
    EXPECT_FALSE(is_valid_amount("1..00"));
}

TEST(AmountTest, RejectsMissingIntegerPart) {
    EXPECT_FALSE(is_valid_amount(".50"));
}

TEST(AmountTest, AcceptsZeroPaddedIntegerPart) {
    EXPECT_TRUE(is_valid_amount("01.00"));
    EXPECT_TRUE(is_valid_amount("007.50"));
    EXPECT_TRUE(is_valid_amount("00.01"));
    EXPECT_TRUE(is_valid_amount("000000001.00"));
    EXPECT_FALSE(is_valid_amount("000000000.00"));
    EXPECT_FALSE(is_valid_amount("0000000001.00"));
}

// Test amount_from_minor()
TEST(AmountFromMinorTest, RendersTwoDecimals) {
    EXPECT_EQ(std::optional<std::string>("0.01"), amount_from_minor(1));
    EXPECT_EQ(std::optional<std::string>("10.00"), amount_from_minor(1000));
    EXPECT_EQ(std::optional<std::string>("12.05"), amount_from_minor(1205));
    EXPECT_EQ(std::optional<std::string>("999999999.99"), amount_from_minor(99999999999));
}

TEST(AmountFromMinorTest, RejectsOutOfRange) {
    EXPECT_FALSE(amount_from_minor(0).has_value());
    EXPECT_FALSE(amount_from_minor(-100).has_value());
    EXPECT_FALSE(amount_from_minor(100000000000).has_value());
}

// Test decimal_to_minor()
TEST(DecimalToMinorTest, ParsesLenientInput) {
    std::int64_t v = -1;
    EXPECT_TRUE(decimal_to_minor("12", v));      EXPECT_EQ(1200, v);
    EXPECT_TRUE(decimal_to_minor("12.5", v));    EXPECT_EQ(1250, v);
    EXPECT_TRUE(decimal_to_minor("12,50", v));   EXPECT_EQ(1250, v);
    EXPECT_TRUE(decimal_to_minor(" 3.07 ", v));  EXPECT_EQ(307, v);
    EXPECT_TRUE(decimal_to_minor("0", v));       EXPECT_EQ(0, v);
}

TEST(DecimalToMinorTest, RejectsMalformedInput) {
    std::int64_t v = 0;
    EXPECT_FALSE(decimal_to_minor("", v));
    EXPECT_FALSE(decimal_to_minor("1.234", v));
    EXPECT_FALSE(decimal_to_minor("1.", v));
    EXPECT_FALSE(decimal_to_minor(".5", v));
    EXPECT_FALSE(decimal_to_minor("-1", v));
    EXPECT_FALSE(decimal_to_minor("1 000", v));
    EXPECT_FALSE(decimal_to_minor("1.000,00", v));
    EXPECT_FALSE(decimal_to_minor("99999999999999999999", v));
}
