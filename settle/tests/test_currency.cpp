#include <gtest/gtest.h>
#include "currency.hpp"
#include <algorithm>

TEST(CurrencyTest, DecimalPlaces) {
    EXPECT_EQ(Currency::decimal_places("USD"), 2);
    EXPECT_EQ(Currency::decimal_places("VND"), 0);
    EXPECT_EQ(Currency::decimal_places("JPY"), 0);
    EXPECT_EQ(Currency::decimal_places("KWD"), 3);
}

TEST(CurrencyTest, CodesAreCaseInsensitive) {
    EXPECT_EQ(Currency::decimal_places("jpy"), 0);
    EXPECT_TRUE(Currency::is_known("eur"));
}

TEST(CurrencyTest, UnknownCodeDefaultsToTwoPlaces) {
    EXPECT_FALSE(Currency::is_known("XYZ"));
    EXPECT_EQ(Currency::decimal_places("XYZ"), 2);
    EXPECT_EQ(Currency::smallest_unit("XYZ"), Decimal::parse("0.01"));
}

TEST(CurrencyTest, SmallestUnit) {
    EXPECT_EQ(Currency::smallest_unit("USD"), Decimal::parse("0.01"));
    EXPECT_EQ(Currency::smallest_unit("VND"), Decimal(1));
    EXPECT_EQ(Currency::smallest_unit("BHD"), Decimal::parse("0.001"));
}

TEST(CurrencyTest, SupportedCodesSorted) {
    auto codes = Currency::supported_codes();
    EXPECT_TRUE(std::is_sorted(codes.begin(), codes.end()));
    EXPECT_NE(std::find(codes.begin(), codes.end(), "USD"), codes.end());
}
