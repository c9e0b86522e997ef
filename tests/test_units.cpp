/**
 * @file test_units.cpp
 * @brief Unit tests for the unit conversion table (GoogleTest)
 */

#include <gtest/gtest.h>
#include "jmutate/Units.hpp"

using namespace jmutate;

TEST(UnitsTest, ExactMetricFactors) {
    EXPECT_DOUBLE_EQ(*conversion_factor("km", "m"), 1000.0);
    EXPECT_DOUBLE_EQ(*conversion_factor("kg", "g"), 1000.0);
    EXPECT_DOUBLE_EQ(*conversion_factor("h", "min"), 60.0);
    EXPECT_DOUBLE_EQ(*conversion_factor("GB", "MB"), 1024.0);
}

TEST(UnitsTest, ImperialFactors) {
    EXPECT_NEAR(*conversion_factor("lb", "kg"), 0.45359237, 1e-12);
    EXPECT_NEAR(*conversion_factor("in", "cm"), 2.54, 1e-12);
    EXPECT_NEAR(*conversion_factor("mi", "km"), 1.609344, 1e-12);
    EXPECT_NEAR(*conversion_factor("gal", "l"), 3.785411784, 1e-12);
}

TEST(UnitsTest, SameUnitIsIdentity) {
    EXPECT_EQ(*conversion_factor("ft", "ft"), 1.0);
}

TEST(UnitsTest, CrossDimensionRejected) {
    EXPECT_FALSE(conversion_factor("m", "kg").has_value());
    EXPECT_FALSE(conversion_factor("s", "B").has_value());
}

TEST(UnitsTest, UnknownUnitsRejected) {
    EXPECT_FALSE(conversion_factor("furlong", "m").has_value());
    EXPECT_FALSE(conversion_factor("m", "").has_value());
    // Names are case-sensitive
    EXPECT_FALSE(conversion_factor("KM", "m").has_value());
}
