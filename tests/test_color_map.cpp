#include <gtest/gtest.h>

#include "ColorMap.h"
#include "DotmatrixExceptions.h"

TEST(ColorMapTest, RedsEndpoints) {
    const ColorMap reds = ColorMap::named("Reds");
    EXPECT_EQ(reds(0.0).hex(), "#fff5f0");
    EXPECT_EQ(reds(1.0).hex(), "#67000d");
    EXPECT_EQ(reds(-3.0).hex(), "#fff5f0");
    EXPECT_EQ(reds(7.0).hex(), "#67000d");
    EXPECT_EQ(reds(0.5).hex(), "#fb6a4a");
}

TEST(ColorMapTest, ReversedSuffix) {
    const ColorMap rev = ColorMap::named("Reds_r");
    EXPECT_EQ(rev.name(), "Reds_r");
    EXPECT_EQ(rev(0.0).hex(), "#67000d");
    EXPECT_EQ(rev(1.0).hex(), "#fff5f0");
    EXPECT_EQ(rev.reversed().name(), "Reds");
}

TEST(ColorMapTest, UnknownNameRejected) {
    EXPECT_THROW(ColorMap::named("jet"), Dotmatrix::InvalidArgumentException);
    EXPECT_THROW(Rgba::fromHex("#12345"), Dotmatrix::InvalidArgumentException);
    EXPECT_THROW(Rgba::fromHex("#zz0000"), Dotmatrix::InvalidArgumentException);
}

TEST(ColorMapTest, ExpressionMapStartsGrey) {
    const ColorMap expr = ColorMap::named("expression");
    const Rgba low = expr(0.0);
    EXPECT_EQ(low.hex(), "#cecece");
    EXPECT_DOUBLE_EQ(low.r, low.g);
    EXPECT_DOUBLE_EQ(low.g, low.b);
    EXPECT_EQ(expr(1.0).hex(), "#67000d");
    EXPECT_THROW(ColorMap::expression(1.0), Dotmatrix::InvalidArgumentException);
}

TEST(ColorMapTest, PackedRgb) {
    EXPECT_EQ(Rgba::fromHex("#67000d").packedRgb(), 0x67000du);
    EXPECT_EQ(Rgba::fromHex("#ffffff").packedRgb(), 0xffffffu);
}

TEST(NormalizeTest, LinearAndClamped) {
    const Normalize norm(1.0, 3.0);
    EXPECT_DOUBLE_EQ(norm(2.0), 0.5);
    EXPECT_DOUBLE_EQ(norm(0.0), 0.0);
    EXPECT_DOUBLE_EQ(norm(5.0), 1.0);
    EXPECT_DOUBLE_EQ(Normalize(2.0, 2.0)(9.0), 0.0);
    EXPECT_THROW(Normalize(1.0, 0.5), Dotmatrix::InvalidArgumentException);
}
