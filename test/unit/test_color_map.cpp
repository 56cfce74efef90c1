#include <gtest/gtest.h>
#include "semcloud/segmentation/color_map.hpp"

#include <set>
#include <stdexcept>
#include <tuple>

using namespace semcloud::segmentation;

TEST(ColorMapTest, FirstEntriesMatchBitInterleaving) {
    ColorMap cmap = buildColorMap(8);
    ASSERT_EQ(cmap.size(), 8u);

    // Class 0 is black, low three bits land in the top bit of R, G, B
    EXPECT_EQ(cmap[0], cv::Vec3b(0, 0, 0));
    EXPECT_EQ(cmap[1], cv::Vec3b(128, 0, 0));
    EXPECT_EQ(cmap[2], cv::Vec3b(0, 128, 0));
    EXPECT_EQ(cmap[3], cv::Vec3b(128, 128, 0));
    EXPECT_EQ(cmap[4], cv::Vec3b(0, 0, 128));
    EXPECT_EQ(cmap[7], cv::Vec3b(128, 128, 128));
}

TEST(ColorMapTest, HigherBitsFillLowerColorBits) {
    ColorMap cmap = buildColorMap(16);

    // 8 = 0b001000: second round sets bit 6 of R
    EXPECT_EQ(cmap[8], cv::Vec3b(64, 0, 0));
    // 9 = 0b001001: bit 7 and bit 6 of R
    EXPECT_EQ(cmap[9], cv::Vec3b(192, 0, 0));
    // 15 = 0b001111
    EXPECT_EQ(cmap[15], cv::Vec3b(192, 128, 128));
}

TEST(ColorMapTest, Deterministic) {
    ColorMap a = buildColorMap(150);
    ColorMap b = buildColorMap(150);
    EXPECT_EQ(a.colors(), b.colors());
}

TEST(ColorMapTest, PrefixStableAcrossSizes) {
    ColorMap small = buildColorMap(10);
    ColorMap large = buildColorMap(40);
    for (size_t i = 0; i < small.size(); ++i) {
        EXPECT_EQ(small[i], large[i]) << "index " << i;
    }
}

TEST(ColorMapTest, CollisionFreeUpTo256) {
    ColorMap cmap = buildColorMap(256);
    std::set<std::tuple<int, int, int>> seen;
    for (size_t i = 0; i < cmap.size(); ++i) {
        const auto& c = cmap[i];
        EXPECT_TRUE(seen.emplace(c[0], c[1], c[2]).second) << "duplicate color at " << i;
    }
}

TEST(ColorMapTest, EmptyAndInvalidSizes) {
    EXPECT_TRUE(buildColorMap(0).empty());
    EXPECT_THROW(buildColorMap(-1), std::invalid_argument);
}

TEST(ColorMapTest, NormalizedView) {
    ColorMap cmap = buildColorMap(10);
    auto normalized = cmap.normalized();
    ASSERT_EQ(normalized.size(), cmap.size());
    EXPECT_FLOAT_EQ(normalized[1][0], 128.0f / 255.0f);
    EXPECT_FLOAT_EQ(normalized[9][0], 192.0f / 255.0f);
    for (const auto& c : normalized) {
        for (int k = 0; k < 3; ++k) {
            EXPECT_GE(c[k], 0.0f);
            EXPECT_LE(c[k], 1.0f);
        }
    }
}
