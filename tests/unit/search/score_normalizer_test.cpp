#include <gtest/gtest.h>
#include <verity/search/score_normalizer.h>

#include <cmath>
#include <vector>

using namespace verity::search::normalize;

TEST(ScoreNormalizerTest, ZScoreHasZeroMeanAndUnitVariance) {
    std::vector<double> scores{1.0, 2.0, 3.0};
    auto z = zScore(scores);
    ASSERT_EQ(z.size(), 3u);

    const double sd = std::sqrt(2.0 / 3.0);
    EXPECT_NEAR(z[0], -1.0 / sd, 1e-9);
    EXPECT_NEAR(z[1], 0.0, 1e-9);
    EXPECT_NEAR(z[2], 1.0 / sd, 1e-9);

    double mean = (z[0] + z[1] + z[2]) / 3.0;
    double var = (z[0] * z[0] + z[1] * z[1] + z[2] * z[2]) / 3.0;
    EXPECT_NEAR(mean, 0.0, 1e-9);
    EXPECT_NEAR(var, 1.0, 1e-9);
}

TEST(ScoreNormalizerTest, DegenerateListsNormalizeToZero) {
    EXPECT_TRUE(zScore(std::vector<double>{}).empty());

    auto single = zScore(std::vector<double>{42.0});
    ASSERT_EQ(single.size(), 1u);
    EXPECT_EQ(single[0], 0.0);

    auto constant = zScore(std::vector<double>{7.5, 7.5, 7.5, 7.5});
    for (double v : constant) {
        EXPECT_EQ(v, 0.0);
    }
}

TEST(ScoreNormalizerTest, ConstantLargeValuesStayZeroDespiteRounding) {
    auto z = zScore(std::vector<double>{1e9 + 0.1, 1e9 + 0.1, 1e9 + 0.1});
    for (double v : z) {
        EXPECT_EQ(v, 0.0);
    }
}

TEST(ScoreNormalizerTest, PreservesOrderOfInput) {
    std::vector<double> scores{-0.3, 0.9, 0.1, 0.5};
    auto z = zScore(scores);
    EXPECT_LT(z[0], z[2]);
    EXPECT_LT(z[2], z[3]);
    EXPECT_LT(z[3], z[1]);
}

TEST(ScoreNormalizerTest, StatsReportMedianAndSpread) {
    auto odd = computeScoreStats(std::vector<double>{3.0, 1.0, 2.0});
    EXPECT_EQ(odd.count, 3u);
    EXPECT_DOUBLE_EQ(odd.min, 1.0);
    EXPECT_DOUBLE_EQ(odd.max, 3.0);
    EXPECT_DOUBLE_EQ(odd.median, 2.0);
    EXPECT_NEAR(odd.stddev, std::sqrt(2.0 / 3.0), 1e-12);

    auto even = computeScoreStats(std::vector<double>{4.0, 1.0, 3.0, 2.0});
    EXPECT_DOUBLE_EQ(even.median, 2.5);
    EXPECT_DOUBLE_EQ(even.mean, 2.5);
}

TEST(ScoreNormalizerTest, SemanticScoreIsNegatedDistance) {
    EXPECT_DOUBLE_EQ(semanticFromDistance(0.25), -0.25);
    EXPECT_GT(semanticFromDistance(0.1), semanticFromDistance(0.6));
}
