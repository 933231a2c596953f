// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "src/analytics/volatility_estimator.hpp"
#include <cmath>
#include <limits>
#include <vector>

namespace kumquat {
namespace {

TEST(VolatilityEstimatorTest, ShortSeriesIsPositive) {
    std::vector<double> closes{100.0, 101.0, 99.0, 102.0, 98.0};
    auto sigma = annualized_volatility(closes);
    ASSERT_TRUE(sigma.has_value());
    EXPECT_GT(*sigma, 0.0);
    EXPECT_NEAR(*sigma, 0.42660, 1e-4);
}

TEST(VolatilityEstimatorTest, ZeroMeanVariant) {
    std::vector<double> closes{100.0, 101.0, 99.0, 102.0, 98.0};
    auto sigma = annualized_volatility(closes, VolatilityConfig{.subtract_mean = false});
    ASSERT_TRUE(sigma.has_value());
    EXPECT_NEAR(*sigma, 0.43406, 1e-4);
}

TEST(VolatilityEstimatorTest, SingleCloseIsInsufficient) {
    std::vector<double> closes{100.0};
    auto sigma = annualized_volatility(closes);
    ASSERT_FALSE(sigma.has_value());
    EXPECT_EQ(sigma.error().code, VolatilityErrorCode::InsufficientData);
    EXPECT_EQ(sigma.error().count, 1u);
    EXPECT_EQ(error_category(sigma.error()), ErrorCategory::InsufficientData);
}

TEST(VolatilityEstimatorTest, EmptySeriesIsInsufficient) {
    auto sigma = annualized_volatility(std::span<const double>{});
    ASSERT_FALSE(sigma.has_value());
    EXPECT_EQ(sigma.error().code, VolatilityErrorCode::InsufficientData);
}

TEST(VolatilityEstimatorTest, RejectsNonPositivePrice) {
    std::vector<double> closes{100.0, 101.0, 0.0, 102.0};
    auto sigma = annualized_volatility(closes);
    ASSERT_FALSE(sigma.has_value());
    EXPECT_EQ(sigma.error().code, VolatilityErrorCode::InvalidPrice);
    EXPECT_EQ(sigma.error().index, 2u);
}

TEST(VolatilityEstimatorTest, RejectsNaNPrice) {
    std::vector<double> closes{100.0, std::numeric_limits<double>::quiet_NaN(), 102.0};
    auto sigma = annualized_volatility(closes);
    ASSERT_FALSE(sigma.has_value());
    EXPECT_EQ(sigma.error().code, VolatilityErrorCode::InvalidPrice);
    EXPECT_EQ(sigma.error().index, 1u);
}

TEST(VolatilityEstimatorTest, ConstantSeriesHasZeroVolatility) {
    std::vector<double> closes(30, 50.0);
    auto sigma = annualized_volatility(closes);
    ASSERT_TRUE(sigma.has_value());
    EXPECT_DOUBLE_EQ(*sigma, 0.0);
}

TEST(VolatilityEstimatorTest, SteadyTrendHasZeroDemeanedVolatility) {
    // Constant 1% daily growth: every log return equals the mean
    std::vector<double> closes;
    double p = 100.0;
    for (int i = 0; i < 40; ++i) {
        closes.push_back(p);
        p *= 1.01;
    }
    auto demeaned = annualized_volatility(closes);
    auto raw = annualized_volatility(closes, VolatilityConfig{.subtract_mean = false});
    ASSERT_TRUE(demeaned.has_value());
    ASSERT_TRUE(raw.has_value());
    EXPECT_NEAR(*demeaned, 0.0, 1e-9);
    EXPECT_NEAR(*raw, std::log(1.01) * std::sqrt(252.0), 1e-9);
}

TEST(VolatilityEstimatorTest, AnnualizationFactor) {
    std::vector<double> closes{100.0, 102.0, 101.0, 103.0};
    auto daily = annualized_volatility(closes, VolatilityConfig{.trading_days_per_year = 1.0});
    auto annual = annualized_volatility(closes);
    ASSERT_TRUE(daily.has_value());
    ASSERT_TRUE(annual.has_value());
    EXPECT_NEAR(*annual, *daily * std::sqrt(252.0), 1e-12);
}

}  // namespace
}  // namespace kumquat
