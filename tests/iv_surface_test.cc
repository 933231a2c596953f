// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "src/analytics/iv_surface.hpp"
#include "src/math/black_scholes_analytics.hpp"
#include <stdexcept>
#include <vector>

namespace kumquat {
namespace {

TEST(IVSurfaceTest, GridShapeAndOrdering) {
    std::vector<int> expiries{90, 7, 30};
    auto surface = generate_surface(100.0, 0.3, expiries, 5);
    ASSERT_TRUE(surface.has_value());

    EXPECT_EQ(surface->n_expiries(), 3u);
    EXPECT_EQ(surface->n_strikes(), 5u);
    EXPECT_EQ(surface->points.size(), 15u);
    EXPECT_EQ(surface->expiries, (std::vector<int>{7, 30, 90}));
    EXPECT_EQ(surface->strikes, (std::vector<double>{95.0, 97.5, 100.0, 102.5, 105.0}));

    for (size_t i = 0; i < surface->n_expiries(); ++i) {
        for (size_t j = 0; j < surface->n_strikes(); ++j) {
            const auto& pt = surface->at(i, j);
            EXPECT_EQ(pt.expiry_days, surface->expiries[i]);
            EXPECT_DOUBLE_EQ(pt.strike, surface->strikes[j]);
        }
    }
}

TEST(IVSurfaceTest, AtRejectsOutOfRangeIndex) {
    std::vector<int> expiries{30, 60};
    auto surface = generate_surface(100.0, 0.3, expiries, 3);
    ASSERT_TRUE(surface.has_value());

    EXPECT_NO_THROW(surface->at(1, 2));
    EXPECT_THROW(surface->at(5, 0), std::out_of_range);
    EXPECT_THROW(surface->at(2, 0), std::out_of_range);
    // Would alias row 1 if only the flat offset were checked
    EXPECT_THROW(surface->at(0, 3), std::out_of_range);
}

TEST(IVSurfaceTest, FlatVolatilityEverywhere) {
    std::vector<int> expiries{7, 14, 30, 60};
    auto surface = generate_surface(250.0, 0.42, expiries, 11);
    ASSERT_TRUE(surface.has_value());
    for (const auto& pt : surface->points) {
        EXPECT_DOUBLE_EQ(pt.implied_vol, 0.42);
    }
}

TEST(IVSurfaceTest, PricesMatchPricer) {
    std::vector<int> expiries{30, 60};
    auto calls = generate_surface(100.0, 0.25, expiries, 3);
    SurfaceConfig put_config;
    put_config.option_type = OptionType::PUT;
    auto puts = generate_surface(100.0, 0.25, expiries, 3, put_config);
    ASSERT_TRUE(calls.has_value());
    ASSERT_TRUE(puts.has_value());

    const auto& c = calls->at(1, 2);
    EXPECT_NEAR(c.theoretical_price,
                bs_price(OptionType::CALL, 100.0, c.strike, 60.0 / 365.0, 0.05, 0.25), 1e-12);
    const auto& p = puts->at(0, 0);
    EXPECT_NEAR(p.theoretical_price,
                bs_price(OptionType::PUT, 100.0, p.strike, 30.0 / 365.0, 0.05, 0.25), 1e-12);
}

TEST(IVSurfaceTest, CallPriceGrowsWithExpiry) {
    std::vector<int> expiries{7, 30, 90, 180};
    auto surface = generate_surface(100.0, 0.3, expiries, 3);
    ASSERT_TRUE(surface.has_value());
    for (size_t i = 1; i < surface->n_expiries(); ++i) {
        EXPECT_GT(surface->at(i, 1).theoretical_price,
                  surface->at(i - 1, 1).theoretical_price);
    }
}

TEST(IVSurfaceTest, DuplicateAndZeroExpiriesKept) {
    std::vector<int> expiries{30, 0, 30};
    auto surface = generate_surface(100.0, 0.3, expiries, 1);
    ASSERT_TRUE(surface.has_value());
    EXPECT_EQ(surface->expiries, (std::vector<int>{0, 30, 30}));
    // ATM at expiry has no value
    EXPECT_DOUBLE_EQ(surface->at(0, 0).theoretical_price, 0.0);
}

TEST(IVSurfaceTest, EmptyExpiriesGiveEmptySurface) {
    auto surface = generate_surface(100.0, 0.3, std::span<const int>{}, 5);
    ASSERT_TRUE(surface.has_value());
    EXPECT_TRUE(surface->points.empty());
    EXPECT_EQ(surface->n_strikes(), 5u);
}

TEST(IVSurfaceTest, RejectsNegativeExpiry) {
    std::vector<int> expiries{7, -1};
    auto surface = generate_surface(100.0, 0.3, expiries, 5);
    ASSERT_FALSE(surface.has_value());
    EXPECT_EQ(surface.error().code, ValidationErrorCode::InvalidMaturity);
    EXPECT_EQ(surface.error().index, 1u);
}

TEST(IVSurfaceTest, RejectsZeroStrikeCount) {
    std::vector<int> expiries{7};
    auto surface = generate_surface(100.0, 0.3, expiries, 0);
    ASSERT_FALSE(surface.has_value());
    EXPECT_EQ(surface.error().code, ValidationErrorCode::InvalidGridSize);
}

}  // namespace
}  // namespace kumquat
