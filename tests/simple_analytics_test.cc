// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "src/simple/simple.hpp"
#include <cmath>
#include <vector>

namespace {

std::vector<double> sample_closes(size_t n) {
    std::vector<double> closes;
    double p = 100.0;
    for (size_t i = 0; i < n; ++i) {
        closes.push_back(p);
        p *= (i % 2 == 0) ? 1.015 : 0.99;
    }
    return closes;
}

TEST(SimpleAnalyticsTest, EstimateVolatilityConfident) {
    auto closes = sample_closes(60);
    auto est = kumquat::simple::estimate_volatility(closes);
    EXPECT_FALSE(est.used_fallback);
    EXPECT_FALSE(est.low_confidence);
    EXPECT_EQ(est.observations, 60u);
    EXPECT_GT(est.sigma, 0.0);
}

TEST(SimpleAnalyticsTest, EstimateVolatilityShortSeriesFlagged) {
    std::vector<double> closes{100.0, 101.0, 99.0, 102.0, 98.0};
    auto est = kumquat::simple::estimate_volatility(closes);
    EXPECT_FALSE(est.used_fallback);
    EXPECT_TRUE(est.low_confidence);
    EXPECT_NEAR(est.sigma, 0.42660, 1e-4);
}

TEST(SimpleAnalyticsTest, EstimateVolatilityFallsBack) {
    std::vector<double> single{100.0};
    auto est = kumquat::simple::estimate_volatility(single);
    EXPECT_TRUE(est.used_fallback);
    EXPECT_DOUBLE_EQ(est.sigma, kumquat::simple::kDefaultVolatility);

    std::vector<double> flat(30, 42.0);
    auto flat_est = kumquat::simple::estimate_volatility(flat);
    EXPECT_TRUE(flat_est.used_fallback);
    EXPECT_DOUBLE_EQ(flat_est.sigma, 0.30);
}

TEST(SimpleAnalyticsTest, PriceAndGreeks) {
    auto price = kumquat::simple::price(100.0, 100.0, 90, 0.30);
    ASSERT_TRUE(price.has_value());
    EXPECT_NEAR(*price, 6.5340, 1e-3);

    auto greeks = kumquat::simple::greeks(100.0, 100.0, 90, 0.30, 0.05,
                                          kumquat::OptionType::PUT);
    ASSERT_TRUE(greeks.has_value());
    EXPECT_NEAR(greeks->delta, 0.5625 - 1.0, 1e-3);
}

TEST(SimpleAnalyticsTest, ErrorsAreDescribed) {
    auto price = kumquat::simple::price(100.0, -1.0, 30, 0.3);
    ASSERT_FALSE(price.has_value());
    EXPECT_NE(price.error().find("InvalidStrike"), std::string::npos);
}

TEST(SimpleAnalyticsTest, ImpliedVolRoundTrip) {
    auto price = kumquat::simple::price(100.0, 105.0, 45, 0.35);
    ASSERT_TRUE(price.has_value());
    auto vol = kumquat::simple::implied_vol(100.0, 105.0, 45, *price);
    ASSERT_TRUE(vol.has_value());
    EXPECT_NEAR(*vol, 0.35, 1e-3);
}

TEST(SimpleAnalyticsTest, ChainUsesStrikeLadder) {
    auto closes = sample_closes(60);
    auto chain = kumquat::simple::chain(152.4, closes, 30);
    ASSERT_TRUE(chain.has_value());
    ASSERT_EQ(chain->size(), 21u);
    EXPECT_DOUBLE_EQ(chain->rows.front().strike, 100.0);
    EXPECT_DOUBLE_EQ(chain->rows.back().strike, 200.0);
    EXPECT_DOUBLE_EQ(chain->volatility,
                     kumquat::simple::estimate_volatility(closes).sigma);
}

TEST(SimpleAnalyticsTest, StraddleDefaultsToRoundedSpot) {
    auto s = kumquat::simple::straddle(101.4, 0.3, 30);
    ASSERT_TRUE(s.has_value());
    EXPECT_DOUBLE_EQ(s->legs[0].strike, 101.0);
}

TEST(SimpleAnalyticsTest, StandardIronCondorStrikes) {
    auto s = kumquat::simple::standard_iron_condor(100.3, 0.25, 30);
    ASSERT_TRUE(s.has_value());
    ASSERT_EQ(s->legs.size(), 4u);
    EXPECT_DOUBLE_EQ(s->legs[0].strike, 90.0);
    EXPECT_DOUBLE_EQ(s->legs[1].strike, 95.0);
    EXPECT_DOUBLE_EQ(s->legs[2].strike, 105.0);
    EXPECT_DOUBLE_EQ(s->legs[3].strike, 110.0);
}

TEST(SimpleAnalyticsTest, StandardIronCondorRejectsZeroWidth) {
    auto s = kumquat::simple::standard_iron_condor(100.0, 0.25, 30, 0.0);
    ASSERT_FALSE(s.has_value());
    EXPECT_NE(s.error().find("StrikeOrdering"), std::string::npos);
}

TEST(SimpleAnalyticsTest, StandardSurface) {
    auto surface = kumquat::simple::standard_surface(100.0, 0.3);
    ASSERT_TRUE(surface.has_value());
    EXPECT_EQ(surface->n_expiries(), 8u);
    EXPECT_EQ(surface->n_strikes(), 11u);
    EXPECT_EQ(surface->expiries.front(), 7);
    EXPECT_EQ(surface->expiries.back(), 180);
}

TEST(SimpleAnalyticsTest, ProbabilitiesFromCloses) {
    std::vector<double> short_history{100.0};
    auto r = kumquat::simple::probabilities(100.0, 110.0, short_history, 30);
    ASSERT_TRUE(r.has_value());
    // Fallback sigma 0.30
    EXPECT_NEAR(r->prob_itm_call, 0.14340, 1e-4);
}

}  // namespace
