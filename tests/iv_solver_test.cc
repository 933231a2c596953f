// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "src/option/iv_solver.hpp"
#include "src/option/european_option.hpp"
#include <cmath>

namespace kumquat {
namespace {

double market_price(OptionType type, double S, double K, int days, double r, double sigma) {
    return bs_price(type, S, K, days / 365.0, r, sigma);
}

TEST(IVSolverTest, RecoversAtmVolatility) {
    double price = market_price(OptionType::CALL, 100.0, 100.0, 90, 0.05, 0.30);
    IVQuery query(OptionType::CALL, 100.0, 100.0, 90, 0.05, price);

    auto result = solve_implied_vol(query);
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(result->implied_vol, 0.30, 1e-4);
    EXPECT_LT(result->final_error, 1e-4);
    ASSERT_TRUE(result->vega.has_value());
    EXPECT_GT(*result->vega, 0.0);
}

TEST(IVSolverTest, RecoversAcrossMoneyness) {
    IVSolver solver;
    for (double K : {80.0, 90.0, 100.0, 110.0, 120.0}) {
        for (OptionType type : {OptionType::CALL, OptionType::PUT}) {
            double price = market_price(type, 100.0, K, 60, 0.03, 0.45);
            auto result = solver.solve(IVQuery(type, 100.0, K, 60, 0.03, price));
            ASSERT_TRUE(result.has_value()) << "K=" << K;
            // Price tolerance 1e-4 maps to a vol error of 1e-4 / vega
            EXPECT_NEAR(result->implied_vol, 0.45, 1e-3) << "K=" << K;
        }
    }
}

TEST(IVSolverTest, HighVolatility) {
    double price = market_price(OptionType::PUT, 50.0, 55.0, 180, 0.02, 2.5);
    auto result = solve_implied_vol(IVQuery(OptionType::PUT, 50.0, 55.0, 180, 0.02, price));
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(result->implied_vol, 2.5, 1e-3);
}

TEST(IVSolverTest, DeepOtmFallsBackToBrent) {
    // Tiny vega at the 0.30 starting point stalls Newton
    double price = market_price(OptionType::CALL, 100.0, 200.0, 30, 0.05, 1.5);
    auto result = solve_implied_vol(IVQuery(OptionType::CALL, 100.0, 200.0, 30, 0.05, price));
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(result->implied_vol, 1.5, 1e-2);
}

TEST(IVSolverTest, RejectsCallAboveSpot) {
    auto result = solve_implied_vol(IVQuery(OptionType::CALL, 100.0, 100.0, 30, 0.05, 101.0));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, IVErrorCode::ArbitrageViolation);
}

TEST(IVSolverTest, RejectsPriceBelowIntrinsic) {
    auto result = solve_implied_vol(IVQuery(OptionType::PUT, 80.0, 100.0, 30, 0.05, 15.0));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, IVErrorCode::ArbitrageViolation);
}

TEST(IVSolverTest, RejectsInvalidInputs) {
    auto spot = solve_implied_vol(IVQuery(OptionType::CALL, 0.0, 100.0, 30, 0.05, 2.0));
    ASSERT_FALSE(spot.has_value());
    EXPECT_EQ(spot.error().code, IVErrorCode::NegativeSpot);

    auto strike = solve_implied_vol(IVQuery(OptionType::CALL, 100.0, -1.0, 30, 0.05, 2.0));
    ASSERT_FALSE(strike.has_value());
    EXPECT_EQ(strike.error().code, IVErrorCode::NegativeStrike);

    auto expired = solve_implied_vol(IVQuery(OptionType::CALL, 100.0, 100.0, 0, 0.05, 2.0));
    ASSERT_FALSE(expired.has_value());
    EXPECT_EQ(expired.error().code, IVErrorCode::NegativeMaturity);

    auto price = solve_implied_vol(IVQuery(OptionType::CALL, 100.0, 100.0, 30, 0.05, 0.0));
    ASSERT_FALSE(price.has_value());
    EXPECT_EQ(price.error().code, IVErrorCode::NegativeMarketPrice);
}

TEST(IVSolverTest, RejectsInvalidConfig) {
    IVSolverConfig config;
    config.vol_lower = 2.0;
    config.vol_upper = 1.0;
    auto result = solve_implied_vol(IVQuery(OptionType::CALL, 100.0, 100.0, 30, 0.05, 3.0), config);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, IVErrorCode::InvalidConfig);
}

TEST(IVSolverTest, PriceAboveUpperVolIsNotBracketed) {
    // Call worth more than sigma=5 allows, but still under the spot bound
    double price = market_price(OptionType::CALL, 100.0, 100.0, 365, 0.0, 5.0) + 0.5;
    ASSERT_LT(price, 100.0);
    auto result = solve_implied_vol(IVQuery(OptionType::CALL, 100.0, 100.0, 365, 0.0, price));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, IVErrorCode::BracketingFailed);
}

TEST(IVSolverTest, VegaIsPerUnitVolatility) {
    double price = market_price(OptionType::CALL, 100.0, 95.0, 60, 0.05, 0.25);
    auto result = solve_implied_vol(IVQuery(OptionType::CALL, 100.0, 95.0, 60, 0.05, price));
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->vega.has_value());

    auto greeks = european_greeks(
        OptionQuote(OptionType::CALL, 100.0, 95.0, 60, 0.05, result->implied_vol));
    ASSERT_TRUE(greeks.has_value());
    EXPECT_NEAR(*result->vega, greeks->vega * 100.0, 1e-9);
}

TEST(IVSolverTest, BatchCountsFailures) {
    std::vector<IVQuery> queries{
        IVQuery(OptionType::CALL, 100.0, 100.0, 30, 0.05,
                market_price(OptionType::CALL, 100.0, 100.0, 30, 0.05, 0.2)),
        IVQuery(OptionType::CALL, 100.0, 100.0, 30, 0.05, 150.0),
        IVQuery(OptionType::PUT, 100.0, 105.0, 30, 0.05,
                market_price(OptionType::PUT, 100.0, 105.0, 30, 0.05, 0.4)),
    };

    auto batch = IVSolver().solve_batch(queries);
    ASSERT_EQ(batch.size(), 3u);
    EXPECT_EQ(batch.failed_count, 1u);
    EXPECT_FALSE(batch.all_succeeded());
    EXPECT_TRUE(batch.results[0].has_value());
    EXPECT_FALSE(batch.results[1].has_value());
    EXPECT_NEAR(batch.results[2]->implied_vol, 0.4, 1e-3);
}

}  // namespace
}  // namespace kumquat
