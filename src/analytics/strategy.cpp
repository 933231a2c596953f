// SPDX-License-Identifier: MIT
#include "src/analytics/strategy.hpp"
#include "src/analytics/probability.hpp"
#include "src/math/black_scholes_analytics.hpp"
#include "src/option/european_option.hpp"
#include "src/support/kumquat_trace.h"
#include <algorithm>
#include <array>
#include <cmath>
#include <ostream>
#include <utility>

namespace kumquat {

namespace {

std::unexpected<ValidationError> reject(ValidationErrorCode code, double value,
                                        size_t index = 0) {
    KUMQUAT_TRACE_VALIDATION_ERROR(MODULE_STRATEGY, static_cast<int>(code), value, index);
    return std::unexpected(ValidationError(code, value, index));
}

/// Fill premium, flow and position Greeks from priced legs
Strategy assemble(std::string name, std::vector<PricedLeg> legs) {
    Strategy s;
    s.name = std::move(name);

    double cost = 0.0;
    for (const auto& leg : legs) {
        const double q = static_cast<double>(leg.signed_quantity());
        cost += q * leg.price;
        s.greeks += leg.greeks * q;
    }
    s.premium_flow = cost >= 0.0 ? PremiumFlow::DEBIT : PremiumFlow::CREDIT;
    s.net_premium = std::abs(cost);
    s.legs = std::move(legs);
    return s;
}

/// Long-volatility strategies profit outside [low, high]
double long_vol_pop(double spot, double low, double high, double sigma,
                    int days, const PricingConfig& config) {
    auto inside = probability_between(spot, low, high, sigma, days, config);
    return inside ? 1.0 - *inside : 0.0;
}

}  // namespace

std::expected<std::vector<PricedLeg>, ValidationError> price_legs(
    std::span<const StrategyLeg> legs, double spot, double sigma,
    int days_to_expiry, const PricingConfig& config)
{
    if (!(spot > 0.0) || !std::isfinite(spot)) {
        return reject(ValidationErrorCode::InvalidSpotPrice, spot);
    }
    if (!std::isfinite(sigma)) {
        return reject(ValidationErrorCode::InvalidVolatility, sigma);
    }
    if (days_to_expiry < 0) {
        return reject(ValidationErrorCode::InvalidMaturity, days_to_expiry);
    }
    if (!std::isfinite(config.risk_free_rate)) {
        return reject(ValidationErrorCode::InvalidRate, config.risk_free_rate);
    }

    const double tau = year_fraction(days_to_expiry, config);
    const double rate = config.risk_free_rate;

    std::vector<PricedLeg> priced;
    priced.reserve(legs.size());
    for (size_t i = 0; i < legs.size(); ++i) {
        const StrategyLeg& leg = legs[i];
        if (!(leg.strike > 0.0) || !std::isfinite(leg.strike)) {
            return reject(ValidationErrorCode::InvalidStrike, leg.strike, i);
        }
        if (leg.quantity < 1) {
            return reject(ValidationErrorCode::InvalidQuantity, leg.quantity, i);
        }

        PricedLeg p;
        static_cast<StrategyLeg&>(p) = leg;
        p.price = bs_price(leg.type, spot, leg.strike, tau, rate, sigma);
        p.greeks = bs_greeks(leg.type, spot, leg.strike, tau, rate, sigma,
                             config.days_per_year);
        priced.push_back(p);
    }
    return priced;
}

std::expected<Strategy, ValidationError> straddle(
    double spot, double strike, double sigma, int days_to_expiry,
    const PricingConfig& config)
{
    KUMQUAT_TRACE_ALGO_START(MODULE_STRATEGY, 2, strike, sigma);

    const std::array<StrategyLeg, 2> legs{{
        {OptionType::CALL, strike, LegAction::BUY, 1},
        {OptionType::PUT, strike, LegAction::BUY, 1},
    }};
    auto priced = price_legs(legs, spot, sigma, days_to_expiry, config);
    if (!priced) {
        return std::unexpected(priced.error());
    }

    Strategy s = assemble("Long Straddle", std::move(*priced));
    const double p = s.net_premium;

    s.breakevens = {strike - p, strike + p};
    s.max_loss = PayoffBound::finite(p);
    s.max_profit = PayoffBound::unlimited();
    s.probability_of_profit = long_vol_pop(spot, strike - p, strike + p, sigma,
                                           days_to_expiry, config);

    KUMQUAT_TRACE_ALGO_COMPLETE(MODULE_STRATEGY, 2, p);
    return s;
}

std::expected<Strategy, ValidationError> strangle(
    double spot, double put_strike, double call_strike, double sigma,
    int days_to_expiry, const PricingConfig& config)
{
    KUMQUAT_TRACE_ALGO_START(MODULE_STRATEGY, 2, put_strike, call_strike);

    const std::array<StrategyLeg, 2> legs{{
        {OptionType::PUT, put_strike, LegAction::BUY, 1},
        {OptionType::CALL, call_strike, LegAction::BUY, 1},
    }};
    auto priced = price_legs(legs, spot, sigma, days_to_expiry, config);
    if (!priced) {
        return std::unexpected(priced.error());
    }
    if (put_strike > call_strike) {
        return reject(ValidationErrorCode::StrikeOrdering, call_strike, 1);
    }

    Strategy s = assemble("Long Strangle", std::move(*priced));
    const double p = s.net_premium;

    s.breakevens = {put_strike - p, call_strike + p};
    s.max_loss = PayoffBound::finite(p);
    s.max_profit = PayoffBound::unlimited();
    s.probability_of_profit = long_vol_pop(spot, put_strike - p, call_strike + p,
                                           sigma, days_to_expiry, config);

    KUMQUAT_TRACE_ALGO_COMPLETE(MODULE_STRATEGY, 2, p);
    return s;
}

std::expected<Strategy, ValidationError> iron_condor(
    double spot, double put_buy_strike, double put_sell_strike,
    double call_sell_strike, double call_buy_strike, double sigma,
    int days_to_expiry, const PricingConfig& config)
{
    KUMQUAT_TRACE_ALGO_START(MODULE_STRATEGY, 4, put_sell_strike, call_sell_strike);

    const std::array<StrategyLeg, 4> legs{{
        {OptionType::PUT, put_buy_strike, LegAction::BUY, 1},
        {OptionType::PUT, put_sell_strike, LegAction::SELL, 1},
        {OptionType::CALL, call_sell_strike, LegAction::SELL, 1},
        {OptionType::CALL, call_buy_strike, LegAction::BUY, 1},
    }};
    auto priced = price_legs(legs, spot, sigma, days_to_expiry, config);
    if (!priced) {
        return std::unexpected(priced.error());
    }
    for (size_t i = 1; i < legs.size(); ++i) {
        if (!(legs[i - 1].strike < legs[i].strike)) {
            return reject(ValidationErrorCode::StrikeOrdering, legs[i].strike, i);
        }
    }

    const auto& pl = *priced;
    const double credit = (pl[1].price - pl[0].price) + (pl[2].price - pl[3].price);

    Strategy s = assemble("Iron Condor", std::move(*priced));

    const double put_width = put_sell_strike - put_buy_strike;
    const double call_width = call_buy_strike - call_sell_strike;
    const double raw_loss = std::max(put_width, call_width) - credit;

    s.breakevens = {put_sell_strike - credit, call_sell_strike + credit};
    s.max_profit = PayoffBound::finite(credit);
    s.max_loss = PayoffBound::finite(std::max(raw_loss, 0.0));
    s.degenerate = raw_loss < 0.0;

    auto pop = probability_between(spot, s.breakevens[0], s.breakevens[1], sigma,
                                   days_to_expiry, config);
    s.probability_of_profit = pop ? *pop : 0.0;

    KUMQUAT_TRACE_ALGO_COMPLETE(MODULE_STRATEGY, 4, credit);
    return s;
}

double payoff_at_expiry(const Strategy& strategy, double spot_at_expiry) {
    double value = 0.0;
    for (const auto& leg : strategy.legs) {
        value += leg.signed_quantity() * intrinsic_value(spot_at_expiry, leg.strike, leg.type);
    }
    return value - strategy.net_cost();
}

std::expected<PayoffProfile, ValidationError> payoff_profile(
    const Strategy& strategy, double spot, double range_pct, double step_pct)
{
    if (!(spot > 0.0) || !std::isfinite(spot)) {
        return reject(ValidationErrorCode::InvalidSpotPrice, spot);
    }
    if (!(step_pct > 0.0) || !(range_pct >= 0.0) || !std::isfinite(range_pct)) {
        return reject(ValidationErrorCode::InvalidGridSize, step_pct);
    }
    const double ratio = range_pct / step_pct;
    if (!(ratio <= static_cast<double>(kMaxPayoffSteps))) {
        return reject(ValidationErrorCode::InvalidGridSize, ratio);
    }

    // Rounded so 0.30 / 0.02 gives 15 steps each side
    const int steps = static_cast<int>(std::floor(ratio + 1e-9));

    PayoffProfile profile;
    profile.prices.reserve(static_cast<size_t>(2 * steps + 1));
    profile.pnl.reserve(static_cast<size_t>(2 * steps + 1));
    for (int i = -steps; i <= steps; ++i) {
        const double price = spot * (1.0 + i * step_pct);
        profile.prices.push_back(price);
        profile.pnl.push_back(payoff_at_expiry(strategy, price));
    }
    return profile;
}

std::ostream& operator<<(std::ostream& os, PremiumFlow flow) {
    return os << (flow == PremiumFlow::DEBIT ? "DEBIT" : "CREDIT");
}

}  // namespace kumquat
