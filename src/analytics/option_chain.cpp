// SPDX-License-Identifier: MIT
#include "src/analytics/option_chain.hpp"
#include "src/math/black_scholes_analytics.hpp"
#include "src/option/european_option.hpp"
#include "src/support/kumquat_trace.h"
#include "src/support/parallel.hpp"
#include <cmath>

namespace kumquat {

namespace {

ChainLeg price_leg(const OptionQuote& quote, double tau, const PricingConfig& config) {
    ChainLeg leg;
    leg.quote = quote;
    leg.price = bs_price(quote.type, quote.spot, quote.strike, tau,
                         quote.rate, quote.volatility);
    leg.bid = leg.price * (1.0 - config.bid_ask_spread);
    leg.ask = leg.price * (1.0 + config.bid_ask_spread);
    leg.greeks = bs_greeks(quote.type, quote.spot, quote.strike, tau,
                           quote.rate, quote.volatility, config.days_per_year);
    return leg;
}

std::unexpected<ValidationError> reject(ValidationErrorCode code, double value,
                                        size_t index = 0) {
    KUMQUAT_TRACE_VALIDATION_ERROR(MODULE_CHAIN, static_cast<int>(code), value, index);
    return std::unexpected(ValidationError(code, value, index));
}

}  // namespace

std::expected<OptionChain, ValidationError> generate_chain(
    double spot, double sigma, std::span<const double> strikes,
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
    for (size_t i = 0; i < strikes.size(); ++i) {
        if (!(strikes[i] > 0.0) || !std::isfinite(strikes[i])) {
            return reject(ValidationErrorCode::InvalidStrike, strikes[i], i);
        }
        if (i > 0 && strikes[i] < strikes[i - 1]) {
            return reject(ValidationErrorCode::UnsortedStrikes, strikes[i], i);
        }
    }

    KUMQUAT_TRACE_ALGO_START(MODULE_CHAIN, strikes.size(), sigma, days_to_expiry);

    const double tau = year_fraction(days_to_expiry, config);

    OptionChain chain;
    chain.spot = spot;
    chain.volatility = sigma;
    chain.days_to_expiry = days_to_expiry;
    chain.rows.resize(strikes.size());

    KUMQUAT_PRAGMA_PARALLEL_FOR
    for (size_t i = 0; i < strikes.size(); ++i) {
        const double strike = strikes[i];
        ChainRow& row = chain.rows[i];
        row.strike = strike;
        row.call = price_leg(OptionQuote(OptionType::CALL, spot, strike, days_to_expiry,
                                         config.risk_free_rate, sigma), tau, config);
        row.put = price_leg(OptionQuote(OptionType::PUT, spot, strike, days_to_expiry,
                                        config.risk_free_rate, sigma), tau, config);
        row.moneyness_pct = 100.0 * (spot - strike) / strike;
        row.itm = row.moneyness_pct > 0.0;
    }

    KUMQUAT_TRACE_ALGO_COMPLETE(MODULE_CHAIN, strikes.size(), sigma);
    return chain;
}

}  // namespace kumquat
