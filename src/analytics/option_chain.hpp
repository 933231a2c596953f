// SPDX-License-Identifier: MIT
#pragma once

#include "src/option/greeks.hpp"
#include "src/option/option_spec.hpp"
#include "src/support/error_types.hpp"
#include <expected>
#include <span>
#include <vector>

namespace kumquat {

/// One side (call or put) of a chain row
struct ChainLeg {
    OptionQuote quote;
    double price = 0.0;   ///< Theoretical Black-Scholes price
    double bid = 0.0;     ///< price * (1 - bid_ask_spread)
    double ask = 0.0;     ///< price * (1 + bid_ask_spread)
    Greeks greeks;
};

/// Call and put at one strike
struct ChainRow {
    double strike = 0.0;
    ChainLeg call;
    ChainLeg put;
    double moneyness_pct = 0.0;  ///< 100 * (S - K) / K
    bool itm = false;            ///< Call side in the money
};

/// Theoretical option chain at a single expiry
///
/// Rows keep the order of the strikes passed to generate_chain().
struct OptionChain {
    double spot = 0.0;
    double volatility = 0.0;
    int days_to_expiry = 0;
    std::vector<ChainRow> rows;

    size_t size() const { return rows.size(); }
    bool empty() const { return rows.empty(); }
};

/// Price a flat-volatility chain across the given strikes
///
/// Strikes must be positive, finite and ascending (equal neighbours are
/// accepted). An empty strike list yields an empty chain.
///
/// Errors: InvalidSpotPrice, InvalidVolatility, InvalidMaturity,
/// InvalidRate, InvalidStrike / UnsortedStrikes (with offending index).
std::expected<OptionChain, ValidationError> generate_chain(
    double spot, double sigma, std::span<const double> strikes,
    int days_to_expiry, const PricingConfig& config = {});

}  // namespace kumquat
