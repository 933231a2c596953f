// SPDX-License-Identifier: MIT
#pragma once

#include "src/support/error_types.hpp"
#include <expected>
#include <span>

namespace kumquat {

/// Historical volatility conventions
struct VolatilityConfig {
    double trading_days_per_year = 252.0;  ///< Annualization factor for daily returns
    bool subtract_mean = true;             ///< false: zero-mean variance of returns
};

/// Annualized historical volatility from a close-price series
///
/// Uses log returns r_i = ln(P_i / P_{i-1}) and their population variance
/// (divide by N), annualized as sqrt(var * trading_days_per_year).
///
/// Errors:
/// - InsufficientData: fewer than 2 prices
/// - InvalidPrice: a price is non-positive or non-finite (index reported)
std::expected<double, VolatilityError> annualized_volatility(
    std::span<const double> prices, const VolatilityConfig& config = {});

}  // namespace kumquat
