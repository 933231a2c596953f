// SPDX-License-Identifier: MIT
#include "src/analytics/volatility_estimator.hpp"
#include "src/support/kumquat_trace.h"
#include <cmath>

namespace kumquat {

std::expected<double, VolatilityError> annualized_volatility(
    std::span<const double> prices, const VolatilityConfig& config)
{
    KUMQUAT_TRACE_ALGO_START(MODULE_VOLATILITY, prices.size(),
                             config.trading_days_per_year, config.subtract_mean);

    if (prices.size() < 2) {
        KUMQUAT_TRACE_VALIDATION_ERROR(MODULE_VOLATILITY,
            static_cast<int>(VolatilityErrorCode::InsufficientData), prices.size(), 0);
        return std::unexpected(VolatilityError(VolatilityErrorCode::InsufficientData,
                                               prices.size()));
    }

    for (size_t i = 0; i < prices.size(); ++i) {
        if (!(prices[i] > 0.0) || !std::isfinite(prices[i])) {
            KUMQUAT_TRACE_VALIDATION_ERROR(MODULE_VOLATILITY,
                static_cast<int>(VolatilityErrorCode::InvalidPrice), prices[i], i);
            return std::unexpected(VolatilityError(VolatilityErrorCode::InvalidPrice,
                                                   prices.size(), i));
        }
    }

    const size_t n = prices.size() - 1;

    double mean = 0.0;
    if (config.subtract_mean) {
        for (size_t i = 1; i < prices.size(); ++i) {
            mean += std::log(prices[i] / prices[i - 1]);
        }
        mean /= static_cast<double>(n);
    }

    double sum_sq = 0.0;
    for (size_t i = 1; i < prices.size(); ++i) {
        const double dev = std::log(prices[i] / prices[i - 1]) - mean;
        sum_sq += dev * dev;
    }

    const double variance = sum_sq / static_cast<double>(n);
    const double sigma = std::sqrt(variance * config.trading_days_per_year);

    KUMQUAT_TRACE_ALGO_COMPLETE(MODULE_VOLATILITY, n, sigma);
    return sigma;
}

}  // namespace kumquat
