// SPDX-License-Identifier: MIT
#include "src/analytics/probability.hpp"
#include "src/math/normal_distribution.hpp"
#include "src/support/kumquat_trace.h"
#include <algorithm>
#include <cmath>

namespace kumquat {

namespace {

std::expected<void, ValidationError> validate_inputs(double spot, double sigma,
                                                     int days_to_expiry) {
    if (!(spot > 0.0) || !std::isfinite(spot)) {
        KUMQUAT_TRACE_VALIDATION_ERROR(MODULE_PROBABILITY,
            static_cast<int>(ValidationErrorCode::InvalidSpotPrice), spot, 0);
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidSpotPrice, spot));
    }
    if (!std::isfinite(sigma)) {
        KUMQUAT_TRACE_VALIDATION_ERROR(MODULE_PROBABILITY,
            static_cast<int>(ValidationErrorCode::InvalidVolatility), sigma, 0);
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidVolatility, sigma));
    }
    if (days_to_expiry < 0) {
        KUMQUAT_TRACE_VALIDATION_ERROR(MODULE_PROBABILITY,
            static_cast<int>(ValidationErrorCode::InvalidMaturity), days_to_expiry, 0);
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidMaturity,
                                               days_to_expiry));
    }
    return {};
}

}  // namespace

double prob_finish_above(double spot, double level, double sigma, double tau) {
    if (level <= 0.0) {
        return 1.0;
    }
    if (sigma <= 0.0 || tau <= 0.0) {
        return spot > level ? 1.0 : 0.0;
    }
    const double sigma_sqrt_tau = sigma * std::sqrt(tau);
    return norm_cdf((std::log(spot / level) + 0.5 * sigma * sigma * tau) / sigma_sqrt_tau);
}

std::expected<ProbabilityResult, ValidationError> probabilities(
    double spot, double strike, double sigma, int days_to_expiry,
    const PricingConfig& config)
{
    auto validation = validate_inputs(spot, sigma, days_to_expiry);
    if (!validation) {
        return std::unexpected(validation.error());
    }
    if (!(strike > 0.0) || !std::isfinite(strike)) {
        KUMQUAT_TRACE_VALIDATION_ERROR(MODULE_PROBABILITY,
            static_cast<int>(ValidationErrorCode::InvalidStrike), strike, 0);
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidStrike, strike));
    }

    const double tau = year_fraction(days_to_expiry, config);
    KUMQUAT_TRACE_ALGO_START(MODULE_PROBABILITY, strike, sigma, tau);

    ProbabilityResult result;

    if (sigma <= 0.0 || tau <= 0.0) {
        result.prob_itm_call = spot > strike ? 1.0 : 0.0;
        result.prob_itm_put = spot < strike ? 1.0 : 0.0;
        result.prob_touch = spot == strike ? 1.0 : 0.0;
        result.one_std_dev_range = {spot, spot};
        KUMQUAT_TRACE_ALGO_COMPLETE(MODULE_PROBABILITY, 0, result.prob_itm_call);
        return result;
    }

    const double std_dev = spot * sigma * std::sqrt(tau);

    result.prob_itm_call = prob_finish_above(spot, strike, sigma, tau);
    result.prob_itm_put = 1.0 - result.prob_itm_call;

    // Reflection principle: P(touch) ~ 2 * P(finish beyond the barrier)
    if (strike == spot) {
        result.prob_touch = 1.0;
    } else if (strike > spot) {
        result.prob_touch = std::min(1.0, 2.0 * result.prob_itm_call);
    } else {
        result.prob_touch = std::min(1.0, 2.0 * result.prob_itm_put);
    }

    result.expected_move = std_dev;
    result.expected_move_pct = 100.0 * std_dev / spot;
    result.one_std_dev_range = {spot - std_dev, spot + std_dev};

    KUMQUAT_TRACE_ALGO_COMPLETE(MODULE_PROBABILITY, 1, result.prob_itm_call);
    return result;
}

std::expected<double, ValidationError> probability_between(
    double spot, double low, double high, double sigma, int days_to_expiry,
    const PricingConfig& config)
{
    auto validation = validate_inputs(spot, sigma, days_to_expiry);
    if (!validation) {
        return std::unexpected(validation.error());
    }
    if (std::isnan(low) || std::isnan(high)) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidStrike,
                                               std::isnan(low) ? low : high));
    }
    if (low >= high) {
        return 0.0;
    }

    const double tau = year_fraction(days_to_expiry, config);

    if (sigma <= 0.0 || tau <= 0.0) {
        return (spot > low && spot < high) ? 1.0 : 0.0;
    }

    const double above_low = prob_finish_above(spot, low, sigma, tau);
    const double above_high = std::isinf(high) ? 0.0
                                               : prob_finish_above(spot, high, sigma, tau);
    return std::clamp(above_low - above_high, 0.0, 1.0);
}

}  // namespace kumquat
