// SPDX-License-Identifier: MIT
#pragma once

#include "src/option/option_spec.hpp"
#include "src/support/error_types.hpp"
#include <expected>

namespace kumquat {

/// Price interval at expiry
struct PriceRange {
    double low = 0.0;
    double high = 0.0;
};

/// Outcome statistics under a zero-drift lognormal model
struct ProbabilityResult {
    double prob_itm_call = 0.0;    ///< P(S_T > K)
    double prob_itm_put = 0.0;     ///< P(S_T < K)
    double prob_touch = 0.0;       ///< Reflection-principle estimate of touching K
    double expected_move = 0.0;    ///< One standard deviation in price units
    double expected_move_pct = 0.0;
    PriceRange one_std_dev_range;

    double prob_itm(OptionType type) const {
        return type == OptionType::CALL ? prob_itm_call : prob_itm_put;
    }
};

/// Probability that the underlying finishes above a level
///
/// N((ln(S/level) + σ²T/2) / (σ√T)). Unchecked; collapses to a step
/// function when sigma <= 0 or T <= 0. Levels <= 0 return 1.
double prob_finish_above(double spot, double level, double sigma, double tau);

/// In-the-money, touch and expected-move statistics for one strike
///
/// T = days / days_per_year. sigma <= 0 or days == 0 give the Heaviside
/// collapse with zero expected move.
///
/// Errors: InvalidSpotPrice, InvalidStrike, InvalidVolatility (non-finite),
/// InvalidMaturity (negative days).
std::expected<ProbabilityResult, ValidationError> probabilities(
    double spot, double strike, double sigma, int days_to_expiry,
    const PricingConfig& config = {});

/// P(low < S_T < high) under the same model
///
/// low may be <= 0 and high may be +infinity for one-sided intervals.
/// An empty interval (low >= high) has probability 0.
std::expected<double, ValidationError> probability_between(
    double spot, double low, double high, double sigma, int days_to_expiry,
    const PricingConfig& config = {});

}  // namespace kumquat
