// SPDX-License-Identifier: MIT
/**
 * @file analytics.hpp
 * @brief One-call analytics for a ticker's close history
 *
 * Wraps the core calculators with the defaults a quoting front end uses:
 * historical volatility with a fallback, the listed strike ladder and
 * the standard strategy layouts. Errors are flattened to strings.
 */

#pragma once

#include "src/analytics/iv_surface.hpp"
#include "src/analytics/option_chain.hpp"
#include "src/analytics/probability.hpp"
#include "src/analytics/strategy.hpp"
#include "src/analytics/volatility_estimator.hpp"
#include "src/option/greeks.hpp"
#include "src/option/option_spec.hpp"
#include <array>
#include <cstddef>
#include <expected>
#include <optional>
#include <span>
#include <string>

namespace kumquat::simple {

using kumquat::OptionType;
using kumquat::PricingConfig;

/// Volatility used when the close history cannot produce an estimate
inline constexpr double kDefaultVolatility = 0.30;

/// Close count below which an estimate is flagged low-confidence
inline constexpr size_t kMinConfidentObservations = 20;

/// Expiries (days) and strike count of the standard surface
inline constexpr std::array<int, 8> kSurfaceExpiries = {7, 14, 30, 45, 60, 90, 120, 180};
inline constexpr size_t kSurfaceStrikeCount = 11;

struct VolatilityEstimate {
    double sigma = kDefaultVolatility;
    size_t observations = 0;       ///< Number of closes supplied
    bool low_confidence = true;    ///< Fewer than kMinConfidentObservations closes
    bool used_fallback = true;     ///< sigma is kDefaultVolatility
};

/// Historical volatility that never fails
///
/// Falls back to kDefaultVolatility when the estimator rejects the
/// series (too short, bad prices) or returns zero.
VolatilityEstimate estimate_volatility(std::span<const double> closes,
                                       const VolatilityConfig& config = {});

/// Black-Scholes price with days to expiry
std::expected<double, std::string> price(
    double spot, double strike, int days_to_expiry, double volatility,
    double rate = 0.05, OptionType type = OptionType::CALL);

/// Black-Scholes Greeks with days to expiry
std::expected<Greeks, std::string> greeks(
    double spot, double strike, int days_to_expiry, double volatility,
    double rate = 0.05, OptionType type = OptionType::CALL);

/// Implied volatility from a market price
std::expected<double, std::string> implied_vol(
    double spot, double strike, int days_to_expiry, double market_price,
    double rate = 0.05, OptionType type = OptionType::CALL);

/// Probability statistics with volatility estimated from closes
std::expected<ProbabilityResult, std::string> probabilities(
    double spot, double strike, std::span<const double> closes,
    int days_to_expiry);

/// Chain over strike_ladder(spot) with volatility estimated from closes
std::expected<OptionChain, std::string> chain(
    double spot, std::span<const double> closes, int days_to_expiry,
    const PricingConfig& config = {});

/// Straddle at `strike`, or at the spot rounded to a whole dollar
std::expected<Strategy, std::string> straddle(
    double spot, double sigma, int days_to_expiry,
    std::optional<double> strike = std::nullopt,
    const PricingConfig& config = {});

/// Iron condor at ATM -/+ width (short) and ATM -/+ 2*width (long),
/// ATM being the spot rounded to a whole dollar
std::expected<Strategy, std::string> standard_iron_condor(
    double spot, double sigma, int days_to_expiry, double width = 5.0,
    const PricingConfig& config = {});

/// Surface over kSurfaceExpiries x kSurfaceStrikeCount strikes
std::expected<IVSurface, std::string> standard_surface(
    double spot, double sigma, const SurfaceConfig& config = {});

}  // namespace kumquat::simple
