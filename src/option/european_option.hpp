// SPDX-License-Identifier: MIT
/**
 * @file european_option.hpp
 * @brief European option pricing with closed-form Black-Scholes formulas
 *
 * Provides the validated pricing and Greeks entry points, plus
 * EuropeanOptionResult for callers that want price, Greeks and breakeven
 * for one quote.
 */

#pragma once

#include "src/math/black_scholes_analytics.hpp"
#include "src/option/greeks.hpp"
#include "src/option/option_spec.hpp"
#include <expected>

namespace kumquat {

/// Closed-form Greeks (unchecked)
///
/// Degenerate boundary (tau <= 0 or sigma <= 0): gamma, theta, vega and rho
/// are zero and delta is the terminal step function.
///
/// @param days_per_year Divisor turning annual theta into per-day theta
Greeks bs_greeks(OptionType option_type, double spot, double strike,
                 double tau, double rate, double sigma,
                 double days_per_year = 365.0);

/// Validated Black-Scholes price with T in years
std::expected<double, ValidationError> european_price(
    OptionType option_type, double spot, double strike,
    double maturity, double rate, double volatility);

/// Validated Black-Scholes price for a quote (days converted via config)
std::expected<double, ValidationError> european_price(
    const OptionQuote& quote, const PricingConfig& config = {});

/// Validated Greeks with T in years
std::expected<Greeks, ValidationError> european_greeks(
    OptionType option_type, double spot, double strike,
    double maturity, double rate, double volatility);

/// Validated Greeks for a quote
std::expected<Greeks, ValidationError> european_greeks(
    const OptionQuote& quote, const PricingConfig& config = {});

/**
 * @brief European option pricing result with closed-form Greeks
 *
 * Stores a validated quote and computes price/Greeks analytically.
 *
 * Thread-safety: All methods are const and thread-safe.
 */
class EuropeanOptionResult {
public:
    EuropeanOptionResult(const OptionQuote& quote, const PricingConfig& config = {});

    /// Option value at current spot
    double value() const;

    /// Option value at arbitrary spot price
    double value_at(double S) const;

    /// All Greeks in desk units
    Greeks greeks() const;

    double delta() const { return greeks().delta; }
    double gamma() const { return greeks().gamma; }
    double theta() const { return greeks().theta; }
    double vega() const { return greeks().vega; }
    double rho() const { return greeks().rho; }

    /// Underlying price at expiry where a long position breaks even
    /// (strike + premium for calls, strike - premium for puts)
    double breakeven() const;

    const OptionQuote& quote() const { return quote_; }
    double maturity() const { return tau_; }

private:
    OptionQuote quote_;
    double tau_;            ///< Time to expiry in years
    double days_per_year_;
};

/**
 * @brief Factory for EuropeanOptionResult with validation
 */
class EuropeanOptionSolver {
public:
    /// Factory with validation via validate_option_quote()
    static std::expected<EuropeanOptionSolver, ValidationError>
    create(const OptionQuote& quote, const PricingConfig& config = {}) noexcept;

    /// Compute European option price and Greeks (always succeeds)
    EuropeanOptionResult solve() const;

private:
    EuropeanOptionSolver(const OptionQuote& quote, const PricingConfig& config);

    OptionQuote quote_;
    PricingConfig config_;
};

}  // namespace kumquat
