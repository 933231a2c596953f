// SPDX-License-Identifier: MIT
#include "src/option/european_option.hpp"
#include "src/support/kumquat_trace.h"
#include <cmath>

namespace kumquat {

// ===========================================================================
// Closed-form kernels
// ===========================================================================

Greeks bs_greeks(OptionType option_type, double spot, double strike,
                 double tau, double rate, double sigma,
                 double days_per_year)
{
    if (bs_degenerate(tau, sigma)) {
        // Terminal step: ITM options move one-for-one, OTM and ATM do not move
        Greeks g;
        if (option_type == OptionType::PUT) {
            g.delta = (spot < strike) ? -1.0 : 0.0;
        } else {
            g.delta = (spot > strike) ? 1.0 : 0.0;
        }
        return g;
    }

    double sqrt_tau = std::sqrt(tau);
    double d1 = bs_d1(spot, strike, tau, sigma, rate);
    double d2 = bs_d2(d1, tau, sigma);
    double pdf_d1 = norm_pdf(d1);
    double exp_rt = std::exp(-rate * tau);

    // Common term: -S·φ(d1)·σ/(2√τ)
    double decay = -spot * pdf_d1 * sigma / (2.0 * sqrt_tau);

    Greeks g;
    g.gamma = pdf_d1 / (spot * sigma * sqrt_tau);
    g.vega = spot * pdf_d1 * sqrt_tau / 100.0;

    if (option_type == OptionType::PUT) {
        g.delta = norm_cdf(d1) - 1.0;
        g.theta = (decay + rate * strike * exp_rt * norm_cdf(-d2)) / days_per_year;
        g.rho = -strike * tau * exp_rt * norm_cdf(-d2) / 100.0;
    } else {
        g.delta = norm_cdf(d1);
        g.theta = (decay - rate * strike * exp_rt * norm_cdf(d2)) / days_per_year;
        g.rho = strike * tau * exp_rt * norm_cdf(d2) / 100.0;
    }
    return g;
}

// ===========================================================================
// Validated entry points
// ===========================================================================

std::expected<double, ValidationError> european_price(
    OptionType option_type, double spot, double strike,
    double maturity, double rate, double volatility)
{
    auto validation = validate_pricing_inputs(spot, strike, maturity, rate, volatility);
    if (!validation) {
        return std::unexpected(validation.error());
    }
    return bs_price(option_type, spot, strike, maturity, rate, volatility);
}

std::expected<double, ValidationError> european_price(
    const OptionQuote& quote, const PricingConfig& config)
{
    auto validation = validate_option_quote(quote);
    if (!validation) {
        return std::unexpected(validation.error());
    }
    return bs_price(quote.type, quote.spot, quote.strike,
                    quote.maturity(config), quote.rate, quote.volatility);
}

std::expected<Greeks, ValidationError> european_greeks(
    OptionType option_type, double spot, double strike,
    double maturity, double rate, double volatility)
{
    KUMQUAT_TRACE_ALGO_START(MODULE_GREEKS, spot, strike, maturity);
    auto validation = validate_pricing_inputs(spot, strike, maturity, rate, volatility);
    if (!validation) {
        return std::unexpected(validation.error());
    }
    Greeks g = bs_greeks(option_type, spot, strike, maturity, rate, volatility);
    KUMQUAT_TRACE_ALGO_COMPLETE(MODULE_GREEKS, 0, g.delta);
    return g;
}

std::expected<Greeks, ValidationError> european_greeks(
    const OptionQuote& quote, const PricingConfig& config)
{
    const double tau = quote.maturity(config);
    KUMQUAT_TRACE_ALGO_START(MODULE_GREEKS, quote.spot, quote.strike, tau);
    auto validation = validate_option_quote(quote);
    if (!validation) {
        return std::unexpected(validation.error());
    }
    Greeks g = bs_greeks(quote.type, quote.spot, quote.strike, tau, quote.rate,
                         quote.volatility, config.days_per_year);
    KUMQUAT_TRACE_ALGO_COMPLETE(MODULE_GREEKS, 0, g.delta);
    return g;
}

// ===========================================================================
// EuropeanOptionResult
// ===========================================================================

EuropeanOptionResult::EuropeanOptionResult(const OptionQuote& quote,
                                           const PricingConfig& config)
    : quote_(quote)
    , tau_(quote.maturity(config))
    , days_per_year_(config.days_per_year)
{}

double EuropeanOptionResult::value() const {
    return value_at(quote_.spot);
}

double EuropeanOptionResult::value_at(double S) const {
    return bs_price(quote_.type, S, quote_.strike, tau_, quote_.rate, quote_.volatility);
}

Greeks EuropeanOptionResult::greeks() const {
    return bs_greeks(quote_.type, quote_.spot, quote_.strike, tau_,
                     quote_.rate, quote_.volatility, days_per_year_);
}

double EuropeanOptionResult::breakeven() const {
    double premium = value();
    return quote_.type == OptionType::CALL ? quote_.strike + premium
                                           : quote_.strike - premium;
}

// ===========================================================================
// EuropeanOptionSolver
// ===========================================================================

EuropeanOptionSolver::EuropeanOptionSolver(const OptionQuote& quote,
                                           const PricingConfig& config)
    : quote_(quote)
    , config_(config)
{}

std::expected<EuropeanOptionSolver, ValidationError>
EuropeanOptionSolver::create(const OptionQuote& quote, const PricingConfig& config) noexcept {
    auto validation = validate_option_quote(quote);
    if (!validation.has_value()) {
        return std::unexpected(validation.error());
    }
    return EuropeanOptionSolver(quote, config);
}

EuropeanOptionResult EuropeanOptionSolver::solve() const {
    return EuropeanOptionResult(quote_, config_);
}

}  // namespace kumquat
