// SPDX-License-Identifier: MIT
#include "src/simple/analytics.hpp"
#include "src/analytics/strike_ladder.hpp"
#include "src/option/european_option.hpp"
#include "src/option/iv_solver.hpp"
#include <cmath>
#include <sstream>
#include <utility>

namespace kumquat::simple {

namespace {

template <typename E>
std::unexpected<std::string> describe(const E& error) {
    std::ostringstream oss;
    oss << error;
    return std::unexpected(oss.str());
}

}  // namespace

VolatilityEstimate estimate_volatility(std::span<const double> closes,
                                       const VolatilityConfig& config)
{
    VolatilityEstimate estimate;
    estimate.observations = closes.size();
    estimate.low_confidence = closes.size() < kMinConfidentObservations;

    auto sigma = annualized_volatility(closes, config);
    if (sigma && *sigma > 0.0) {
        estimate.sigma = *sigma;
        estimate.used_fallback = false;
    }
    return estimate;
}

std::expected<double, std::string> price(
    double spot, double strike, int days_to_expiry, double volatility,
    double rate, OptionType type)
{
    auto result = european_price(
        OptionQuote(type, spot, strike, days_to_expiry, rate, volatility));
    if (!result) {
        return describe(result.error());
    }
    return *result;
}

std::expected<Greeks, std::string> greeks(
    double spot, double strike, int days_to_expiry, double volatility,
    double rate, OptionType type)
{
    auto result = european_greeks(
        OptionQuote(type, spot, strike, days_to_expiry, rate, volatility));
    if (!result) {
        return describe(result.error());
    }
    return *result;
}

std::expected<double, std::string> implied_vol(
    double spot, double strike, int days_to_expiry, double market_price,
    double rate, OptionType type)
{
    auto result = solve_implied_vol(
        IVQuery(type, spot, strike, days_to_expiry, rate, market_price));
    if (!result) {
        return describe(result.error());
    }
    return result->implied_vol;
}

std::expected<ProbabilityResult, std::string> probabilities(
    double spot, double strike, std::span<const double> closes,
    int days_to_expiry)
{
    const VolatilityEstimate vol = estimate_volatility(closes);
    auto result = kumquat::probabilities(spot, strike, vol.sigma, days_to_expiry);
    if (!result) {
        return describe(result.error());
    }
    return *result;
}

std::expected<OptionChain, std::string> chain(
    double spot, std::span<const double> closes, int days_to_expiry,
    const PricingConfig& config)
{
    const VolatilityEstimate vol = estimate_volatility(closes);
    const std::vector<double> strikes = strike_ladder(spot);
    auto result = generate_chain(spot, vol.sigma, strikes, days_to_expiry, config);
    if (!result) {
        return describe(result.error());
    }
    return std::move(*result);
}

std::expected<Strategy, std::string> straddle(
    double spot, double sigma, int days_to_expiry,
    std::optional<double> strike, const PricingConfig& config)
{
    const double k = strike.value_or(std::round(spot));
    auto result = kumquat::straddle(spot, k, sigma, days_to_expiry, config);
    if (!result) {
        return describe(result.error());
    }
    return std::move(*result);
}

std::expected<Strategy, std::string> standard_iron_condor(
    double spot, double sigma, int days_to_expiry, double width,
    const PricingConfig& config)
{
    const double atm = std::round(spot);
    auto result = iron_condor(spot, atm - 2.0 * width, atm - width,
                              atm + width, atm + 2.0 * width,
                              sigma, days_to_expiry, config);
    if (!result) {
        return describe(result.error());
    }
    return std::move(*result);
}

std::expected<IVSurface, std::string> standard_surface(
    double spot, double sigma, const SurfaceConfig& config)
{
    auto result = generate_surface(spot, sigma, kSurfaceExpiries,
                                   kSurfaceStrikeCount, config);
    if (!result) {
        return describe(result.error());
    }
    return std::move(*result);
}

}  // namespace kumquat::simple
