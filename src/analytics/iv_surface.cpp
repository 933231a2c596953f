// SPDX-License-Identifier: MIT
#include "src/analytics/iv_surface.hpp"
#include "src/analytics/strike_ladder.hpp"
#include "src/math/black_scholes_analytics.hpp"
#include "src/support/kumquat_trace.h"
#include "src/support/parallel.hpp"
#include <algorithm>
#include <cmath>

namespace kumquat {

namespace {

std::unexpected<ValidationError> reject(ValidationErrorCode code, double value,
                                        size_t index = 0) {
    KUMQUAT_TRACE_VALIDATION_ERROR(MODULE_SURFACE, static_cast<int>(code), value, index);
    return std::unexpected(ValidationError(code, value, index));
}

}  // namespace

std::expected<IVSurface, ValidationError> generate_surface(
    double spot, double sigma, std::span<const int> expiries_days,
    size_t strike_count, const SurfaceConfig& config)
{
    if (!(spot > 0.0) || !std::isfinite(spot)) {
        return reject(ValidationErrorCode::InvalidSpotPrice, spot);
    }
    if (!std::isfinite(sigma)) {
        return reject(ValidationErrorCode::InvalidVolatility, sigma);
    }
    if (!std::isfinite(config.risk_free_rate)) {
        return reject(ValidationErrorCode::InvalidRate, config.risk_free_rate);
    }
    if (strike_count == 0) {
        return reject(ValidationErrorCode::InvalidGridSize, 0.0);
    }
    for (size_t i = 0; i < expiries_days.size(); ++i) {
        if (expiries_days[i] < 0) {
            return reject(ValidationErrorCode::InvalidMaturity, expiries_days[i], i);
        }
    }

    KUMQUAT_TRACE_ALGO_START(MODULE_SURFACE, expiries_days.size(), strike_count, sigma);

    IVSurface surface;
    surface.spot = spot;
    surface.expiries.assign(expiries_days.begin(), expiries_days.end());
    std::sort(surface.expiries.begin(), surface.expiries.end());
    surface.strikes = centered_strikes(spot, strike_count);
    surface.points.resize(surface.expiries.size() * surface.strikes.size());

    const size_t n_exp = surface.expiries.size();
    const size_t n_k = surface.strikes.size();
    const double rate = config.risk_free_rate;

    KUMQUAT_PRAGMA_PARALLEL
    {
        KUMQUAT_PRAGMA_FOR_COLLAPSE2
        for (size_t i = 0; i < n_exp; ++i) {
            for (size_t j = 0; j < n_k; ++j) {
                const int days = surface.expiries[i];
                const double strike = surface.strikes[j];
                const double tau = year_fraction(days, config);

                IVSurfacePoint& pt = surface.points[i * n_k + j];
                pt.expiry_days = days;
                pt.strike = strike;
                pt.theoretical_price = bs_price(config.option_type, spot, strike,
                                                tau, rate, sigma);
                pt.implied_vol = sigma;
            }
        }
    }

    KUMQUAT_TRACE_ALGO_COMPLETE(MODULE_SURFACE, surface.points.size(), sigma);
    return surface;
}

}  // namespace kumquat
