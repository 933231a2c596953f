// SPDX-License-Identifier: MIT
#pragma once

#include "src/option/option_spec.hpp"
#include "src/support/error_types.hpp"
#include <cstddef>
#include <expected>
#include <span>
#include <stdexcept>
#include <vector>

namespace kumquat {

/// Surface conventions: pricing config plus the side stored per point
struct SurfaceConfig : PricingConfig {
    OptionType option_type = OptionType::CALL;
};

struct IVSurfacePoint {
    int expiry_days = 0;
    double strike = 0.0;
    double theoretical_price = 0.0;
    double implied_vol = 0.0;
};

/// Rectangular expiry x strike grid, stored row-major
///
/// Rows are ascending expiries, columns ascending strikes. Volatility is
/// flat: implied_vol equals the input sigma at every point (no smile).
struct IVSurface {
    double spot = 0.0;
    std::vector<int> expiries;      ///< Days, ascending
    std::vector<double> strikes;    ///< Ascending
    std::vector<IVSurfacePoint> points;

    size_t n_expiries() const { return expiries.size(); }
    size_t n_strikes() const { return strikes.size(); }

    /// Throws std::out_of_range when either index is outside the grid
    const IVSurfacePoint& at(size_t expiry_index, size_t strike_index) const {
        if (expiry_index >= expiries.size() || strike_index >= strikes.size()) {
            throw std::out_of_range("IVSurface::at: index outside grid");
        }
        return points[expiry_index * strikes.size() + strike_index];
    }
};

/// Price a flat-volatility grid over expiries and centred strikes
///
/// Expiries are sorted ascending (duplicates kept). Strikes come from
/// centered_strikes(spot, strike_count).
///
/// Errors: InvalidSpotPrice, InvalidVolatility, InvalidRate,
/// InvalidMaturity (negative expiry, with index), InvalidGridSize
/// (strike_count == 0).
std::expected<IVSurface, ValidationError> generate_surface(
    double spot, double sigma, std::span<const int> expiries_days,
    size_t strike_count, const SurfaceConfig& config = {});

}  // namespace kumquat
