// SPDX-License-Identifier: MIT
#pragma once

#include "src/support/error_types.hpp"
#include <cstddef>
#include <expected>
#include <optional>
#include <vector>

namespace kumquat {

/// Converged implied volatility
///
/// `vega` is dPrice/dSigma per unit volatility (the raw derivative the
/// Newton step uses), not the per-point desk unit reported in Greeks.
/// Divide by 100 to compare with Greeks::vega.
struct IVSuccess {
    double implied_vol;              ///< Annualized, inside [vol_lower, vol_upper]
    size_t iterations;               ///< Newton plus any Brent iterations
    double final_error;              ///< |bs_price(implied_vol) - market_price|
    std::optional<double> vega;      ///< Per unit volatility at implied_vol
};

/// Per-query outcomes of IVSolver::solve_batch, in input order
struct BatchIVResult {
    std::vector<std::expected<IVSuccess, IVError>> results;
    size_t failed_count;

    size_t size() const { return results.size(); }

    bool all_succeeded() const {
        return failed_count == 0;
    }
};

}  // namespace kumquat
