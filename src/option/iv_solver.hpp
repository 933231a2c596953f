// SPDX-License-Identifier: MIT
#pragma once

#include "src/math/root_finding.hpp"
#include "src/option/iv_result.hpp"
#include "src/option/option_spec.hpp"
#include <expected>
#include <vector>

namespace kumquat {

/// Configuration for the Black-Scholes IV solver
struct IVSolverConfig {
    /// Newton / Brent parameters (tolerance is on price, in dollars)
    RootFindingConfig root_config;

    /// Starting volatility for Newton
    double initial_guess = 0.30;

    /// Search bounds
    double vol_lower = 0.01;
    double vol_upper = 5.0;

    /// Day-count conventions
    PricingConfig pricing;
};

/// Black-Scholes implied volatility solver
///
/// Finds σ such that bs_price(σ) matches the observed market price.
///
/// **Algorithm:**
/// Bounded Newton-Raphson on analytic vega starting from initial_guess.
/// When Newton stalls (flat vega deep in or out of the money) the solver
/// falls back to Brent's method on [vol_lower, vol_upper].
///
/// **Usage:**
/// ```cpp
/// IVQuery query(OptionType::CALL, 100.0, 100.0, 90, 0.05, 6.89);
/// IVSolver solver;
/// auto result = solver.solve(query);
/// if (result) {
///     std::cout << "IV: " << result->implied_vol << "\n";
/// }
/// ```
///
/// **Thread Safety:** solve() is const and keeps no state.
///
/// **USDT Tracing:** iv_start / iv_complete, validation_error on rejects.
class IVSolver {
public:
    explicit IVSolver(const IVSolverConfig& config = {});

    /// Solve for implied volatility (single query)
    ///
    /// Error codes:
    /// - NegativeSpot, NegativeStrike, NegativeMaturity, NegativeMarketPrice: validation
    /// - ArbitrageViolation: price outside no-arbitrage bounds
    /// - InvalidConfig: bounds or initial guess unusable
    /// - MaxIterationsExceeded / BracketingFailed: no root found
    std::expected<IVSuccess, IVError> solve(const IVQuery& query) const;

    /// Solve a batch of queries (parallel when OpenMP is available)
    BatchIVResult solve_batch(const std::vector<IVQuery>& queries) const;

private:
    std::expected<void, IVError> validate(const IVQuery& query) const;

    IVSolverConfig config_;
};

/// Convenience wrapper around IVSolver::solve()
std::expected<IVSuccess, IVError> solve_implied_vol(
    const IVQuery& query, const IVSolverConfig& config = {});

}  // namespace kumquat
