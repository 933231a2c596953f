// SPDX-License-Identifier: MIT
#include "src/option/iv_solver.hpp"
#include "src/math/black_scholes_analytics.hpp"
#include "src/support/kumquat_trace.h"
#include "src/support/parallel.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace kumquat {

namespace {

std::unexpected<IVError> reject(IVErrorCode code, double p1, double p2) {
    KUMQUAT_TRACE_VALIDATION_ERROR(MODULE_IMPLIED_VOL, static_cast<int>(code), p1, p2);
    return std::unexpected(IVError{.code = code});
}

}  // namespace

IVSolver::IVSolver(const IVSolverConfig& config)
    : config_(config) {}

std::expected<void, IVError> IVSolver::validate(const IVQuery& query) const {
    auto spec_validation = validate_option_spec(query);
    if (!spec_validation) {
        return std::unexpected(convert_to_iv_error(spec_validation.error()));
    }

    // An expired contract has no volatility left to solve for
    if (query.days_to_expiry == 0) {
        return reject(IVErrorCode::NegativeMaturity, query.days_to_expiry, 0.0);
    }

    if (query.market_price <= 0.0 || !std::isfinite(query.market_price)) {
        return reject(IVErrorCode::NegativeMarketPrice, query.market_price, 0.0);
    }

    if (config_.vol_lower <= 0.0 || config_.vol_lower >= config_.vol_upper ||
        config_.initial_guess <= 0.0) {
        return reject(IVErrorCode::InvalidConfig, config_.vol_lower, config_.vol_upper);
    }

    // No-arbitrage bounds for European options
    const double tau = query.maturity(config_.pricing);
    const double pv_strike = query.strike * std::exp(-query.rate * tau);

    double lower;
    double upper;
    if (query.type == OptionType::CALL) {
        lower = std::max(query.spot - pv_strike, 0.0);
        upper = query.spot;
    } else {
        lower = std::max(pv_strike - query.spot, 0.0);
        upper = pv_strike;
    }

    if (query.market_price < lower || query.market_price > upper) {
        return reject(IVErrorCode::ArbitrageViolation, query.market_price, lower);
    }

    return {};
}

std::expected<IVSuccess, IVError> IVSolver::solve(const IVQuery& query) const {
    KUMQUAT_TRACE_IV_START(query.spot, query.strike, query.days_to_expiry, query.market_price);

    auto validation = validate(query);
    if (!validation) {
        KUMQUAT_TRACE_IV_COMPLETE(0.0, 0, 0);
        return std::unexpected(validation.error());
    }

    const double tau = query.maturity(config_.pricing);

    auto objective = [&](double vol) {
        return bs_price(query.type, query.spot, query.strike, tau, query.rate, vol)
             - query.market_price;
    };
    auto vega = [&](double vol) {
        return bs_vega(query.spot, query.strike, tau, vol, query.rate);
    };

    KUMQUAT_TRACE_ALGO_START(MODULE_IMPLIED_VOL, query.strike, tau, query.market_price);

    auto newton = newton_find_root(objective, vega, config_.initial_guess,
                                   config_.vol_lower, config_.vol_upper,
                                   config_.root_config);
    if (newton.converged) {
        const double vol = newton.root.value();
        KUMQUAT_TRACE_IV_COMPLETE(vol, newton.iterations, 1);
        return IVSuccess{
            .implied_vol = vol,
            .iterations = newton.iterations,
            .final_error = newton.final_error,
            .vega = vega(vol)
        };
    }

    // Newton stalled: bracket the full volatility range instead
    auto brent = brent_find_root(objective, config_.vol_lower, config_.vol_upper,
                                 config_.root_config);
    const size_t total_iterations = newton.iterations + brent.iterations;

    if (brent.converged) {
        const double vol = brent.root.value();
        KUMQUAT_TRACE_IV_COMPLETE(vol, total_iterations, 1);
        return IVSuccess{
            .implied_vol = vol,
            .iterations = total_iterations,
            .final_error = brent.final_error,
            .vega = vega(vol)
        };
    }

    KUMQUAT_TRACE_CONVERGENCE_FAILED(MODULE_IMPLIED_VOL, total_iterations, brent.final_error);
    KUMQUAT_TRACE_IV_COMPLETE(0.0, total_iterations, 0);

    const bool bracketed = brent.root.has_value();
    return std::unexpected(IVError{
        .code = bracketed ? IVErrorCode::MaxIterationsExceeded
                          : IVErrorCode::BracketingFailed,
        .iterations = total_iterations,
        .final_error = bracketed ? brent.final_error : newton.final_error,
        .last_vol = bracketed ? brent.root : newton.root
    });
}

BatchIVResult IVSolver::solve_batch(const std::vector<IVQuery>& queries) const {
    std::vector<std::expected<IVSuccess, IVError>> results(
        queries.size(), std::unexpected(IVError{.code = IVErrorCode::InvalidConfig}));

    KUMQUAT_PRAGMA_PARALLEL_FOR
    for (size_t i = 0; i < queries.size(); ++i) {
        results[i] = solve(queries[i]);
    }

    size_t failed = static_cast<size_t>(std::count_if(
        results.begin(), results.end(), [](const auto& r) { return !r.has_value(); }));

    return BatchIVResult{.results = std::move(results), .failed_count = failed};
}

std::expected<IVSuccess, IVError> solve_implied_vol(
    const IVQuery& query, const IVSolverConfig& config)
{
    return IVSolver(config).solve(query);
}

}  // namespace kumquat
