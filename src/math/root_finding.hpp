// SPDX-License-Identifier: MIT
#pragma once

#include "src/support/kumquat_trace.h"
#include <algorithm>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <utility>

namespace kumquat {

/// Configuration for all root-finding methods
///
/// Each method uses only its relevant parameters.
struct RootFindingConfig {
    /// Maximum iterations for any method
    size_t max_iter = 100;

    /// Absolute convergence tolerance on |f(x)|
    double tolerance = 1e-4;

    /// Derivative magnitude below which Newton stops (flat region)
    double min_derivative = 1e-10;

    /// Absolute tolerance on the bracket width for Brent's method
    double brent_tol_abs = 1e-8;
};

/// Result from any root-finding method
struct RootFindingResult {
    /// Convergence status
    bool converged;

    /// Number of iterations performed
    size_t iterations;

    /// Final error measure |f(root)|
    double final_error;

    /// Optional failure diagnostic message
    std::optional<std::string> failure_reason;

    /// Last iterate (present on success, best effort on failure)
    std::optional<double> root;
};

/// Concept for objective functions (scalar functions f: R -> R)
template<typename F>
concept ObjectiveFunction = requires(F f, double x) {
    { f(x) } -> std::convertible_to<double>;
};

/// Concept for derivative functions (scalar functions df: R -> R)
template<typename DF>
concept DerivativeFunction = requires(DF df, double x) {
    { df(x) } -> std::convertible_to<double>;
};

/// Find root using Brent's method
///
/// Combines bisection, secant, and inverse quadratic interpolation.
/// Guaranteed to converge if f(a) and f(b) have opposite signs.
///
/// Reference: Brent, R. (1973). "Algorithms for Minimization without Derivatives"
template<ObjectiveFunction F>
RootFindingResult brent_find_root(F&& f, double a, double b,
                                  const RootFindingConfig& config) {
    double fa = f(a);
    double fb = f(b);

    KUMQUAT_TRACE_ALGO_START(MODULE_ROOT_FINDING, config.max_iter, config.tolerance, (b - a));

    if (!std::isfinite(fa) || !std::isfinite(fb)) {
        return RootFindingResult{
            .converged = false,
            .iterations = 0,
            .final_error = std::numeric_limits<double>::quiet_NaN(),
            .failure_reason = "Function returned non-finite value (NaN or Inf)",
            .root = std::nullopt
        };
    }

    if (fa * fb > 0.0) {
        return RootFindingResult{
            .converged = false,
            .iterations = 0,
            .final_error = std::min(std::abs(fa), std::abs(fb)),
            .failure_reason = "Root not bracketed",
            .root = std::nullopt
        };
    }

    if (std::abs(fa) < config.tolerance) {
        return RootFindingResult{true, 0, std::abs(fa), std::nullopt, a};
    }
    if (std::abs(fb) < config.tolerance) {
        return RootFindingResult{true, 0, std::abs(fb), std::nullopt, b};
    }

    // Keep b as the best estimate
    if (std::abs(fa) < std::abs(fb)) {
        std::swap(a, b);
        std::swap(fa, fb);
    }

    double c = a;
    double fc = fa;
    bool mflag = true;
    double d = 0.0;

    for (size_t iter = 0; iter < config.max_iter; ++iter) {
        KUMQUAT_TRACE_CONVERGENCE_ITER(MODULE_ROOT_FINDING, iter, b, fb);

        if (std::abs(fb) < config.tolerance ||
            std::abs(b - a) < config.brent_tol_abs) {
            KUMQUAT_TRACE_ALGO_COMPLETE(MODULE_ROOT_FINDING, iter + 1, b);
            return RootFindingResult{
                .converged = true,
                .iterations = iter + 1,
                .final_error = std::abs(fb),
                .failure_reason = std::nullopt,
                .root = b
            };
        }

        double s;
        if (fa != fc && fb != fc) {
            // Inverse quadratic interpolation
            s = a * fb * fc / ((fa - fb) * (fa - fc))
              + b * fa * fc / ((fb - fa) * (fb - fc))
              + c * fa * fb / ((fc - fa) * (fc - fb));
        } else {
            // Secant
            s = b - fb * (b - a) / (fb - fa);
        }

        const double lo = (3.0 * a + b) / 4.0;
        const bool outside = (s < std::min(lo, b)) || (s > std::max(lo, b));
        const bool slow_m = mflag && std::abs(s - b) >= std::abs(b - c) / 2.0;
        const bool slow_d = !mflag && std::abs(s - b) >= std::abs(c - d) / 2.0;
        const bool tiny_m = mflag && std::abs(b - c) < config.brent_tol_abs;
        const bool tiny_d = !mflag && std::abs(c - d) < config.brent_tol_abs;

        if (outside || slow_m || slow_d || tiny_m || tiny_d) {
            s = (a + b) / 2.0;
            mflag = true;
        } else {
            mflag = false;
        }

        const double fs = f(s);
        d = c;
        c = b;
        fc = fb;

        if (fa * fs < 0.0) {
            b = s;
            fb = fs;
        } else {
            a = s;
            fa = fs;
        }

        if (std::abs(fa) < std::abs(fb)) {
            std::swap(a, b);
            std::swap(fa, fb);
        }
    }

    KUMQUAT_TRACE_CONVERGENCE_FAILED(MODULE_ROOT_FINDING, config.max_iter, std::abs(fb));
    return RootFindingResult{
        .converged = false,
        .iterations = config.max_iter,
        .final_error = std::abs(fb),
        .failure_reason = "Maximum iterations reached without convergence",
        .root = b
    };
}

/// Find root using bounded Newton-Raphson
///
/// Quadratic convergence near the root when the derivative is cheap.
/// The iterate is clamped to [x_min, x_max] after every step.
///
/// **Example:**
/// ```cpp
/// auto f = [](double x) { return x*x - 2.0; };
/// auto df = [](double x) { return 2.0*x; };
/// auto result = newton_find_root(f, df, 1.0, 0.0, 10.0, config);
/// // result.root.value() ≈ 1.414213...
/// ```
template<ObjectiveFunction F, DerivativeFunction DF>
RootFindingResult newton_find_root(F&& f, DF&& df,
                                   double x0,
                                   double x_min, double x_max,
                                   const RootFindingConfig& config) {
    if (x_min >= x_max) {
        return RootFindingResult{
            .converged = false,
            .iterations = 0,
            .final_error = std::numeric_limits<double>::quiet_NaN(),
            .failure_reason = "Invalid bounds: x_min must be < x_max",
            .root = std::nullopt
        };
    }

    double x = std::clamp(x0, x_min, x_max);

    for (size_t iter = 0; iter < config.max_iter; ++iter) {
        const double fx = f(x);
        const double dfx = df(x);

        KUMQUAT_TRACE_CONVERGENCE_ITER(MODULE_ROOT_FINDING, iter, x, fx);

        if (!std::isfinite(fx) || !std::isfinite(dfx)) {
            return RootFindingResult{
                .converged = false,
                .iterations = iter + 1,
                .final_error = std::numeric_limits<double>::quiet_NaN(),
                .failure_reason = "Function or derivative returned non-finite value",
                .root = x
            };
        }

        const double error_abs = std::abs(fx);
        if (error_abs < config.tolerance) {
            return RootFindingResult{
                .converged = true,
                .iterations = iter + 1,
                .final_error = error_abs,
                .failure_reason = std::nullopt,
                .root = x
            };
        }

        if (std::abs(dfx) < config.min_derivative) {
            return RootFindingResult{
                .converged = false,
                .iterations = iter + 1,
                .final_error = error_abs,
                .failure_reason = "Derivative too small (flat region)",
                .root = x
            };
        }

        const double x_new = x - fx / dfx;
        const double x_clamped = std::clamp(x_new, x_min, x_max);

        if ((x_new < x_min || x_new > x_max) && iter > 10) {
            return RootFindingResult{
                .converged = false,
                .iterations = iter + 1,
                .final_error = error_abs,
                .failure_reason = "Hit bounds without convergence",
                .root = x_clamped
            };
        }

        x = x_clamped;
    }

    const double fx_final = f(x);
    KUMQUAT_TRACE_CONVERGENCE_FAILED(MODULE_ROOT_FINDING, config.max_iter, std::abs(fx_final));
    return RootFindingResult{
        .converged = false,
        .iterations = config.max_iter,
        .final_error = std::abs(fx_final),
        .failure_reason = "Maximum iterations reached without convergence",
        .root = x
    };
}

}  // namespace kumquat
