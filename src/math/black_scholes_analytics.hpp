// SPDX-License-Identifier: MIT
#pragma once

#include <cmath>

#include "src/math/normal_distribution.hpp"
#include "src/option/option_spec.hpp"

namespace kumquat {

/// Black-Scholes d1 term
/// d1 = [ln(S/K) + (r + σ²/2)τ] / (σ√τ)
inline double bs_d1(double spot, double strike, double tau, double sigma, double rate) {
    double sigma_sqrt_tau = sigma * std::sqrt(tau);
    return (std::log(spot / strike) + (rate + 0.5 * sigma * sigma) * tau) / sigma_sqrt_tau;
}

/// Black-Scholes d2 = d1 - σ√τ
inline double bs_d2(double d1, double tau, double sigma) {
    return d1 - sigma * std::sqrt(tau);
}

/// True when no time value remains (expiry reached or zero volatility)
inline bool bs_degenerate(double tau, double sigma) {
    return tau <= 0.0 || sigma <= 0.0;
}

/// Black-Scholes Vega: ∂V/∂σ = S · √τ · φ(d1), per unit volatility
/// Same for puts and calls
inline double bs_vega(double spot, double strike, double tau, double sigma, double rate) {
    if (bs_degenerate(tau, sigma)) {
        return 0.0;
    }
    double d1 = bs_d1(spot, strike, tau, sigma, rate);
    return spot * std::sqrt(tau) * norm_pdf(d1);
}

/// Black-Scholes European option price (unchecked)
///
/// @param option_type PUT or CALL
/// @param spot Current underlying price (> 0)
/// @param strike Strike price (> 0)
/// @param tau Time to expiry in years
/// @param rate Risk-free rate
/// @param sigma Volatility
/// @return Option price; intrinsic value when tau <= 0 or sigma <= 0
inline double bs_price(OptionType option_type, double spot, double strike,
                       double tau, double rate, double sigma) {
    if (bs_degenerate(tau, sigma)) {
        return intrinsic_value(spot, strike, option_type);
    }

    double d1 = bs_d1(spot, strike, tau, sigma, rate);
    double d2 = bs_d2(d1, tau, sigma);
    double exp_rt = std::exp(-rate * tau);

    if (option_type == OptionType::PUT) {
        return strike * exp_rt * norm_cdf(-d2) - spot * norm_cdf(-d1);
    } else {
        return spot * norm_cdf(d1) - strike * exp_rt * norm_cdf(d2);
    }
}

}  // namespace kumquat
