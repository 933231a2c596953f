// SPDX-License-Identifier: MIT
/**
 * @file greeks.hpp
 * @brief First-order option sensitivities in trading-desk units
 */

#pragma once

namespace kumquat {

/// Option Greeks
///
/// Units:
/// - delta: price change per $1 move in the underlying
/// - gamma: delta change per $1 move in the underlying
/// - theta: price change per calendar day
/// - vega:  price change per 1 volatility point (1%)
/// - rho:   price change per 1 rate point (1%)
struct Greeks {
    double delta = 0.0;
    double gamma = 0.0;
    double theta = 0.0;
    double vega = 0.0;
    double rho = 0.0;

    Greeks& operator+=(const Greeks& other) {
        delta += other.delta;
        gamma += other.gamma;
        theta += other.theta;
        vega += other.vega;
        rho += other.rho;
        return *this;
    }
};

inline Greeks operator+(Greeks lhs, const Greeks& rhs) {
    lhs += rhs;
    return lhs;
}

/// Scale by a signed position size (negative for short legs)
inline Greeks operator*(const Greeks& g, double quantity) {
    return Greeks{
        .delta = g.delta * quantity,
        .gamma = g.gamma * quantity,
        .theta = g.theta * quantity,
        .vega = g.vega * quantity,
        .rho = g.rho * quantity
    };
}

}  // namespace kumquat
