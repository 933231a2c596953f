// SPDX-License-Identifier: MIT
#include "src/analytics/strike_ladder.hpp"
#include <cmath>

namespace kumquat {

double strike_step(double spot) {
    if (spot > 100.0) {
        return 5.0;
    }
    if (spot > 50.0) {
        return 2.5;
    }
    return 1.0;
}

double atm_strike(double spot) {
    const double step = strike_step(spot);
    return std::round(spot / step) * step;
}

std::vector<double> strike_ladder(double spot, int steps_each_side) {
    const double step = strike_step(spot);
    const double atm = atm_strike(spot);

    std::vector<double> strikes;
    strikes.reserve(static_cast<size_t>(2 * steps_each_side + 1));
    for (int i = -steps_each_side; i <= steps_each_side; ++i) {
        const double k = atm + i * step;
        if (k > 0.0) {
            strikes.push_back(k);
        }
    }
    return strikes;
}

std::vector<double> centered_strikes(double spot, size_t count) {
    std::vector<double> strikes;
    if (count == 0) {
        return strikes;
    }

    const double step = strike_step(spot);
    const double atm = atm_strike(spot);
    const long half = static_cast<long>(count / 2);

    // atm is a multiple of step, so the lowest positive grid strike is step
    double first = atm - static_cast<double>(half) * step;
    if (first <= 0.0) {
        first = step;
    }

    strikes.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        strikes.push_back(first + static_cast<double>(i) * step);
    }
    return strikes;
}

}  // namespace kumquat
