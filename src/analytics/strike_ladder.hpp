// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <vector>

namespace kumquat {

/// Listed-strike spacing for an underlying price
///
/// 5 above 100, 2.5 above 50, otherwise 1.
double strike_step(double spot);

/// Strike nearest to spot on the strike_step grid
double atm_strike(double spot);

/// ATM +/- steps_each_side strikes in ascending order
///
/// Non-positive strikes are dropped, so low-priced underlyings get a
/// shorter lower half.
std::vector<double> strike_ladder(double spot, int steps_each_side = 10);

/// Exactly `count` ascending positive strikes centred on ATM
///
/// The first strike is ATM - (count / 2) * step, so an even count puts one
/// more strike below ATM than above it. When the lower end would reach zero
/// the window shifts upward.
std::vector<double> centered_strikes(double spot, size_t count);

}  // namespace kumquat
