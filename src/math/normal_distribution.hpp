// SPDX-License-Identifier: MIT
#pragma once

#include <cmath>

namespace kumquat {

/// |x| beyond which the CDF is reported as exactly 0 or 1
inline constexpr double kNormCdfSaturation = 8.0;

/// Standard normal PDF: φ(x) = exp(-x²/2) / sqrt(2π)
inline double norm_pdf(double x) {
    static constexpr double kInvSqrt2Pi = 0.3989422804014327;  // 1/sqrt(2π)
    return kInvSqrt2Pi * std::exp(-0.5 * x * x);
}

/// Standard normal CDF: Φ(x)
///
/// Uses erfc for numerical stability in the left tail (absolute error is at
/// double precision across [-8, 8]). Saturates to 0 or 1 outside that range.
inline double norm_cdf(double x) {
    if (x < -kNormCdfSaturation) return 0.0;
    if (x > kNormCdfSaturation) return 1.0;
    return 0.5 * std::erfc(-x * M_SQRT1_2);
}

}  // namespace kumquat
