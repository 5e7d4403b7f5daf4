// SPDX-License-Identifier: MIT
#pragma once

#include <cmath>

namespace bsm {

/// Standard normal PDF: φ(x) = exp(-x²/2) / sqrt(2π)
inline double norm_pdf(double x) {
    static constexpr double kInvSqrt2Pi = 0.3989422804014327;  // 1/sqrt(2π)
    return kInvSqrt2Pi * std::exp(-0.5 * x * x);
}

/// Standard normal CDF: Φ(x) = erfc(-x/√2) / 2
///
/// erfc keeps full relative precision in the far left tail where
/// 0.5 * (1 + erf(x/√2)) would cancel to zero.
inline double norm_cdf(double x) {
    return 0.5 * std::erfc(-x * M_SQRT1_2);
}

}  // namespace bsm
