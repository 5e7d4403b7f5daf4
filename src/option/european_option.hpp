// SPDX-License-Identifier: MIT
/**
 * @file european_option.hpp
 * @brief European option pricing with closed-form Black-Scholes formulas
 *
 * Provides EuropeanOptionPricer, a validated snapshot with its (d1, d2)
 * pair computed once at construction, and free convenience functions for
 * one-off queries.
 */

#pragma once

#include "src/option/option_spec.hpp"
#include "src/support/error_types.hpp"
#include <expected>

namespace bsm {

/// Theta is reported per calendar day: annualized theta / 365
inline constexpr double kDaysPerYear = 365.0;

/// Full set of sensitivities for one option type at one snapshot
struct Greeks {
    double delta = 0.0;
    double gamma = 0.0;
    double vega = 0.0;   ///< Per unit of volatility (not per vol point)
    double theta = 0.0;  ///< Per calendar day
    double rho = 0.0;    ///< Per unit of rate (not per 1%)
};

/**
 * @brief Black-Scholes pricer bound to one market snapshot
 *
 * Construction validates the snapshot and computes d1, d2 once; every price
 * and Greek query reuses them. At T = 0 (or when σ√T underflows to zero)
 * the intrinsic branch is used and d1/d2 are left at 0.
 *
 * Units:
 * - theta() is daily (annualized / 365)
 * - vega() and rho() are unscaled annualized sensitivities
 *
 * Thread-safety: immutable after construction; all methods are const.
 */
class EuropeanOptionPricer {
public:
    /// Validate the snapshot and precompute d1, d2
    static std::expected<EuropeanOptionPricer, ValidationError>
    create(const MarketSnapshot& snapshot) noexcept;

    /// Option value for the given type
    double price(OptionType type) const;

    double call_price() const;
    double put_price() const;

    /// Delta: ∂V/∂S
    double delta(OptionType type) const;

    /// Gamma: ∂²V/∂S² (call and put coincide)
    double gamma() const;

    /// Vega: ∂V/∂σ (call and put coincide)
    double vega() const;

    /// Theta: ∂V/∂t per calendar day
    double theta(OptionType type) const;

    /// Rho: ∂V/∂r
    double rho(OptionType type) const;

    /// Dispatch by name; Gamma and Vega ignore the type
    double greek(Greek greek, OptionType type) const;

    /// All five sensitivities for one type
    Greeks greeks(OptionType type) const;

    /// True when the intrinsic branch applies: T == 0, or σ√T too small to represent
    bool expired() const { return expired_; }

    /// Standardized normal arguments (0 when expired)
    double d1() const { return d1_; }
    double d2() const { return d2_; }

    const MarketSnapshot& snapshot() const { return snapshot_; }

private:
    explicit EuropeanOptionPricer(const MarketSnapshot& snapshot);

    MarketSnapshot snapshot_;
    bool expired_ = false;
    double sqrt_tau_ = 0.0;
    double discount_ = 1.0;  ///< e^(-rT)
    double d1_ = 0.0;
    double d2_ = 0.0;
};

/// One-off price; equivalent to create(snapshot)->price(type)
std::expected<double, ValidationError> bs_price(const MarketSnapshot& snapshot, OptionType type);

/// One-off Greek; equivalent to create(snapshot)->greek(greek, type)
std::expected<double, ValidationError>
bs_greek(const MarketSnapshot& snapshot, Greek greek, OptionType type);

}  // namespace bsm
