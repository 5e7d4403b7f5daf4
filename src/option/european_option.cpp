// SPDX-License-Identifier: MIT
#include "src/option/european_option.hpp"
#include "src/math/normal_distribution.hpp"
#include "src/support/bsm_trace.h"
#include <algorithm>
#include <cmath>

namespace bsm {

// ===========================================================================
// EuropeanOptionPricer
// ===========================================================================

EuropeanOptionPricer::EuropeanOptionPricer(const MarketSnapshot& snapshot)
    : snapshot_(snapshot)
    , expired_(snapshot.maturity <= 0.0)
{
    if (expired_) {
        return;
    }

    double tau = snapshot_.maturity;
    double sigma = snapshot_.volatility;
    double r = snapshot_.rate;

    sqrt_tau_ = std::sqrt(tau);
    discount_ = std::exp(-r * tau);

    // d1 = [ln(S/K) + (r + σ²/2)τ] / (σ√τ),  d2 = d1 - σ√τ
    double sigma_sqrt_tau = sigma * sqrt_tau_;
    double d1 = (std::log(snapshot_.spot / snapshot_.strike) + (r + 0.5 * sigma * sigma) * tau) /
                sigma_sqrt_tau;

    // σ√τ underflowed: no time value left, use the intrinsic branch
    if (sigma_sqrt_tau == 0.0 || !std::isfinite(d1)) {
        expired_ = true;
        return;
    }

    d1_ = d1;
    d2_ = d1_ - sigma_sqrt_tau;
}

std::expected<EuropeanOptionPricer, ValidationError>
EuropeanOptionPricer::create(const MarketSnapshot& snapshot) noexcept {
    auto validation = validate_market_snapshot(snapshot);
    if (!validation.has_value()) {
        return std::unexpected(validation.error());
    }
    BSM_TRACE_PRICER_CREATE(snapshot.spot, snapshot.strike, snapshot.maturity, snapshot.volatility);
    return EuropeanOptionPricer(snapshot);
}

double EuropeanOptionPricer::call_price() const {
    double S = snapshot_.spot;
    double K = snapshot_.strike;

    if (expired_) {
        return std::max(S - K, 0.0);
    }
    return S * norm_cdf(d1_) - K * discount_ * norm_cdf(d2_);
}

double EuropeanOptionPricer::put_price() const {
    double S = snapshot_.spot;
    double K = snapshot_.strike;

    if (expired_) {
        return std::max(K - S, 0.0);
    }
    return K * discount_ * norm_cdf(-d2_) - S * norm_cdf(-d1_);
}

double EuropeanOptionPricer::price(OptionType type) const {
    return type == OptionType::PUT ? put_price() : call_price();
}

double EuropeanOptionPricer::delta(OptionType type) const {
    double S = snapshot_.spot;
    double K = snapshot_.strike;

    if (expired_) {
        // Step function at expiry; at-the-money is 0 for both types
        if (type == OptionType::PUT) {
            return (S < K) ? -1.0 : 0.0;
        }
        return (S > K) ? 1.0 : 0.0;
    }

    double call_delta = norm_cdf(d1_);
    return type == OptionType::PUT ? call_delta - 1.0 : call_delta;
}

double EuropeanOptionPricer::gamma() const {
    if (expired_) {
        return 0.0;
    }
    return norm_pdf(d1_) / (snapshot_.spot * snapshot_.volatility * sqrt_tau_);
}

double EuropeanOptionPricer::vega() const {
    if (expired_) {
        return 0.0;
    }
    return snapshot_.spot * norm_pdf(d1_) * sqrt_tau_;
}

double EuropeanOptionPricer::theta(OptionType type) const {
    if (expired_) {
        return 0.0;
    }

    double S = snapshot_.spot;
    double K = snapshot_.strike;
    double r = snapshot_.rate;
    double sigma = snapshot_.volatility;

    // Common term: -S·φ(d1)·σ/(2√τ)
    double common = -S * norm_pdf(d1_) * sigma / (2.0 * sqrt_tau_);

    double annual;
    if (type == OptionType::PUT) {
        annual = common + r * K * discount_ * norm_cdf(-d2_);
    } else {
        annual = common - r * K * discount_ * norm_cdf(d2_);
    }
    return annual / kDaysPerYear;
}

double EuropeanOptionPricer::rho(OptionType type) const {
    if (expired_) {
        return 0.0;
    }

    double K = snapshot_.strike;
    double tau = snapshot_.maturity;

    if (type == OptionType::PUT) {
        return -K * tau * discount_ * norm_cdf(-d2_);
    }
    return K * tau * discount_ * norm_cdf(d2_);
}

double EuropeanOptionPricer::greek(Greek greek, OptionType type) const {
    switch (greek) {
        case Greek::Delta: return delta(type);
        case Greek::Gamma: return gamma();
        case Greek::Vega:  return vega();
        case Greek::Theta: return theta(type);
        case Greek::Rho:   return rho(type);
    }
    return 0.0;
}

Greeks EuropeanOptionPricer::greeks(OptionType type) const {
    return Greeks{
        .delta = delta(type),
        .gamma = gamma(),
        .vega = vega(),
        .theta = theta(type),
        .rho = rho(type),
    };
}

// ===========================================================================
// Convenience functions
// ===========================================================================

std::expected<double, ValidationError> bs_price(const MarketSnapshot& snapshot, OptionType type) {
    auto pricer = EuropeanOptionPricer::create(snapshot);
    if (!pricer.has_value()) {
        return std::unexpected(pricer.error());
    }
    return pricer->price(type);
}

std::expected<double, ValidationError>
bs_greek(const MarketSnapshot& snapshot, Greek greek, OptionType type) {
    auto pricer = EuropeanOptionPricer::create(snapshot);
    if (!pricer.has_value()) {
        return std::unexpected(pricer.error());
    }
    return pricer->greek(greek, type);
}

}  // namespace bsm
