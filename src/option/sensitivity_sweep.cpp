// SPDX-License-Identifier: MIT
#include "src/option/sensitivity_sweep.hpp"
#include "src/option/european_option.hpp"
#include "src/support/bsm_trace.h"
#include "src/support/parallel.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>

namespace bsm {

namespace {

// Placeholder volatility for expiry evaluation; unused by the T = 0 branch
constexpr double kExpiryVolatility = 1.0;

std::unexpected<ValidationError> reject(ValidationErrorCode code, double value) {
    BSM_TRACE_VALIDATION_ERROR(BSM_MODULE_VALIDATION, static_cast<int>(code), value, 0);
    return std::unexpected(ValidationError(code, value));
}

std::expected<void, ValidationError> validate_purchase_price(double price) {
    if (price < 0.0 || !std::isfinite(price)) {
        return reject(ValidationErrorCode::InvalidPurchasePrice, price);
    }
    return {};
}

void subtract(std::vector<double>& values, double amount) {
    BSM_PRAGMA_SIMD
    for (size_t i = 0; i < values.size(); ++i) {
        values[i] -= amount;
    }
}

}  // namespace

// ===========================================================================
// Axes and configuration
// ===========================================================================

std::vector<double> SweepAxis::points() const {
    std::vector<double> v(n_points);
    if (n_points == 1) {
        v[0] = min;
        return v;
    }
    for (size_t i = 0; i < n_points; ++i) {
        v[i] = min + (max - min) * static_cast<double>(i) / static_cast<double>(n_points - 1);
    }
    // Pin the endpoint so max is reproduced exactly
    v.back() = max;
    return v;
}

std::expected<void, ValidationError> validate_sweep_axis(const SweepAxis& axis) {
    if (axis.n_points == 0) {
        return reject(ValidationErrorCode::InvalidGridSize, 0.0);
    }
    if (!std::isfinite(axis.min)) {
        return reject(ValidationErrorCode::InvalidBounds, axis.min);
    }
    if (!std::isfinite(axis.max) || axis.min > axis.max) {
        return reject(ValidationErrorCode::InvalidBounds, axis.max);
    }
    return {};
}

HeatmapConfig default_heatmap_config(const MarketSnapshot& base) {
    HeatmapConfig config;
    config.vol_axis = SweepAxis{
        .min = std::max(0.05, base.volatility - 0.3),
        .max = base.volatility + 0.3,
        .n_points = 20};
    config.spot_axis = SweepAxis{
        .min = std::max(1.0, base.spot * 0.7),
        .max = base.spot * 1.3,
        .n_points = 20};
    return config;
}

PayoffConfig default_payoff_config(double spot) {
    return PayoffConfig{
        .spot_axis = SweepAxis{.min = spot * 0.5, .max = spot * 1.5, .n_points = 100}};
}

// ===========================================================================
// Heat map
// ===========================================================================

std::expected<PriceHeatmap, ValidationError>
compute_price_heatmap(const MarketSnapshot& base, const HeatmapConfig& config) {
    if (auto ok = validate_sweep_axis(config.spot_axis); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = validate_sweep_axis(config.vol_axis); !ok) {
        return std::unexpected(ok.error());
    }

    PriceHeatmap heatmap;
    heatmap.spots = config.spot_axis.points();
    heatmap.vols = config.vol_axis.points();

    const size_t n_rows = heatmap.vols.size();
    const size_t n_cols = heatmap.spots.size();
    heatmap.call_values.assign(n_rows * n_cols, 0.0);
    heatmap.put_values.assign(n_rows * n_cols, 0.0);

    BSM_TRACE_SWEEP_START(BSM_MODULE_HEATMAP, n_rows, n_cols);

    size_t failed_count = 0;
    size_t first_failed = std::numeric_limits<size_t>::max();
    std::optional<ValidationError> first_error;

    BSM_PRAGMA_PARALLEL
    {
        BSM_PRAGMA_FOR_COLLAPSE2
        for (size_t i = 0; i < n_rows; ++i) {
            for (size_t j = 0; j < n_cols; ++j) {
                const size_t idx = i * n_cols + j;

                MarketSnapshot cell = base;
                cell.spot = heatmap.spots[j];
                cell.volatility = heatmap.vols[i];

                auto pricer = EuropeanOptionPricer::create(cell);
                if (!pricer.has_value()) {
                    BSM_PRAGMA_ATOMIC
                    ++failed_count;

                    BSM_PRAGMA_CRITICAL
                    {
                        if (idx < first_failed) {
                            first_failed = idx;
                            first_error = pricer.error();
                        }
                    }
                    continue;
                }

                heatmap.call_values[idx] = pricer->call_price();
                heatmap.put_values[idx] = pricer->put_price();
            }
        }
    }

    BSM_TRACE_SWEEP_COMPLETE(BSM_MODULE_HEATMAP, n_rows * n_cols, failed_count);

    if (failed_count > 0) {
        ValidationError err = *first_error;
        err.index = first_failed;
        return std::unexpected(err);
    }
    return heatmap;
}

std::expected<PriceHeatmap, ValidationError>
PriceHeatmap::pnl(double call_purchase, double put_purchase) const {
    if (auto ok = validate_purchase_price(call_purchase); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = validate_purchase_price(put_purchase); !ok) {
        return std::unexpected(ok.error());
    }

    PriceHeatmap out = *this;
    subtract(out.call_values, call_purchase);
    subtract(out.put_values, put_purchase);
    return out;
}

// ===========================================================================
// Payoff curve
// ===========================================================================

std::expected<PayoffCurve, ValidationError>
compute_payoff_curve(double strike, const PayoffConfig& config) {
    if (auto ok = validate_sweep_axis(config.spot_axis); !ok) {
        return std::unexpected(ok.error());
    }

    PayoffCurve curve;
    curve.strike = strike;
    curve.spots = config.spot_axis.points();
    curve.call_payoff.reserve(curve.spots.size());
    curve.put_payoff.reserve(curve.spots.size());

    BSM_TRACE_SWEEP_START(BSM_MODULE_PAYOFF, 1, curve.spots.size());

    for (size_t j = 0; j < curve.spots.size(); ++j) {
        MarketSnapshot at_expiry{
            .spot = curve.spots[j],
            .strike = strike,
            .maturity = 0.0,
            .rate = 0.0,
            .volatility = kExpiryVolatility};

        auto pricer = EuropeanOptionPricer::create(at_expiry);
        if (!pricer.has_value()) {
            BSM_TRACE_SWEEP_COMPLETE(BSM_MODULE_PAYOFF, j, 1);
            ValidationError err = pricer.error();
            err.index = j;
            return std::unexpected(err);
        }
        curve.call_payoff.push_back(pricer->call_price());
        curve.put_payoff.push_back(pricer->put_price());
    }

    BSM_TRACE_SWEEP_COMPLETE(BSM_MODULE_PAYOFF, curve.spots.size(), 0);
    return curve;
}

std::expected<PayoffCurve, ValidationError>
PayoffCurve::pnl(double call_purchase, double put_purchase) const {
    if (auto ok = validate_purchase_price(call_purchase); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = validate_purchase_price(put_purchase); !ok) {
        return std::unexpected(ok.error());
    }

    PayoffCurve out = *this;
    subtract(out.call_payoff, call_purchase);
    subtract(out.put_payoff, put_purchase);
    return out;
}

}  // namespace bsm
