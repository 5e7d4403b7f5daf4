// SPDX-License-Identifier: MIT
/**
 * @file sensitivity_sweep.hpp
 * @brief Price × volatility heat maps and expiry payoff curves
 *
 * Grid sweeps over independent snapshots, evaluated in parallel. Each cell
 * is priced by EuropeanOptionPricer; nothing is cached across cells.
 *
 * **Heat map:**
 * ```cpp
 * MarketSnapshot base{.spot = 100, .strike = 100, .maturity = 1, .rate = 0.05, .volatility = 0.2};
 * auto heatmap = compute_price_heatmap(base, default_heatmap_config(base));
 * if (heatmap) {
 *     double c = heatmap->call_at(vol_idx, spot_idx);
 * }
 * ```
 *
 * **Payoff at expiry with P&L overlay:**
 * ```cpp
 * auto curve = compute_payoff_curve(100.0, default_payoff_config(100.0));
 * auto pnl = curve->pnl(10.0, 10.0);  // subtract purchase prices
 * ```
 */

#pragma once

#include "src/option/option_spec.hpp"
#include "src/support/error_types.hpp"
#include <cstddef>
#include <expected>
#include <vector>

namespace bsm {

/// Evenly spaced axis [min, max] with n_points samples (endpoints included)
struct SweepAxis {
    double min = 0.0;
    double max = 0.0;
    size_t n_points = 0;

    /// Sample points; a single-point axis yields {min}
    std::vector<double> points() const;
};

/// Rejects n_points == 0 and non-finite or inverted bounds
std::expected<void, ValidationError> validate_sweep_axis(const SweepAxis& axis);

/// Heat map configuration: rows follow volatility, columns follow spot
struct HeatmapConfig {
    SweepAxis spot_axis{.min = 70.0, .max = 130.0, .n_points = 20};
    SweepAxis vol_axis{.min = 0.05, .max = 0.50, .n_points = 20};
};

/// Dashboard defaults: σ ± 0.3 (floored at 0.05), 0.7·S to 1.3·S (floored at 1)
HeatmapConfig default_heatmap_config(const MarketSnapshot& base);

/// Payoff curve configuration
struct PayoffConfig {
    SweepAxis spot_axis{.min = 50.0, .max = 150.0, .n_points = 100};
};

/// Dashboard defaults: 100 points from 0.5·S to 1.5·S
PayoffConfig default_payoff_config(double spot);

/**
 * @brief Call and put values over a (volatility × spot) grid
 *
 * Values are stored row-major: row i is vols[i], column j is spots[j].
 */
struct PriceHeatmap {
    std::vector<double> spots;
    std::vector<double> vols;
    std::vector<double> call_values;
    std::vector<double> put_values;

    size_t n_rows() const { return vols.size(); }
    size_t n_cols() const { return spots.size(); }

    double call_at(size_t vol_idx, size_t spot_idx) const {
        return call_values[vol_idx * spots.size() + spot_idx];
    }
    double put_at(size_t vol_idx, size_t spot_idx) const {
        return put_values[vol_idx * spots.size() + spot_idx];
    }

    /// Copy with purchase prices subtracted from every cell
    std::expected<PriceHeatmap, ValidationError>
    pnl(double call_purchase, double put_purchase) const;
};

/// Intrinsic call/put values at expiry over a spot axis
struct PayoffCurve {
    double strike = 0.0;
    std::vector<double> spots;
    std::vector<double> call_payoff;
    std::vector<double> put_payoff;

    /// Copy with purchase prices subtracted from every point
    std::expected<PayoffCurve, ValidationError>
    pnl(double call_purchase, double put_purchase) const;
};

/**
 * @brief Price calls and puts over a (volatility × spot) grid
 *
 * Each cell uses the base strike, maturity and rate with the cell's spot
 * and volatility. The sweep either succeeds for every cell or fails with
 * the first rejected parameter; no partial grid is returned.
 *
 * @param base Snapshot supplying strike, maturity and rate
 * @param config Spot and volatility axes
 * @return Heat map, or ValidationError (index = flat cell index for cell failures)
 */
std::expected<PriceHeatmap, ValidationError>
compute_price_heatmap(const MarketSnapshot& base, const HeatmapConfig& config);

/**
 * @brief Expiry payoff curve max(0, S−K) / max(0, K−S) over a spot axis
 *
 * Evaluated through the pricing engine at T = 0.
 */
std::expected<PayoffCurve, ValidationError>
compute_payoff_curve(double strike, const PayoffConfig& config);

}  // namespace bsm
