// SPDX-License-Identifier: MIT
/**
 * @file dashboard_args.hpp
 * @brief Command-line flags for the text option dashboard
 */

#pragma once

#include "src/option/option_spec.hpp"
#include <cstddef>
#include <expected>
#include <optional>
#include <string>

namespace bsm::dashboard {

/// Largest accepted points per heat map axis (the grid holds points² cells)
inline constexpr size_t kMaxGridPoints = 2000;

/// Largest accepted payoff curve length
inline constexpr size_t kMaxPayoffPoints = 100000;

struct DashboardArgs {
    MarketSnapshot snapshot{.spot = 100.0, .strike = 100.0, .maturity = 1.0,
                            .rate = 0.05, .volatility = 0.20};
    std::optional<double> call_cost;
    std::optional<double> put_cost;
    std::optional<double> spot_min, spot_max, vol_min, vol_max;
    std::optional<size_t> grid;           ///< Unset keeps the heat map default
    std::optional<size_t> payoff_points;  ///< Unset keeps the payoff curve default
    bool show_help = false;
};

/**
 * @brief Parse `--name value` flags
 *
 * Market parameters are taken as given; the pricer validates them. Grid
 * sizes must be integers in [1, kMaxGridPoints] and [1, kMaxPayoffPoints].
 *
 * @return Parsed arguments, or an error message for stderr
 */
std::expected<DashboardArgs, std::string> parse_dashboard_args(int argc, const char* const* argv);

}  // namespace bsm::dashboard
