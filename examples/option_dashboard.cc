// SPDX-License-Identifier: MIT
/// @file option_dashboard.cc
/// @brief Text rendition of the option pricing dashboard
///
/// Prints prices, Greeks, call/put heat maps over (spot × volatility) and
/// the payoff at expiry for one set of market parameters.
///
/// Usage:
///   option_dashboard [--spot 100] [--strike 100] [--maturity 1] [--rate 0.05]
///                    [--vol 0.2] [--call-cost X --put-cost Y]
///                    [--spot-min A --spot-max B] [--vol-min C --vol-max D]
///                    [--grid 20] [--payoff-points 100]

#include "examples/dashboard_args.hpp"
#include "src/option/european_option.hpp"
#include "src/option/sensitivity_sweep.hpp"
#include <iomanip>
#include <iostream>
#include <utility>

namespace {

using namespace bsm;

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " [--spot S] [--strike K] [--maturity T] [--rate r] [--vol sigma]\n"
              << "       [--call-cost X] [--put-cost Y]\n"
              << "       [--spot-min A] [--spot-max B] [--vol-min C] [--vol-max D]\n"
              << "       [--grid N] [--payoff-points M]\n";
}

int fail(const ValidationError& err) {
    std::cerr << "Error: " << describe(err) << "\n";
    return 1;
}

void print_matrix(const char* title, const PriceHeatmap& heatmap, bool call) {
    std::cout << "\n" << title << " (rows: volatility, columns: spot)\n";
    std::cout << std::setw(8) << "vol\\S";
    for (double s : heatmap.spots) {
        std::cout << std::setw(9) << s;
    }
    std::cout << "\n";
    for (size_t i = 0; i < heatmap.n_rows(); ++i) {
        std::cout << std::setw(8) << heatmap.vols[i];
        for (size_t j = 0; j < heatmap.n_cols(); ++j) {
            double v = call ? heatmap.call_at(i, j) : heatmap.put_at(i, j);
            std::cout << std::setw(9) << v;
        }
        std::cout << "\n";
    }
}

}  // namespace

int main(int argc, char** argv) {
    auto parsed = dashboard::parse_dashboard_args(argc, argv);
    if (!parsed) {
        std::cerr << "Error: " << parsed.error() << "\n";
        print_usage(argv[0]);
        return 1;
    }
    if (parsed->show_help) {
        print_usage(argv[0]);
        return 0;
    }
    const dashboard::DashboardArgs& args = *parsed;
    const bool pnl_mode = args.call_cost.has_value() || args.put_cost.has_value();
    const double call_cost = args.call_cost.value_or(0.0);
    const double put_cost = args.put_cost.value_or(0.0);

    if (auto limits = check_dashboard_limits(args.snapshot); !limits) {
        std::cerr << "Warning: " << describe(limits.error()) << "\n";
    }

    auto pricer = EuropeanOptionPricer::create(args.snapshot);
    if (!pricer) {
        return fail(pricer.error());
    }

    const auto& s = args.snapshot;
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "=== Black-Scholes Option Pricer ===\n"
              << "S=" << s.spot << " K=" << s.strike << " T=" << s.maturity
              << "y r=" << s.rate * 100.0 << "% sigma=" << s.volatility << "\n\n";

    double call = pricer->call_price();
    double put = pricer->put_price();
    std::cout << "Call price: $" << call;
    if (pnl_mode) std::cout << "  (P&L " << std::showpos << call - call_cost << std::noshowpos << ")";
    std::cout << "\nPut price:  $" << put;
    if (pnl_mode) std::cout << "  (P&L " << std::showpos << put - put_cost << std::noshowpos << ")";
    std::cout << "\n\n";

    auto gc = pricer->greeks(OptionType::CALL);
    auto gp = pricer->greeks(OptionType::PUT);
    std::cout << std::setprecision(4)
              << "Delta (call) " << gc.delta << "   Delta (put) " << gp.delta << "\n"
              << std::setprecision(6)
              << "Gamma        " << gc.gamma << "\n"
              << std::setprecision(2)
              << "Vega         " << gc.vega << "\n"
              << std::setprecision(4)
              << "Theta (call) " << gc.theta << "   Theta (put) " << gp.theta << "   per day\n"
              << std::setprecision(2)
              << "Rho (call)   " << gc.rho << "   Rho (put)   " << gp.rho << "\n";

    HeatmapConfig hm_config = default_heatmap_config(s);
    if (args.spot_min) hm_config.spot_axis.min = *args.spot_min;
    if (args.spot_max) hm_config.spot_axis.max = *args.spot_max;
    if (args.vol_min) hm_config.vol_axis.min = *args.vol_min;
    if (args.vol_max) hm_config.vol_axis.max = *args.vol_max;
    if (args.grid) {
        hm_config.spot_axis.n_points = *args.grid;
        hm_config.vol_axis.n_points = *args.grid;
    }

    auto heatmap = compute_price_heatmap(s, hm_config);
    if (!heatmap) {
        return fail(heatmap.error());
    }
    if (pnl_mode) {
        auto pnl = heatmap->pnl(call_cost, put_cost);
        if (!pnl) {
            return fail(pnl.error());
        }
        print_matrix("Call P&L", *pnl, true);
        print_matrix("Put P&L", *pnl, false);
    } else {
        print_matrix("Call values", *heatmap, true);
        print_matrix("Put values", *heatmap, false);
    }

    PayoffConfig payoff_config = default_payoff_config(s.spot);
    if (args.payoff_points) {
        payoff_config.spot_axis.n_points = *args.payoff_points;
    }
    auto payoff = compute_payoff_curve(s.strike, payoff_config);
    if (!payoff) {
        return fail(payoff.error());
    }
    if (pnl_mode) {
        auto pnl = payoff->pnl(call_cost, put_cost);
        if (!pnl) {
            return fail(pnl.error());
        }
        payoff = std::move(pnl);
    }

    std::cout << "\n" << (pnl_mode ? "P&L" : "Payoff") << " at expiration (strike "
              << s.strike << ")\n";
    std::cout << std::setw(10) << "S_T" << std::setw(10) << "call" << std::setw(10) << "put" << "\n";
    for (size_t j = 0; j < payoff->spots.size(); ++j) {
        std::cout << std::setw(10) << payoff->spots[j]
                  << std::setw(10) << payoff->call_payoff[j]
                  << std::setw(10) << payoff->put_payoff[j] << "\n";
    }
    return 0;
}
