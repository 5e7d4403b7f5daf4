// SPDX-License-Identifier: MIT
#include "examples/dashboard_args.hpp"
#include <cmath>
#include <cstdlib>
#include <string_view>

namespace bsm::dashboard {

namespace {

std::optional<double> parse_number(const char* text) {
    char* end = nullptr;
    double value = std::strtod(text, &end);
    if (end == text || *end != '\0') {
        return std::nullopt;
    }
    return value;
}

// Integral count in [1, max]; NaN and infinities fail the range check
std::optional<size_t> to_count(double value, size_t max) {
    if (!(value >= 1.0 && value <= static_cast<double>(max)) || value != std::floor(value)) {
        return std::nullopt;
    }
    return static_cast<size_t>(value);
}

}  // namespace

std::expected<DashboardArgs, std::string> parse_dashboard_args(int argc, const char* const* argv) {
    DashboardArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string_view flag = argv[i];
        if (flag == "--help" || flag == "-h") {
            args.show_help = true;
            return args;
        }
        if (!flag.starts_with("--")) {
            return std::unexpected("Unexpected argument " + std::string(flag));
        }
        if (i + 1 >= argc) {
            return std::unexpected("Missing value for " + std::string(flag));
        }
        const char* text = argv[++i];
        auto value = parse_number(text);
        if (!value) {
            return std::unexpected("Not a number for " + std::string(flag) + ": " + text);
        }

        std::string_view name = flag.substr(2);
        if (name == "spot") args.snapshot.spot = *value;
        else if (name == "strike") args.snapshot.strike = *value;
        else if (name == "maturity") args.snapshot.maturity = *value;
        else if (name == "rate") args.snapshot.rate = *value;
        else if (name == "vol") args.snapshot.volatility = *value;
        else if (name == "call-cost") args.call_cost = *value;
        else if (name == "put-cost") args.put_cost = *value;
        else if (name == "spot-min") args.spot_min = *value;
        else if (name == "spot-max") args.spot_max = *value;
        else if (name == "vol-min") args.vol_min = *value;
        else if (name == "vol-max") args.vol_max = *value;
        else if (name == "grid") {
            args.grid = to_count(*value, kMaxGridPoints);
            if (!args.grid) {
                return std::unexpected("--grid must be an integer in [1, " +
                                       std::to_string(kMaxGridPoints) + "]: " + text);
            }
        } else if (name == "payoff-points") {
            args.payoff_points = to_count(*value, kMaxPayoffPoints);
            if (!args.payoff_points) {
                return std::unexpected("--payoff-points must be an integer in [1, " +
                                       std::to_string(kMaxPayoffPoints) + "]: " + text);
            }
        } else {
            return std::unexpected("Unknown option " + std::string(flag));
        }
    }
    return args;
}

}  // namespace bsm::dashboard
