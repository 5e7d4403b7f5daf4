// SPDX-License-Identifier: MIT
/**
 * @file bsm_bindings.cpp
 * @brief Python bindings for the Black-Scholes pricing engine using pybind11
 *
 * Lets a Python dashboard (sliders, heat-map rendering) call the C++ core.
 * Failed validations surface as ValueError.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <expected>
#include <sstream>
#include <string>
#include <utility>
#include <vector>
#include "src/option/option_spec.hpp"
#include "src/option/european_option.hpp"
#include "src/option/sensitivity_sweep.hpp"

namespace py = pybind11;

namespace {

// Unwrap an expected or raise ValueError
template <typename T>
T value_or_raise(std::expected<T, bsm::ValidationError> result) {
    if (!result.has_value()) {
        throw py::value_error(bsm::describe(result.error()));
    }
    return std::move(result).value();
}

// Row-major vector to list of rows for plotting libraries
py::list to_rows(const std::vector<double>& values, size_t n_rows, size_t n_cols) {
    py::list rows;
    for (size_t i = 0; i < n_rows; ++i) {
        py::list row;
        for (size_t j = 0; j < n_cols; ++j) {
            row.append(values[i * n_cols + j]);
        }
        rows.append(row);
    }
    return rows;
}

}  // namespace

PYBIND11_MODULE(bsm_option, m) {
    m.doc() = "Python bindings for the bsm-option Black-Scholes pricing engine";

    py::enum_<bsm::OptionType>(m, "OptionType")
        .value("CALL", bsm::OptionType::CALL)
        .value("PUT", bsm::OptionType::PUT);

    py::enum_<bsm::Greek>(m, "Greek")
        .value("DELTA", bsm::Greek::Delta)
        .value("GAMMA", bsm::Greek::Gamma)
        .value("VEGA", bsm::Greek::Vega)
        .value("THETA", bsm::Greek::Theta)
        .value("RHO", bsm::Greek::Rho);

    py::class_<bsm::MarketSnapshot>(m, "MarketSnapshot")
        .def(py::init<>())
        .def(py::init([](double spot, double strike, double maturity, double rate, double volatility) {
                 return bsm::MarketSnapshot{.spot = spot, .strike = strike, .maturity = maturity,
                                            .rate = rate, .volatility = volatility};
             }),
             py::arg("spot"), py::arg("strike"), py::arg("maturity"),
             py::arg("rate"), py::arg("volatility"))
        .def_readwrite("spot", &bsm::MarketSnapshot::spot)
        .def_readwrite("strike", &bsm::MarketSnapshot::strike)
        .def_readwrite("maturity", &bsm::MarketSnapshot::maturity)
        .def_readwrite("rate", &bsm::MarketSnapshot::rate)
        .def_readwrite("volatility", &bsm::MarketSnapshot::volatility)
        .def("__repr__", [](const bsm::MarketSnapshot& s) {
            std::ostringstream os;
            os << "<MarketSnapshot spot=" << s.spot << " strike=" << s.strike
               << " maturity=" << s.maturity << " rate=" << s.rate
               << " volatility=" << s.volatility << ">";
            return os.str();
        });

    py::class_<bsm::Greeks>(m, "Greeks")
        .def_readonly("delta", &bsm::Greeks::delta)
        .def_readonly("gamma", &bsm::Greeks::gamma)
        .def_readonly("vega", &bsm::Greeks::vega)
        .def_readonly("theta", &bsm::Greeks::theta)
        .def_readonly("rho", &bsm::Greeks::rho);

    py::class_<bsm::EuropeanOptionPricer>(m, "EuropeanOptionPricer")
        .def(py::init([](const bsm::MarketSnapshot& snapshot) {
                 return value_or_raise(bsm::EuropeanOptionPricer::create(snapshot));
             }),
             py::arg("snapshot"),
             R"pbdoc(
                 Validate a market snapshot and precompute d1, d2.

                 Raises:
                     ValueError: if spot, strike or volatility <= 0, maturity < 0,
                                 or any input is not finite
             )pbdoc")
        .def("price", &bsm::EuropeanOptionPricer::price, py::arg("type"))
        .def("call_price", &bsm::EuropeanOptionPricer::call_price)
        .def("put_price", &bsm::EuropeanOptionPricer::put_price)
        .def("delta", &bsm::EuropeanOptionPricer::delta, py::arg("type"))
        .def("gamma", &bsm::EuropeanOptionPricer::gamma)
        .def("vega", &bsm::EuropeanOptionPricer::vega,
             "Price change per unit volatility (divide by 100 for per vol point)")
        .def("theta", &bsm::EuropeanOptionPricer::theta, py::arg("type"),
             "Time decay per calendar day")
        .def("rho", &bsm::EuropeanOptionPricer::rho, py::arg("type"),
             "Price change per unit rate (divide by 100 for per 1%)")
        .def("greek", &bsm::EuropeanOptionPricer::greek, py::arg("greek"), py::arg("type"))
        .def("greeks", &bsm::EuropeanOptionPricer::greeks, py::arg("type"))
        .def_property_readonly("d1", &bsm::EuropeanOptionPricer::d1)
        .def_property_readonly("d2", &bsm::EuropeanOptionPricer::d2)
        .def_property_readonly("expired", &bsm::EuropeanOptionPricer::expired)
        .def_property_readonly("snapshot", &bsm::EuropeanOptionPricer::snapshot);

    m.def(
        "calculate_option_price",
        [](double spot, double strike, double maturity, double rate, double volatility,
           const std::string& option_type) {
            auto type = value_or_raise(bsm::parse_option_type(option_type));
            bsm::MarketSnapshot snapshot{.spot = spot, .strike = strike, .maturity = maturity,
                                         .rate = rate, .volatility = volatility};
            return value_or_raise(bsm::bs_price(snapshot, type));
        },
        py::arg("spot"), py::arg("strike"), py::arg("maturity"), py::arg("rate"),
        py::arg("volatility"), py::arg("option_type") = "call",
        "Price a European option; option_type is 'call' or 'put'");

    py::class_<bsm::SweepAxis>(m, "SweepAxis")
        .def(py::init([](double min, double max, size_t n_points) {
                 return bsm::SweepAxis{.min = min, .max = max, .n_points = n_points};
             }),
             py::arg("min"), py::arg("max"), py::arg("n_points"))
        .def_readwrite("min", &bsm::SweepAxis::min)
        .def_readwrite("max", &bsm::SweepAxis::max)
        .def_readwrite("n_points", &bsm::SweepAxis::n_points)
        .def("points", &bsm::SweepAxis::points);

    py::class_<bsm::HeatmapConfig>(m, "HeatmapConfig")
        .def(py::init<>())
        .def_readwrite("spot_axis", &bsm::HeatmapConfig::spot_axis)
        .def_readwrite("vol_axis", &bsm::HeatmapConfig::vol_axis);

    py::class_<bsm::PayoffConfig>(m, "PayoffConfig")
        .def(py::init<>())
        .def_readwrite("spot_axis", &bsm::PayoffConfig::spot_axis);

    py::class_<bsm::PriceHeatmap>(m, "PriceHeatmap")
        .def_readonly("spots", &bsm::PriceHeatmap::spots)
        .def_readonly("vols", &bsm::PriceHeatmap::vols)
        .def_property_readonly("call_values", [](const bsm::PriceHeatmap& h) {
            return to_rows(h.call_values, h.n_rows(), h.n_cols());
        })
        .def_property_readonly("put_values", [](const bsm::PriceHeatmap& h) {
            return to_rows(h.put_values, h.n_rows(), h.n_cols());
        })
        .def("pnl", [](const bsm::PriceHeatmap& h, double call_purchase, double put_purchase) {
                return value_or_raise(h.pnl(call_purchase, put_purchase));
            },
            py::arg("call_purchase"), py::arg("put_purchase"));

    py::class_<bsm::PayoffCurve>(m, "PayoffCurve")
        .def_readonly("strike", &bsm::PayoffCurve::strike)
        .def_readonly("spots", &bsm::PayoffCurve::spots)
        .def_readonly("call_payoff", &bsm::PayoffCurve::call_payoff)
        .def_readonly("put_payoff", &bsm::PayoffCurve::put_payoff)
        .def("pnl", [](const bsm::PayoffCurve& c, double call_purchase, double put_purchase) {
                return value_or_raise(c.pnl(call_purchase, put_purchase));
            },
            py::arg("call_purchase"), py::arg("put_purchase"));

    m.def("default_heatmap_config", &bsm::default_heatmap_config, py::arg("base"));
    m.def("default_payoff_config", &bsm::default_payoff_config, py::arg("spot"));

    m.def(
        "compute_price_heatmap",
        [](const bsm::MarketSnapshot& base, const bsm::HeatmapConfig& config) {
            std::expected<bsm::PriceHeatmap, bsm::ValidationError> result =
                std::unexpected(bsm::ValidationError(bsm::ValidationErrorCode::InvalidGridSize));
            {
                py::gil_scoped_release release;
                result = bsm::compute_price_heatmap(base, config);
            }
            return value_or_raise(std::move(result));
        },
        py::arg("base"), py::arg("config"),
        "Call/put values over (volatility rows × spot columns), evaluated in parallel");

    m.def(
        "compute_payoff_curve",
        [](double strike, const bsm::PayoffConfig& config) {
            return value_or_raise(bsm::compute_payoff_curve(strike, config));
        },
        py::arg("strike"), py::arg("config"));
}
