// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "src/option/european_option.hpp"
#include <cmath>
#include <vector>

using namespace bsm;

// Test fixture for European option tests
class EuropeanOptionTest : public ::testing::Test {
protected:
    static constexpr double tolerance = 1e-8;

    static MarketSnapshot snapshot(double S, double K, double T, double r, double sigma) {
        return MarketSnapshot{.spot = S, .strike = K, .maturity = T, .rate = r, .volatility = sigma};
    }

    static EuropeanOptionPricer pricer(double S, double K, double T, double r, double sigma) {
        auto result = EuropeanOptionPricer::create(snapshot(S, K, T, r, sigma));
        EXPECT_TRUE(result.has_value());
        return result.value();
    }
};

// ============================================================================
// Reference values
// ============================================================================

TEST_F(EuropeanOptionTest, ATMReferenceValues) {
    auto p = pricer(100.0, 100.0, 1.0, 0.05, 0.20);

    EXPECT_NEAR(p.call_price(), 10.4506, 1e-4);
    EXPECT_NEAR(p.put_price(), 5.5735, 1e-4);
    EXPECT_NEAR(p.delta(OptionType::CALL), 0.6368, 1e-4);
    EXPECT_NEAR(p.delta(OptionType::PUT), -0.3632, 1e-4);
    EXPECT_NEAR(p.gamma(), 0.0188, 1e-4);
    EXPECT_NEAR(p.vega(), 37.52, 1e-2);
    EXPECT_NEAR(p.theta(OptionType::CALL), -0.01758, 1e-5);
    EXPECT_NEAR(p.theta(OptionType::PUT), -0.00454, 1e-5);
    EXPECT_NEAR(p.rho(OptionType::CALL), 53.23, 1e-2);
    EXPECT_NEAR(p.rho(OptionType::PUT), -41.89, 1e-2);
}

TEST_F(EuropeanOptionTest, D1D2ComputedOnce) {
    auto p = pricer(100.0, 100.0, 1.0, 0.05, 0.20);
    // d1 = (0 + (0.05 + 0.02)) / 0.2 = 0.35, d2 = 0.15
    EXPECT_NEAR(p.d1(), 0.35, 1e-14);
    EXPECT_NEAR(p.d2(), 0.15, 1e-14);
    EXPECT_FALSE(p.expired());
}

TEST_F(EuropeanOptionTest, OTMCallReferenceValues) {
    // S=50, K=60, T=0.5, r=0.03, σ=0.30 evaluated in double precision
    auto p = pricer(50.0, 60.0, 0.5, 0.03, 0.30);
    EXPECT_NEAR(p.call_price(), 1.409253, 1e-3);
    EXPECT_NEAR(p.put_price(), 10.515970, 1e-3);
    EXPECT_NEAR(p.delta(OptionType::CALL), 0.2474, 1e-4);
    EXPECT_NEAR(p.vega(), 11.1727, 1e-3);
}

TEST_F(EuropeanOptionTest, ITMCallReferenceValues) {
    auto p = pricer(110.0, 100.0, 1.0, 0.05, 0.20);
    EXPECT_NEAR(p.call_price(), 17.662954, 1e-5);
    EXPECT_NEAR(p.put_price(), 2.785896, 1e-5);
    EXPECT_GT(p.call_price(), 110.0 - 100.0);
}

TEST_F(EuropeanOptionTest, NegativeRate) {
    auto p = pricer(100.0, 100.0, 0.5, -0.01, 0.25);
    EXPECT_NEAR(p.call_price(), 6.813041, 1e-5);
    EXPECT_NEAR(p.put_price(), 7.314293, 1e-5);
    EXPECT_NEAR(p.theta(OptionType::PUT), -0.020791, 1e-6);
}

// ============================================================================
// Put-call parity
// ============================================================================

TEST_F(EuropeanOptionTest, PutCallParityAcrossInputs) {
    const std::vector<double> spots = {1.0, 45.0, 100.0, 180.0, 5000.0};
    const std::vector<double> strikes = {50.0, 100.0, 150.0};
    const std::vector<double> maturities = {0.01, 0.25, 1.0, 10.0};
    const std::vector<double> rates = {0.0, 0.05, 0.20};
    const std::vector<double> vols = {0.01, 0.2, 2.0};

    for (double S : spots)
        for (double K : strikes)
            for (double T : maturities)
                for (double r : rates)
                    for (double sigma : vols) {
                        auto p = pricer(S, K, T, r, sigma);
                        double lhs = p.call_price() - p.put_price();
                        double rhs = S - K * std::exp(-r * T);
                        // Absolute tolerance scaled by the price level
                        EXPECT_NEAR(lhs, rhs, tolerance * std::max(1.0, std::max(S, K)))
                            << "S=" << S << " K=" << K << " T=" << T
                            << " r=" << r << " sigma=" << sigma;
                    }
}

// ============================================================================
// Expiry branch
// ============================================================================

TEST_F(EuropeanOptionTest, ZeroMaturityITMCall) {
    auto p = pricer(110.0, 100.0, 0.0, 0.05, 0.20);
    EXPECT_TRUE(p.expired());
    EXPECT_EQ(p.call_price(), 10.0);
    EXPECT_EQ(p.put_price(), 0.0);

    EXPECT_EQ(p.delta(OptionType::CALL), 1.0);
    EXPECT_EQ(p.delta(OptionType::PUT), 0.0);
    EXPECT_EQ(p.gamma(), 0.0);
    EXPECT_EQ(p.vega(), 0.0);
    EXPECT_EQ(p.theta(OptionType::CALL), 0.0);
    EXPECT_EQ(p.theta(OptionType::PUT), 0.0);
    EXPECT_EQ(p.rho(OptionType::CALL), 0.0);
    EXPECT_EQ(p.rho(OptionType::PUT), 0.0);
}

TEST_F(EuropeanOptionTest, ZeroMaturityITMPut) {
    auto p = pricer(90.0, 100.0, 0.0, 0.05, 0.20);
    EXPECT_EQ(p.call_price(), 0.0);
    EXPECT_EQ(p.put_price(), 10.0);
    EXPECT_EQ(p.delta(OptionType::CALL), 0.0);
    EXPECT_EQ(p.delta(OptionType::PUT), -1.0);
}

TEST_F(EuropeanOptionTest, ZeroMaturityAtTheMoneyDeltasAreZero) {
    auto p = pricer(100.0, 100.0, 0.0, 0.05, 0.20);
    EXPECT_EQ(p.call_price(), 0.0);
    EXPECT_EQ(p.put_price(), 0.0);
    EXPECT_EQ(p.delta(OptionType::CALL), 0.0);
    EXPECT_EQ(p.delta(OptionType::PUT), 0.0);
}

TEST_F(EuropeanOptionTest, UnderflowingSigmaSqrtTauUsesIntrinsicBranch) {
    // σ√T = 1e-200 · 1e-150 underflows to zero; at the money d1 would be 0/0
    auto p = pricer(100.0, 100.0, 1e-300, 0.0, 1e-200);
    EXPECT_TRUE(p.expired());
    EXPECT_EQ(p.call_price(), 0.0);
    EXPECT_EQ(p.put_price(), 0.0);

    auto gc = p.greeks(OptionType::CALL);
    auto gp = p.greeks(OptionType::PUT);
    for (double g : {gc.delta, gc.gamma, gc.vega, gc.theta, gc.rho,
                     gp.delta, gp.gamma, gp.vega, gp.theta, gp.rho}) {
        EXPECT_TRUE(std::isfinite(g));
        EXPECT_EQ(g, 0.0);
    }

    auto itm = pricer(110.0, 100.0, 1e-300, 0.0, 1e-200);
    EXPECT_TRUE(itm.expired());
    EXPECT_EQ(itm.call_price(), 10.0);
    EXPECT_EQ(itm.delta(OptionType::CALL), 1.0);
}

TEST_F(EuropeanOptionTest, ContinuityAtExpiry) {
    const double T = 1e-10;
    for (double S : {80.0, 99.0, 100.0, 101.0, 120.0}) {
        auto p = pricer(S, 100.0, T, 0.05, 0.20);
        EXPECT_NEAR(p.call_price(), std::max(S - 100.0, 0.0), 1e-3) << "S=" << S;
        EXPECT_NEAR(p.put_price(), std::max(100.0 - S, 0.0), 1e-3) << "S=" << S;
    }
}

// ============================================================================
// Greek properties
// ============================================================================

TEST_F(EuropeanOptionTest, DeltaBounds) {
    for (double S : {1.0, 50.0, 100.0, 200.0, 10000.0})
        for (double T : {0.0, 0.01, 1.0, 10.0})
            for (double sigma : {0.01, 0.3, 2.0}) {
                auto p = pricer(S, 100.0, T, 0.05, sigma);
                double dc = p.delta(OptionType::CALL);
                double dp = p.delta(OptionType::PUT);
                EXPECT_GE(dc, 0.0);
                EXPECT_LE(dc, 1.0);
                EXPECT_GE(dp, -1.0);
                EXPECT_LE(dp, 0.0);
            }
}

TEST_F(EuropeanOptionTest, GammaAndVegaIndependentOfType) {
    auto p = pricer(95.0, 100.0, 0.75, 0.03, 0.35);
    EXPECT_EQ(p.greek(Greek::Gamma, OptionType::CALL), p.greek(Greek::Gamma, OptionType::PUT));
    EXPECT_EQ(p.greek(Greek::Vega, OptionType::CALL), p.greek(Greek::Vega, OptionType::PUT));

    auto gc = p.greeks(OptionType::CALL);
    auto gp = p.greeks(OptionType::PUT);
    EXPECT_EQ(gc.gamma, gp.gamma);
    EXPECT_EQ(gc.vega, gp.vega);
}

TEST_F(EuropeanOptionTest, GreekDispatchMatchesAccessors) {
    auto p = pricer(105.0, 100.0, 0.5, 0.04, 0.25);
    for (auto type : {OptionType::CALL, OptionType::PUT}) {
        EXPECT_EQ(p.greek(Greek::Delta, type), p.delta(type));
        EXPECT_EQ(p.greek(Greek::Theta, type), p.theta(type));
        EXPECT_EQ(p.greek(Greek::Rho, type), p.rho(type));

        auto g = p.greeks(type);
        EXPECT_EQ(g.delta, p.delta(type));
        EXPECT_EQ(g.gamma, p.gamma());
        EXPECT_EQ(g.vega, p.vega());
        EXPECT_EQ(g.theta, p.theta(type));
        EXPECT_EQ(g.rho, p.rho(type));
        EXPECT_EQ(p.price(type), type == OptionType::CALL ? p.call_price() : p.put_price());
    }
}

TEST_F(EuropeanOptionTest, GreeksMatchFiniteDifferences) {
    const double S = 100.0, K = 95.0, T = 0.8, r = 0.04, sigma = 0.3;
    auto base = pricer(S, K, T, r, sigma);

    for (auto type : {OptionType::CALL, OptionType::PUT}) {
        const double hS = 0.01;
        double up = pricer(S + hS, K, T, r, sigma).price(type);
        double dn = pricer(S - hS, K, T, r, sigma).price(type);
        EXPECT_NEAR(base.delta(type), (up - dn) / (2 * hS), 1e-6);
        EXPECT_NEAR(base.gamma(), (up - 2 * base.price(type) + dn) / (hS * hS), 1e-4);

        const double hv = 1e-5;
        double vu = pricer(S, K, T, r, sigma + hv).price(type);
        double vd = pricer(S, K, T, r, sigma - hv).price(type);
        EXPECT_NEAR(base.vega(), (vu - vd) / (2 * hv), 1e-5);

        const double hr = 1e-6;
        double ru = pricer(S, K, T, r + hr, sigma).price(type);
        double rd = pricer(S, K, T, r - hr, sigma).price(type);
        EXPECT_NEAR(base.rho(type), (ru - rd) / (2 * hr), 1e-4);

        // Theta is -∂V/∂T per day (calendar time moves maturity down)
        const double hT = 1e-6;
        double tu = pricer(S, K, T + hT, r, sigma).price(type);
        double td = pricer(S, K, T - hT, r, sigma).price(type);
        double annual_theta = -(tu - td) / (2 * hT);
        EXPECT_NEAR(base.theta(type), annual_theta / kDaysPerYear, 1e-6);
    }
}

TEST_F(EuropeanOptionTest, MonotoneInSpot) {
    double prev_call = -1.0;
    double prev_put = 1e300;
    for (int i = 1; i <= 300; ++i) {
        double S = static_cast<double>(i);
        auto p = pricer(S, 100.0, 0.5, 0.05, 0.25);
        EXPECT_GE(p.call_price(), prev_call) << "S=" << S;
        EXPECT_LE(p.put_price(), prev_put) << "S=" << S;
        prev_call = p.call_price();
        prev_put = p.put_price();
    }
}

// ============================================================================
// Invalid input
// ============================================================================

TEST_F(EuropeanOptionTest, ZeroVolatilityRejected) {
    auto result = EuropeanOptionPricer::create(snapshot(100.0, 100.0, 1.0, 0.05, 0.0));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::InvalidVolatility);
}

TEST_F(EuropeanOptionTest, NegativeVolatilityRejected) {
    auto result = EuropeanOptionPricer::create(snapshot(100.0, 100.0, 1.0, 0.05, -0.1));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::InvalidVolatility);
}

TEST_F(EuropeanOptionTest, ZeroVolatilityRejectedEvenAtExpiry) {
    auto result = EuropeanOptionPricer::create(snapshot(110.0, 100.0, 0.0, 0.05, 0.0));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::InvalidVolatility);
}

TEST_F(EuropeanOptionTest, InvalidSpotStrikeMaturityRejected) {
    EXPECT_EQ(EuropeanOptionPricer::create(snapshot(0.0, 100.0, 1.0, 0.05, 0.2)).error().code,
              ValidationErrorCode::InvalidSpotPrice);
    EXPECT_EQ(EuropeanOptionPricer::create(snapshot(100.0, 0.0, 1.0, 0.05, 0.2)).error().code,
              ValidationErrorCode::InvalidStrike);
    EXPECT_EQ(EuropeanOptionPricer::create(snapshot(100.0, 100.0, -1.0, 0.05, 0.2)).error().code,
              ValidationErrorCode::InvalidMaturity);
}

// ============================================================================
// Convenience functions
// ============================================================================

TEST_F(EuropeanOptionTest, ConvenienceFunctions) {
    auto snap = snapshot(100.0, 100.0, 1.0, 0.05, 0.20);

    auto call = bs_price(snap, OptionType::CALL);
    ASSERT_TRUE(call.has_value());
    EXPECT_NEAR(*call, 10.4506, 1e-4);

    auto rho_put = bs_greek(snap, Greek::Rho, OptionType::PUT);
    ASSERT_TRUE(rho_put.has_value());
    EXPECT_NEAR(*rho_put, -41.89, 1e-2);

    snap.volatility = 0.0;
    auto bad = bs_price(snap, OptionType::PUT);
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, ValidationErrorCode::InvalidVolatility);
    EXPECT_FALSE(bs_greek(snap, Greek::Delta, OptionType::CALL).has_value());
}
