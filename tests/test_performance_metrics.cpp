/**
 * @file test_performance_metrics.cpp
 * @brief Unit tests for PerformanceCalculator
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "analytics/performance_metrics.hpp"
#include <cmath>

using namespace esg;
using namespace esg::analytics;
using Catch::Approx;
using Catch::Matchers::WithinAbs;

namespace {

data::ReturnSeries series(const std::vector<double>& returns, int first_day = 2)
{
    data::ReturnSeries r;
    r.base_date = "2024-01-01";
    for (size_t i = 0; i < returns.size(); ++i) {
        int day = first_day + static_cast<int>(i);
        r.dates.push_back(std::string("2024-01-") + (day < 10 ? "0" : "") + std::to_string(day));
    }
    r.returns = returns;
    return r;
}

} // namespace

TEST_CASE("Calculator construction", "[PerformanceCalculator]") {
    PerformanceCalculator calc;
    REQUIRE(calc.risk_free_rate() == 0.02);
    REQUIRE(calc.trading_days_per_year() == 252);

    REQUIRE_THROWS_AS(PerformanceCalculator(0.02, 0), std::invalid_argument);
    REQUIRE_THROWS_AS(PerformanceCalculator(0.02, -5), std::invalid_argument);
}

TEST_CASE("Annualized return and volatility", "[PerformanceCalculator]") {
    PerformanceCalculator calc;
    std::vector<double> r = {0.01, -0.02, 0.03};

    double mean = 0.02 / 3.0;
    REQUIRE_THAT(calc.annualized_return(r), WithinAbs(std::pow(1.0 + mean, 252.0) - 1.0, 1e-9));

    double ss = (0.01 - mean) * (0.01 - mean) + (-0.02 - mean) * (-0.02 - mean) + (0.03 - mean) * (0.03 - mean);
    double daily_sd = std::sqrt(ss / 2.0);
    REQUIRE_THAT(PerformanceCalculator::sample_std_dev(r), WithinAbs(daily_sd, 1e-12));
    REQUIRE_THAT(calc.annualized_volatility(r), WithinAbs(daily_sd * std::sqrt(252.0), 1e-12));

    REQUIRE(calc.annualized_return({}) == 0.0);
    REQUIRE(calc.annualized_volatility({0.05}) == 0.0);
}

TEST_CASE("Sharpe ratio", "[PerformanceCalculator]") {
    PerformanceCalculator calc(0.02, 252);

    SECTION("Excess mean over dispersion, scaled by sqrt(252)") {
        std::vector<double> r = {0.01, -0.005, 0.02, 0.0};
        double mean = PerformanceCalculator::mean(r);
        double sd = PerformanceCalculator::sample_std_dev(r);
        double expected = std::sqrt(252.0) * (mean - 0.02 / 252.0) / sd;

        REQUIRE_THAT(calc.sharpe_ratio(r), WithinAbs(expected, 1e-9));
    }

    SECTION("Zero dispersion gives exactly zero") {
        REQUIRE(calc.sharpe_ratio({0.01, 0.01, 0.01}) == 0.0);
        REQUIRE(calc.sharpe_ratio({0.01}) == 0.0);
        REQUIRE(calc.sharpe_ratio({}) == 0.0);
    }
}

TEST_CASE("Max drawdown", "[PerformanceCalculator]") {
    SECTION("Wealth path 1.01, 0.9898, 1.0195") {
        std::vector<double> r = {0.01, -0.02, 0.03};
        REQUIRE(PerformanceCalculator::max_drawdown(r) == Approx(0.9898 / 1.01 - 1.0).margin(1e-9));
        REQUIRE(PerformanceCalculator::max_drawdown(r) == Approx(-0.02).margin(1e-4));
    }

    SECTION("Drawdown series tracks the running peak") {
        auto dd = PerformanceCalculator::drawdown_series({0.10, -0.10, -0.10, 0.50});

        REQUIRE(dd.size() == 4);
        REQUIRE(dd[0] == 0.0);
        REQUIRE_THAT(dd[1], WithinAbs(-0.10, 1e-12));
        REQUIRE_THAT(dd[2], WithinAbs(0.81 - 1.0, 1e-12));
        REQUIRE(dd[3] == 0.0);
        for (double d : dd) {
            REQUIRE(d <= 0.0);
        }
    }

    SECTION("The peak starts at the first compounded value") {
        REQUIRE(PerformanceCalculator::max_drawdown({-0.05, -0.05}) == Approx(0.9025 / 0.95 - 1.0).margin(1e-12));
    }

    SECTION("Monotonic gains have no drawdown") {
        REQUIRE(PerformanceCalculator::max_drawdown({0.01, 0.02, 0.03}) == 0.0);
        REQUIRE(PerformanceCalculator::max_drawdown({}) == 0.0);
    }
}

TEST_CASE("Compute metrics record", "[PerformanceCalculator]") {
    PerformanceCalculator calc;

    SECTION("Empty returns give an empty record") {
        auto m = calc.compute(data::ReturnSeries());

        REQUIRE(m.empty());
        REQUIRE(m.annualized_return == 0.0);
        REQUIRE(m.annualized_volatility == 0.0);
        REQUIRE(m.sharpe_ratio == 0.0);
        REQUIRE(m.max_drawdown == 0.0);
        REQUIRE_FALSE(m.beta.has_value());
        REQUIRE_FALSE(m.alpha.has_value());
    }

    SECTION("Without benchmark, beta and alpha are absent") {
        auto m = calc.compute(series({0.01, -0.02, 0.03}));

        REQUIRE(m.num_observations == 3);
        REQUIRE(m.max_drawdown < 0.0);
        REQUIRE_FALSE(m.beta.has_value());
        REQUIRE_FALSE(m.alpha.has_value());
    }

    SECTION("With an empty benchmark, beta and alpha are absent") {
        auto m = calc.compute(series({0.01, -0.02, 0.03}), data::ReturnSeries());
        REQUIRE_FALSE(m.beta.has_value());
    }

    SECTION("Zero-variance benchmark gives beta 1 and alpha 0") {
        auto m = calc.compute(series({0.01, -0.02, 0.03}), series({0.005, 0.005, 0.005}));

        REQUIRE(m.beta.has_value());
        REQUIRE(*m.beta == 1.0);
        REQUIRE(*m.alpha == 0.0);
    }

    SECTION("Leveraged benchmark gives beta 2") {
        auto m = calc.compute(series({0.02, -0.01, 0.03, 0.01}), series({0.01, -0.005, 0.015, 0.005}));

        REQUIRE_THAT(*m.beta, WithinAbs(2.0, 1e-9));
        double expected_alpha = (m.annualized_return - 0.02) -
                                2.0 * (calc.annualized_return({0.01, -0.005, 0.015, 0.005}) - 0.02);
        REQUIRE_THAT(*m.alpha, WithinAbs(expected_alpha, 1e-6));
    }
}

TEST_CASE("Analytics settings", "[AnalyticsSettings]") {
    auto s = AnalyticsSettings::from_json({{"risk_free_rate", 0.03}});
    REQUIRE(s.risk_free_rate == 0.03);
    REQUIRE(s.trading_days_per_year == 252);
    REQUIRE(s.to_json()["trading_days_per_year"] == 252);

    REQUIRE_THROWS_AS(AnalyticsSettings::from_json({{"trading_days_per_year", 0}}), std::invalid_argument);
}

TEST_CASE("Metrics export", "[PerformanceMetrics]") {
    PerformanceCalculator calc;
    auto m = calc.compute(series({0.01, -0.02, 0.03}));

    auto j = m.to_json();
    REQUIRE(j["num_observations"] == 3);
    REQUIRE(j["beta"].is_null());
    REQUIRE(j["alpha"].is_null());
    REQUIRE_THAT(j["max_drawdown"].get<double>(), WithinAbs(m.max_drawdown, 1e-15));

    auto text = m.summary();
    REQUIRE(text.find("Sharpe Ratio") != std::string::npos);
    REQUIRE(text.find("Beta") == std::string::npos);

    REQUIRE(PerformanceMetrics().summary().find("No return data") != std::string::npos);
}
