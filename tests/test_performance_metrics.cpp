/**
 * @file test_performance_metrics.cpp
 * @brief Unit tests for the performance summary and extended metrics
 */

#include <catch2/catch.hpp>
#include "allocsim/analytics/performance_analyzer.hpp"
#include "allocsim/analytics/performance_metrics.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace allocsim;
using namespace allocsim::analytics;
using Catch::Matchers::WithinAbs;

namespace {

backtest::EquityCurve curve_of(const std::vector<double>& values) {
    static const char* const kDates[] = {"2020-01-02", "2020-01-03", "2020-01-06", "2020-01-07",
                                         "2020-01-08", "2020-01-09", "2020-01-10", "2020-01-13",
                                         "2020-01-14", "2020-01-15", "2020-01-16", "2020-01-17"};
    backtest::EquityCurve curve;
    for (size_t i = 0; i < values.size(); ++i) {
        curve.push_back({kDates[i], values[i]});
    }
    return curve;
}

backtest::EquityCurve grown_from(const std::vector<double>& daily_returns) {
    std::vector<double> values = {100.0};
    for (double r : daily_returns) {
        values.push_back(values.back() * (1.0 + r));
    }
    return curve_of(values);
}

} // namespace

TEST_CASE("Performance summary", "[PerformanceAnalyzer]") {
    SECTION("Four-bar scenario") {
        auto s = analyze(curve_of({100000.0, 110000.0, 99000.0, 121000.0}), 1, 0.0, 4);
        REQUIRE_FALSE(s.insufficient_data);
        REQUIRE_THAT(s.total_return, WithinAbs(0.21, 1e-12));
        REQUIRE_THAT(s.annualized_return, WithinAbs(0.21, 1e-12));
        REQUIRE_THAT(s.max_drawdown, WithinAbs(99.0 / 110.0 - 1.0, 1e-12));
        REQUIRE(s.trade_count == 1);
        REQUIRE(s.num_points == 4);
        REQUIRE(s.start_date == "2020-01-02");
        REQUIRE(s.end_date == "2020-01-07");
    }

    SECTION("Annualized return compounds over the number of points") {
        auto s = analyze(curve_of({100.0, 101.0}), 0, 0.0, 252);
        REQUIRE_THAT(s.annualized_return, WithinAbs(std::pow(1.01, 126.0) - 1.0, 1e-9));
    }

    SECTION("Volatility from daily returns") {
        auto s = analyze(curve_of({100.0, 101.0, 100.0}), 0, 0.0, 252);
        double r1 = 0.01;
        double r2 = 100.0 / 101.0 - 1.0;
        double mean = (r1 + r2) / 2.0;
        double sd = std::sqrt((r1 - mean) * (r1 - mean) + (r2 - mean) * (r2 - mean));
        REQUIRE_THAT(s.annualized_volatility, WithinAbs(sd * std::sqrt(252.0), 1e-12));
    }

    SECTION("Flat curve has zero volatility and zero Sharpe") {
        auto s = analyze(curve_of({100.0, 100.0, 100.0, 100.0}), 0, 0.02, 252);
        REQUIRE(s.annualized_volatility == 0.0);
        REQUIRE(s.sharpe_ratio == 0.0);
        REQUIRE(s.max_drawdown == 0.0);
        REQUIRE(s.total_return == 0.0);
    }

    SECTION("Fewer than two points is flagged, not raised") {
        auto one = analyze(curve_of({100.0}), 0, 0.02, 252);
        REQUIRE(one.insufficient_data);
        REQUIRE(one.total_return == 0.0);
        REQUIRE(one.sharpe_ratio == 0.0);
        auto none = analyze({}, 0, 0.02, 252);
        REQUIRE(none.insufficient_data);
        REQUIRE(none.num_points == 0);
    }

    SECTION("Error: non-positive periods per year") {
        REQUIRE_THROWS_AS(analyze(curve_of({100.0, 101.0}), 0, 0.0, 0), std::invalid_argument);
    }

    SECTION("JSON view") {
        auto j = analyze(curve_of({100.0, 110.0}), 2, 0.0, 252).to_json();
        REQUIRE_THAT(j.at("total_return").get<double>(), WithinAbs(0.1, 1e-12));
        REQUIRE(j.at("trade_count").get<int>() == 2);
        REQUIRE(j.at("insufficient_data").get<bool>() == false);
    }
}

TEST_CASE("Drawdown bounds", "[PerformanceAnalyzer]") {
    SECTION("Monotonic increase has zero drawdown") {
        REQUIRE(max_drawdown(curve_of({1.0, 2.0, 3.0, 4.0, 5.0})) == 0.0);
    }

    SECTION("Always within [-1, 0]") {
        std::vector<std::vector<double>> curves = {
            {100.0, 50.0, 25.0, 200.0},
            {100.0, 1e-9, 100.0},
            {100.0, 0.0, 0.0},
            {5.0, 4.0, 3.0, 2.0, 1.0},
            {100.0, 120.0, 80.0, 130.0, 60.0}};
        for (const auto& values : curves) {
            double dd = max_drawdown(curve_of(values));
            REQUIRE(dd <= 0.0);
            REQUIRE(dd >= -1.0);
        }
    }

    SECTION("Worst peak-to-trough decline") {
        REQUIRE_THAT(max_drawdown(curve_of({100.0, 120.0, 80.0, 130.0, 65.0})), WithinAbs(-0.5, 1e-12));
    }
}

TEST_CASE("Sharpe sign", "[PerformanceAnalyzer]") {
    auto rising = analyze(curve_of({100.0, 102.0, 101.0, 104.0, 103.0, 107.0}), 0, 0.02, 252);
    REQUIRE(rising.annualized_volatility > 0.0);
    REQUIRE(rising.annualized_return > 0.02);
    REQUIRE(rising.sharpe_ratio > 0.0);

    auto falling = analyze(curve_of({100.0, 98.0, 99.0, 96.0, 97.0, 94.0}), 0, 0.02, 252);
    REQUIRE(falling.annualized_return < 0.02);
    REQUIRE(falling.sharpe_ratio < 0.0);

    // Positive return that still trails the risk-free rate
    auto lagging = analyze(curve_of({100.0, 100.01, 100.0, 100.02}), 0, 0.5, 252);
    REQUIRE(lagging.annualized_return > 0.0);
    REQUIRE(lagging.annualized_return < 0.5);
    REQUIRE(lagging.sharpe_ratio < 0.0);
}

TEST_CASE("PerformanceMetrics construction", "[PerformanceMetrics]") {
    SECTION("From an equity curve") {
        PerformanceMetrics m(curve_of({100.0, 110.0, 99.0, 121.0}), 0.0, 4);
        REQUIRE(m.nav_series().size() == 4);
        REQUIRE(m.return_series().size() == 3);
        REQUIRE(m.dates().front() == "2020-01-02");
    }

    SECTION("Errors") {
        REQUIRE_THROWS_AS(PerformanceMetrics(curve_of({100.0})), std::invalid_argument);
        REQUIRE_THROWS_AS(PerformanceMetrics(std::vector<double>{100.0, 101.0},
                                             std::vector<std::string>{"2020-01-02"}),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(PerformanceMetrics(curve_of({100.0, 0.0})), std::invalid_argument);
        REQUIRE_THROWS_AS(PerformanceMetrics(curve_of({100.0, 101.0}), 0.0, 0), std::invalid_argument);
    }
}

TEST_CASE("PerformanceMetrics values", "[PerformanceMetrics]") {
    PerformanceMetrics m(curve_of({100.0, 110.0, 99.0, 121.0}), 0.0, 4);

    SECTION("Returns") {
        REQUIRE_THAT(m.total_return(), WithinAbs(0.21, 1e-12));
        REQUIRE_THAT(m.annualized_return(), WithinAbs(0.21, 1e-12));
        REQUIRE_THAT(m.win_rate(), WithinAbs(2.0 / 3.0, 1e-12));
        REQUIRE_THAT(m.best_day(), WithinAbs(121.0 / 99.0 - 1.0, 1e-12));
        REQUIRE_THAT(m.worst_day(), WithinAbs(-0.1, 1e-12));
    }

    SECTION("Drawdown detail") {
        REQUIRE_THAT(m.max_drawdown(), WithinAbs(-0.1, 1e-12));
        auto info = m.max_drawdown_info();
        REQUIRE_THAT(info.depth, WithinAbs(0.1, 1e-12));
        REQUIRE(info.peak_date == "2020-01-03");
        REQUIRE(info.trough_date == "2020-01-06");
        REQUIRE(info.recovery_date == "2020-01-07");
        REQUIRE(info.duration_days == 1);
        REQUIRE(info.recovery_days == 1);

        auto series = m.drawdown_series();
        REQUIRE(series.size() == 4);
        REQUIRE(series[0] == 0.0);
        REQUIRE_THAT(series[2], WithinAbs(-0.1, 1e-12));
    }

    SECTION("Agrees with the summary") {
        auto s = m.summarize(3);
        REQUIRE_THAT(s.max_drawdown, WithinAbs(m.max_drawdown(), 1e-12));
        REQUIRE_THAT(s.sharpe_ratio, WithinAbs(m.sharpe_ratio(), 1e-12));
        REQUIRE_THAT(s.annualized_volatility, WithinAbs(m.annualized_volatility(), 1e-12));
        REQUIRE(s.trade_count == 3);
    }

    SECTION("Tail risk") {
        REQUIRE(m.value_at_risk(0.95) >= 0.0);
        REQUIRE_THAT(m.conditional_var(0.95), WithinAbs(0.1, 1e-12));
        REQUIRE_THROWS_AS(m.value_at_risk(1.0), std::invalid_argument);
        REQUIRE_THROWS_AS(m.conditional_var(0.0), std::invalid_argument);
    }

    SECTION("Risk-adjusted ratios") {
        REQUIRE(m.sharpe_ratio() > 0.0);
        REQUIRE(m.sortino_ratio() > 0.0);
        REQUIRE_THAT(m.calmar_ratio(), WithinAbs(0.21 / 0.1, 1e-9));
    }

    SECTION("Unrecovered drawdown") {
        PerformanceMetrics down(curve_of({100.0, 90.0, 95.0}), 0.0, 252);
        auto info = down.max_drawdown_info();
        REQUIRE(info.recovery_days == -1);
        REQUIRE(info.recovery_date.empty());
    }
}

TEST_CASE("PerformanceMetrics export", "[PerformanceMetrics]") {
    PerformanceMetrics m(curve_of({100.0, 105.0, 103.0}), 0.02, 252);

    SECTION("JSON") {
        auto j = nlohmann::json::parse(m.to_json());
        REQUIRE(j.contains("return_metrics"));
        REQUIRE(j["settings"]["num_observations"].get<int>() == 3);
        REQUIRE_THAT(j["return_metrics"]["total_return"].get<double>(), WithinAbs(0.03, 1e-12));
    }

    SECTION("CSV") {
        auto path = (std::filesystem::temp_directory_path() / "allocsim_tests" / "metrics.csv").string();
        m.to_csv(path);
        std::ifstream in(path);
        std::string header;
        std::getline(in, header);
        REQUIRE(header == "date,equity,return,drawdown");
        int rows = 0;
        std::string line;
        while (std::getline(in, line)) ++rows;
        REQUIRE(rows == 3);
    }

    SECTION("Text summary") {
        REQUIRE(m.summary().find("Sharpe Ratio") != std::string::npos);
    }
}

TEST_CASE("PerformanceMetrics against a benchmark", "[PerformanceMetrics]") {
    const std::vector<double> bench_returns = {0.02, -0.01, 0.03, -0.005};
    std::vector<double> levered;
    for (double r : bench_returns) levered.push_back(2.0 * r);

    PerformanceMetrics bench(grown_from(bench_returns), 0.0, 4);
    PerformanceMetrics twice(grown_from(levered), 0.0, 4);

    SECTION("A curve against itself") {
        REQUIRE_THAT(bench.beta(bench), WithinAbs(1.0, 1e-9));
        REQUIRE_THAT(bench.active_return(bench), WithinAbs(0.0, 1e-15));
        REQUIRE_THAT(bench.tracking_error(bench), WithinAbs(0.0, 1e-15));
        REQUIRE(bench.information_ratio(bench) == 0.0);
    }

    SECTION("Doubled daily returns") {
        // Active returns equal the benchmark returns: mean 0.00875, sum of squared deviations 0.00111875
        const double expected_te = std::sqrt(0.00111875 / 3.0) * 2.0;
        REQUIRE_THAT(twice.beta(bench), WithinAbs(2.0, 1e-9));
        REQUIRE_THAT(bench.beta(twice), WithinAbs(0.5, 1e-9));
        REQUIRE_THAT(twice.active_return(bench), WithinAbs(0.035, 1e-9));
        REQUIRE_THAT(twice.tracking_error(bench), WithinAbs(expected_te, 1e-9));
        REQUIRE_THAT(twice.information_ratio(bench), WithinAbs(0.035 / expected_te, 1e-6));
        REQUIRE(bench.information_ratio(twice) < 0.0);
    }

    SECTION("Flat benchmark has zero beta") {
        PerformanceMetrics cash(curve_of({100.0, 100.0, 100.0, 100.0, 100.0}), 0.0, 4);
        REQUIRE(twice.beta(cash) == 0.0);
        REQUIRE(twice.tracking_error(cash) > 0.0);
    }

    SECTION("Error: different dates") {
        PerformanceMetrics shifted(std::vector<double>{100.0, 102.0, 101.0, 104.0, 103.0},
                                   {"2021-03-01", "2021-03-02", "2021-03-03", "2021-03-04", "2021-03-05"},
                                   0.0, 4);
        REQUIRE_THROWS_AS(twice.beta(shifted), std::invalid_argument);
        REQUIRE_THROWS_AS(twice.tracking_error(shifted), std::invalid_argument);
        PerformanceMetrics shorter(curve_of({100.0, 101.0, 102.0}), 0.0, 4);
        REQUIRE_THROWS_AS(twice.information_ratio(shorter), std::invalid_argument);
    }

    SECTION("Error: a single daily return") {
        PerformanceMetrics one(curve_of({100.0, 101.0}), 0.0, 4);
        REQUIRE_THROWS_AS(one.beta(one), std::invalid_argument);
        REQUIRE_THROWS_AS(one.tracking_error(one), std::invalid_argument);
    }
}
