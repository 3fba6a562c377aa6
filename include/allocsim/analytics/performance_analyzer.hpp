/**
 * @file performance_analyzer.hpp
 * @brief Headline statistics of an equity curve.
 *
 * Conventions:
 * - annualized_return = (1 + total_return)^(periods_per_year / N) - 1,
 *   with N the number of curve points
 * - annualized_volatility = sample standard deviation of daily returns
 *   times sqrt(periods_per_year)
 * - sharpe_ratio = (annualized_return - risk_free_rate) / annualized_volatility,
 *   or 0 when volatility is 0
 * - max_drawdown is the most negative (equity / running_peak - 1), in [-1, 0]
 */

#ifndef ALLOCSIM_ANALYTICS_PERFORMANCE_ANALYZER_HPP
#define ALLOCSIM_ANALYTICS_PERFORMANCE_ANALYZER_HPP

#include "allocsim/backtest/equity_curve.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace allocsim
{
    namespace analytics
    {

        /**
         * @struct PerformanceSummary
         * @brief Immutable result of analyze().
         *
         * With fewer than two curve points insufficient_data is set and every
         * metric is 0.
         */
        struct PerformanceSummary
        {
            double total_return = 0.0;
            double annualized_return = 0.0;
            double annualized_volatility = 0.0;
            double sharpe_ratio = 0.0;
            double max_drawdown = 0.0;
            int trade_count = 0;
            int num_points = 0;
            std::string start_date;
            std::string end_date;
            double start_equity = 0.0;
            double end_equity = 0.0;
            bool insufficient_data = true;

            nlohmann::json to_json() const;
            std::string to_string() const;
        };

        /**
         * @brief Compute the summary statistics of an equity curve.
         *
         * Pure function: never modifies its input and never throws on
         * degenerate curves (empty, single point, zero variance).
         *
         * @throws std::invalid_argument If periods_per_year <= 0.
         */
        PerformanceSummary analyze(const backtest::EquityCurve &equity_curve,
                                   int trade_count,
                                   double risk_free_rate,
                                   int periods_per_year = 252);

        /**
         * @brief Most negative drawdown of a value series, in [-1, 0].
         *
         * Single forward pass with a running peak.
         */
        double max_drawdown(const backtest::EquityCurve &equity_curve);

    } // namespace analytics
} // namespace allocsim

#endif // ALLOCSIM_ANALYTICS_PERFORMANCE_ANALYZER_HPP
