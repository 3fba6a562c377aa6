/**
 * @file backtest_result.hpp
 * @brief Read-only outcome of one backtest run.
 *
 * Holds the equity curve, the trade log and the performance summary
 * computed once at the end of the run, with helpers that bridge to the
 * full analytics layer and export to CSV/JSON.
 */

#ifndef ALLOCSIM_BACKTEST_BACKTEST_RESULT_HPP
#define ALLOCSIM_BACKTEST_BACKTEST_RESULT_HPP

#include "allocsim/analytics/performance_analyzer.hpp"
#include "allocsim/analytics/performance_metrics.hpp"
#include "allocsim/backtest/equity_curve.hpp"
#include "allocsim/backtest/portfolio.hpp"
#include "allocsim/backtest/trade_logger.hpp"

#include <string>
#include <vector>

namespace allocsim
{
    namespace backtest
    {

        /**
         * @struct BacktestResult
         * @brief Container for backtest output data and analytics.
         */
        struct BacktestResult
        {
            std::string strategy_name;

            EquityCurve equity_curve;              ///< One post-trade point per trading date
            std::vector<TradeRecord> trades;       ///< Executed trades in execution order
            TradeSummary trade_summary;
            std::vector<std::string> rebalance_dates;
            analytics::PerformanceSummary performance;
            PortfolioSnapshot final_snapshot;

            double risk_free_rate = 0.0;
            int trading_days_per_year = 252;

            std::vector<double> nav_series() const;
            std::vector<std::string> dates() const;

            /**
             * @brief Full PerformanceMetrics over the equity curve.
             * @throws std::invalid_argument If the curve has fewer than 2 points.
             */
            analytics::PerformanceMetrics compute_analytics() const;

            /**
             * @brief Print the performance summary and trade statistics to stdout.
             */
            void print_summary() const;

            /**
             * @brief Write date, equity, daily return and cumulative return columns.
             * @throws std::runtime_error If the file cannot be opened.
             */
            void export_equity_to_csv(const std::string &filepath) const;

            /**
             * @brief Summary, trade statistics and (when available) extended
             * metrics as a JSON document.
             */
            std::string export_analytics_json() const;
        };

    } // namespace backtest
} // namespace allocsim

#endif // ALLOCSIM_BACKTEST_BACKTEST_RESULT_HPP
