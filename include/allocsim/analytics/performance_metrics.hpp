/**
 * @file performance_metrics.hpp
 * @brief Extended performance metrics for an equity curve.
 *
 * Complements analyze() with drawdown detail, downside risk, tail risk,
 * benchmark-relative figures and export helpers. Requires at least two curve points; use analyze()
 * when a degenerate curve must not throw.
 *
 * All annualized calculations default to 252 trading days per year and
 * follow the same conventions as analyze().
 */

#ifndef ALLOCSIM_ANALYTICS_PERFORMANCE_METRICS_HPP
#define ALLOCSIM_ANALYTICS_PERFORMANCE_METRICS_HPP

#include "allocsim/analytics/performance_analyzer.hpp"
#include "allocsim/backtest/equity_curve.hpp"

#include <string>
#include <vector>

namespace allocsim
{
    namespace analytics
    {

        /**
         * @struct DrawdownInfo
         * @brief Summary of the maximum drawdown event.
         */
        struct DrawdownInfo
        {
            double depth = 0.0;        ///< Magnitude of the worst decline as a positive fraction
            int duration_days = 0;     ///< Trading days from peak to trough
            int recovery_days = -1;    ///< Trading days from trough to recovery (-1 if unrecovered)
            int peak_index = 0;
            int trough_index = 0;
            int recovery_index = -1;
            std::string peak_date;
            std::string trough_date;
            std::string recovery_date; ///< Empty if unrecovered
        };

        /**
         * @class PerformanceMetrics
         * @brief Performance analytics over a daily equity curve.
         *
         * Usage:
         * @code
         *   PerformanceMetrics metrics(result.equity_curve, 0.02);
         *   double sortino = metrics.sortino_ratio();
         *   auto dd = metrics.max_drawdown_info();
         * @endcode
         *
         * Every series is computed in the constructor; instances are
         * immutable afterwards and safe to read from several threads.
         */
        class PerformanceMetrics
        {
        public:
            /**
             * @throws std::invalid_argument If the curve has fewer than 2 points,
             *         a non-positive first value, or trading_days_per_year <= 0.
             */
            explicit PerformanceMetrics(const backtest::EquityCurve &equity_curve,
                                        double risk_free_rate = 0.02,
                                        int trading_days_per_year = 252);

            PerformanceMetrics(const std::vector<double> &nav_series,
                               const std::vector<std::string> &dates,
                               double risk_free_rate = 0.02,
                               int trading_days_per_year = 252);

            ~PerformanceMetrics() = default;

            // ---------------------------------------------------------------
            // Return Metrics
            // ---------------------------------------------------------------

            double total_return() const;
            double annualized_return() const;

            /** @brief Fraction of daily returns that are strictly positive. */
            double win_rate() const;
            double best_day() const;
            double worst_day() const;

            // ---------------------------------------------------------------
            // Risk Metrics
            // ---------------------------------------------------------------

            double annualized_volatility() const;

            /**
             * @brief Annualized semi-deviation below target_return (annual rate).
             */
            double downside_deviation(double target_return = 0.0) const;

            /** @brief Worst drawdown, in [-1, 0]. */
            double max_drawdown() const;
            DrawdownInfo max_drawdown_info() const;

            /** @brief equity / running_peak - 1 for every point (all <= 0). */
            std::vector<double> drawdown_series() const;

            /**
             * @brief Historical one-day Value at Risk as a positive loss fraction.
             * @throws std::invalid_argument If confidence is not in (0, 1).
             */
            double value_at_risk(double confidence = 0.95) const;

            /**
             * @brief Historical Expected Shortfall: mean loss beyond VaR.
             * @throws std::invalid_argument If confidence is not in (0, 1).
             */
            double conditional_var(double confidence = 0.95) const;

            // ---------------------------------------------------------------
            // Risk-Adjusted Metrics
            // ---------------------------------------------------------------

            double sharpe_ratio() const;
            double sortino_ratio(double target_return = 0.0) const;

            /** @brief annualized_return / |max_drawdown|, 0 without a drawdown. */
            double calmar_ratio() const;

            // ---------------------------------------------------------------
            // Benchmark-Relative Metrics
            //
            // The benchmark is another curve over the same dates, typically a
            // constant-weight run on the same market data. Each throws
            // std::invalid_argument if the dates differ or there are fewer
            // than 2 daily returns.
            // ---------------------------------------------------------------

            /** @brief cov(r, r_b) / var(r_b) of daily returns; 0 for a flat benchmark. */
            double beta(const PerformanceMetrics &benchmark) const;

            /** @brief Annualized mean of daily active returns r - r_b. */
            double active_return(const PerformanceMetrics &benchmark) const;

            /** @brief Annualized sample standard deviation of daily active returns. */
            double tracking_error(const PerformanceMetrics &benchmark) const;

            /** @brief active_return / tracking_error, 0 when the curves track exactly. */
            double information_ratio(const PerformanceMetrics &benchmark) const;

            // ---------------------------------------------------------------
            // Accessors
            // ---------------------------------------------------------------

            const std::vector<double> &nav_series() const { return nav_series_; }
            const std::vector<double> &return_series() const { return return_series_; }
            const std::vector<std::string> &dates() const { return dates_; }
            double risk_free_rate() const { return risk_free_rate_; }
            int trading_days_per_year() const { return trading_days_per_year_; }

            // ---------------------------------------------------------------
            // Export
            // ---------------------------------------------------------------

            PerformanceSummary summarize(int trade_count = 0) const;
            std::string summary() const;
            std::string to_json() const;

            /**
             * @brief Write date, equity, return and drawdown columns.
             * @throws std::runtime_error If the file cannot be opened.
             */
            void to_csv(const std::string &filepath) const;

        private:
            std::vector<double> nav_series_;
            std::vector<double> return_series_;
            std::vector<std::string> dates_;
            double risk_free_rate_;
            int trading_days_per_year_;

            PerformanceSummary headline_;
            std::vector<double> drawdown_series_;
            DrawdownInfo worst_drawdown_;

            void initialize();
            void build_drawdowns();
            backtest::EquityCurve to_curve() const;
            void check_benchmark(const PerformanceMetrics &benchmark) const;
            std::vector<double> active_returns(const PerformanceMetrics &benchmark) const;
        };

    } // namespace analytics
} // namespace allocsim

#endif // ALLOCSIM_ANALYTICS_PERFORMANCE_METRICS_HPP
