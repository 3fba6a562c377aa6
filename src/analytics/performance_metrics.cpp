/**
 * @file performance_metrics.cpp
 * @brief Extended metrics layered on top of analyze().
 */

#include "allocsim/analytics/performance_metrics.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace allocsim
{
    namespace analytics
    {

        namespace
        {
            void require_confidence(double confidence)
            {
                if (!(confidence > 0.0 && confidence < 1.0))
                {
                    throw std::invalid_argument(
                        "Confidence level must be in (0, 1), got: " + std::to_string(confidence));
                }
            }

            std::vector<double> ascending(std::vector<double> values)
            {
                std::sort(values.begin(), values.end());
                return values;
            }

            // Ratio with a zero denominator reported as 0.
            double safe_ratio(double numerator, double denominator)
            {
                return denominator > 1e-12 ? numerator / denominator : 0.0;
            }

            double mean_of(const std::vector<double> &values)
            {
                double sum = 0.0;
                for (double v : values)
                {
                    sum += v;
                }
                return sum / static_cast<double>(values.size());
            }
        } // namespace

        PerformanceMetrics::PerformanceMetrics(const backtest::EquityCurve &equity_curve,
                                               double risk_free_rate,
                                               int trading_days_per_year)
            : risk_free_rate_(risk_free_rate), trading_days_per_year_(trading_days_per_year)
        {
            for (const auto &point : equity_curve)
            {
                dates_.push_back(point.date);
                nav_series_.push_back(point.equity);
            }
            initialize();
        }

        PerformanceMetrics::PerformanceMetrics(const std::vector<double> &nav_series,
                                               const std::vector<std::string> &dates,
                                               double risk_free_rate,
                                               int trading_days_per_year)
            : nav_series_(nav_series), dates_(dates),
              risk_free_rate_(risk_free_rate), trading_days_per_year_(trading_days_per_year)
        {
            initialize();
        }

        void PerformanceMetrics::initialize()
        {
            const size_t n = nav_series_.size();
            if (n < 2)
            {
                throw std::invalid_argument("PerformanceMetrics needs at least 2 equity points, got " +
                                            std::to_string(n));
            }
            if (dates_.size() != n)
            {
                throw std::invalid_argument("Got " + std::to_string(dates_.size()) + " dates for " +
                                            std::to_string(n) + " equity points");
            }
            if (trading_days_per_year_ <= 0)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'trading_days_per_year', got: " +
                    std::to_string(trading_days_per_year_));
            }
            auto bad = std::find_if(nav_series_.begin(), nav_series_.end(),
                                    [](double v) { return !std::isfinite(v) || v <= 0.0; });
            if (bad != nav_series_.end())
            {
                throw std::invalid_argument("Equity on " + dates_[static_cast<size_t>(bad - nav_series_.begin())] +
                                            " is not a positive finite value");
            }

            return_series_.clear();
            for (size_t i = 1; i < n; ++i)
            {
                return_series_.push_back(nav_series_[i] / nav_series_[i - 1] - 1.0);
            }

            headline_ = analyze(to_curve(), 0, risk_free_rate_, trading_days_per_year_);
            build_drawdowns();
        }

        void PerformanceMetrics::build_drawdowns()
        {
            const int n = static_cast<int>(nav_series_.size());
            drawdown_series_.assign(static_cast<size_t>(n), 0.0);

            int running_peak = 0;
            DrawdownInfo worst;
            for (int i = 1; i < n; ++i)
            {
                if (nav_series_[i] > nav_series_[running_peak])
                {
                    running_peak = i;
                }
                double dd = nav_series_[i] / nav_series_[running_peak] - 1.0;
                drawdown_series_[i] = dd;
                if (-dd > worst.depth)
                {
                    worst.depth = -dd;
                    worst.peak_index = running_peak;
                    worst.trough_index = i;
                }
            }

            if (worst.depth > 0.0)
            {
                const double peak_value = nav_series_[worst.peak_index];
                auto it = std::find_if(nav_series_.begin() + worst.trough_index + 1, nav_series_.end(),
                                       [peak_value](double v) { return v >= peak_value; });
                if (it != nav_series_.end())
                {
                    worst.recovery_index = static_cast<int>(it - nav_series_.begin());
                    worst.recovery_days = worst.recovery_index - worst.trough_index;
                    worst.recovery_date = dates_[worst.recovery_index];
                }
            }
            worst.duration_days = worst.trough_index - worst.peak_index;
            worst.peak_date = dates_[worst.peak_index];
            worst.trough_date = dates_[worst.trough_index];
            worst_drawdown_ = worst;
        }

        backtest::EquityCurve PerformanceMetrics::to_curve() const
        {
            backtest::EquityCurve curve;
            for (size_t i = 0; i < nav_series_.size(); ++i)
            {
                curve.push_back({dates_[i], nav_series_[i]});
            }
            return curve;
        }

        // Headline figures come from analyze() so both views always agree.
        double PerformanceMetrics::total_return() const { return headline_.total_return; }
        double PerformanceMetrics::annualized_return() const { return headline_.annualized_return; }
        double PerformanceMetrics::annualized_volatility() const { return headline_.annualized_volatility; }
        double PerformanceMetrics::sharpe_ratio() const { return headline_.sharpe_ratio; }

        double PerformanceMetrics::win_rate() const
        {
            auto positive = std::count_if(return_series_.begin(), return_series_.end(),
                                          [](double r) { return r > 0.0; });
            return static_cast<double>(positive) / static_cast<double>(return_series_.size());
        }

        double PerformanceMetrics::best_day() const
        {
            return *std::max_element(return_series_.begin(), return_series_.end());
        }

        double PerformanceMetrics::worst_day() const
        {
            return *std::min_element(return_series_.begin(), return_series_.end());
        }

        double PerformanceMetrics::downside_deviation(double target_return) const
        {
            if (return_series_.size() < 2)
            {
                return 0.0;
            }
            const double daily_target = target_return / trading_days_per_year_;
            double shortfall_sq = 0.0;
            for (double r : return_series_)
            {
                double shortfall = std::min(0.0, r - daily_target);
                shortfall_sq += shortfall * shortfall;
            }
            const double periods = static_cast<double>(return_series_.size() - 1);
            return std::sqrt(shortfall_sq / periods * trading_days_per_year_);
        }

        double PerformanceMetrics::max_drawdown() const
        {
            return -worst_drawdown_.depth;
        }

        DrawdownInfo PerformanceMetrics::max_drawdown_info() const
        {
            return worst_drawdown_;
        }

        std::vector<double> PerformanceMetrics::drawdown_series() const
        {
            return drawdown_series_;
        }

        double PerformanceMetrics::value_at_risk(double confidence) const
        {
            require_confidence(confidence);
            const std::vector<double> sorted = ascending(return_series_);

            // Linear interpolation between order statistics.
            const double pos = (1.0 - confidence) * static_cast<double>(sorted.size() - 1);
            const size_t lo = static_cast<size_t>(pos);
            const size_t hi = std::min(lo + 1, sorted.size() - 1);
            const double frac = pos - static_cast<double>(lo);
            return -(sorted[lo] + (sorted[hi] - sorted[lo]) * frac);
        }

        double PerformanceMetrics::conditional_var(double confidence) const
        {
            require_confidence(confidence);
            const std::vector<double> sorted = ascending(return_series_);

            size_t tail = static_cast<size_t>((1.0 - confidence) * static_cast<double>(sorted.size()));
            tail = std::max<size_t>(tail, 1);
            double tail_sum = 0.0;
            for (size_t i = 0; i < tail; ++i)
            {
                tail_sum += sorted[i];
            }
            return -tail_sum / static_cast<double>(tail);
        }

        double PerformanceMetrics::sortino_ratio(double target_return) const
        {
            return safe_ratio(annualized_return() - target_return, downside_deviation(target_return));
        }

        double PerformanceMetrics::calmar_ratio() const
        {
            return safe_ratio(annualized_return(), worst_drawdown_.depth);
        }

        // ===================================================================
        // Benchmark-Relative Metrics
        // ===================================================================

        void PerformanceMetrics::check_benchmark(const PerformanceMetrics &benchmark) const
        {
            if (benchmark.dates_ != dates_)
            {
                throw std::invalid_argument("Benchmark must cover the same " + std::to_string(dates_.size()) +
                                            " dates, got " + std::to_string(benchmark.dates_.size()) +
                                            " dates from " + benchmark.dates_.front());
            }
            if (return_series_.size() < 2)
            {
                throw std::invalid_argument("At least 2 daily returns are required against a benchmark, got: " +
                                            std::to_string(return_series_.size()));
            }
        }

        std::vector<double> PerformanceMetrics::active_returns(const PerformanceMetrics &benchmark) const
        {
            check_benchmark(benchmark);
            std::vector<double> active(return_series_.size());
            for (size_t i = 0; i < return_series_.size(); ++i)
            {
                active[i] = return_series_[i] - benchmark.return_series_[i];
            }
            return active;
        }

        double PerformanceMetrics::beta(const PerformanceMetrics &benchmark) const
        {
            check_benchmark(benchmark);
            const std::vector<double> &rb = benchmark.return_series_;
            const double mean_p = mean_of(return_series_);
            const double mean_b = mean_of(rb);

            double covariance = 0.0;
            double variance = 0.0;
            for (size_t i = 0; i < rb.size(); ++i)
            {
                covariance += (return_series_[i] - mean_p) * (rb[i] - mean_b);
                variance += (rb[i] - mean_b) * (rb[i] - mean_b);
            }
            return variance > 1e-18 ? covariance / variance : 0.0;
        }

        double PerformanceMetrics::active_return(const PerformanceMetrics &benchmark) const
        {
            return mean_of(active_returns(benchmark)) * static_cast<double>(trading_days_per_year_);
        }

        double PerformanceMetrics::tracking_error(const PerformanceMetrics &benchmark) const
        {
            const std::vector<double> active = active_returns(benchmark);
            const double mean_active = mean_of(active);
            double sum_sq = 0.0;
            for (double a : active)
            {
                sum_sq += (a - mean_active) * (a - mean_active);
            }
            const double daily_te = std::sqrt(sum_sq / static_cast<double>(active.size() - 1));
            return daily_te * std::sqrt(static_cast<double>(trading_days_per_year_));
        }

        double PerformanceMetrics::information_ratio(const PerformanceMetrics &benchmark) const
        {
            const double te = tracking_error(benchmark);
            return te > 1e-18 ? active_return(benchmark) / te : 0.0;
        }

        PerformanceSummary PerformanceMetrics::summarize(int trade_count) const
        {
            PerformanceSummary s = headline_;
            s.trade_count = trade_count;
            return s;
        }

        std::string PerformanceMetrics::summary() const
        {
            std::ostringstream oss;
            oss << "Performance Summary\n===================\n"
                << headline_.to_string();

            auto pct = [&oss](const char *label, double value) {
                oss << "  " << std::left << std::setw(21) << label << std::right
                    << std::fixed << std::setprecision(4) << value * 100.0 << "%\n";
            };
            auto num = [&oss](const char *label, double value) {
                oss << "  " << std::left << std::setw(21) << label << std::right
                    << std::fixed << std::setprecision(4) << value << "\n";
            };

            oss << "\nDownside & Tail:\n";
            pct("Win Rate:", win_rate());
            pct("Downside Deviation:", downside_deviation());
            pct("VaR (95%, Hist):", value_at_risk(0.95));
            pct("CVaR (95%, Hist):", conditional_var(0.95));
            num("Sortino Ratio:", sortino_ratio());
            num("Calmar Ratio:", calmar_ratio());

            const DrawdownInfo &dd = worst_drawdown_;
            oss << "\nWorst Drawdown: " << dd.peak_date << " -> " << dd.trough_date
                << " (" << dd.duration_days << " days), ";
            if (dd.recovery_days < 0)
            {
                oss << "not recovered\n";
            }
            else
            {
                oss << "recovered " << dd.recovery_date << " after " << dd.recovery_days << " days\n";
            }
            return oss.str();
        }

        std::string PerformanceMetrics::to_json() const
        {
            const DrawdownInfo &dd = worst_drawdown_;
            nlohmann::json j = {
                {"return_metrics", {{"total_return", total_return()},
                                    {"annualized_return", annualized_return()},
                                    {"win_rate", win_rate()},
                                    {"best_day", best_day()},
                                    {"worst_day", worst_day()}}},
                {"risk_metrics", {{"annualized_volatility", annualized_volatility()},
                                  {"downside_deviation", downside_deviation()},
                                  {"max_drawdown", max_drawdown()},
                                  {"var_95_historical", value_at_risk(0.95)},
                                  {"cvar_95_historical", conditional_var(0.95)}}},
                {"risk_adjusted", {{"sharpe_ratio", sharpe_ratio()},
                                   {"sortino_ratio", sortino_ratio()},
                                   {"calmar_ratio", calmar_ratio()}}},
                {"max_drawdown_detail", {{"depth", dd.depth},
                                         {"duration_days", dd.duration_days},
                                         {"recovery_days", dd.recovery_days},
                                         {"peak_date", dd.peak_date},
                                         {"trough_date", dd.trough_date},
                                         {"recovery_date", dd.recovery_date}}},
                {"settings", {{"risk_free_rate", risk_free_rate_},
                              {"trading_days_per_year", trading_days_per_year_},
                              {"num_observations", static_cast<int>(nav_series_.size())}}}};
            return j.dump(2);
        }

        void PerformanceMetrics::to_csv(const std::string &filepath) const
        {
            const std::filesystem::path path(filepath);
            if (path.has_parent_path())
            {
                std::filesystem::create_directories(path.parent_path());
            }
            std::ofstream out(path);
            if (!out)
            {
                throw std::runtime_error("Cannot write metrics to " + filepath);
            }

            out << "date,equity,return,drawdown\n" << std::fixed << std::setprecision(8);
            for (size_t i = 0; i < nav_series_.size(); ++i)
            {
                out << dates_[i] << ',' << nav_series_[i] << ',';
                // No return on the first date
                if (i > 0)
                {
                    out << return_series_[i - 1];
                }
                out << ',' << drawdown_series_[i] << '\n';
            }
        }

    } // namespace analytics
} // namespace allocsim
