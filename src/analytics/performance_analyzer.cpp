#include "allocsim/analytics/performance_analyzer.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace allocsim
{
    namespace analytics
    {

        double max_drawdown(const backtest::EquityCurve &equity_curve)
        {
            double peak = 0.0;
            double worst = 0.0;
            for (const auto &point : equity_curve)
            {
                peak = std::max(peak, point.equity);
                if (peak <= 0.0)
                {
                    continue;
                }
                double dd = point.equity / peak - 1.0;
                worst = std::min(worst, dd);
            }
            return std::max(-1.0, worst);
        }

        PerformanceSummary analyze(const backtest::EquityCurve &equity_curve,
                                   int trade_count,
                                   double risk_free_rate,
                                   int periods_per_year)
        {
            if (periods_per_year <= 0)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'periods_per_year', got: " + std::to_string(periods_per_year));
            }

            PerformanceSummary s;
            s.trade_count = trade_count;
            s.num_points = static_cast<int>(equity_curve.size());
            if (!equity_curve.empty())
            {
                s.start_date = equity_curve.front().date;
                s.end_date = equity_curve.back().date;
                s.start_equity = equity_curve.front().equity;
                s.end_equity = equity_curve.back().equity;
            }

            const int n = s.num_points;
            if (n < 2 || !(s.start_equity > 0.0))
            {
                s.insufficient_data = true;
                return s;
            }
            s.insufficient_data = false;

            s.total_return = s.end_equity / s.start_equity - 1.0;
            double growth = std::max(0.0, 1.0 + s.total_return);
            s.annualized_return = std::pow(growth, static_cast<double>(periods_per_year) / n) - 1.0;

            Eigen::VectorXd returns(n - 1);
            for (int i = 1; i < n; ++i)
            {
                double prev = equity_curve[static_cast<size_t>(i - 1)].equity;
                double cur = equity_curve[static_cast<size_t>(i)].equity;
                returns[i - 1] = prev > 0.0 ? cur / prev - 1.0 : 0.0;
            }

            if (returns.size() >= 2)
            {
                double mean = returns.mean();
                double variance = (returns.array() - mean).square().sum() / static_cast<double>(returns.size() - 1);
                s.annualized_volatility = std::sqrt(variance) * std::sqrt(static_cast<double>(periods_per_year));
            }

            // Rounding-level volatility counts as zero.
            if (s.annualized_volatility > 1e-12)
            {
                s.sharpe_ratio = (s.annualized_return - risk_free_rate) / s.annualized_volatility;
            }

            s.max_drawdown = max_drawdown(equity_curve);
            return s;
        }

        nlohmann::json PerformanceSummary::to_json() const
        {
            nlohmann::json j;
            j["total_return"] = total_return;
            j["annualized_return"] = annualized_return;
            j["annualized_volatility"] = annualized_volatility;
            j["sharpe_ratio"] = sharpe_ratio;
            j["max_drawdown"] = max_drawdown;
            j["trade_count"] = trade_count;
            j["num_points"] = num_points;
            j["start_date"] = start_date;
            j["end_date"] = end_date;
            j["start_equity"] = start_equity;
            j["end_equity"] = end_equity;
            j["insufficient_data"] = insufficient_data;
            return j;
        }

        std::string PerformanceSummary::to_string() const
        {
            std::ostringstream oss;
            oss << std::fixed;
            if (insufficient_data)
            {
                oss << "  (insufficient data: " << num_points << " point(s))\n";
                return oss.str();
            }
            oss << "  Period:              " << start_date << " .. " << end_date << "\n";
            oss << "  Final Equity:        " << std::setprecision(2) << end_equity << "\n";
            oss << "  Total Return:        " << std::setprecision(4) << total_return * 100.0 << "%\n";
            oss << "  Annualized Return:   " << std::setprecision(4) << annualized_return * 100.0 << "%\n";
            oss << "  Annualized Vol:      " << std::setprecision(4) << annualized_volatility * 100.0 << "%\n";
            oss << "  Sharpe Ratio:        " << std::setprecision(4) << sharpe_ratio << "\n";
            oss << "  Max Drawdown:        " << std::setprecision(4) << max_drawdown * 100.0 << "%\n";
            oss << "  Trades:              " << trade_count << "\n";
            return oss.str();
        }

    } // namespace analytics
} // namespace allocsim
