
#include "allocsim/backtest/backtest_result.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>

namespace allocsim
{
    namespace backtest
    {

        std::vector<double> BacktestResult::nav_series() const
        {
            std::vector<double> out;
            out.reserve(equity_curve.size());
            for (const auto &point : equity_curve)
                out.push_back(point.equity);
            return out;
        }

        std::vector<std::string> BacktestResult::dates() const
        {
            std::vector<std::string> out;
            out.reserve(equity_curve.size());
            for (const auto &point : equity_curve)
                out.push_back(point.date);
            return out;
        }

        analytics::PerformanceMetrics BacktestResult::compute_analytics() const
        {
            return analytics::PerformanceMetrics(equity_curve, risk_free_rate, trading_days_per_year);
        }

        void BacktestResult::print_summary() const
        {
            std::cout << "\n=== " << strategy_name << " ===\n";
            std::cout << performance.to_string();
            std::cout << "  Rebalances:          " << trade_summary.rebalance_count << "\n";
            std::cout << "  Turnover:            " << std::fixed << std::setprecision(4) << trade_summary.turnover << "\n";
            std::cout << "  Total Costs:         " << std::setprecision(2) << trade_summary.total_costs << "\n";
        }

        void BacktestResult::export_equity_to_csv(const std::string &filepath) const
        {
            std::filesystem::path path(filepath);
            if (path.has_parent_path())
                std::filesystem::create_directories(path.parent_path());

            std::ofstream out(filepath);
            if (!out)
                throw std::runtime_error("unable to open file for writing: " + filepath);

            out << "date,equity,daily_return,cumulative_return\n";
            out << std::fixed << std::setprecision(8);
            for (size_t i = 0; i < equity_curve.size(); ++i)
            {
                double daily = 0.0;
                if (i > 0 && equity_curve[i - 1].equity > 0.0)
                    daily = equity_curve[i].equity / equity_curve[i - 1].equity - 1.0;
                double cum = equity_curve.front().equity > 0.0
                                 ? equity_curve[i].equity / equity_curve.front().equity - 1.0
                                 : 0.0;
                out << equity_curve[i].date << "," << equity_curve[i].equity << "," << daily << "," << cum << "\n";
            }
        }

        std::string BacktestResult::export_analytics_json() const
        {
            nlohmann::json j;
            j["strategy"] = strategy_name;
            j["summary"] = performance.to_json();

            j["trades"]["total_trades"] = trade_summary.total_trades;
            j["trades"]["buy_trades"] = trade_summary.buy_trades;
            j["trades"]["sell_trades"] = trade_summary.sell_trades;
            j["trades"]["total_notional"] = trade_summary.total_notional;
            j["trades"]["total_costs"] = trade_summary.total_costs;
            j["trades"]["rebalance_count"] = trade_summary.rebalance_count;
            j["trades"]["turnover"] = trade_summary.turnover;
            j["trades"]["max_rebalance_turnover"] = trade_summary.max_rebalance_turnover;
            j["trades"]["by_reason"] = trade_summary.trades_by_reason;

            if (!performance.insufficient_data)
                j["metrics"] = nlohmann::json::parse(compute_analytics().to_json());

            return j.dump(2);
        }

    } // namespace backtest
} // namespace allocsim
