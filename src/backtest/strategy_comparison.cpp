#include "allocsim/backtest/strategy_comparison.hpp"
#include "allocsim/analytics/performance_metrics.hpp"

#include <algorithm>
#include <future>
#include <iomanip>
#include <stdexcept>

namespace allocsim {
namespace backtest {

static BacktestResult run_one(const BacktestEngine& engine,
                              const data::MarketData& market_data,
                              const policy::PolicyFactory& factory) {
    std::unique_ptr<policy::AllocationPolicy> policy = factory();
    if (!policy) {
        throw std::invalid_argument("policy factory returned a null policy");
    }
    return engine.run(market_data, *policy);
}

std::vector<BacktestResult> compare_strategies(const data::MarketData& market_data,
                                               const BacktestParams& params,
                                               const std::vector<policy::PolicyFactory>& factories,
                                               size_t max_parallel) {
    for (const auto& factory : factories) {
        if (!factory) throw std::invalid_argument("empty policy factory");
    }

    const BacktestEngine engine(params);
    std::vector<BacktestResult> results;
    results.reserve(factories.size());

    if (max_parallel <= 1) {
        for (const auto& factory : factories) {
            results.push_back(run_one(engine, market_data, factory));
        }
        return results;
    }

    for (size_t batch_start = 0; batch_start < factories.size(); batch_start += max_parallel) {
        size_t batch_end = std::min(factories.size(), batch_start + max_parallel);

        std::vector<std::future<BacktestResult>> futures;
        futures.reserve(batch_end - batch_start);
        for (size_t i = batch_start; i < batch_end; ++i) {
            const policy::PolicyFactory& factory = factories[i];
            futures.push_back(std::async(std::launch::async, [&engine, &market_data, &factory]() {
                return run_one(engine, market_data, factory);
            }));
        }

        for (auto& fut : futures) {
            results.push_back(fut.get());
        }
    }
    return results;
}

void print_comparison(const std::vector<BacktestResult>& results, std::ostream& out) {
    out << "\n--- Strategy Comparison ---\n";
    out << std::left << std::setw(24) << "Strategy"
        << std::right << std::setw(14) << "Final Equity"
        << std::setw(12) << "Total %"
        << std::setw(12) << "Annual %"
        << std::setw(10) << "Vol %"
        << std::setw(10) << "Sharpe"
        << std::setw(10) << "MaxDD %"
        << std::setw(8) << "Trades" << "\n";

    out << std::fixed;
    for (const auto& r : results) {
        const auto& p = r.performance;
        out << std::left << std::setw(24) << r.strategy_name << std::right
            << std::setw(14) << std::setprecision(2) << p.end_equity
            << std::setw(12) << p.total_return * 100.0
            << std::setw(12) << p.annualized_return * 100.0
            << std::setw(10) << p.annualized_volatility * 100.0
            << std::setw(10) << std::setprecision(3) << p.sharpe_ratio
            << std::setw(10) << std::setprecision(2) << p.max_drawdown * 100.0
            << std::setw(8) << p.trade_count << "\n";
    }

    // Benchmark-relative figures need at least two daily returns.
    if (results.size() < 2 || results.front().equity_curve.size() < 3) return;

    const analytics::PerformanceMetrics benchmark = results.front().compute_analytics();
    out << "\nRelative to " << results.front().strategy_name << ":\n";
    out << std::left << std::setw(24) << "Strategy"
        << std::right << std::setw(10) << "Beta"
        << std::setw(12) << "Active %"
        << std::setw(12) << "TE %"
        << std::setw(12) << "Info Ratio" << "\n";
    for (size_t i = 1; i < results.size(); ++i) {
        const analytics::PerformanceMetrics m = results[i].compute_analytics();
        out << std::left << std::setw(24) << results[i].strategy_name << std::right
            << std::setw(10) << std::setprecision(3) << m.beta(benchmark)
            << std::setw(12) << std::setprecision(2) << m.active_return(benchmark) * 100.0
            << std::setw(12) << m.tracking_error(benchmark) * 100.0
            << std::setw(12) << std::setprecision(3) << m.information_ratio(benchmark) << "\n";
    }
}

} // namespace backtest
} // namespace allocsim
