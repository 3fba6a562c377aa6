#ifndef ALLOCSIM_BACKTEST_STRATEGY_COMPARISON_HPP
#define ALLOCSIM_BACKTEST_STRATEGY_COMPARISON_HPP

#include "allocsim/backtest/backtest_engine.hpp"
#include "allocsim/policy/allocation_policy.hpp"

#include <ostream>
#include <vector>

namespace allocsim {
namespace backtest {

/**
 * @brief Run one independent backtest per policy factory.
 *
 * Each run gets a fresh policy from its factory and its own ledger; only
 * the read-only market data and engine configuration are shared. Up to
 * max_parallel runs execute concurrently (1 = sequential). Results are
 * returned in factory order, and the first failing run's exception
 * propagates to the caller.
 *
 * @throws std::invalid_argument If a factory is empty or returns null.
 */
std::vector<BacktestResult> compare_strategies(const data::MarketData& market_data,
                                               const BacktestParams& params,
                                               const std::vector<policy::PolicyFactory>& factories,
                                               size_t max_parallel = 4);

/**
 * @brief Side-by-side table of headline metrics, followed by beta, active
 * return, tracking error and information ratio against the first result.
 */
void print_comparison(const std::vector<BacktestResult>& results, std::ostream& out);

} // namespace backtest
} // namespace allocsim

#endif // ALLOCSIM_BACKTEST_STRATEGY_COMPARISON_HPP
