#ifndef ALLOCSIM_BACKTEST_BACKTEST_ENGINE_HPP
#define ALLOCSIM_BACKTEST_BACKTEST_ENGINE_HPP

#include <memory>
#include <string>
#include <vector>
#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include "allocsim/data/market_data.hpp"
#include "allocsim/backtest/backtest_result.hpp"
#include "allocsim/backtest/portfolio.hpp"
#include "allocsim/backtest/rebalance_scheduler.hpp"
#include "allocsim/backtest/trade_logger.hpp"
#include "allocsim/backtest/transaction_cost_model.hpp"
#include "allocsim/policy/allocation_policy.hpp"

namespace allocsim
{
    namespace backtest
    {

        struct BacktestParams
        {
            double initial_cash = 100000.0;
            std::string start_date;               ///< Inclusive; empty = first available date
            std::string end_date;                 ///< Inclusive; empty = last available date
            RebalanceConfig rebalance;
            TransactionCostConfig transaction_costs;
            double risk_free_rate = 0.02;
            double cash_interest_rate = 0.0;      ///< Annual rate credited daily on positive cash
            double min_trade_weight = 1e-4;       ///< Skip trades moving a weight by less than this
            bool fractional_shares = true;
            double cash_tolerance = 1e-6;
            double allocation_tolerance = 0.01;   ///< Percentage points allowed above 100 before scaling
            long long time_budget_ms = 0;         ///< 0 disables the budget
            bool verbose = false;
            int trading_days_per_year = 252;

            /**
             * @throws ConfigurationError On invalid or unknown values.
             */
            static BacktestParams from_json(const nlohmann::json &j);

            /**
             * @throws ConfigurationError Describing the first invalid parameter.
             */
            void validate() const;
        };

        /**
         * @brief Convert a percent allocation into fractions aligned with symbols.
         *
         * The key "CASH" is ignored unless it is a symbol of the universe.
         * Values are clamped to [0, 100]; if they sum to more than
         * 100 + tolerance_pct they are scaled down proportionally.
         *
         * @throws PolicyError On a non-finite value or a symbol outside the universe.
         */
        Eigen::VectorXd normalize_allocation(const policy::TargetAllocation &allocation,
                                             const std::vector<std::string> &symbols,
                                             double tolerance_pct,
                                             const std::string &policy_name,
                                             const std::string &date);

        /**
         * @class BacktestEngine
         * @brief Runs one allocation policy over a multi-symbol dataset.
         *
         * The engine holds configuration only; every run builds its own
         * ledger, scheduler and trade log, so one engine may serve several
         * runs, including concurrent ones with distinct policy instances.
         */
        class BacktestEngine
        {
        public:
            /**
             * @throws ConfigurationError If params fail validation.
             */
            explicit BacktestEngine(const BacktestParams &params);
            BacktestEngine(const BacktestParams &params, std::shared_ptr<const CostModel> cost_model);
            ~BacktestEngine() = default;

            /**
             * @brief Simulate policy over market_data.
             *
             * @throws ConfigurationError If the dataset is empty or no trading
             *         date falls inside [start_date, end_date].
             * @throws MissingPriceError, InsufficientCashError, PolicyError,
             *         TimeBudgetExceeded On fatal mid-run conditions.
             */
            BacktestResult run(const data::MarketData &market_data,
                               policy::AllocationPolicy &policy) const;

            const BacktestParams &params() const { return params_; }
            const CostModel &cost_model() const { return *cost_model_; }

        private:
            BacktestParams params_;
            std::shared_ptr<const CostModel> cost_model_;
        };

    } // namespace backtest
} // namespace allocsim

#endif // ALLOCSIM_BACKTEST_BACKTEST_ENGINE_HPP
