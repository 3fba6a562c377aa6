/**
 * @file allocation_policy.hpp
 * @brief Abstract interface for allocation policies
 *
 * A policy is consulted by the backtester on rebalance dates and answers
 * with target weights in percent (0-100) per symbol. Whatever is not
 * allocated stays in cash.
 *
 * A policy only ever sees history cut at the evaluation date, a read-only
 * snapshot of the ledger and the prices of symbols trading that day.
 */

#ifndef ALLOCSIM_POLICY_ALLOCATION_POLICY_HPP
#define ALLOCSIM_POLICY_ALLOCATION_POLICY_HPP

#include "allocsim/backtest/portfolio.hpp"
#include "allocsim/data/market_data.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace allocsim
{
    namespace policy
    {

        /// Symbol -> target weight in percent of equity.
        using TargetAllocation = std::map<std::string, double>;

        /**
         * @brief What an empty TargetAllocation means for a policy.
         */
        enum class EmptyAllocation
        {
            NO_CHANGE, ///< Keep the current holdings, trade nothing
            ALL_CASH   ///< Liquidate everything tradeable
        };

        /**
         * @class AllocationPolicy
         * @brief Abstract base class for allocation policies
         *
         * Implementations must not keep references to the views or snapshot
         * past the call. Internal state carried between calls is allowed, but
         * a policy instance belongs to exactly one run.
         */
        class AllocationPolicy
        {
        public:
            virtual ~AllocationPolicy() = default;

            /**
             * @brief Target weights for the given date.
             *
             * @param date Evaluation date (YYYY-MM-DD)
             * @param history Per-symbol bars on or before date
             * @param portfolio Ledger state marked at date
             * @param current_prices Closes of the symbols with a bar on date
             * @return Percent weights; an empty mapping is interpreted through
             *         empty_allocation()
             */
            virtual TargetAllocation calculate_allocation(const std::string &date,
                                                          const data::LookbackViews &history,
                                                          const backtest::PortfolioSnapshot &portfolio,
                                                          const data::PriceMap &current_prices) = 0;

            virtual std::string name() const = 0;

            virtual EmptyAllocation empty_allocation() const { return EmptyAllocation::NO_CHANGE; }

            /** @brief Called once before the first date of a run. */
            virtual void on_start(const std::vector<std::string> &symbols,
                                  const std::string &start_date,
                                  const std::string &end_date)
            {
                (void)symbols;
                (void)start_date;
                (void)end_date;
            }

            /** @brief Called once after the last date of a run. */
            virtual void on_finish(const backtest::PortfolioSnapshot &final_portfolio)
            {
                (void)final_portfolio;
            }
        };

        /// Builds a fresh policy instance for one run.
        using PolicyFactory = std::function<std::unique_ptr<AllocationPolicy>()>;

    } // namespace policy
} // namespace allocsim

#endif // ALLOCSIM_POLICY_ALLOCATION_POLICY_HPP
