#ifndef ALLOCSIM_POLICY_ENSEMBLE_POLICY_HPP
#define ALLOCSIM_POLICY_ENSEMBLE_POLICY_HPP

#include "allocsim/policy/allocation_policy.hpp"

#include <memory>
#include <vector>

namespace allocsim
{
    namespace policy
    {

        struct EnsembleMember
        {
            std::unique_ptr<AllocationPolicy> policy;
            double weight = 1.0;
        };

        /**
         * @class EnsemblePolicy
         * @brief Weighted average of several member policies' allocations.
         *
         * Members are blended with their weights normalized to sum to one.
         * A member returning an empty mapping contributes zeros if it
         * declares ALL_CASH, or its previous allocation if it declares
         * NO_CHANGE. A NO_CHANGE member with no previous allocation is left
         * out, and the remaining weights are renormalized over the members
         * that contributed.
         *
         * The ensemble itself declares NO_CHANGE: it returns an empty mapping
         * only while no member has produced anything.
         */
        class EnsemblePolicy : public AllocationPolicy
        {
        public:
            /**
             * @throws std::invalid_argument If members is empty, a member is null,
             *         or a weight is not positive and finite
             */
            EnsemblePolicy(const std::string &name, std::vector<EnsembleMember> members);

            TargetAllocation calculate_allocation(const std::string &date,
                                                  const data::LookbackViews &history,
                                                  const backtest::PortfolioSnapshot &portfolio,
                                                  const data::PriceMap &current_prices) override;

            std::string name() const override { return name_; }

            void on_start(const std::vector<std::string> &symbols,
                          const std::string &start_date,
                          const std::string &end_date) override;
            void on_finish(const backtest::PortfolioSnapshot &final_portfolio) override;

            size_t num_members() const { return members_.size(); }

        private:
            std::string name_;
            std::vector<EnsembleMember> members_;
            std::vector<TargetAllocation> last_allocations_;
            std::vector<bool> has_last_;
        };

    } // namespace policy
} // namespace allocsim

#endif // ALLOCSIM_POLICY_ENSEMBLE_POLICY_HPP
