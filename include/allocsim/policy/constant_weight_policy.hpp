#ifndef ALLOCSIM_POLICY_CONSTANT_WEIGHT_POLICY_HPP
#define ALLOCSIM_POLICY_CONSTANT_WEIGHT_POLICY_HPP

#include "allocsim/policy/allocation_policy.hpp"

namespace allocsim
{
    namespace policy
    {

        /**
         * @class ConstantWeightPolicy
         * @brief Returns the same target weights on every rebalance date.
         *
         * With an empty weight set and ALL_CASH semantics the policy holds
         * only cash.
         */
        class ConstantWeightPolicy : public AllocationPolicy
        {
        public:
            /**
             * @param name Display name
             * @param weights Percent weights (each in [0, 100], sum <= 100)
             * @param empty_semantics Meaning of an empty weight set
             * @throws std::invalid_argument On negative, non-finite or over-allocated weights
             */
            ConstantWeightPolicy(const std::string &name,
                                 const TargetAllocation &weights,
                                 EmptyAllocation empty_semantics = EmptyAllocation::NO_CHANGE);

            TargetAllocation calculate_allocation(const std::string &date,
                                                  const data::LookbackViews &history,
                                                  const backtest::PortfolioSnapshot &portfolio,
                                                  const data::PriceMap &current_prices) override;

            std::string name() const override { return name_; }
            EmptyAllocation empty_allocation() const override { return empty_semantics_; }

            const TargetAllocation &weights() const { return weights_; }

        private:
            std::string name_;
            TargetAllocation weights_;
            EmptyAllocation empty_semantics_;
        };

    } // namespace policy
} // namespace allocsim

#endif // ALLOCSIM_POLICY_CONSTANT_WEIGHT_POLICY_HPP
