#include "allocsim/policy/constant_weight_policy.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace allocsim
{
    namespace policy
    {

        ConstantWeightPolicy::ConstantWeightPolicy(const std::string &name,
                                                   const TargetAllocation &weights,
                                                   EmptyAllocation empty_semantics)
            : name_(name), weights_(weights), empty_semantics_(empty_semantics)
        {
            double total = 0.0;
            for (const auto &entry : weights_)
            {
                if (!std::isfinite(entry.second) || entry.second < 0.0 || entry.second > 100.0)
                {
                    std::ostringstream ss;
                    ss << entry.second;
                    throw std::invalid_argument("Expected weight in [0, 100] for '" + entry.first + "', got: " + ss.str());
                }
                total += entry.second;
            }
            if (total > 100.0 + 1e-9)
            {
                std::ostringstream ss;
                ss << total;
                throw std::invalid_argument("Weights of policy '" + name + "' sum to " + ss.str() + "%, more than 100%");
            }
        }

        TargetAllocation ConstantWeightPolicy::calculate_allocation(const std::string &date,
                                                                    const data::LookbackViews &history,
                                                                    const backtest::PortfolioSnapshot &portfolio,
                                                                    const data::PriceMap &current_prices)
        {
            (void)date;
            (void)history;
            (void)portfolio;
            (void)current_prices;
            return weights_;
        }

    } // namespace policy
} // namespace allocsim
