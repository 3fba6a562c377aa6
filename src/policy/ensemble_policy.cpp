#include "allocsim/policy/ensemble_policy.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace allocsim
{
    namespace policy
    {

        EnsemblePolicy::EnsemblePolicy(const std::string &name, std::vector<EnsembleMember> members)
            : name_(name), members_(std::move(members))
        {
            if (members_.empty())
            {
                throw std::invalid_argument("EnsemblePolicy '" + name_ + "' needs at least one member");
            }
            for (const auto &m : members_)
            {
                if (!m.policy)
                {
                    throw std::invalid_argument("EnsemblePolicy '" + name_ + "' has a null member");
                }
                if (!std::isfinite(m.weight) || m.weight <= 0.0)
                {
                    std::ostringstream ss;
                    ss << m.weight;
                    throw std::invalid_argument("Expected positive value for member weight of '" + m.policy->name() + "', got: " + ss.str());
                }
            }
            last_allocations_.resize(members_.size());
            has_last_.assign(members_.size(), false);
        }

        TargetAllocation EnsemblePolicy::calculate_allocation(const std::string &date,
                                                              const data::LookbackViews &history,
                                                              const backtest::PortfolioSnapshot &portfolio,
                                                              const data::PriceMap &current_prices)
        {
            TargetAllocation blended;
            double contributing_weight = 0.0;

            for (size_t i = 0; i < members_.size(); ++i)
            {
                EnsembleMember &m = members_[i];
                TargetAllocation alloc = m.policy->calculate_allocation(date, history, portfolio, current_prices);

                if (alloc.empty() && m.policy->empty_allocation() == EmptyAllocation::NO_CHANGE)
                {
                    if (!has_last_[i])
                    {
                        continue;
                    }
                    alloc = last_allocations_[i];
                }
                else
                {
                    last_allocations_[i] = alloc;
                    has_last_[i] = true;
                }

                contributing_weight += m.weight;
                for (const auto &entry : alloc)
                {
                    blended[entry.first] += m.weight * entry.second;
                }
            }

            if (contributing_weight <= 0.0)
            {
                return TargetAllocation{};
            }

            // Members skipped above do not dilute the others.
            for (auto &entry : blended)
            {
                entry.second /= contributing_weight;
            }

            // Name every symbol so an all-zero blend still reads as "all cash".
            for (const auto &entry : history)
            {
                blended.emplace(entry.first, 0.0);
            }
            return blended;
        }

        void EnsemblePolicy::on_start(const std::vector<std::string> &symbols,
                                      const std::string &start_date,
                                      const std::string &end_date)
        {
            for (auto &m : members_)
            {
                m.policy->on_start(symbols, start_date, end_date);
            }
            for (size_t i = 0; i < members_.size(); ++i)
            {
                last_allocations_[i].clear();
                has_last_[i] = false;
            }
        }

        void EnsemblePolicy::on_finish(const backtest::PortfolioSnapshot &final_portfolio)
        {
            for (auto &m : members_)
            {
                m.policy->on_finish(final_portfolio);
            }
        }

    } // namespace policy
} // namespace allocsim
