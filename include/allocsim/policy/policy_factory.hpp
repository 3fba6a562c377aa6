/**
 * @file policy_factory.hpp
 * @brief Builds reference policies from JSON configuration
 *
 * Example configuration:
 * @code{.json}
 * { "name": "60/40", "type": "constant_weight",
 *   "weights": {"SPY": 60, "TLT": 40}, "empty_means_cash": false }
 *
 * { "name": "blend", "type": "ensemble",
 *   "members": [ {"weight": 2, "policy": {...}}, {"weight": 1, "policy": {...}} ] }
 * @endcode
 */

#ifndef ALLOCSIM_POLICY_POLICY_FACTORY_HPP
#define ALLOCSIM_POLICY_POLICY_FACTORY_HPP

#include "allocsim/policy/allocation_policy.hpp"

#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace allocsim
{
    namespace policy
    {

        /**
         * @brief Create a policy from its JSON description.
         * @throws std::invalid_argument On an unknown type or invalid parameters
         */
        std::unique_ptr<AllocationPolicy> make_policy(const nlohmann::json &j);

        /**
         * @brief Factory that builds a fresh policy from j on every call.
         */
        PolicyFactory make_policy_factory(const nlohmann::json &j);

        /**
         * @brief One factory per entry of a "strategies" array.
         */
        std::vector<PolicyFactory> make_policy_factories(const nlohmann::json &strategies);

        /**
         * @brief Supported policy type names.
         */
        std::vector<std::string> available_policy_types();

    } // namespace policy
} // namespace allocsim

#endif // ALLOCSIM_POLICY_POLICY_FACTORY_HPP
