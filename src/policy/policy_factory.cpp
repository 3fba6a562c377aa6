#include "allocsim/policy/policy_factory.hpp"
#include "allocsim/policy/constant_weight_policy.hpp"
#include "allocsim/policy/ensemble_policy.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace allocsim
{
    namespace policy
    {

        namespace
        {
            std::string to_lower(std::string s)
            {
                std::transform(s.begin(), s.end(), s.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                return s;
            }

            EmptyAllocation parse_empty_semantics(const nlohmann::json &j)
            {
                return j.value("empty_means_cash", false) ? EmptyAllocation::ALL_CASH
                                                          : EmptyAllocation::NO_CHANGE;
            }

            std::unique_ptr<AllocationPolicy> make_constant_weight(const nlohmann::json &j,
                                                                   const std::string &name)
            {
                TargetAllocation weights;
                if (j.contains("weights"))
                {
                    const auto &w = j.at("weights");
                    if (!w.is_object())
                    {
                        throw std::invalid_argument("'weights' of policy '" + name + "' must be an object");
                    }
                    for (auto it = w.begin(); it != w.end(); ++it)
                    {
                        weights[it.key()] = it.value().get<double>();
                    }
                }
                return std::make_unique<ConstantWeightPolicy>(name, weights, parse_empty_semantics(j));
            }

            std::unique_ptr<AllocationPolicy> make_ensemble(const nlohmann::json &j,
                                                            const std::string &name)
            {
                if (!j.contains("members") || !j.at("members").is_array())
                {
                    throw std::invalid_argument("Ensemble policy '" + name + "' requires a 'members' array");
                }
                std::vector<EnsembleMember> members;
                for (const auto &entry : j.at("members"))
                {
                    if (!entry.contains("policy"))
                    {
                        throw std::invalid_argument("Ensemble member of '" + name + "' is missing 'policy'");
                    }
                    EnsembleMember m;
                    m.weight = entry.value("weight", 1.0);
                    m.policy = make_policy(entry.at("policy"));
                    members.push_back(std::move(m));
                }
                return std::make_unique<EnsemblePolicy>(name, std::move(members));
            }
        } // namespace

        std::unique_ptr<AllocationPolicy> make_policy(const nlohmann::json &j)
        {
            if (!j.is_object())
            {
                throw std::invalid_argument("Policy configuration must be a JSON object");
            }
            std::string type = to_lower(j.value("type", std::string("constant_weight")));
            std::string name = j.value("name", type);

            if (type == "constant_weight" || type == "constant" || type == "fixed")
            {
                return make_constant_weight(j, name);
            }
            if (type == "ensemble")
            {
                return make_ensemble(j, name);
            }
            throw std::invalid_argument("Unknown policy type: " + type);
        }

        PolicyFactory make_policy_factory(const nlohmann::json &j)
        {
            // Build once up front so configuration errors surface before any run.
            make_policy(j);
            nlohmann::json config = j;
            return [config]() { return make_policy(config); };
        }

        std::vector<PolicyFactory> make_policy_factories(const nlohmann::json &strategies)
        {
            if (!strategies.is_array())
            {
                throw std::invalid_argument("'strategies' must be an array");
            }
            std::vector<PolicyFactory> factories;
            for (const auto &entry : strategies)
            {
                factories.push_back(make_policy_factory(entry));
            }
            return factories;
        }

        std::vector<std::string> available_policy_types()
        {
            return {"constant_weight", "ensemble"};
        }

    } // namespace policy
} // namespace allocsim
