#include <catch2/catch.hpp>

#include "allocsim/backtest/errors.hpp"
#include "allocsim/backtest/strategy_comparison.hpp"
#include "allocsim/data/data_loader.hpp"
#include "allocsim/policy/constant_weight_policy.hpp"
#include "allocsim/policy/policy_factory.hpp"

#include <sstream>
#include <stdexcept>

using namespace allocsim;
using namespace allocsim::backtest;
using Catch::Matchers::WithinAbs;

namespace {

data::MarketData synthetic_market() {
    return data::DataLoader::generate_synthetic_data({"AAA", "BBB", "CCC"}, 120, "2021-01-04", 0.012, 0.0002, 7);
}

policy::PolicyFactory constant(const std::string& name, const policy::TargetAllocation& weights) {
    return [name, weights]() { return std::make_unique<policy::ConstantWeightPolicy>(name, weights); };
}

class FailingPolicy : public policy::AllocationPolicy {
public:
    policy::TargetAllocation calculate_allocation(const std::string&, const data::LookbackViews&,
                                                  const PortfolioSnapshot&, const data::PriceMap&) override {
        throw std::runtime_error("no allocation today");
    }
    std::string name() const override { return "failing"; }
};

} // namespace

TEST_CASE("Strategy comparison", "[StrategyComparison]") {
    auto md = synthetic_market();
    BacktestParams params;
    params.rebalance.frequency = RebalanceFrequency::MONTHLY;
    params.transaction_costs.commission_rate = 0.0005;

    std::vector<policy::PolicyFactory> factories = {
        constant("aaa_only", {{"AAA", 100.0}}),
        constant("balanced", {{"AAA", 40.0}, {"BBB", 40.0}, {"CCC", 20.0}}),
        constant("defensive", {{"BBB", 30.0}, {"CASH", 70.0}}),
        constant("idle", {{"CASH", 100.0}})};

    SECTION("Results follow factory order") {
        auto results = compare_strategies(md, params, factories);
        REQUIRE(results.size() == 4);
        REQUIRE(results[0].strategy_name == "aaa_only");
        REQUIRE(results[3].strategy_name == "idle");
        REQUIRE_THAT(results[3].equity_curve.back().equity, WithinAbs(params.initial_cash, 1e-9));
    }

    SECTION("Parallel runs match sequential runs") {
        auto sequential = compare_strategies(md, params, factories, 1);
        auto parallel = compare_strategies(md, params, factories, 4);
        REQUIRE(sequential.size() == parallel.size());
        for (size_t i = 0; i < sequential.size(); ++i) {
            REQUIRE(sequential[i].strategy_name == parallel[i].strategy_name);
            REQUIRE(sequential[i].trades.size() == parallel[i].trades.size());
            REQUIRE(sequential[i].equity_curve.back().equity == parallel[i].equity_curve.back().equity);
        }
    }

    SECTION("Runs are independent of their neighbours") {
        auto alone = compare_strategies(md, params, {factories[1]}, 1);
        auto together = compare_strategies(md, params, factories, 3);
        REQUIRE(alone[0].equity_curve.back().equity == together[1].equity_curve.back().equity);
    }

    SECTION("Comparison table") {
        auto results = compare_strategies(md, params, factories, 2);
        std::ostringstream out;
        print_comparison(results, out);
        const std::string table = out.str();
        REQUIRE(table.find("Strategy Comparison") != std::string::npos);
        REQUIRE(table.find("balanced") != std::string::npos);
        REQUIRE(table.find("defensive") != std::string::npos);
        REQUIRE(table.find("Relative to aaa_only") != std::string::npos);
        REQUIRE(table.find("Info Ratio") != std::string::npos);
    }

    SECTION("Benchmark-relative metrics against the first strategy") {
        auto results = compare_strategies(md, params, factories, 2);
        const auto benchmark = results[0].compute_analytics();
        REQUIRE_THAT(results[0].compute_analytics().beta(benchmark), WithinAbs(1.0, 1e-9));
        // Cash never moves with the benchmark
        REQUIRE(results[3].compute_analytics().beta(benchmark) == 0.0);
        REQUIRE(results[1].compute_analytics().tracking_error(benchmark) > 0.0);
    }
}

TEST_CASE("Strategy comparison from configuration", "[StrategyComparison]") {
    auto md = synthetic_market();
    nlohmann::json strategies = nlohmann::json::parse(R"([
        {"name": "static", "type": "constant_weight", "weights": {"AAA": 50, "BBB": 50}},
        {"name": "blend", "type": "ensemble", "members": [
            {"weight": 1, "policy": {"name": "a", "type": "constant_weight", "weights": {"AAA": 100}}},
            {"weight": 1, "policy": {"name": "c", "type": "constant_weight", "weights": {"CCC": 100}}}
        ]}
    ])");
    auto results = compare_strategies(md, BacktestParams(), policy::make_policy_factories(strategies));
    REQUIRE(results.size() == 2);
    REQUIRE(results[1].strategy_name == "blend");
    REQUIRE_THAT(results[1].trades[0].post_trade_weight, WithinAbs(0.5, 1e-9));
}

TEST_CASE("Strategy comparison errors", "[StrategyComparison]") {
    auto md = synthetic_market();
    BacktestParams params;

    SECTION("Empty factory") {
        std::vector<policy::PolicyFactory> factories = {policy::PolicyFactory()};
        REQUIRE_THROWS_AS(compare_strategies(md, params, factories), std::invalid_argument);
    }

    SECTION("Factory returning null") {
        std::vector<policy::PolicyFactory> factories = {
            []() { return std::unique_ptr<policy::AllocationPolicy>(); }};
        REQUIRE_THROWS_AS(compare_strategies(md, params, factories), std::invalid_argument);
    }

    SECTION("A failing run propagates") {
        std::vector<policy::PolicyFactory> factories = {
            constant("ok", {{"AAA", 100.0}}),
            []() { return std::unique_ptr<policy::AllocationPolicy>(new FailingPolicy()); }};
        REQUIRE_THROWS_AS(compare_strategies(md, params, factories, 2), PolicyError);
        REQUIRE_THROWS_AS(compare_strategies(md, params, factories, 1), PolicyError);
    }
}
