/**
 * @file test_policies.cpp
 * @brief Unit tests for allocation policies and lookback helpers
 */

#include <catch2/catch.hpp>
#include "allocsim/policy/constant_weight_policy.hpp"
#include "allocsim/policy/ensemble_policy.hpp"
#include "allocsim/policy/lookback.hpp"
#include "allocsim/policy/policy_factory.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <cmath>
#include <deque>
#include <limits>

using namespace allocsim;
using namespace allocsim::policy;
using Catch::Matchers::WithinAbs;
using allocsim_test::make_series;

namespace {

/// Replays a fixed sequence of allocations, then repeats the last one.
class ScriptedPolicy : public AllocationPolicy {
public:
    ScriptedPolicy(std::string name, std::deque<TargetAllocation> script, EmptyAllocation empty)
        : name_(std::move(name)), script_(std::move(script)), empty_(empty) {}

    TargetAllocation calculate_allocation(const std::string&, const data::LookbackViews&,
                                          const backtest::PortfolioSnapshot&,
                                          const data::PriceMap&) override {
        ++calls;
        TargetAllocation next = script_.front();
        if (script_.size() > 1) script_.pop_front();
        return next;
    }

    std::string name() const override { return name_; }
    EmptyAllocation empty_allocation() const override { return empty_; }

    void on_start(const std::vector<std::string>&, const std::string&, const std::string&) override {
        ++starts;
    }

    int calls = 0;
    int starts = 0;

private:
    std::string name_;
    std::deque<TargetAllocation> script_;
    EmptyAllocation empty_;
};

struct PolicyInputs {
    data::MarketData market;
    data::LookbackViews views;
    backtest::PortfolioSnapshot snapshot;
    data::PriceMap prices;

    PolicyInputs() {
        market.add_series(make_series("X", {"2020-01-02", "2020-01-03"}, {10.0, 11.0}));
        market.add_series(make_series("Y", {"2020-01-02", "2020-01-03"}, {20.0, 19.0}));
        views = market.views_as_of("2020-01-03");
        snapshot.date = "2020-01-03";
        snapshot.cash = 1000.0;
        snapshot.equity = 1000.0;
        prices = market.closes_on("2020-01-03");
    }
};

} // namespace

TEST_CASE("Lookback helpers", "[Lookback]") {
    auto s = make_series("X",
                         {"2020-01-02", "2020-01-03", "2020-01-06", "2020-01-07", "2020-01-08"},
                         {100.0, 110.0, 99.0, 121.0, 121.0});
    auto view = s.as_of("2020-01-08");

    SECTION("Trailing window") {
        auto w = lookback(view, 3);
        REQUIRE(w.size() == 3);
        REQUIRE(w.front().date == "2020-01-06");
    }

    SECTION("Moving average") {
        REQUIRE(*moving_average(view, 2) == Catch::Detail::Approx(121.0));
        REQUIRE(*moving_average(view, 5) == Catch::Detail::Approx((100.0 + 110.0 + 99.0 + 121.0 + 121.0) / 5.0));
        REQUIRE_FALSE(moving_average(view, 6).has_value());
        REQUIRE_THROWS_AS(moving_average(view, 0), std::invalid_argument);
    }

    SECTION("Period returns") {
        auto r = period_returns(view);
        REQUIRE(r.size() == 4);
        REQUIRE_THAT(r[0], WithinAbs(0.1, 1e-12));
        REQUIRE_THAT(r[1], WithinAbs(-0.1, 1e-12));
        REQUIRE_THAT(r[3], WithinAbs(0.0, 1e-12));
        auto r2 = period_returns(view, 2);
        REQUIRE(r2.size() == 3);
        REQUIRE_THAT(r2[0], WithinAbs(-0.01, 1e-12));
        REQUIRE(period_returns(s.as_of("2020-01-02")).size() == 0);
    }

    SECTION("Volatility") {
        Eigen::VectorXd flat = Eigen::VectorXd::Constant(10, 0.01);
        REQUIRE_THAT(volatility(flat), WithinAbs(0.0, 1e-15));

        Eigen::VectorXd r(2); r << 0.01, -0.01;
        double daily = std::sqrt(2.0 * 0.01 * 0.01);
        REQUIRE_THAT(volatility(r, false), WithinAbs(daily, 1e-12));
        REQUIRE_THAT(volatility(r, true, 252), WithinAbs(daily * std::sqrt(252.0), 1e-12));

        Eigen::VectorXd one(1); one << 0.05;
        REQUIRE(volatility(one) == 0.0);
    }

    SECTION("Momentum") {
        REQUIRE_THAT(*momentum(view, 5), WithinAbs(0.21, 1e-12));
        REQUIRE_THAT(*momentum(view, 3), WithinAbs(121.0 / 99.0 - 1.0, 1e-12));
        REQUIRE_FALSE(momentum(view, 6).has_value());
    }
}

TEST_CASE("ConstantWeightPolicy", "[Policy]") {
    PolicyInputs in;

    SECTION("Returns the configured weights every call") {
        ConstantWeightPolicy p("60/40", {{"X", 60.0}, {"Y", 40.0}});
        auto a1 = p.calculate_allocation("2020-01-02", in.views, in.snapshot, in.prices);
        auto a2 = p.calculate_allocation("2020-01-03", in.views, in.snapshot, in.prices);
        REQUIRE(a1 == a2);
        REQUIRE(a1.at("X") == Catch::Detail::Approx(60.0));
        REQUIRE(p.name() == "60/40");
        REQUIRE(p.empty_allocation() == EmptyAllocation::NO_CHANGE);
    }

    SECTION("Partial allocation leaves cash") {
        ConstantWeightPolicy p("half", {{"X", 50.0}});
        REQUIRE(p.weights().size() == 1);
    }

    SECTION("Declared empty semantics") {
        ConstantWeightPolicy p("cash", {}, EmptyAllocation::ALL_CASH);
        REQUIRE(p.calculate_allocation("2020-01-03", in.views, in.snapshot, in.prices).empty());
        REQUIRE(p.empty_allocation() == EmptyAllocation::ALL_CASH);
    }

    SECTION("Errors") {
        REQUIRE_THROWS_AS(ConstantWeightPolicy("bad", {{"X", -1.0}}), std::invalid_argument);
        REQUIRE_THROWS_AS(ConstantWeightPolicy("bad", {{"X", 101.0}}), std::invalid_argument);
        REQUIRE_THROWS_AS(ConstantWeightPolicy("bad", {{"X", 60.0}, {"Y", 50.0}}), std::invalid_argument);
        REQUIRE_THROWS_AS(ConstantWeightPolicy("bad", {{"X", std::numeric_limits<double>::quiet_NaN()}}),
                          std::invalid_argument);
    }
}

TEST_CASE("EnsemblePolicy", "[Policy]") {
    PolicyInputs in;

    SECTION("Weight-normalized blend") {
        std::vector<EnsembleMember> members;
        members.push_back({std::make_unique<ConstantWeightPolicy>("x", TargetAllocation{{"X", 100.0}}), 3.0});
        members.push_back({std::make_unique<ConstantWeightPolicy>("y", TargetAllocation{{"Y", 100.0}}), 1.0});
        EnsemblePolicy e("blend", std::move(members));

        auto a = e.calculate_allocation("2020-01-03", in.views, in.snapshot, in.prices);
        REQUIRE(a.at("X") == Catch::Detail::Approx(75.0));
        REQUIRE(a.at("Y") == Catch::Detail::Approx(25.0));
        REQUIRE(e.num_members() == 2);
    }

    SECTION("No-change member repeats its last allocation") {
        std::vector<EnsembleMember> members;
        members.push_back({std::make_unique<ConstantWeightPolicy>("x", TargetAllocation{{"X", 100.0}}), 1.0});
        members.push_back({std::make_unique<ScriptedPolicy>(
                               "y", std::deque<TargetAllocation>{{{"Y", 100.0}}, {}}, EmptyAllocation::NO_CHANGE),
                           1.0});
        EnsemblePolicy e("blend", std::move(members));

        e.calculate_allocation("2020-01-02", in.views, in.snapshot, in.prices);
        auto a = e.calculate_allocation("2020-01-03", in.views, in.snapshot, in.prices);
        REQUIRE(a.at("X") == Catch::Detail::Approx(50.0));
        REQUIRE(a.at("Y") == Catch::Detail::Approx(50.0));
    }

    SECTION("All-cash member contributes zeros") {
        std::vector<EnsembleMember> members;
        members.push_back({std::make_unique<ConstantWeightPolicy>("x", TargetAllocation{{"X", 100.0}}), 1.0});
        members.push_back({std::make_unique<ConstantWeightPolicy>("cash", TargetAllocation{}, EmptyAllocation::ALL_CASH), 1.0});
        EnsemblePolicy e("blend", std::move(members));

        auto a = e.calculate_allocation("2020-01-03", in.views, in.snapshot, in.prices);
        REQUIRE(a.at("X") == Catch::Detail::Approx(50.0));
        REQUIRE(a.at("Y") == Catch::Detail::Approx(0.0));
    }

    SECTION("Member without history is left out of the normalization") {
        std::vector<EnsembleMember> members;
        members.push_back({std::make_unique<ScriptedPolicy>(
                               "late", std::deque<TargetAllocation>{{}, {{"Y", 100.0}}}, EmptyAllocation::NO_CHANGE),
                           3.0});
        members.push_back({std::make_unique<ConstantWeightPolicy>("x", TargetAllocation{{"X", 100.0}}), 1.0});
        EnsemblePolicy e("blend", std::move(members));

        auto first = e.calculate_allocation("2020-01-02", in.views, in.snapshot, in.prices);
        REQUIRE(first.at("X") == Catch::Detail::Approx(100.0));
        REQUIRE(first.at("Y") == Catch::Detail::Approx(0.0));

        auto second = e.calculate_allocation("2020-01-03", in.views, in.snapshot, in.prices);
        REQUIRE(second.at("X") == Catch::Detail::Approx(25.0));
        REQUIRE(second.at("Y") == Catch::Detail::Approx(75.0));
    }

    SECTION("Every member empty and without history yields empty") {
        std::vector<EnsembleMember> members;
        members.push_back({std::make_unique<ScriptedPolicy>("a", std::deque<TargetAllocation>(1),
                                                            EmptyAllocation::NO_CHANGE), 1.0});
        EnsemblePolicy e("blend", std::move(members));
        REQUIRE(e.calculate_allocation("2020-01-03", in.views, in.snapshot, in.prices).empty());
    }

    SECTION("Lifecycle hooks reach members") {
        auto scripted = std::make_unique<ScriptedPolicy>("a", std::deque<TargetAllocation>{{{"X", 10.0}}},
                                                         EmptyAllocation::NO_CHANGE);
        ScriptedPolicy* raw = scripted.get();
        std::vector<EnsembleMember> members;
        members.push_back({std::move(scripted), 1.0});
        EnsemblePolicy e("blend", std::move(members));
        e.on_start({"X", "Y"}, "2020-01-02", "2020-01-03");
        REQUIRE(raw->starts == 1);
        e.calculate_allocation("2020-01-03", in.views, in.snapshot, in.prices);
        REQUIRE(raw->calls == 1);
    }

    SECTION("Errors") {
        REQUIRE_THROWS_AS(EnsemblePolicy("empty", {}), std::invalid_argument);

        std::vector<EnsembleMember> null_member(1);
        REQUIRE_THROWS_AS(EnsemblePolicy("null", std::move(null_member)), std::invalid_argument);

        std::vector<EnsembleMember> zero_weight;
        zero_weight.push_back({std::make_unique<ConstantWeightPolicy>("x", TargetAllocation{{"X", 100.0}}), 0.0});
        REQUIRE_THROWS_AS(EnsemblePolicy("zero", std::move(zero_weight)), std::invalid_argument);
    }
}

TEST_CASE("Policy factory", "[Policy]") {
    PolicyInputs in;

    SECTION("Constant weight from JSON") {
        nlohmann::json j = {{"name", "60/40"}, {"type", "constant_weight"},
                            {"weights", {{"X", 60}, {"Y", 40}}}, {"empty_means_cash", true}};
        auto p = make_policy(j);
        REQUIRE(p->name() == "60/40");
        REQUIRE(p->empty_allocation() == EmptyAllocation::ALL_CASH);
        auto a = p->calculate_allocation("2020-01-03", in.views, in.snapshot, in.prices);
        REQUIRE(a.at("Y") == Catch::Detail::Approx(40.0));
    }

    SECTION("Nested ensemble from JSON") {
        nlohmann::json j = nlohmann::json::parse(R"({
            "name": "blend", "type": "ensemble",
            "members": [
                {"weight": 1, "policy": {"name": "a", "type": "constant_weight", "weights": {"X": 100}}},
                {"weight": 1, "policy": {"name": "b", "type": "constant_weight", "weights": {"Y": 100}}}
            ]})");
        auto p = make_policy(j);
        auto a = p->calculate_allocation("2020-01-03", in.views, in.snapshot, in.prices);
        REQUIRE(a.at("X") == Catch::Detail::Approx(50.0));
    }

    SECTION("Factories build independent instances") {
        nlohmann::json strategies = nlohmann::json::array({
            {{"name", "a"}, {"type", "constant_weight"}, {"weights", {{"X", 100}}}},
            {{"name", "b"}, {"type", "fixed"}, {"weights", {{"Y", 100}}}}});
        auto factories = make_policy_factories(strategies);
        REQUIRE(factories.size() == 2);
        auto p1 = factories[0]();
        auto p2 = factories[0]();
        REQUIRE(p1.get() != p2.get());
        REQUIRE(factories[1]()->name() == "b");
    }

    SECTION("Errors surface when the factory is made") {
        REQUIRE_THROWS_AS(make_policy({{"type", "momentum_magic"}}), std::invalid_argument);
        REQUIRE_THROWS_AS(make_policy_factory({{"type", "constant_weight"}, {"weights", {{"X", 150}}}}),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(make_policy({{"type", "ensemble"}}), std::invalid_argument);
    }

    SECTION("Known types") {
        auto types = available_policy_types();
        REQUIRE(std::find(types.begin(), types.end(), "ensemble") != types.end());
    }
}
