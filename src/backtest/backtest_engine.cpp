
#include "allocsim/backtest/backtest_engine.hpp"
#include "allocsim/backtest/errors.hpp"
#include "allocsim/analytics/performance_analyzer.hpp"
#include "allocsim/data/calendar.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <sstream>

namespace allocsim
{
    namespace backtest
    {

        namespace
        {
            struct PlannedTrade
            {
                int index;
                double shares; // signed
                double price;
            };

            struct RebalanceContext
            {
                const BacktestParams &params;
                const CostModel &cost_model;
                const std::vector<std::string> &symbols;
                Portfolio &ledger;
                TradeLogger &logger;
            };

            std::string format_value(double value)
            {
                std::ostringstream ss;
                ss << value;
                return ss.str();
            }

            data::PriceMap build_mark_prices(const data::MarketData &market_data,
                                             const std::vector<std::string> &symbols,
                                             const data::PriceMap &current_prices,
                                             const std::string &date)
            {
                data::PriceMap mark = current_prices;
                for (const auto &symbol : symbols)
                {
                    if (mark.count(symbol))
                        continue;
                    auto last = market_data.series(symbol).last_close_on_or_before(date);
                    if (last)
                        mark[symbol] = *last;
                }
                return mark;
            }

            policy::TargetAllocation call_policy(policy::AllocationPolicy &policy,
                                                 const std::string &date,
                                                 const data::MarketData &market_data,
                                                 const Portfolio &ledger,
                                                 const data::PriceMap &mark_prices,
                                                 const data::PriceMap &current_prices)
            {
                data::LookbackViews history = market_data.views_as_of(date);
                PortfolioSnapshot snapshot = ledger.snapshot(mark_prices);
                try
                {
                    return policy.calculate_allocation(date, history, snapshot, current_prices);
                }
                catch (const PolicyError &)
                {
                    throw;
                }
                catch (const std::exception &e)
                {
                    throw PolicyError(policy.name(), date, e.what());
                }
            }

            void record_trade(RebalanceContext &ctx, const std::string &date, const std::string &reason,
                              const PlannedTrade &trade, const TradeCost &cost,
                              double pre_weight, double target_weight)
            {
                TradeRecord r;
                r.date = date;
                r.symbol = ctx.symbols[static_cast<size_t>(trade.index)];
                r.shares = trade.shares;
                r.price = trade.price;
                r.notional = trade.shares * trade.price;
                r.set_cost(cost);
                r.pre_trade_weight = pre_weight;
                r.post_trade_weight = target_weight;
                r.reason = reason;
                ctx.logger.log_trade(r);
            }

            void execute_trades(RebalanceContext &ctx, const std::string &date, RebalanceTrigger trigger,
                                const Eigen::VectorXd &target, const data::PriceMap &current_prices,
                                const data::PriceMap &mark_prices)
            {
                const BacktestParams &params = ctx.params;
                const int n = static_cast<int>(ctx.symbols.size());
                const double equity = ctx.ledger.total_equity(mark_prices);
                const Eigen::VectorXd pre_weights = ctx.ledger.current_weights(mark_prices);
                const std::string reason = to_string(trigger);

                std::vector<PlannedTrade> sells;
                std::vector<PlannedTrade> buys;

                for (int i = 0; i < n; ++i)
                {
                    const std::string &symbol = ctx.symbols[static_cast<size_t>(i)];
                    const double held = ctx.ledger.shares(symbol);
                    const bool liquidate = target[i] <= 0.0;

                    if (liquidate && held <= 0.0)
                        continue;
                    if (!liquidate && std::abs(target[i] - pre_weights[i]) < params.min_trade_weight)
                        continue;

                    auto price_it = current_prices.find(symbol);
                    if (price_it == current_prices.end())
                    {
                        if (params.verbose)
                            std::cerr << "  [" << date << "] skip " << symbol << ": no bar on this date\n";
                        continue;
                    }
                    const double price = price_it->second;

                    double desired = liquidate ? 0.0 : target[i] * equity / price;
                    if (!params.fractional_shares)
                        desired = std::floor(desired + 1e-9);

                    double delta = desired - held;
                    if (delta < 0.0)
                        sells.push_back({i, std::max(delta, -held), price});
                    else if (delta > 0.0)
                        buys.push_back({i, delta, price});
                }

                // Sells first so their proceeds fund the buys.
                for (const auto &sell : sells)
                {
                    const std::string &symbol = ctx.symbols[static_cast<size_t>(sell.index)];
                    TradeCost cost = ctx.cost_model.calculate_cost(TradeOrder{symbol, sell.shares, sell.price});
                    double proceeds = -sell.shares * sell.price;
                    if (ctx.ledger.cash() + proceeds - cost.total() < -ctx.ledger.cash_tolerance())
                    {
                        if (params.verbose)
                            std::cerr << "  [" << date << "] skip sell " << symbol
                                      << ": cost " << cost.total() << " exceeds proceeds " << proceeds << "\n";
                        continue;
                    }
                    ctx.ledger.apply_trade(symbol, sell.shares, sell.price, cost.total());
                    record_trade(ctx, date, reason, sell, cost, pre_weights[sell.index], target[sell.index]);
                }

                for (auto buy : buys)
                {
                    const std::string &symbol = ctx.symbols[static_cast<size_t>(buy.index)];
                    double affordable = ctx.cost_model.max_affordable_notional(std::max(0.0, ctx.ledger.cash()), buy.price);
                    // Stay clear of rounding in the closed-form solution.
                    affordable *= (1.0 - 1e-12);

                    if (buy.shares * buy.price > affordable)
                    {
                        double shares = affordable / buy.price;
                        if (!params.fractional_shares)
                            shares = std::floor(shares);
                        if (params.verbose)
                            std::cerr << "  [" << date << "] trim buy " << symbol << ": requested "
                                      << buy.shares << " shares, affordable " << shares << "\n";
                        buy.shares = shares;
                    }
                    if (buy.shares <= 0.0)
                        continue;

                    TradeCost cost = ctx.cost_model.calculate_cost(TradeOrder{symbol, buy.shares, buy.price});
                    ctx.ledger.apply_trade(symbol, buy.shares, buy.price, cost.total());
                    record_trade(ctx, date, reason, buy, cost, pre_weights[buy.index], target[buy.index]);
                }

                ctx.logger.log_rebalance_event(pre_weights, ctx.ledger.current_weights(mark_prices));
            }
        } // namespace

        // ------------------------- BacktestParams -------------------------------
        BacktestParams BacktestParams::from_json(const nlohmann::json &j)
        {
            BacktestParams p;
            if (j.is_null())
                return p;
            if (!j.is_object())
                throw ConfigurationError("backtest section must be a JSON object");

            try
            {
                p.initial_cash = j.value("initial_capital", p.initial_cash);
                p.initial_cash = j.value("initial_cash", p.initial_cash);
                p.start_date = j.value("start_date", p.start_date);
                p.end_date = j.value("end_date", p.end_date);
                p.risk_free_rate = j.value("risk_free_rate", p.risk_free_rate);
                p.cash_interest_rate = j.value("cash_interest_rate", p.cash_interest_rate);
                p.min_trade_weight = j.value("min_trade_weight", p.min_trade_weight);
                p.fractional_shares = j.value("fractional_shares", p.fractional_shares);
                p.cash_tolerance = j.value("cash_tolerance", p.cash_tolerance);
                p.allocation_tolerance = j.value("allocation_tolerance", p.allocation_tolerance);
                p.time_budget_ms = j.value("time_budget_ms", p.time_budget_ms);
                p.verbose = j.value("verbose", p.verbose);
                p.trading_days_per_year = j.value("trading_days_per_year", p.trading_days_per_year);

                if (j.contains("rebalance"))
                {
                    const auto &r = j.at("rebalance");
                    p.rebalance = r.is_string() ? RebalanceConfig::from_string(r.get<std::string>())
                                                : RebalanceConfig::from_json(r);
                }
                if (j.contains("rebalance_frequency"))
                {
                    p.rebalance.frequency = RebalanceConfig::parse_frequency(j.at("rebalance_frequency").get<std::string>());
                }
                if (j.contains("transaction_costs"))
                {
                    p.transaction_costs = TransactionCostConfig::from_json(j.at("transaction_costs"));
                }
            }
            catch (const ConfigurationError &)
            {
                throw;
            }
            catch (const std::invalid_argument &e)
            {
                throw ConfigurationError(e.what());
            }
            catch (const nlohmann::json::exception &e)
            {
                throw ConfigurationError(e.what());
            }

            p.validate();
            return p;
        }

        void BacktestParams::validate() const
        {
            if (!(initial_cash > 0.0) || !std::isfinite(initial_cash))
                throw ConfigurationError("Expected positive value for parameter 'initial_cash', got: " + format_value(initial_cash));
            if (!start_date.empty() && !data::is_valid_date(start_date))
                throw ConfigurationError("invalid start_date: '" + start_date + "'");
            if (!end_date.empty() && !data::is_valid_date(end_date))
                throw ConfigurationError("invalid end_date: '" + end_date + "'");
            if (!start_date.empty() && !end_date.empty() && end_date < start_date)
                throw ConfigurationError("end_date " + end_date + " is before start_date " + start_date);
            if (!(min_trade_weight >= 0.0 && min_trade_weight <= 1.0))
                throw ConfigurationError("min_trade_weight must be in [0, 1], got: " + format_value(min_trade_weight));
            if (!(cash_tolerance >= 0.0))
                throw ConfigurationError("cash_tolerance must be >= 0, got: " + format_value(cash_tolerance));
            if (!(allocation_tolerance >= 0.0))
                throw ConfigurationError("allocation_tolerance must be >= 0, got: " + format_value(allocation_tolerance));
            if (!(cash_interest_rate >= 0.0) || !std::isfinite(cash_interest_rate))
                throw ConfigurationError("cash_interest_rate must be >= 0, got: " + format_value(cash_interest_rate));
            if (!std::isfinite(risk_free_rate))
                throw ConfigurationError("risk_free_rate must be finite");
            if (time_budget_ms < 0)
                throw ConfigurationError("time_budget_ms must be >= 0, got: " + std::to_string(time_budget_ms));
            if (trading_days_per_year <= 0)
                throw ConfigurationError("Expected positive value for parameter 'trading_days_per_year', got: " + std::to_string(trading_days_per_year));

            try
            {
                rebalance.validate();
                TransactionCostModel check(transaction_costs);
                (void)check;
            }
            catch (const std::invalid_argument &e)
            {
                throw ConfigurationError(e.what());
            }
        }

        // ------------------------- Allocation normalization ---------------------
        Eigen::VectorXd normalize_allocation(const policy::TargetAllocation &allocation,
                                             const std::vector<std::string> &symbols,
                                             double tolerance_pct,
                                             const std::string &policy_name,
                                             const std::string &date)
        {
            Eigen::VectorXd weights = Eigen::VectorXd::Zero(static_cast<int>(symbols.size()));
            double total = 0.0;

            for (const auto &entry : allocation)
            {
                auto it = std::find(symbols.begin(), symbols.end(), entry.first);
                if (it == symbols.end())
                {
                    if (entry.first == "CASH")
                        continue;
                    throw PolicyError(policy_name, date, "unknown symbol '" + entry.first + "' in allocation");
                }
                if (!std::isfinite(entry.second))
                {
                    throw PolicyError(policy_name, date, "non-finite weight for '" + entry.first + "'");
                }
                double value = std::min(100.0, std::max(0.0, entry.second));
                weights[static_cast<int>(it - symbols.begin())] = value;
                total += value;
            }

            if (total > 100.0 + tolerance_pct)
            {
                weights *= 100.0 / total;
            }
            return weights / 100.0;
        }

        // ------------------------- BacktestEngine -------------------------------
        BacktestEngine::BacktestEngine(const BacktestParams &params) : params_(params)
        {
            params_.validate();
            cost_model_ = std::make_shared<TransactionCostModel>(params_.transaction_costs);
        }

        BacktestEngine::BacktestEngine(const BacktestParams &params, std::shared_ptr<const CostModel> cost_model)
            : params_(params), cost_model_(std::move(cost_model))
        {
            params_.validate();
            if (!cost_model_)
                throw ConfigurationError("cost model must not be null");
        }

        BacktestResult BacktestEngine::run(const data::MarketData &market_data,
                                           policy::AllocationPolicy &policy) const
        {
            if (market_data.empty())
                throw ConfigurationError("market data contains no symbols");

            const std::vector<std::string> symbols = market_data.symbols();
            const std::vector<std::string> dates = market_data.trading_dates(params_.start_date, params_.end_date);
            if (dates.empty())
            {
                throw ConfigurationError("no trading dates in range [" +
                                         (params_.start_date.empty() ? std::string("-") : params_.start_date) + ", " +
                                         (params_.end_date.empty() ? std::string("-") : params_.end_date) + "]");
            }

            Portfolio ledger(params_.initial_cash, symbols, params_.cash_tolerance);
            RebalanceScheduler scheduler(params_.rebalance);
            TradeLogger logger;
            RebalanceContext ctx{params_, *cost_model_, symbols, ledger, logger};

            BacktestResult result;
            result.strategy_name = policy.name();
            result.risk_free_rate = params_.risk_free_rate;
            result.trading_days_per_year = params_.trading_days_per_year;
            result.equity_curve.reserve(dates.size());

            Eigen::VectorXd last_target;
            bool has_target = false;
            const double daily_interest = params_.cash_interest_rate / static_cast<double>(params_.trading_days_per_year);
            const auto started = std::chrono::steady_clock::now();

            if (params_.verbose)
            {
                std::cerr << "Running '" << policy.name() << "' over " << dates.size() << " dates ("
                          << dates.front() << " .. " << dates.back() << ")\n";
            }

            policy.on_start(symbols, dates.front(), dates.back());

            data::PriceMap mark_prices;
            for (size_t d = 0; d < dates.size(); ++d)
            {
                const std::string &date = dates[d];
                ledger.set_date(date);

                data::PriceMap current_prices = market_data.closes_on(date);
                mark_prices = build_mark_prices(market_data, symbols, current_prices, date);

                if (d > 0 && daily_interest > 0.0 && ledger.cash() > 0.0)
                {
                    ledger.credit(ledger.cash() * daily_interest);
                }

                Eigen::VectorXd current_weights = ledger.current_weights(mark_prices);
                RebalanceTrigger trigger = scheduler.evaluate(date, current_weights,
                                                              has_target ? last_target : current_weights);

                if (trigger != RebalanceTrigger::NONE)
                {
                    if (params_.verbose)
                        std::cerr << "[" << date << "] rebalance (" << to_string(trigger) << ")\n";

                    policy::TargetAllocation allocation =
                        call_policy(policy, date, market_data, ledger, mark_prices, current_prices);

                    if (allocation.empty() && policy.empty_allocation() == policy::EmptyAllocation::NO_CHANGE)
                    {
                        if (params_.verbose)
                            std::cerr << "  [" << date << "] empty allocation, holdings unchanged\n";
                        logger.log_rebalance_event(current_weights, current_weights);
                    }
                    else
                    {
                        Eigen::VectorXd target = allocation.empty()
                                                     ? Eigen::VectorXd::Zero(static_cast<int>(symbols.size()))
                                                     : normalize_allocation(allocation, symbols, params_.allocation_tolerance,
                                                                            policy.name(), date);
                        execute_trades(ctx, date, trigger, target, current_prices, mark_prices);
                        last_target = target;
                        has_target = true;
                    }

                    scheduler.record_rebalance(date, trigger);
                    result.rebalance_dates.push_back(date);
                }

                result.equity_curve.push_back({date, ledger.total_equity(mark_prices)});

                if (params_.time_budget_ms > 0)
                {
                    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                       std::chrono::steady_clock::now() - started)
                                       .count();
                    if (elapsed > params_.time_budget_ms)
                        throw TimeBudgetExceeded(date, params_.time_budget_ms);
                }
            }

            result.final_snapshot = ledger.snapshot(mark_prices);
            policy.on_finish(result.final_snapshot);

            result.trades = logger.trades();
            result.trade_summary = logger.get_summary();
            result.performance = analytics::analyze(result.equity_curve, logger.num_trades(),
                                                    params_.risk_free_rate, params_.trading_days_per_year);
            return result;
        }

    } // namespace backtest
} // namespace allocsim
