/**
 * @file trade_logger.cpp
 * @brief Trade and rebalance-event bookkeeping for one backtest run
 */

#include "allocsim/backtest/trade_logger.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <numeric>
#include <stdexcept>

namespace allocsim {
namespace backtest {

namespace {

const char* const kCsvHeader =
    "trade_id,date,symbol,reason,shares,price,notional,"
    "commission,slippage,market_impact,fixed_fee,total_cost,"
    "pre_trade_weight,post_trade_weight";

void write_csv_row(std::ostream& out, const TradeRecord& t)
{
    // Identifiers first, then the numeric columns in header order
    out << t.trade_id << ',' << t.date << ',' << t.symbol << ',' << t.reason;
    const double values[] = {t.shares, t.price, t.notional,
                             t.commission, t.slippage, t.market_impact, t.fixed_fee, t.total_cost,
                             t.pre_trade_weight, t.post_trade_weight};
    for (double v : values) {
        out << ',' << v;
    }
    out << '\n';
}

} // namespace

void TradeRecord::set_cost(const TradeCost& cost)
{
    commission = cost.commission;
    slippage = cost.slippage;
    market_impact = cost.market_impact;
    fixed_fee = cost.fixed_fee;
    total_cost = cost.total();
}

void TradeLogger::log_trade(const TradeRecord& record)
{
    trades_.push_back(record);
    trades_.back().trade_id = next_trade_id_++;
}

void TradeLogger::log_rebalance_event(const Eigen::VectorXd& pre_weights,
                                      const Eigen::VectorXd& post_weights)
{
    if (pre_weights.size() != post_weights.size()) {
        throw std::invalid_argument("Rebalance weight vectors differ in size: " +
                                    std::to_string(pre_weights.size()) + " vs " +
                                    std::to_string(post_weights.size()));
    }
    rebalance_turnover_.push_back((post_weights - pre_weights).cwiseAbs().sum() / 2.0);
}

template <typename Pred>
std::vector<TradeRecord> TradeLogger::select(Pred pred) const
{
    std::vector<TradeRecord> out;
    std::copy_if(trades_.begin(), trades_.end(), std::back_inserter(out), pred);
    return out;
}

std::vector<TradeRecord> TradeLogger::trades_for_date(const std::string& date) const
{
    return select([&date](const TradeRecord& t) { return t.date == date; });
}

std::vector<TradeRecord> TradeLogger::trades_for_symbol(const std::string& symbol) const
{
    return select([&symbol](const TradeRecord& t) { return t.symbol == symbol; });
}

std::vector<TradeRecord> TradeLogger::trades_for_reason(const std::string& reason) const
{
    return select([&reason](const TradeRecord& t) { return t.reason == reason; });
}

TradeSummary TradeLogger::get_summary() const
{
    TradeSummary s;
    s.total_trades = num_trades();
    s.rebalance_count = static_cast<int>(rebalance_turnover_.size());
    s.turnover = std::accumulate(rebalance_turnover_.begin(), rebalance_turnover_.end(), 0.0);
    if (!rebalance_turnover_.empty()) {
        s.max_rebalance_turnover = *std::max_element(rebalance_turnover_.begin(), rebalance_turnover_.end());
    }

    for (const auto& t : trades_) {
        if (t.is_buy()) {
            ++s.buy_trades;
        } else if (t.shares < 0.0) {
            ++s.sell_trades;
        }
        s.total_notional += std::abs(t.notional);
        s.total_costs += t.total_cost;
        ++s.trades_by_reason[t.reason];
    }
    if (s.total_trades > 0) {
        s.avg_cost_per_trade = s.total_costs / s.total_trades;
    }
    return s;
}

void TradeLogger::export_to_csv(const std::string& filepath) const
{
    const std::filesystem::path path(filepath);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot write trade log to " + filepath);
    }
    out << kCsvHeader << '\n' << std::fixed << std::setprecision(8);
    for (const auto& t : trades_) {
        write_csv_row(out, t);
    }
}

void TradeLogger::clear()
{
    trades_.clear();
    rebalance_turnover_.clear();
    next_trade_id_ = 0;
}

} // namespace backtest
} // namespace allocsim
