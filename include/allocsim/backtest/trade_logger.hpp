#ifndef ALLOCSIM_BACKTEST_TRADE_LOGGER_HPP
#define ALLOCSIM_BACKTEST_TRADE_LOGGER_HPP

#include <map>
#include <string>
#include <vector>
#include <Eigen/Dense>
#include "allocsim/backtest/transaction_cost_model.hpp"

namespace allocsim {
namespace backtest {

/**
 * @brief One executed trade. Shares are signed: positive buys, negative sells.
 */
struct TradeRecord {
    int trade_id = 0;
    std::string date;
    std::string symbol;
    double shares = 0.0;
    double price = 0.0;
    double notional = 0.0;   ///< shares * price (signed)
    double commission = 0.0;
    double slippage = 0.0;
    double market_impact = 0.0;
    double fixed_fee = 0.0;
    double total_cost = 0.0;
    double pre_trade_weight = 0.0;
    double post_trade_weight = 0.0;  ///< Target weight the trade moves toward
    std::string reason;              ///< Trigger that caused the rebalance

    bool is_buy() const { return shares > 0.0; }
    void set_cost(const TradeCost& cost);
};

struct TradeSummary {
    int total_trades = 0;
    int buy_trades = 0;
    int sell_trades = 0;
    double total_notional = 0.0;     ///< Sum of |notional|
    double total_costs = 0.0;
    double avg_cost_per_trade = 0.0;
    int rebalance_count = 0;
    double turnover = 0.0;           ///< Sum of one-way turnover over rebalances
    double max_rebalance_turnover = 0.0;
    std::map<std::string, int> trades_by_reason;
};

/**
 * @class TradeLogger
 * @brief Append-only record of the trades and rebalance events of one run.
 */
class TradeLogger {
public:
    TradeLogger() = default;
    ~TradeLogger() = default;

    /** @brief Append a trade; the logger assigns the trade id. */
    void log_trade(const TradeRecord& record);

    /**
     * @brief Count one rebalance event and record its one-way turnover,
     * sum(|post - pre|) / 2. An event with no trades still counts.
     */
    void log_rebalance_event(const Eigen::VectorXd& pre_weights,
                             const Eigen::VectorXd& post_weights);

    const std::vector<TradeRecord>& trades() const { return trades_; }
    std::vector<TradeRecord> trades_for_date(const std::string& date) const;
    std::vector<TradeRecord> trades_for_symbol(const std::string& symbol) const;
    std::vector<TradeRecord> trades_for_reason(const std::string& reason) const;
    const std::vector<double>& rebalance_turnover() const { return rebalance_turnover_; }

    TradeSummary get_summary() const;
    int num_trades() const { return static_cast<int>(trades_.size()); }

    /**
     * @brief Write every trade as one CSV row, creating parent directories.
     * @throws std::runtime_error If the file cannot be opened.
     */
    void export_to_csv(const std::string& filepath) const;

    void clear();

private:
    template <typename Pred>
    std::vector<TradeRecord> select(Pred pred) const;

    std::vector<TradeRecord> trades_;
    std::vector<double> rebalance_turnover_;
    int next_trade_id_ = 0;
};

} // namespace backtest
} // namespace allocsim

#endif // ALLOCSIM_BACKTEST_TRADE_LOGGER_HPP
