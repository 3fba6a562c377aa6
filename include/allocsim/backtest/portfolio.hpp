#ifndef ALLOCSIM_BACKTEST_PORTFOLIO_HPP
#define ALLOCSIM_BACKTEST_PORTFOLIO_HPP

#include <string>
#include <vector>
#include <map>
#include <stdexcept>
#include <Eigen/Dense>

#include "allocsim/data/market_data.hpp"

namespace allocsim {
namespace backtest {

/**
 * @struct Position
 * @brief Holding in a single symbol
 */
struct Position {
    std::string symbol;       ///< Asset identifier
    double shares = 0.0;      ///< Number of shares held (never negative)
    double cost_basis = 0.0;  ///< Average cost per share
};

/**
 * @struct PortfolioSnapshot
 * @brief Read-only point-in-time view of the ledger handed to policies
 */
struct PortfolioSnapshot {
    std::string date;                         ///< Snapshot date (YYYY-MM-DD)
    double cash = 0.0;                        ///< Cash balance
    double equity = 0.0;                      ///< Cash + marked positions
    std::map<std::string, double> shares;     ///< Held symbols only
    std::map<std::string, double> weights;    ///< Fraction of equity per held symbol

    double shares_of(const std::string& symbol) const;
    double weight_of(const std::string& symbol) const;
};

/**
 * @class Portfolio
 * @brief Cash and share ledger; the only mutable state of a run
 *
 * Trades are executed at a given price with a given cost; the ledger does
 * not size orders or consult policies. Short positions are not supported.
 */
class Portfolio {
public:
    Portfolio(double initial_capital,
              const std::vector<std::string>& symbols,
              double cash_tolerance = 1e-6);

    ~Portfolio() = default;

    // -- State queries
    double cash() const;
    double initial_capital() const { return initial_capital_; }
    double cash_tolerance() const { return cash_tolerance_; }
    size_t num_assets() const;
    const std::vector<std::string>& symbols() const;
    const std::string& current_date() const { return current_date_; }

    const Position& get_position(const std::string& symbol) const;
    double shares(const std::string& symbol) const;
    bool has_symbol(const std::string& symbol) const;
    bool is_held(const std::string& symbol) const;
    std::vector<std::string> held_symbols() const;

    // -- Valuation (prices must cover every held symbol)
    double total_equity(const data::PriceMap& prices) const;
    double invested_value(const data::PriceMap& prices) const;
    Eigen::VectorXd current_weights(const data::PriceMap& prices) const;

    // -- Mutation
    void set_date(const std::string& date);
    void apply_trade(const std::string& symbol, double signed_quantity, double price, double cost);
    void credit(double amount);

    // -- Snapshots
    PortfolioSnapshot snapshot(const data::PriceMap& prices) const;

private:
    double initial_capital_;
    double cash_;
    double cash_tolerance_;
    std::string current_date_;
    std::vector<std::string> symbols_;
    std::map<std::string, int> symbol_index_;
    std::vector<Position> positions_;

    void build_symbol_index();
    int find_symbol_index(const std::string& symbol) const;
    double price_for(const std::string& symbol, const data::PriceMap& prices) const;
};

} // namespace backtest
} // namespace allocsim

#endif // ALLOCSIM_BACKTEST_PORTFOLIO_HPP
