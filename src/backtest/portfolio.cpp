// ============================================================================
// Implementation of Portfolio
// ============================================================================

#include "allocsim/backtest/portfolio.hpp"
#include "allocsim/backtest/errors.hpp"

#include <cmath>
#include <sstream>

namespace allocsim {
namespace backtest {

namespace {
// Share residue below this after a sell is treated as a closed position.
constexpr double kShareDust = 1e-9;
}

// ============================================================================
// PortfolioSnapshot
// ============================================================================

double PortfolioSnapshot::shares_of(const std::string& symbol) const {
    auto it = shares.find(symbol);
    return it == shares.end() ? 0.0 : it->second;
}

double PortfolioSnapshot::weight_of(const std::string& symbol) const {
    auto it = weights.find(symbol);
    return it == weights.end() ? 0.0 : it->second;
}

// ============================================================================
// Portfolio - helpers
// ============================================================================

void Portfolio::build_symbol_index() {
    symbol_index_.clear();
    for (size_t i = 0; i < symbols_.size(); ++i) {
        if (symbol_index_.count(symbols_[i])) {
            throw std::invalid_argument("duplicate symbol in universe: " + symbols_[i]);
        }
        symbol_index_[symbols_[i]] = static_cast<int>(i);
    }
}

int Portfolio::find_symbol_index(const std::string& symbol) const {
    auto it = symbol_index_.find(symbol);
    if (it == symbol_index_.end()) return -1;
    return it->second;
}

double Portfolio::price_for(const std::string& symbol, const data::PriceMap& prices) const {
    auto it = prices.find(symbol);
    if (it == prices.end() || !(it->second > 0.0)) {
        throw MissingPriceError(symbol, current_date_);
    }
    return it->second;
}

// ============================================================================
// Portfolio - lifecycle
// ============================================================================

Portfolio::Portfolio(double initial_capital, const std::vector<std::string>& symbols,
                     double cash_tolerance)
    : initial_capital_(initial_capital), cash_(initial_capital),
      cash_tolerance_(cash_tolerance), symbols_(symbols) {
    if (!(initial_capital > 0.0)) {
        throw std::invalid_argument("initial_capital must be > 0");
    }
    if (symbols.empty()) {
        throw std::invalid_argument("symbols must not be empty");
    }
    if (!(cash_tolerance >= 0.0)) {
        throw std::invalid_argument("cash_tolerance must be >= 0");
    }
    positions_.resize(symbols_.size());
    for (size_t i = 0; i < symbols_.size(); ++i) {
        positions_[i].symbol = symbols_[i];
    }
    build_symbol_index();
}

// ============================================================================
// Portfolio - queries
// ============================================================================

double Portfolio::cash() const { return cash_; }

size_t Portfolio::num_assets() const { return symbols_.size(); }

const std::vector<std::string>& Portfolio::symbols() const { return symbols_; }

const Position& Portfolio::get_position(const std::string& symbol) const {
    int idx = find_symbol_index(symbol);
    if (idx < 0) throw std::invalid_argument("symbol not in universe: " + symbol);
    return positions_[static_cast<size_t>(idx)];
}

double Portfolio::shares(const std::string& symbol) const {
    return get_position(symbol).shares;
}

bool Portfolio::has_symbol(const std::string& symbol) const {
    return find_symbol_index(symbol) >= 0;
}

bool Portfolio::is_held(const std::string& symbol) const {
    int idx = find_symbol_index(symbol);
    return idx >= 0 && positions_[static_cast<size_t>(idx)].shares > 0.0;
}

std::vector<std::string> Portfolio::held_symbols() const {
    std::vector<std::string> out;
    for (const auto& p : positions_) {
        if (p.shares > 0.0) out.push_back(p.symbol);
    }
    return out;
}

double Portfolio::invested_value(const data::PriceMap& prices) const {
    double invested = 0.0;
    for (const auto& p : positions_) {
        if (p.shares == 0.0) continue;
        invested += p.shares * price_for(p.symbol, prices);
    }
    return invested;
}

double Portfolio::total_equity(const data::PriceMap& prices) const {
    return cash_ + invested_value(prices);
}

Eigen::VectorXd Portfolio::current_weights(const data::PriceMap& prices) const {
    Eigen::VectorXd w = Eigen::VectorXd::Zero(static_cast<int>(symbols_.size()));
    double equity = total_equity(prices);
    if (!(equity > 0.0)) {
        return w;
    }
    for (size_t i = 0; i < positions_.size(); ++i) {
        if (positions_[i].shares == 0.0) continue;
        w[static_cast<int>(i)] = positions_[i].shares * price_for(positions_[i].symbol, prices) / equity;
    }
    return w;
}

// ============================================================================
// Portfolio - mutation
// ============================================================================

void Portfolio::set_date(const std::string& date) {
    current_date_ = date;
}

void Portfolio::apply_trade(const std::string& symbol, double signed_quantity, double price, double cost) {
    int idx = find_symbol_index(symbol);
    if (idx < 0) throw std::invalid_argument("symbol not in universe: " + symbol);
    if (!(price > 0.0)) throw std::invalid_argument("price must be > 0");
    if (!(cost >= 0.0)) throw std::invalid_argument("cost must be >= 0");
    if (!std::isfinite(signed_quantity)) throw std::invalid_argument("quantity must be finite");

    Position& pos = positions_[static_cast<size_t>(idx)];

    if (signed_quantity < 0.0 && -signed_quantity > pos.shares + kShareDust) {
        std::ostringstream msg;
        msg << "attempt to sell " << -signed_quantity << " shares of " << symbol
            << " but only " << pos.shares << " held";
        throw std::invalid_argument(msg.str());
    }

    double cash_delta = -(signed_quantity * price) - cost;
    if (cash_ + cash_delta < -cash_tolerance_) {
        throw InsufficientCashError(symbol, signed_quantity * price + cost, cash_);
    }

    if (signed_quantity > 0.0) {
        double new_total_shares = pos.shares + signed_quantity;
        pos.cost_basis = ((pos.shares * pos.cost_basis) + (signed_quantity * price)) / new_total_shares;
    }

    pos.shares += signed_quantity;
    if (std::abs(pos.shares) <= kShareDust) {
        pos.shares = 0.0;
        pos.cost_basis = 0.0;
    }

    cash_ += cash_delta;
}

void Portfolio::credit(double amount) {
    if (!(amount >= 0.0)) throw std::invalid_argument("credit amount must be >= 0");
    cash_ += amount;
}

// ============================================================================
// Portfolio - snapshots
// ============================================================================

PortfolioSnapshot Portfolio::snapshot(const data::PriceMap& prices) const {
    PortfolioSnapshot s;
    s.date = current_date_;
    s.cash = cash_;
    s.equity = total_equity(prices);
    for (const auto& p : positions_) {
        if (p.shares == 0.0) continue;
        s.shares[p.symbol] = p.shares;
        s.weights[p.symbol] = s.equity > 0.0 ? p.shares * price_for(p.symbol, prices) / s.equity : 0.0;
    }
    return s;
}

} // namespace backtest
} // namespace allocsim
