#include "allocsim/backtest/transaction_cost_model.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace allocsim {
namespace backtest {

static void require_non_negative(double value, const std::string& name) {
    if (!(value >= 0.0) || !std::isfinite(value)) {
        std::ostringstream ss; ss << value;
        throw std::invalid_argument("Expected non-negative value for parameter '" + name + "', got: " + ss.str());
    }
}

// ============================================================================
// CostModel
// ============================================================================

double CostModel::cost(double notional, double price) const {
    if (notional == 0.0) return 0.0;
    TradeOrder o;
    o.shares = std::abs(notional) / price;
    o.price = price;
    return calculate_cost(o).total();
}

// ============================================================================
// TransactionCostConfig
// ============================================================================

TransactionCostConfig TransactionCostConfig::default_config() {
    TransactionCostConfig cfg;
    cfg.commission_rate = 0.0;
    cfg.slippage_bps = 0.0;
    cfg.fixed_fee = 0.0;
    cfg.market_impact_model = "none";
    cfg.market_impact_coeff = 0.0;
    return cfg;
}

TransactionCostConfig TransactionCostConfig::from_json(const nlohmann::json& j) {
    TransactionCostConfig cfg = default_config();
    if (j.is_object()) {
        cfg.commission_rate = j.value("commission_rate", cfg.commission_rate);
        cfg.slippage_bps = j.value("slippage_bps", cfg.slippage_bps);
        cfg.fixed_fee = j.value("fixed_fee", cfg.fixed_fee);
        cfg.market_impact_model = j.value("market_impact_model", cfg.market_impact_model);
        cfg.market_impact_coeff = j.value("market_impact_coeff", cfg.market_impact_coeff);
    }
    return cfg;
}

// ============================================================================
// TransactionCostModel
// ============================================================================

TransactionCostModel::TransactionCostModel(const TransactionCostConfig& config)
    : config_(config) {
    validate_config();
}

TransactionCostModel::TransactionCostModel()
    : config_(TransactionCostConfig::default_config()) {
}

void TransactionCostModel::validate_config() const {
    require_non_negative(config_.commission_rate, "commission_rate");
    require_non_negative(config_.slippage_bps, "slippage_bps");
    require_non_negative(config_.fixed_fee, "fixed_fee");
    require_non_negative(config_.market_impact_coeff, "market_impact_coeff");
    if (!(config_.market_impact_model == "none" || config_.market_impact_model == "linear" || config_.market_impact_model == "sqrt")) {
        throw std::invalid_argument("Expected one of 'none','linear','sqrt' for parameter 'market_impact_model', got: " + config_.market_impact_model);
    }
}

TradeCost TransactionCostModel::calculate_cost(const TradeOrder& order) const {
    if (order.price <= 0.0) {
        std::ostringstream ss; ss << order.price;
        throw std::invalid_argument("Expected positive value for parameter 'price', got: " + ss.str());
    }
    double notional = order.notional();
    if (notional == 0.0) return TradeCost{};
    TradeCost c;
    c.commission = std::max(0.0, commission_cost(notional));
    c.slippage = std::max(0.0, slippage_cost(notional));
    c.market_impact = std::max(0.0, market_impact_cost(notional, order.price));
    c.fixed_fee = config_.fixed_fee;
    return c;
}

double TransactionCostModel::commission_cost(double notional) const {
    return std::abs(notional) * config_.commission_rate;
}

double TransactionCostModel::slippage_cost(double notional) const {
    return std::abs(notional) * (config_.slippage_bps / 10000.0);
}

double TransactionCostModel::market_impact_cost(double notional, double price) const {
    double abs_notional = std::abs(notional);
    if (config_.market_impact_model == "linear") {
        return abs_notional * config_.market_impact_coeff;
    }
    if (config_.market_impact_model == "sqrt") {
        if (price <= 0.0) return 0.0;
        return config_.market_impact_coeff * std::sqrt(abs_notional * price);
    }
    return 0.0;
}

double TransactionCostModel::proportional_rate() const {
    double rate = config_.commission_rate + config_.slippage_bps / 10000.0;
    if (config_.market_impact_model == "linear") rate += config_.market_impact_coeff;
    return rate;
}

double TransactionCostModel::max_affordable_notional(double cash, double price) const {
    if (price <= 0.0) {
        std::ostringstream ss; ss << price;
        throw std::invalid_argument("Expected positive value for parameter 'price', got: " + ss.str());
    }
    double budget = cash - config_.fixed_fee;
    if (!(budget > 0.0)) return 0.0;

    double a = 1.0 + proportional_rate();
    if (config_.market_impact_model != "sqrt" || config_.market_impact_coeff == 0.0) {
        return budget / a;
    }

    // a*N + b*sqrt(N) = budget, solved as a quadratic in x = sqrt(N).
    double b = config_.market_impact_coeff * std::sqrt(price);
    double x = (-b + std::sqrt(b * b + 4.0 * a * budget)) / (2.0 * a);
    return std::max(0.0, x * x);
}

} // namespace backtest
} // namespace allocsim
