// transaction_cost_model.hpp
#ifndef ALLOCSIM_BACKTEST_TRANSACTION_COST_MODEL_HPP
#define ALLOCSIM_BACKTEST_TRANSACTION_COST_MODEL_HPP

#include <cmath>
#include <string>
#include <vector>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace allocsim {
namespace backtest {

struct TradeOrder {
    std::string symbol;
    double shares{0.0};
    double price{0.0};
    double notional() const { return std::abs(shares * price); }
};

struct TradeCost {
    double commission{0.0};
    double slippage{0.0};
    double market_impact{0.0};
    double fixed_fee{0.0};
    double total() const { return commission + slippage + market_impact + fixed_fee; }
};

/**
 * @class CostModel
 * @brief Friction charged on a trade, as a function of its notional and price.
 *
 * Every cost component is non-negative and a zero-notional trade costs nothing.
 */
class CostModel {
public:
    virtual ~CostModel() = default;

    virtual TradeCost calculate_cost(const TradeOrder& order) const = 0;

    /**
     * @brief Largest notional N such that N + cost(N) <= cash at the given price.
     *
     * Never negative; 0 when even a minimal trade is unaffordable.
     */
    virtual double max_affordable_notional(double cash, double price) const = 0;

    virtual std::string name() const = 0;

    /** @brief Total cost of a trade with the given absolute notional. */
    double cost(double notional, double price = 1.0) const;
};

struct TransactionCostConfig {
    double commission_rate{0.0};
    double slippage_bps{0.0};
    double fixed_fee{0.0};
    std::string market_impact_model{"none"};
    double market_impact_coeff{0.0};

    static TransactionCostConfig from_json(const nlohmann::json& j);
    static TransactionCostConfig default_config();
};

/**
 * @class TransactionCostModel
 * @brief Commission + spread slippage + per-trade fee + optional market impact.
 *
 * Market impact is either linear (coeff * N) or square-root
 * (coeff * sqrt(N * price)).
 */
class TransactionCostModel : public CostModel {
public:
    explicit TransactionCostModel(const TransactionCostConfig& config);
    TransactionCostModel();
    ~TransactionCostModel() override = default;

    TradeCost calculate_cost(const TradeOrder& order) const override;
    double max_affordable_notional(double cash, double price) const override;
    std::string name() const override { return "TransactionCostModel"; }

    const TransactionCostConfig& config() const { return config_; }

    double commission_cost(double notional) const;
    double slippage_cost(double notional) const;
    double market_impact_cost(double notional, double price) const;

    /** @brief Cost per unit of notional, excluding the fixed fee and sqrt impact. */
    double proportional_rate() const;

private:
    TransactionCostConfig config_;
    void validate_config() const;
};

} // namespace backtest
} // namespace allocsim

#endif // ALLOCSIM_BACKTEST_TRANSACTION_COST_MODEL_HPP
