#ifndef ALLOCSIM_BACKTEST_REBALANCE_SCHEDULER_HPP
#define ALLOCSIM_BACKTEST_REBALANCE_SCHEDULER_HPP

#include <string>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <Eigen/Dense>

namespace allocsim {
namespace backtest {

enum class RebalanceFrequency {
    DAILY,
    WEEKLY,
    MONTHLY,
    QUARTERLY,
    ANNUALLY
};

/**
 * @brief Why a rebalance fires on a date.
 */
enum class RebalanceTrigger {
    NONE,
    INITIAL,    ///< First evaluated date of a run
    SCHEDULED,  ///< First trading day of a new calendar period
    DRIFT       ///< A weight moved past the drift threshold
};

std::string to_string(RebalanceTrigger trigger);
std::string to_string(RebalanceFrequency frequency);

struct RebalanceConfig {
    RebalanceFrequency frequency = RebalanceFrequency::MONTHLY;
    double drift_threshold = 0.0;  ///< Fraction of equity; 0 disables drift checks
    int min_days_between = 0;      ///< Calendar days between non-initial rebalances

    static RebalanceConfig from_json(const nlohmann::json& j);
    static RebalanceConfig from_string(const std::string& freq_str);
    static RebalanceFrequency parse_frequency(const std::string& freq_str);

    void validate() const;
};

/**
 * @class RebalanceScheduler
 * @brief Decides on which dates the policy is consulted.
 *
 * Calendar rebalances fire on the first trading date whose period key
 * (day, Monday-anchored week, month, quarter or year) differs from the key
 * of the last calendar rebalance. Drift rebalances never move the calendar.
 */
class RebalanceScheduler {
public:
    explicit RebalanceScheduler(const RebalanceConfig& config);
    ~RebalanceScheduler() = default;

    RebalanceTrigger evaluate(const std::string& date,
                              const Eigen::VectorXd& current_weights,
                              const Eigen::VectorXd& target_weights) const;

    bool should_rebalance(const std::string& date,
                          const Eigen::VectorXd& current_weights,
                          const Eigen::VectorXd& target_weights) const;

    bool is_calendar_trigger(const std::string& date) const;

    /**
     * @brief True when a held symbol's weight is more than drift_threshold away
     * from its target. Symbols with zero current weight are not held and never drift.
     * @throws std::invalid_argument If the vectors differ in size.
     */
    bool is_drift_trigger(const Eigen::VectorXd& current_weights,
                          const Eigen::VectorXd& target_weights) const;

    void record_rebalance(const std::string& date, RebalanceTrigger trigger);

    /** @brief Calendar bucket of a date under the configured frequency. */
    long long period_key(const std::string& date) const;

    const RebalanceConfig& config() const { return config_; }
    const std::string& last_rebalance_date() const { return last_rebalance_date_; }
    int rebalance_count() const { return rebalance_count_; }

private:
    RebalanceConfig config_;
    std::string last_rebalance_date_;
    long long last_period_key_;
    bool has_period_key_;
    int rebalance_count_;

    bool check_min_days(const std::string& date) const;
};

} // namespace backtest
} // namespace allocsim

#endif // ALLOCSIM_BACKTEST_REBALANCE_SCHEDULER_HPP
