#include "allocsim/backtest/rebalance_scheduler.hpp"
#include "allocsim/data/calendar.hpp"

#include <cmath>
#include <algorithm>
#include <cctype>

namespace allocsim {
namespace backtest {

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

// Floor division; day numbers before 1970 are negative.
static long long floor_div(long long a, long long b) {
    long long q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

std::string to_string(RebalanceTrigger trigger) {
    switch (trigger) {
        case RebalanceTrigger::NONE: return "none";
        case RebalanceTrigger::INITIAL: return "initial";
        case RebalanceTrigger::SCHEDULED: return "scheduled";
        case RebalanceTrigger::DRIFT: return "drift";
    }
    return "unknown";
}

std::string to_string(RebalanceFrequency frequency) {
    switch (frequency) {
        case RebalanceFrequency::DAILY: return "daily";
        case RebalanceFrequency::WEEKLY: return "weekly";
        case RebalanceFrequency::MONTHLY: return "monthly";
        case RebalanceFrequency::QUARTERLY: return "quarterly";
        case RebalanceFrequency::ANNUALLY: return "annually";
    }
    return "unknown";
}

RebalanceConfig RebalanceConfig::from_json(const nlohmann::json& j) {
    RebalanceConfig cfg;
    if (j.contains("frequency")) {
        cfg.frequency = parse_frequency(j.at("frequency").get<std::string>());
    }
    if (j.contains("drift_threshold")) {
        cfg.drift_threshold = j.at("drift_threshold").get<double>();
    }
    if (j.contains("min_days_between")) {
        cfg.min_days_between = j.at("min_days_between").get<int>();
    }
    cfg.validate();
    return cfg;
}

RebalanceConfig RebalanceConfig::from_string(const std::string& freq_str) {
    RebalanceConfig cfg;
    cfg.frequency = parse_frequency(freq_str);
    return cfg;
}

RebalanceFrequency RebalanceConfig::parse_frequency(const std::string& freq_str) {
    auto s = to_lower(freq_str);
    if (s == "daily" || s == "d") return RebalanceFrequency::DAILY;
    if (s == "weekly" || s == "w") return RebalanceFrequency::WEEKLY;
    if (s == "monthly" || s == "m") return RebalanceFrequency::MONTHLY;
    if (s == "quarterly" || s == "q") return RebalanceFrequency::QUARTERLY;
    if (s == "annually" || s == "annual" || s == "y" || s == "yearly") return RebalanceFrequency::ANNUALLY;
    throw std::invalid_argument("Invalid rebalance frequency: " + freq_str);
}

void RebalanceConfig::validate() const {
    if (!std::isfinite(drift_threshold) || drift_threshold < 0.0 || drift_threshold > 1.0) {
        throw std::invalid_argument("drift_threshold must be in [0, 1]");
    }
    if (min_days_between < 0) {
        throw std::invalid_argument("min_days_between must be >= 0");
    }
}

RebalanceScheduler::RebalanceScheduler(const RebalanceConfig& config)
    : config_(config), last_rebalance_date_(), last_period_key_(0),
      has_period_key_(false), rebalance_count_(0) {
    config_.validate();
}

RebalanceTrigger RebalanceScheduler::evaluate(const std::string& date,
                                              const Eigen::VectorXd& current_weights,
                                              const Eigen::VectorXd& target_weights) const {
    if (last_rebalance_date_.empty()) return RebalanceTrigger::INITIAL;
    if (!check_min_days(date)) return RebalanceTrigger::NONE;
    if (is_calendar_trigger(date)) return RebalanceTrigger::SCHEDULED;
    if (is_drift_trigger(current_weights, target_weights)) return RebalanceTrigger::DRIFT;
    return RebalanceTrigger::NONE;
}

bool RebalanceScheduler::should_rebalance(const std::string& date,
                                         const Eigen::VectorXd& current_weights,
                                         const Eigen::VectorXd& target_weights) const {
    return evaluate(date, current_weights, target_weights) != RebalanceTrigger::NONE;
}

bool RebalanceScheduler::is_calendar_trigger(const std::string& date) const {
    if (!has_period_key_) return true;
    return period_key(date) != last_period_key_;
}

bool RebalanceScheduler::is_drift_trigger(const Eigen::VectorXd& current_weights,
                                         const Eigen::VectorXd& target_weights) const {
    if (config_.drift_threshold <= 0.0) return false;
    if (current_weights.size() != target_weights.size())
        throw std::invalid_argument("Weight vectors must have same size");
    for (int i = 0; i < current_weights.size(); ++i) {
        // Only held symbols can drift; an unheld target waits for the next scheduled rebalance.
        if (std::abs(current_weights[i]) < 1e-12) continue;
        if (std::abs(current_weights[i] - target_weights[i]) > config_.drift_threshold) return true;
    }
    return false;
}

void RebalanceScheduler::record_rebalance(const std::string& date, RebalanceTrigger trigger) {
    if (trigger == RebalanceTrigger::NONE) {
        throw std::invalid_argument("record_rebalance called without a trigger on " + date);
    }
    last_rebalance_date_ = date;
    ++rebalance_count_;
    if (trigger == RebalanceTrigger::INITIAL || trigger == RebalanceTrigger::SCHEDULED) {
        last_period_key_ = period_key(date);
        has_period_key_ = true;
    }
}

long long RebalanceScheduler::period_key(const std::string& date) const {
    switch (config_.frequency) {
        case RebalanceFrequency::DAILY:
            return data::day_number(date);
        case RebalanceFrequency::WEEKLY:
            // 1970-01-01 was a Thursday; shift so weeks start on Monday.
            return floor_div(data::day_number(date) + 3, 7);
        case RebalanceFrequency::MONTHLY:
            return static_cast<long long>(data::extract_year(date)) * 12 + (data::extract_month(date) - 1);
        case RebalanceFrequency::QUARTERLY:
            return static_cast<long long>(data::extract_year(date)) * 4 + (data::extract_month(date) - 1) / 3;
        case RebalanceFrequency::ANNUALLY:
            return data::extract_year(date);
    }
    return 0;
}

bool RebalanceScheduler::check_min_days(const std::string& date) const {
    if (config_.min_days_between <= 0) return true;
    if (last_rebalance_date_.empty()) return true;
    return data::days_between(last_rebalance_date_, date) >= config_.min_days_between;
}

} // namespace backtest
} // namespace allocsim
