#ifndef ALLOCSIM_BACKTEST_ERRORS_HPP
#define ALLOCSIM_BACKTEST_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace allocsim {
namespace backtest {

/**
 * @brief Invalid run configuration, detected before the date loop starts.
 */
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what)
        : std::invalid_argument("configuration error: " + what) {}
};

/**
 * @brief Base for errors that abort a run once the date loop has started.
 */
class BacktestError : public std::runtime_error {
public:
    explicit BacktestError(const std::string& what) : std::runtime_error(what) {}
};

class InsufficientCashError : public BacktestError {
public:
    InsufficientCashError(const std::string& symbol, double required, double available);

    const std::string& symbol() const { return symbol_; }
    double required() const { return required_; }
    double available() const { return available_; }

private:
    std::string symbol_;
    double required_;
    double available_;
};

/**
 * @brief A held position cannot be marked to market on a date.
 */
class MissingPriceError : public BacktestError {
public:
    MissingPriceError(const std::string& symbol, const std::string& date);

    const std::string& symbol() const { return symbol_; }
    const std::string& date() const { return date_; }

private:
    std::string symbol_;
    std::string date_;
};

/**
 * @brief The allocation policy threw or returned a malformed allocation.
 */
class PolicyError : public BacktestError {
public:
    PolicyError(const std::string& policy_name, const std::string& date, const std::string& detail);

    const std::string& policy_name() const { return policy_name_; }
    const std::string& date() const { return date_; }

private:
    std::string policy_name_;
    std::string date_;
};

class TimeBudgetExceeded : public BacktestError {
public:
    TimeBudgetExceeded(const std::string& date, long long budget_ms);

    const std::string& date() const { return date_; }

private:
    std::string date_;
};

} // namespace backtest
} // namespace allocsim

#endif // ALLOCSIM_BACKTEST_ERRORS_HPP
