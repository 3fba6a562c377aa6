#include "allocsim/backtest/errors.hpp"

#include <sstream>

namespace allocsim {
namespace backtest {

static std::string insufficient_cash_message(const std::string& symbol, double required, double available) {
    std::ostringstream msg;
    msg << "insufficient cash";
    if (!symbol.empty()) msg << " for " << symbol;
    msg << ": required " << required << ", available " << available;
    return msg.str();
}

InsufficientCashError::InsufficientCashError(const std::string& symbol, double required, double available)
    : BacktestError(insufficient_cash_message(symbol, required, available)),
      symbol_(symbol), required_(required), available_(available) {}

MissingPriceError::MissingPriceError(const std::string& symbol, const std::string& date)
    : BacktestError("missing price for held position " + symbol + " on " + (date.empty() ? std::string("<unknown date>") : date)),
      symbol_(symbol), date_(date) {}

PolicyError::PolicyError(const std::string& policy_name, const std::string& date, const std::string& detail)
    : BacktestError("policy '" + policy_name + "' failed on " + date + ": " + detail),
      policy_name_(policy_name), date_(date) {}

TimeBudgetExceeded::TimeBudgetExceeded(const std::string& date, long long budget_ms)
    : BacktestError("time budget of " + std::to_string(budget_ms) + " ms exceeded at " + date + "; run aborted"),
      date_(date) {}

} // namespace backtest
} // namespace allocsim
