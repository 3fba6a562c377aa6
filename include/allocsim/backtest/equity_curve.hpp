#ifndef ALLOCSIM_BACKTEST_EQUITY_CURVE_HPP
#define ALLOCSIM_BACKTEST_EQUITY_CURVE_HPP

#include <string>
#include <vector>

namespace allocsim {
namespace backtest {

/**
 * @brief Post-trade portfolio value at the close of one trading date.
 */
struct EquityPoint {
    std::string date;
    double equity = 0.0;
};

/// One point per trading date, in strictly increasing date order.
using EquityCurve = std::vector<EquityPoint>;

} // namespace backtest
} // namespace allocsim

#endif // ALLOCSIM_BACKTEST_EQUITY_CURVE_HPP
