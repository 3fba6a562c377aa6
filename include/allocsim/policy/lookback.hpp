/**
 * @file lookback.hpp
 * @brief Indicator helpers over point-in-time price views.
 *
 * All helpers take a PriceSeriesView, so they can only see bars on or
 * before the view's as-of date.
 */

#ifndef ALLOCSIM_POLICY_LOOKBACK_HPP
#define ALLOCSIM_POLICY_LOOKBACK_HPP

#include "allocsim/data/price_series.hpp"

#include <Eigen/Dense>
#include <cstddef>
#include <optional>

namespace allocsim
{
    namespace policy
    {

        /**
         * @brief Trailing window of at most n bars.
         */
        data::PriceSeriesView lookback(const data::PriceSeriesView &view, size_t n);

        /**
         * @brief Simple moving average of the last period closes.
         * @return Empty if fewer than period bars are available.
         */
        std::optional<double> moving_average(const data::PriceSeriesView &view, size_t period);

        /**
         * @brief Relative change between closes period bars apart, oldest first.
         *
         * Empty when the view has fewer than period + 1 bars.
         */
        Eigen::VectorXd period_returns(const data::PriceSeriesView &view, size_t period = 1);

        /**
         * @brief Sample standard deviation of returns.
         * @return 0 for fewer than two returns.
         */
        double volatility(const Eigen::VectorXd &returns, bool annualize = true,
                          int periods_per_year = 252);

        /**
         * @brief Total return over the last period bars.
         * @return Empty if fewer than period bars are available.
         */
        std::optional<double> momentum(const data::PriceSeriesView &view, size_t period);

    } // namespace policy
} // namespace allocsim

#endif // ALLOCSIM_POLICY_LOOKBACK_HPP
