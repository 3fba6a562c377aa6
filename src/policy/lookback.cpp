#include "allocsim/policy/lookback.hpp"

#include <cmath>
#include <stdexcept>

namespace allocsim
{
    namespace policy
    {

        data::PriceSeriesView lookback(const data::PriceSeriesView &view, size_t n)
        {
            return view.tail(n);
        }

        std::optional<double> moving_average(const data::PriceSeriesView &view, size_t period)
        {
            if (period == 0)
            {
                throw std::invalid_argument("moving_average period must be > 0");
            }
            if (view.size() < period)
            {
                return std::nullopt;
            }
            return view.tail(period).closes().mean();
        }

        Eigen::VectorXd period_returns(const data::PriceSeriesView &view, size_t period)
        {
            if (period == 0)
            {
                throw std::invalid_argument("period_returns period must be > 0");
            }
            if (view.size() < period + 1)
            {
                return Eigen::VectorXd();
            }

            const int n = static_cast<int>(view.size() - period);
            Eigen::VectorXd returns(n);
            for (int i = 0; i < n; ++i)
            {
                double prev = view[static_cast<size_t>(i)].close;
                double cur = view[static_cast<size_t>(i) + period].close;
                returns[i] = (cur - prev) / prev;
            }
            return returns;
        }

        double volatility(const Eigen::VectorXd &returns, bool annualize, int periods_per_year)
        {
            const int n = static_cast<int>(returns.size());
            if (n < 2)
            {
                return 0.0;
            }

            double mean = returns.mean();
            double variance = (returns.array() - mean).square().sum() / (n - 1);
            double std_dev = std::sqrt(variance);

            if (annualize)
            {
                return std_dev * std::sqrt(static_cast<double>(periods_per_year));
            }
            return std_dev;
        }

        std::optional<double> momentum(const data::PriceSeriesView &view, size_t period)
        {
            if (period == 0)
            {
                throw std::invalid_argument("momentum period must be > 0");
            }
            if (view.size() < period)
            {
                return std::nullopt;
            }

            data::PriceSeriesView window = view.tail(period);
            double start_price = window.front().close;
            double end_price = window.back().close;
            return (end_price - start_price) / start_price;
        }

    } // namespace policy
} // namespace allocsim
