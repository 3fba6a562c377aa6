/**
 * @file price_series.cpp
 * @brief Implementation of PriceSeries and PriceSeriesView
 */

#include "allocsim/data/price_series.hpp"
#include "allocsim/data/calendar.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace allocsim
{
    namespace data
    {

        // ============================================================================
        // PriceSeriesView
        // ============================================================================

        PriceSeriesView::PriceSeriesView(const std::string &symbol, const Bar *data, size_t size,
                                         const std::string &as_of_date)
            : symbol_(symbol), data_(data), size_(size), as_of_date_(as_of_date)
        {
        }

        const Bar &PriceSeriesView::operator[](size_t index) const
        {
            if (index >= size_)
            {
                throw std::out_of_range("Bar index " + std::to_string(index) + " out of range for view of size " + std::to_string(size_));
            }
            return data_[index];
        }

        const Bar &PriceSeriesView::front() const
        {
            return (*this)[0];
        }

        const Bar &PriceSeriesView::back() const
        {
            if (size_ == 0)
            {
                throw std::out_of_range("back() on empty view for " + symbol_);
            }
            return data_[size_ - 1];
        }

        PriceSeriesView PriceSeriesView::tail(size_t n) const
        {
            size_t count = std::min(n, size_);
            return PriceSeriesView(symbol_, data_ + (size_ - count), count, as_of_date_);
        }

        Eigen::VectorXd PriceSeriesView::closes() const
        {
            Eigen::VectorXd out(static_cast<Eigen::Index>(size_));
            for (size_t i = 0; i < size_; ++i)
            {
                out[static_cast<Eigen::Index>(i)] = data_[i].close;
            }
            return out;
        }

        // ============================================================================
        // PriceSeries
        // ============================================================================

        PriceSeries::PriceSeries(const std::string &symbol, std::vector<Bar> bars)
            : symbol_(symbol), bars_(std::move(bars))
        {
            validate();
        }

        void PriceSeries::validate() const
        {
            if (symbol_.empty())
            {
                throw std::invalid_argument("PriceSeries symbol must not be empty");
            }

            for (size_t i = 0; i < bars_.size(); ++i)
            {
                const Bar &bar = bars_[i];
                if (!is_valid_date(bar.date))
                {
                    throw std::invalid_argument(symbol_ + ": invalid bar date '" + bar.date + "'");
                }
                if (!(bar.close > 0.0) || !std::isfinite(bar.close))
                {
                    std::ostringstream msg;
                    msg << symbol_ << ": close on " << bar.date << " is not positive: " << bar.close;
                    throw std::invalid_argument(msg.str());
                }
                if (i > 0 && !(bars_[i - 1].date < bar.date))
                {
                    throw std::invalid_argument(symbol_ + ": bars must be strictly ascending by date, got '" + bars_[i - 1].date + "' followed by '" + bar.date + "'");
                }
            }
        }

        const std::string &PriceSeries::first_date() const
        {
            if (bars_.empty())
            {
                throw std::out_of_range("Empty price series: " + symbol_);
            }
            return bars_.front().date;
        }

        const std::string &PriceSeries::last_date() const
        {
            if (bars_.empty())
            {
                throw std::out_of_range("Empty price series: " + symbol_);
            }
            return bars_.back().date;
        }

        size_t PriceSeries::upper_index(const std::string &date) const
        {
            auto it = std::upper_bound(bars_.begin(), bars_.end(), date,
                                       [](const std::string &d, const Bar &bar)
                                       { return d < bar.date; });
            return static_cast<size_t>(std::distance(bars_.begin(), it));
        }

        PriceSeriesView PriceSeries::as_of(const std::string &as_of_date) const
        {
            return PriceSeriesView(symbol_, bars_.data(), upper_index(as_of_date), as_of_date);
        }

        std::optional<Bar> PriceSeries::bar_on(const std::string &date) const
        {
            size_t idx = upper_index(date);
            if (idx == 0 || bars_[idx - 1].date != date)
            {
                return std::nullopt;
            }
            return bars_[idx - 1];
        }

        std::optional<double> PriceSeries::last_close_on_or_before(const std::string &date) const
        {
            size_t idx = upper_index(date);
            if (idx == 0)
            {
                return std::nullopt;
            }
            return bars_[idx - 1].close;
        }

    } // namespace data
} // namespace allocsim
