/**
 * @file price_series.hpp
 * @brief Per-symbol daily bar storage and point-in-time views.
 *
 * A PriceSeries owns the bars of one symbol in strictly ascending date
 * order. A PriceSeriesView is a read-only window onto a prefix of that
 * series: every bar it exposes has a date on or before the view's as-of
 * date, so a policy holding a view cannot reach future data.
 */

#ifndef ALLOCSIM_DATA_PRICE_SERIES_HPP
#define ALLOCSIM_DATA_PRICE_SERIES_HPP

#include <Eigen/Dense>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace allocsim
{
    namespace data
    {

        /**
         * @struct Bar
         * @brief One trading day's OHLCV record.
         */
        struct Bar
        {
            std::string date; ///< Trading date (YYYY-MM-DD)
            double open = 0.0;
            double high = 0.0;
            double low = 0.0;
            double close = 0.0;
            double volume = 0.0;
        };

        /**
         * @class PriceSeriesView
         * @brief Non-owning, read-only prefix of a PriceSeries.
         *
         * @note The view borrows the series' storage; the series must outlive it.
         */
        class PriceSeriesView
        {
        public:
            using const_iterator = const Bar *;

            PriceSeriesView() = default;
            PriceSeriesView(const std::string &symbol, const Bar *data, size_t size,
                            const std::string &as_of_date);

            const std::string &symbol() const { return symbol_; }

            /** @brief Date the view was cut at; no bar is later than this. */
            const std::string &as_of_date() const { return as_of_date_; }

            size_t size() const { return size_; }
            bool empty() const { return size_ == 0; }

            /**
             * @throws std::out_of_range If index >= size().
             */
            const Bar &operator[](size_t index) const;
            const Bar &front() const;
            const Bar &back() const;

            const_iterator begin() const { return data_; }
            const_iterator end() const { return data_ + size_; }

            /**
             * @brief Trailing window of at most n bars ending at the as-of date.
             *
             * Returns fewer than n bars when the history is shorter (partial
             * lookback); callers decide whether that is enough.
             */
            PriceSeriesView tail(size_t n) const;

            /** @brief Close prices of the view, oldest first. */
            Eigen::VectorXd closes() const;

        private:
            std::string symbol_;
            const Bar *data_ = nullptr;
            size_t size_ = 0;
            std::string as_of_date_;
        };

        /**
         * @class PriceSeries
         * @brief Immutable, date-ordered bar history for one symbol.
         */
        class PriceSeries
        {
        public:
            /**
             * @brief Construct and validate a series.
             * @param symbol Asset identifier (non-empty).
             * @param bars Bars in strictly ascending date order.
             * @throws std::invalid_argument On an empty symbol, malformed date,
             *         unordered or duplicate dates, or a non-positive close.
             */
            PriceSeries(const std::string &symbol, std::vector<Bar> bars);

            const std::string &symbol() const { return symbol_; }
            const std::vector<Bar> &bars() const { return bars_; }
            size_t size() const { return bars_.size(); }
            bool empty() const { return bars_.empty(); }

            const std::string &first_date() const;
            const std::string &last_date() const;

            /**
             * @brief All bars with date <= as_of_date.
             */
            PriceSeriesView as_of(const std::string &as_of_date) const;

            /** @brief Bar dated exactly on date, if any. */
            std::optional<Bar> bar_on(const std::string &date) const;

            /** @brief Close of the latest bar on or before date, if any. */
            std::optional<double> last_close_on_or_before(const std::string &date) const;

        private:
            std::string symbol_;
            std::vector<Bar> bars_;

            size_t upper_index(const std::string &date) const;
            void validate() const;
        };

    } // namespace data
} // namespace allocsim

#endif // ALLOCSIM_DATA_PRICE_SERIES_HPP
