/*
 * @file market_data.hpp
 * @brief Multi-symbol daily price dataset.
 *
 * Groups one PriceSeries per symbol and answers the questions the
 * backtester asks of historical data: which dates are trading dates in a
 * range, which symbols trade on a date, and what each symbol's history
 * looks like as of a date.
 */

#ifndef ALLOCSIM_DATA_MARKET_DATA_HPP
#define ALLOCSIM_DATA_MARKET_DATA_HPP

#include "allocsim/data/price_series.hpp"

#include <map>
#include <string>
#include <vector>

namespace allocsim
{
    namespace data
    {

        /// Symbol -> price on one date.
        using PriceMap = std::map<std::string, double>;

        /// Symbol -> history restricted to bars on or before one date.
        using LookbackViews = std::map<std::string, PriceSeriesView>;

        /**
         * @class MarketData
         * @brief Container for multi-asset daily bar histories.
         *
         * Series may start and end on different dates; a symbol that has no
         * bar on a date simply does not trade that day.
         *
         * @note Views returned by views_as_of() borrow storage from this
         *       object and must not outlive it.
         */
        class MarketData
        {
        public:
            MarketData() = default;
            explicit MarketData(std::vector<PriceSeries> series);

            ~MarketData() = default;

            /** ===========================================
             *  Data Access Methods
             *  ===========================================
             */

            /**
             * @brief Add a series.
             * @throws std::invalid_argument If the symbol is already present.
             */
            void add_series(PriceSeries series);

            bool has_symbol(const std::string &symbol) const;

            /**
             * @brief Series for a symbol.
             * @throws std::invalid_argument If the symbol is unknown.
             */
            const PriceSeries &series(const std::string &symbol) const;

            /** @brief Symbols in ascending order. */
            std::vector<std::string> symbols() const;

            size_t num_symbols() const { return series_.size(); }
            bool empty() const { return series_.empty(); }

            /** ===========================================
             *  Point-in-time Queries
             *  ===========================================
             */

            /**
             * @brief Union of all series' dates within [start_date, end_date].
             *
             * Empty bounds are treated as open. Result is sorted and unique.
             */
            std::vector<std::string> trading_dates(const std::string &start_date = "",
                                                   const std::string &end_date = "") const;

            /** @brief Close of every symbol with a bar exactly on date. */
            PriceMap closes_on(const std::string &date) const;

            /** @brief Lookback views of every symbol, cut at date. */
            LookbackViews views_as_of(const std::string &date) const;

            /**
             * @brief Restrict to a subset of symbols.
             * @throws std::invalid_argument If a requested symbol is missing.
             */
            MarketData select_symbols(const std::vector<std::string> &symbols) const;

            void print_summary() const;

        private:
            std::map<std::string, PriceSeries> series_;
        };

    } // namespace data
} // namespace allocsim

#endif // ALLOCSIM_DATA_MARKET_DATA_HPP
