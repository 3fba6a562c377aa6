/**
 * @file market_data.cpp
 * @brief Implementation of MarketData class
 */

#include "allocsim/data/market_data.hpp"

#include <iomanip>
#include <iostream>
#include <set>
#include <stdexcept>

namespace allocsim
{
    namespace data
    {

        // ============================================================================
        // Constructors
        // ============================================================================

        MarketData::MarketData(std::vector<PriceSeries> series)
        {
            for (auto &s : series)
            {
                add_series(std::move(s));
            }
        }

        // ============================================================================
        // Data Access Methods
        // ============================================================================

        void MarketData::add_series(PriceSeries series)
        {
            std::string symbol = series.symbol();
            if (series_.count(symbol))
            {
                throw std::invalid_argument("Duplicate series for symbol: " + symbol);
            }
            series_.emplace(symbol, std::move(series));
        }

        bool MarketData::has_symbol(const std::string &symbol) const
        {
            return series_.count(symbol) > 0;
        }

        const PriceSeries &MarketData::series(const std::string &symbol) const
        {
            auto it = series_.find(symbol);
            if (it == series_.end())
            {
                throw std::invalid_argument("Symbol not found: " + symbol);
            }
            return it->second;
        }

        std::vector<std::string> MarketData::symbols() const
        {
            std::vector<std::string> out;
            out.reserve(series_.size());
            for (const auto &entry : series_)
            {
                out.push_back(entry.first);
            }
            return out;
        }

        // ============================================================================
        // Point-in-time Queries
        // ============================================================================

        std::vector<std::string> MarketData::trading_dates(const std::string &start_date,
                                                           const std::string &end_date) const
        {
            std::set<std::string> dates;
            for (const auto &entry : series_)
            {
                for (const auto &bar : entry.second.bars())
                {
                    if (!start_date.empty() && bar.date < start_date)
                        continue;
                    if (!end_date.empty() && bar.date > end_date)
                        break;
                    dates.insert(bar.date);
                }
            }
            return std::vector<std::string>(dates.begin(), dates.end());
        }

        PriceMap MarketData::closes_on(const std::string &date) const
        {
            PriceMap prices;
            for (const auto &entry : series_)
            {
                auto bar = entry.second.bar_on(date);
                if (bar)
                {
                    prices[entry.first] = bar->close;
                }
            }
            return prices;
        }

        LookbackViews MarketData::views_as_of(const std::string &date) const
        {
            LookbackViews views;
            for (const auto &entry : series_)
            {
                views.emplace(entry.first, entry.second.as_of(date));
            }
            return views;
        }

        MarketData MarketData::select_symbols(const std::vector<std::string> &symbols) const
        {
            MarketData out;
            for (const auto &symbol : symbols)
            {
                out.add_series(series(symbol));
            }
            return out;
        }

        void MarketData::print_summary() const
        {
            std::cout << "MarketData: " << series_.size() << " symbols\n";
            for (const auto &entry : series_)
            {
                const PriceSeries &s = entry.second;
                std::cout << "  " << std::setw(8) << std::left << entry.first << std::right;
                if (s.empty())
                {
                    std::cout << " (no bars)\n";
                    continue;
                }
                std::cout << " " << s.size() << " bars  "
                          << s.first_date() << " .. " << s.last_date()
                          << "  last close " << std::fixed << std::setprecision(2)
                          << s.bars().back().close << "\n";
            }
        }

    } // namespace data
} // namespace allocsim
