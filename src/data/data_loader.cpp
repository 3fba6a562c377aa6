/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader and the run configuration structures
 */

#include "allocsim/data/data_loader.hpp"
#include "allocsim/backtest/errors.hpp"
#include "allocsim/data/calendar.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <map>
#include <random>
#include <sstream>
#include <stdexcept>

namespace allocsim
{
    namespace data
    {

        // =============================================
        // Configuration Structures - from_json Methods
        // =============================================

        DataConfig DataConfig::from_json(const nlohmann::json &j)
        {
            DataConfig config;
            config.data_file = j.value("data_file", "");
            config.universe = j.value("universe", std::vector<std::string>{});

            if (j.contains("synthetic"))
            {
                const auto &syn = j["synthetic"];
                config.synthetic_days = syn.value("num_days", config.synthetic_days);
                config.synthetic_volatility = syn.value("volatility", config.synthetic_volatility);
                config.synthetic_drift = syn.value("drift", config.synthetic_drift);
                config.synthetic_seed = syn.value("seed", config.synthetic_seed);
            }

            return config;
        }

        RunConfig RunConfig::from_json(const nlohmann::json &j)
        {
            RunConfig config;

            if (j.contains("data"))
            {
                config.data = DataConfig::from_json(j["data"]);
            }

            if (j.contains("backtest"))
            {
                config.backtest = backtest::BacktestParams::from_json(j["backtest"]);
            }

            if (j.contains("strategies"))
            {
                if (!j["strategies"].is_array())
                {
                    throw backtest::ConfigurationError("'strategies' must be an array");
                }
                config.strategies = j["strategies"];
            }

            return config;
        }

        // ===========================
        // CSV Loading - Wide Format
        // ===========================

        MarketData DataLoader::load_csv_wide(const std::string &filepath,
                                             const std::vector<std::string> &symbols)
        {
            std::ifstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file: " + filepath);
            }

            std::string line;
            if (!std::getline(file, line))
            {
                throw std::runtime_error("Empty CSV file: " + filepath);
            }

            auto header = parse_csv_line(line);
            if (header.empty() || to_lower(trim(header[0])) != "date")
            {
                throw std::runtime_error("CSV must start with 'date' column: " + filepath);
            }

            // Column index -> symbol, for the selected columns only
            std::vector<std::pair<size_t, std::string>> columns;
            for (size_t i = 1; i < header.size(); ++i)
            {
                std::string symbol = trim(header[i]);
                if (!symbol.empty() && wanted(symbols, symbol))
                {
                    columns.emplace_back(i, symbol);
                }
            }

            if (columns.empty())
            {
                throw std::runtime_error("None of the requested symbols found in CSV: " + filepath);
            }

            std::map<std::string, std::vector<Bar>> bars;
            while (std::getline(file, line))
            {
                if (trim(line).empty())
                    continue;

                auto fields = parse_csv_line(line);
                std::string date = trim(fields[0]);
                if (!is_valid_date(date))
                {
                    continue; // Skip invalid dates
                }

                for (const auto &col : columns)
                {
                    if (col.first >= fields.size())
                        continue;

                    double close = safe_stod(fields[col.first]);
                    if (std::isnan(close))
                        continue;

                    Bar bar;
                    bar.date = date;
                    bar.open = bar.high = bar.low = bar.close = close;
                    bars[col.second].push_back(bar);
                }
            }

            file.close();

            MarketData data;
            for (auto &entry : bars)
            {
                std::sort(entry.second.begin(), entry.second.end(),
                          [](const Bar &a, const Bar &b)
                          { return a.date < b.date; });
                try
                {
                    data.add_series(PriceSeries(entry.first, std::move(entry.second)));
                }
                catch (const std::invalid_argument &e)
                {
                    throw std::runtime_error("Invalid price data in " + filepath + ": " + e.what());
                }
            }

            if (data.empty())
            {
                throw std::runtime_error("No valid data found in CSV file: " + filepath);
            }

            return data;
        }

        // ===========================
        // CSV Loading - Long Format
        // ===========================

        MarketData DataLoader::load_csv_long(const std::string &filepath,
                                             const std::vector<std::string> &symbols)
        {
            std::ifstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file: " + filepath);
            }

            std::string line;
            if (!std::getline(file, line))
            {
                throw std::runtime_error("Empty CSV file: " + filepath);
            }

            // Locate columns by name so their order does not matter
            auto header = parse_csv_line(line);
            std::map<std::string, size_t> index;
            for (size_t i = 0; i < header.size(); ++i)
            {
                index[to_lower(trim(header[i]))] = i;
            }

            auto column = [&index](const std::string &name) -> long
            {
                auto it = index.find(name);
                return it == index.end() ? -1 : static_cast<long>(it->second);
            };

            long date_col = column("date");
            long symbol_col = column("symbol") >= 0 ? column("symbol") : column("ticker");
            long close_col = column("close") >= 0 ? column("close") : column("price");
            long open_col = column("open");
            long high_col = column("high");
            long low_col = column("low");
            long volume_col = column("volume");

            if (date_col < 0 || symbol_col < 0 || close_col < 0)
            {
                throw std::runtime_error("Long CSV needs date, symbol and close columns: " + filepath);
            }

            auto field_or = [](const std::vector<std::string> &fields, long col, double fallback)
            {
                if (col < 0 || static_cast<size_t>(col) >= fields.size())
                    return fallback;
                double v = safe_stod(fields[static_cast<size_t>(col)]);
                return std::isnan(v) ? fallback : v;
            };

            // symbol -> date -> bar; the inner map keeps dates sorted
            std::map<std::string, std::map<std::string, Bar>> bars;

            while (std::getline(file, line))
            {
                if (trim(line).empty())
                    continue;

                auto fields = parse_csv_line(line);
                if (static_cast<size_t>(std::max(date_col, std::max(symbol_col, close_col))) >= fields.size())
                    continue;

                std::string date = trim(fields[static_cast<size_t>(date_col)]);
                std::string symbol = trim(fields[static_cast<size_t>(symbol_col)]);
                double close = safe_stod(fields[static_cast<size_t>(close_col)]);

                if (!is_valid_date(date) || symbol.empty() || std::isnan(close))
                    continue;

                if (!wanted(symbols, symbol))
                    continue;

                Bar bar;
                bar.date = date;
                bar.close = close;
                bar.open = field_or(fields, open_col, close);
                bar.high = field_or(fields, high_col, close);
                bar.low = field_or(fields, low_col, close);
                bar.volume = field_or(fields, volume_col, 0.0);

                bars[symbol][date] = bar;
            }

            file.close();

            MarketData data;
            for (const auto &entry : bars)
            {
                std::vector<Bar> series;
                series.reserve(entry.second.size());
                for (const auto &dated : entry.second)
                {
                    series.push_back(dated.second);
                }

                try
                {
                    data.add_series(PriceSeries(entry.first, std::move(series)));
                }
                catch (const std::invalid_argument &e)
                {
                    throw std::runtime_error("Invalid price data in " + filepath + ": " + e.what());
                }
            }

            if (data.empty())
            {
                throw std::runtime_error("No valid data found in CSV file: " + filepath);
            }

            return data;
        }

        // ========================
        // Auto-detect CSV Format
        // ========================

        MarketData DataLoader::load_csv(const std::string &filepath,
                                        const std::vector<std::string> &symbols)
        {
            std::ifstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file: " + filepath);
            }

            std::string line;
            std::getline(file, line);
            file.close();

            // Long format names its symbol column; wide format uses symbols as headers
            for (const auto &field : parse_csv_line(line))
            {
                std::string name = to_lower(trim(field));
                if (name == "symbol" || name == "ticker")
                {
                    return load_csv_long(filepath, symbols);
                }
            }

            return load_csv_wide(filepath, symbols);
        }

        // ================
        // JSON Loading
        // ================

        nlohmann::json DataLoader::load_json(const std::string &filepath)
        {
            std::ifstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open JSON file: " + filepath);
            }

            nlohmann::json j;
            try
            {
                file >> j;
            }
            catch (const nlohmann::json::exception &e)
            {
                throw std::runtime_error("JSON parsing error: " + std::string(e.what()));
            }

            file.close();
            return j;
        }

        RunConfig DataLoader::load_config(const std::string &config_path)
        {
            return RunConfig::from_json(load_json(config_path));
        }

        // ===========================
        // Synthetic Data Generation
        // ===========================

        MarketData DataLoader::generate_synthetic_data(const std::vector<std::string> &symbols,
                                                       size_t num_days,
                                                       const std::string &start_date,
                                                       double volatility,
                                                       double drift,
                                                       std::uint32_t seed)
        {
            if (symbols.empty())
            {
                throw std::invalid_argument("generate_synthetic_data requires at least one symbol");
            }
            if (num_days == 0)
            {
                throw std::invalid_argument("generate_synthetic_data requires num_days > 0");
            }
            if (!is_valid_date(start_date))
            {
                throw std::invalid_argument("Invalid start date: " + start_date);
            }
            if (!(volatility >= 0.0))
            {
                throw std::invalid_argument("Expected non-negative value for parameter 'volatility', got: " +
                                            std::to_string(volatility));
            }

            std::mt19937 gen(seed);
            std::normal_distribution<double> dist(0.0, 1.0);

            // Weekday calendar shared by every path
            std::vector<std::string> dates;
            dates.reserve(num_days);
            std::string date = start_date;
            while (dates.size() < num_days)
            {
                if (day_of_week(date) < 5)
                {
                    dates.push_back(date);
                }
                date = add_days(date, 1);
            }

            // Log-normal steps keep every price strictly positive
            const double step_drift = drift - 0.5 * volatility * volatility;

            MarketData data;
            for (const auto &symbol : symbols)
            {
                std::vector<Bar> bars;
                bars.reserve(num_days);

                double price = 100.0;
                for (size_t i = 0; i < num_days; ++i)
                {
                    double open = price;
                    if (i > 0)
                    {
                        price *= std::exp(step_drift + volatility * dist(gen));
                    }

                    Bar bar;
                    bar.date = dates[i];
                    bar.open = open;
                    bar.close = price;
                    bar.high = std::max(open, price);
                    bar.low = std::min(open, price);
                    bar.volume = 1.0e6;
                    bars.push_back(bar);
                }

                data.add_series(PriceSeries(symbol, std::move(bars)));
            }

            return data;
        }

        // ==================
        // Export Methods
        // ==================

        void DataLoader::save_csv_long(const MarketData &data, const std::string &filepath)
        {
            std::filesystem::path path(filepath);
            if (path.has_parent_path())
            {
                std::filesystem::create_directories(path.parent_path());
            }

            std::ofstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file for writing: " + filepath);
            }

            file << "date,symbol,open,high,low,close,volume\n";
            file << std::fixed << std::setprecision(6);

            for (const auto &symbol : data.symbols())
            {
                for (const auto &bar : data.series(symbol).bars())
                {
                    file << bar.date << "," << symbol << ","
                         << bar.open << "," << bar.high << "," << bar.low << ","
                         << bar.close << "," << bar.volume << "\n";
                }
            }

            file.close();
        }

        // =======================
        // Private Helper Methods
        // =======================

        std::vector<std::string> DataLoader::parse_csv_line(const std::string &line)
        {
            std::vector<std::string> tokens;
            std::string token;
            bool in_quotes = false;

            for (char c : line)
            {
                if (c == '"')
                {
                    in_quotes = !in_quotes;
                }
                else if (c == ',' && !in_quotes)
                {
                    tokens.push_back(token);
                    token.clear();
                }
                else
                {
                    token += c;
                }
            }

            tokens.push_back(token);
            return tokens;
        }

        std::string DataLoader::trim(const std::string &str)
        {
            size_t first = str.find_first_not_of(" \t\r\n");
            if (first == std::string::npos)
                return "";

            size_t last = str.find_last_not_of(" \t\r\n");
            return str.substr(first, last - first + 1);
        }

        std::string DataLoader::to_lower(const std::string &str)
        {
            std::string out = str;
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return out;
        }

        double DataLoader::safe_stod(const std::string &str)
        {
            std::string trimmed = trim(str);
            if (trimmed.empty() || to_lower(trimmed) == "nan")
            {
                return std::numeric_limits<double>::quiet_NaN();
            }

            try
            {
                size_t consumed = 0;
                double value = std::stod(trimmed, &consumed);
                if (consumed != trimmed.size())
                {
                    return std::numeric_limits<double>::quiet_NaN();
                }
                return value;
            }
            catch (const std::invalid_argument &)
            {
                return std::numeric_limits<double>::quiet_NaN();
            }
            catch (const std::out_of_range &)
            {
                return std::numeric_limits<double>::quiet_NaN();
            }
        }

        bool DataLoader::wanted(const std::vector<std::string> &symbols, const std::string &symbol)
        {
            return symbols.empty() ||
                   std::find(symbols.begin(), symbols.end(), symbol) != symbols.end();
        }

    } // namespace data
} // namespace allocsim
