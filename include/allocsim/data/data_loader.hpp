/**
 * @file data_loader.hpp
 * @brief Loading of market data and run configuration from files
 *
 * CSV price files come in two layouts:
 *  - long:  date,symbol,open,high,low,close,volume (one row per bar)
 *  - wide:  date,SYM1,SYM2,... (one close per symbol per row)
 *
 * load_csv() inspects the header and dispatches to the matching reader.
 */

#ifndef ALLOCSIM_DATA_DATA_LOADER_HPP
#define ALLOCSIM_DATA_DATA_LOADER_HPP

#include "allocsim/backtest/backtest_engine.hpp"
#include "allocsim/data/market_data.hpp"

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace allocsim
{
    namespace data
    {

        /**
         * @struct DataConfig
         * @brief Where the price history comes from
         */
        struct DataConfig
        {
            std::string data_file;               ///< CSV path; empty = synthetic data
            std::vector<std::string> universe;   ///< Symbols to load; empty = all in file
            size_t synthetic_days = 504;
            double synthetic_volatility = 0.01;
            double synthetic_drift = 0.0003;
            std::uint32_t synthetic_seed = 42;

            static DataConfig from_json(const nlohmann::json &j);
        };

        /**
         * @struct RunConfig
         * @brief Everything allocsim_run needs for one comparison
         */
        struct RunConfig
        {
            DataConfig data;
            backtest::BacktestParams backtest;
            nlohmann::json strategies = nlohmann::json::array();

            static RunConfig from_json(const nlohmann::json &j);
        };

        /**
         * @class DataLoader
         * @brief Static helpers for reading and writing data files
         */
        class DataLoader
        {
        public:
            /**
             * @brief Load a wide CSV of closes.
             *
             * Every bar gets open = high = low = close and zero volume.
             * Empty cells are gaps: that symbol does not trade on that date.
             *
             * @param filepath Path to CSV file
             * @param symbols Columns to load (empty = all)
             * @throws std::runtime_error If the file cannot be read or holds no data
             */
            static MarketData load_csv_wide(const std::string &filepath,
                                            const std::vector<std::string> &symbols = {});

            /**
             * @brief Load a long CSV with one OHLCV bar per row.
             *
             * The symbol column may be named "symbol" or "ticker". Missing
             * OHLC columns default to the close.
             *
             * @throws std::runtime_error If the file cannot be read or holds no data
             */
            static MarketData load_csv_long(const std::string &filepath,
                                            const std::vector<std::string> &symbols = {});

            /**
             * @brief Detect the layout from the header and load.
             */
            static MarketData load_csv(const std::string &filepath,
                                       const std::vector<std::string> &symbols = {});

            /**
             * @throws std::runtime_error On I/O or parse failure
             */
            static nlohmann::json load_json(const std::string &filepath);

            /**
             * @throws std::runtime_error On I/O or parse failure
             * @throws backtest::ConfigurationError On invalid backtest settings
             */
            static RunConfig load_config(const std::string &config_path);

            /**
             * @brief Geometric Brownian motion paths on weekdays.
             *
             * Deterministic for a given seed. Every path starts at 100.
             *
             * @param start_date First candidate date; weekends are skipped
             * @param volatility Daily return standard deviation
             * @param drift Daily expected return
             */
            static MarketData generate_synthetic_data(const std::vector<std::string> &symbols,
                                                      size_t num_days,
                                                      const std::string &start_date = "2020-01-01",
                                                      double volatility = 0.01,
                                                      double drift = 0.0003,
                                                      std::uint32_t seed = 42);

            /**
             * @throws std::runtime_error If the file cannot be written
             */
            static void save_csv_long(const MarketData &data, const std::string &filepath);

        private:
            static std::vector<std::string> parse_csv_line(const std::string &line);
            static std::string trim(const std::string &str);
            static std::string to_lower(const std::string &str);
            static double safe_stod(const std::string &str);
            static bool wanted(const std::vector<std::string> &symbols, const std::string &symbol);
        };

    } // namespace data
} // namespace allocsim

#endif // ALLOCSIM_DATA_DATA_LOADER_HPP
