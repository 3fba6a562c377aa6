/**
 * @file main.cpp
 * @brief Main entry point for the allocsim backtester
 *
 * Command-line application that loads a run configuration and price
 * history, backtests every configured allocation strategy, and writes the
 * equity curves, trade logs and performance metrics.
 */

#include "allocsim/backtest/backtest_engine.hpp"
#include "allocsim/backtest/errors.hpp"
#include "allocsim/backtest/strategy_comparison.hpp"
#include "allocsim/backtest/trade_logger.hpp"
#include "allocsim/data/data_loader.hpp"
#include "allocsim/data/market_data.hpp"
#include "allocsim/policy/policy_factory.hpp"

#include <cctype>
#include <chrono>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace allocsim;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "allocsim v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config PATH         Path to configuration JSON file (required)\n"
              << "  --output PATH         Path to output directory (default: results/)\n"
              << "  --jobs N              Strategies to backtest concurrently (default: 4)\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --config data/config/backtest_config.json --verbose\n"
              << std::endl;
}

/**
 * @brief Print banner
 */
void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       allocsim v1.0.0                                         \n"
              << "       Daily Portfolio Allocation Backtester                   \n"
              << "================================================================\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string config_path;
    std::string output_dir = "results";
    size_t jobs = 4;
    bool verbose = false;
    bool show_help = false;

    static CommandLineArgs parse(int argc, char *argv[])
    {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                args.show_help = true;
            }
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--output" && i + 1 < argc)
            {
                args.output_dir = argv[++i];
            }
            else if (arg == "--jobs" && i + 1 < argc)
            {
                args.jobs = static_cast<size_t>(std::stoul(argv[++i]));
            }
            else if (arg == "--verbose")
            {
                args.verbose = true;
            }
            else
            {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        return args;
    }

    bool is_valid() const
    {
        return !show_help && !config_path.empty();
    }
};

/**
 * @brief File-name friendly form of a strategy name ("60/40" -> "60_40")
 */
std::string file_stem(const std::string &name)
{
    std::string stem;
    for (char c : name)
    {
        stem += std::isalnum(static_cast<unsigned char>(c)) || c == '-' ? c : '_';
    }
    return stem.empty() ? std::string("strategy") : stem;
}

/**
 * @brief Write equity curve, trade log and metrics JSON for one result
 */
void export_result(const backtest::BacktestResult &result, const std::string &output_dir)
{
    const std::string stem = output_dir + "/" + file_stem(result.strategy_name);

    result.export_equity_to_csv(stem + "_equity.csv");

    backtest::TradeLogger logger;
    for (const auto &trade : result.trades)
    {
        logger.log_trade(trade);
    }
    logger.export_to_csv(stem + "_trades.csv");

    std::ofstream json_file(stem + "_metrics.json");
    if (!json_file.is_open())
    {
        throw std::runtime_error("Could not open file for writing: " + stem + "_metrics.json");
    }
    json_file << result.export_analytics_json() << "\n";
}

/**
 * @brief Main execution function
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    try
    {
        // ====================================================================
        // 1. Load Configuration
        // ====================================================================
        std::cout << "[1/5] Loading configuration..." << std::endl;

        auto config = data::DataLoader::load_config(args.config_path);
        if (args.verbose)
        {
            config.backtest.verbose = true;
        }

        if (args.verbose)
        {
            std::cout << "  - Universe: ";
            for (const auto &symbol : config.data.universe)
            {
                std::cout << symbol << " ";
            }
            std::cout << "\n  - Date range: "
                      << (config.backtest.start_date.empty() ? "<first>" : config.backtest.start_date)
                      << " to "
                      << (config.backtest.end_date.empty() ? "<last>" : config.backtest.end_date) << "\n";
            std::cout << "  - Rebalance: " << backtest::to_string(config.backtest.rebalance.frequency)
                      << " (drift threshold " << config.backtest.rebalance.drift_threshold << ")\n";
        }

        // ====================================================================
        // 2. Load Market Data
        // ====================================================================
        std::cout << "[2/5] Loading market data..." << std::endl;

        data::MarketData market_data;
        if (config.data.data_file.empty())
        {
            if (config.data.universe.empty())
            {
                throw backtest::ConfigurationError("synthetic data needs a non-empty 'universe'");
            }
            std::cout << "  - No data_file configured, generating synthetic prices" << std::endl;
            market_data = data::DataLoader::generate_synthetic_data(
                config.data.universe,
                config.data.synthetic_days,
                config.backtest.start_date.empty() ? "2020-01-01" : config.backtest.start_date,
                config.data.synthetic_volatility,
                config.data.synthetic_drift,
                config.data.synthetic_seed);
        }
        else
        {
            market_data = data::DataLoader::load_csv(config.data.data_file, config.data.universe);
        }

        auto dates = market_data.trading_dates(config.backtest.start_date, config.backtest.end_date);
        std::cout << "  - Loaded " << market_data.num_symbols() << " symbols, "
                  << dates.size() << " trading dates in range" << std::endl;

        if (args.verbose)
        {
            market_data.print_summary();
        }

        // ====================================================================
        // 3. Build Strategies
        // ====================================================================
        std::cout << "[3/5] Building strategies..." << std::endl;

        auto factories = policy::make_policy_factories(config.strategies);
        if (factories.empty())
        {
            throw backtest::ConfigurationError("no strategies configured");
        }
        std::cout << "  - " << factories.size() << " strategies" << std::endl;

        // ====================================================================
        // 4. Run Backtests
        // ====================================================================
        std::cout << "[4/5] Running backtests..." << std::endl;

        auto results = backtest::compare_strategies(market_data, config.backtest, factories, args.jobs);

        for (const auto &result : results)
        {
            result.print_summary();
        }
        backtest::print_comparison(results, std::cout);

        // ====================================================================
        // 5. Export Results
        // ====================================================================
        std::cout << "\n[5/5] Exporting results to " << args.output_dir << "/ ..." << std::endl;

        std::filesystem::create_directories(args.output_dir);
        for (const auto &result : results)
        {
            export_result(result, args.output_dir);
            if (args.verbose)
            {
                std::cout << "  - " << result.strategy_name << " -> "
                          << file_stem(result.strategy_name) << "_{equity,trades}.csv, "
                          << file_stem(result.strategy_name) << "_metrics.json\n";
            }
        }

        // ====================================================================
        // Summary
        // ====================================================================
        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "\n================================================================\n";
        std::cout << "Backtest completed successfully in "
                  << duration << " ms\n";
        std::cout << "================================================================\n"
                  << std::endl;

        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}

/**
 * @brief Main function
 */
int main(int argc, char *argv[])
{
    CommandLineArgs args;
    try
    {
        args = CommandLineArgs::parse(argc, argv);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: invalid arguments: " << e.what() << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    // Show help if requested or invalid args
    if (args.show_help || !args.is_valid())
    {
        print_banner();
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    print_banner();

    return run(args);
}
