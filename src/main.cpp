/**
 * @file main.cpp
 * @brief Main entry point for the ESG Portfolio Analyzer
 *
 * Command-line application that loads configuration, prices and ESG
 * records, screens holdings by sustainability strategy, and reports
 * portfolio ESG scores, exposures and performance against a benchmark.
 */

#include "analytics/benchmark_analysis.hpp"
#include "analytics/portfolio_aggregator.hpp"
#include "data/data_loader.hpp"
#include "data/data_source.hpp"
#include "data/market_data.hpp"
#include "screening/eligibility_filter.hpp"
#include "screening/investor_profile.hpp"
#include <chrono>
#include <exception>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace esg;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "ESG Portfolio Analyzer v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config PATH         Path to configuration JSON file (required)\n"
              << "  --strategy NAME       Sustainability strategy: NetZero, MultiThematicESG,\n"
              << "                        Solidarity (overrides config)\n"
              << "  --benchmark TICKER    Benchmark ticker or index name (overrides config)\n"
              << "  --screen              List every asset eligible under the strategy\n"
              << "  --json                Print results as JSON\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --config data/config/esg_config.json --verbose\n"
              << "  " << program_name << " --config data/config/esg_config.json --strategy NetZero --screen\n"
              << std::endl;
}

/**
 * @brief Print banner
 */
void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       ESG Portfolio Analyzer v1.0.0                           \n"
              << "       Sustainability Screening and Portfolio Metrics          \n"
              << "================================================================\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string config_path;
    std::string strategy;
    std::string benchmark;
    bool screen = false;
    bool json = false;
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
            else if (arg == "--strategy" && i + 1 < argc)
            {
                args.strategy = argv[++i];
            }
            else if (arg == "--benchmark" && i + 1 < argc)
            {
                args.benchmark = argv[++i];
            }
            else if (arg == "--screen")
            {
                args.screen = true;
            }
            else if (arg == "--json")
            {
                args.json = true;
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
 * @brief Print the assets passing a strategy
 */
void print_screen(screening::SustainabilityStrategy strategy,
                  const std::vector<data::AssetRecord> &universe,
                  const std::vector<data::AssetRecord> &eligible)
{
    std::cout << "\nELIGIBLE UNIVERSE (" << screening::EligibilityFilter::to_string(strategy) << ")\n";
    std::cout << std::string(60, '-') << "\n";
    std::cout << "  " << std::setw(8) << std::left << "Ticker"
              << std::setw(24) << "Sector"
              << std::right << std::setw(7) << "ESG"
              << std::setw(6) << "E"
              << std::setw(6) << "S"
              << std::setw(6) << "G" << "\n";

    for (const auto &a : eligible)
    {
        std::cout << "  " << std::setw(8) << std::left << a.ticker
                  << std::setw(24) << a.sector.substr(0, 23)
                  << std::right << std::fixed << std::setprecision(1)
                  << std::setw(7) << a.total_or_zero()
                  << std::setw(6) << a.environmental_or_zero()
                  << std::setw(6) << a.social_or_zero()
                  << std::setw(6) << a.governance_or_zero() << "\n";
    }

    std::cout << "  " << eligible.size() << " of " << universe.size() << " assets eligible\n";
    std::cout << std::string(60, '-') << "\n";
}

/**
 * @brief Main execution function
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();
    const bool progress = !args.json;

    try
    {
        // ====================================================================
        // 1. Load Configuration
        // ====================================================================
        if (progress)
            std::cout << "[1/5] Loading configuration..." << std::endl;

        auto config = data::DataLoader::load_config(args.config_path);

        std::optional<screening::RiskProfile> profile;
        if (!config.portfolio.risk_profile.empty())
        {
            profile = screening::InvestorProfiles::parse_profile(config.portfolio.risk_profile);
        }

        std::string strategy_name = args.strategy.empty() ? config.portfolio.strategy : args.strategy;
        std::optional<screening::SustainabilityStrategy> strategy;
        if (!strategy_name.empty())
        {
            strategy = screening::EligibilityFilter::parse_strategy(strategy_name);
        }

        std::string benchmark_name = args.benchmark.empty() ? config.data.benchmark : args.benchmark;
        if (benchmark_name.empty() && profile)
        {
            benchmark_name = screening::InvestorProfiles::targets(*profile).default_benchmark;
        }
        std::optional<std::string> benchmark;
        if (!benchmark_name.empty())
        {
            benchmark = screening::InvestorProfiles::resolve_benchmark(benchmark_name);
        }

        if (args.verbose && progress)
        {
            std::cout << "  - Holdings: ";
            for (const auto &w : config.portfolio.weights)
            {
                std::cout << w.first << "=" << w.second << " ";
            }
            std::cout << "\n  - Date range: "
                      << (config.data.start_date.empty() ? "start" : config.data.start_date)
                      << " to " << (config.data.end_date.empty() ? "end" : config.data.end_date) << "\n";
            std::cout << "  - Strategy: "
                      << (strategy ? screening::EligibilityFilter::to_string(*strategy) : "none") << "\n";
            std::cout << "  - Benchmark: " << benchmark.value_or("none") << "\n";
            if (profile)
            {
                std::cout << "  - Risk profile: " << screening::InvestorProfiles::to_string(*profile) << "\n";
            }
        }

        // ====================================================================
        // 2. Load Market Data and ESG Records
        // ====================================================================
        if (progress)
            std::cout << "[2/5] Loading market data and ESG records..." << std::endl;

        auto market = data::DataLoader::load_csv(config.data.prices_file);
        std::vector<data::AssetRecord> records;
        if (!config.data.assets_file.empty())
        {
            records = data::DataLoader::load_asset_records(config.data.assets_file);
        }

        if (progress)
        {
            std::cout << "  - Loaded " << market.num_dates() << " dates, "
                      << market.num_assets() << " price series, "
                      << records.size() << " asset records" << std::endl;
        }

        if (args.verbose && progress)
        {
            market.filter_by_date(config.data.range()).print_summary();
        }

        auto store = data::DataLoader::build_in_memory_source(
            market, records, config.esg_fallback, config.analytics.trading_days_per_year);

        std::shared_ptr<const data::DataSource> source = store;
        std::shared_ptr<data::CachingDataSource> cache;
        if (config.cache.enabled)
        {
            cache = std::make_shared<data::CachingDataSource>(
                store, std::chrono::seconds(config.cache.ttl_seconds));
            source = cache;
        }

        // ====================================================================
        // 3. Aggregate Portfolio Metrics
        // ====================================================================
        if (progress)
            std::cout << "[3/5] Aggregating portfolio metrics..." << std::endl;

        analytics::PortfolioAggregator aggregator(source, config.analytics);
        auto metrics = aggregator.aggregate(config.portfolio.weights, config.data.range(), benchmark, strategy);

        if (progress && metrics.holdings.size() < config.portfolio.weights.size())
        {
            std::cout << "  - " << config.portfolio.weights.size() - metrics.holdings.size()
                      << " holding(s) excluded by strategy" << std::endl;
        }

        // ====================================================================
        // 4. Benchmark Comparison
        // ====================================================================
        if (progress)
            std::cout << "[4/5] Comparing against benchmark..." << std::endl;

        std::optional<analytics::BenchmarkAnalysis> relative;
        if (benchmark)
        {
            std::map<std::string, double> holdings;
            for (const auto &t : metrics.holdings)
            {
                holdings[t] = config.portfolio.weights.at(t);
            }
            auto portfolio_series = aggregator.portfolio_series(holdings, config.data.range());
            auto benchmark_series = aggregator.benchmark_series(*benchmark, config.data.range());
            if (!portfolio_series.empty() && !benchmark_series.empty())
            {
                relative.emplace(portfolio_series.returns, benchmark_series.returns,
                                 config.analytics.risk_free_rate, config.analytics.trading_days_per_year);
            }
            else if (progress)
            {
                std::cout << "  - No price data for benchmark " << *benchmark << std::endl;
            }
        }
        else if (progress)
        {
            std::cout << "  - No benchmark configured" << std::endl;
        }

        // ====================================================================
        // 5. Universe Screening (Optional)
        // ====================================================================
        std::vector<data::AssetRecord> universe = store->asset_records();
        std::vector<data::AssetRecord> eligible;
        screening::SustainabilityStrategy screen_strategy =
            strategy.value_or(screening::SustainabilityStrategy::DEFAULT);
        if (args.screen)
        {
            if (progress)
                std::cout << "[5/5] Screening asset universe..." << std::endl;
            eligible = screening::EligibilityFilter::filter(universe, screen_strategy);
        }
        else if (progress)
        {
            std::cout << "[5/5] Skipping universe screening (use --screen to enable)" << std::endl;
        }

        // ====================================================================
        // Report
        // ====================================================================
        std::optional<bool> within_budget;
        if (profile && !metrics.performance.empty())
        {
            within_budget = screening::InvestorProfiles::within_volatility_budget(
                *profile, metrics.performance.annualized_volatility);
        }

        if (args.json)
        {
            nlohmann::json out;
            out["portfolio"] = metrics.to_json();
            out["strategy"] = strategy ? nlohmann::json(screening::EligibilityFilter::to_string(*strategy))
                                       : nlohmann::json(nullptr);
            out["benchmark"] = benchmark ? nlohmann::json(*benchmark) : nlohmann::json(nullptr);
            out["benchmark_analysis"] = relative ? relative->to_json() : nlohmann::json(nullptr);
            out["settings"] = config.analytics.to_json();
            if (profile)
            {
                out["risk_profile"]["name"] = screening::InvestorProfiles::to_string(*profile);
                out["risk_profile"]["targets"] = screening::InvestorProfiles::targets(*profile).to_json();
                out["risk_profile"]["within_volatility_budget"] =
                    within_budget ? nlohmann::json(*within_budget) : nlohmann::json(nullptr);
            }
            if (args.screen)
            {
                out["screen"]["strategy"] = screening::EligibilityFilter::to_string(screen_strategy);
                out["screen"]["eligible"] = nlohmann::json::array();
                for (const auto &a : eligible)
                {
                    out["screen"]["eligible"].push_back(a.to_json());
                }
            }
            std::cout << out.dump(2) << std::endl;
            return 0;
        }

        std::cout << "\n"
                  << metrics.summary();

        if (relative)
        {
            std::cout << "\n"
                      << "Benchmark: " << *benchmark << "\n"
                      << relative->summary();
        }

        if (profile)
        {
            auto targets = screening::InvestorProfiles::targets(*profile);
            std::cout << "\nRisk Profile: " << screening::InvestorProfiles::to_string(*profile)
                      << " (" << targets.description << ")\n";
            std::cout << "  Target allocation:   " << std::fixed << std::setprecision(0)
                      << targets.equities * 100.0 << "% equities / "
                      << targets.bonds * 100.0 << "% bonds / "
                      << targets.money_market * 100.0 << "% money market\n";
            std::cout << "  Volatility ceiling:  " << std::setprecision(1)
                      << targets.max_volatility * 100.0 << "%";
            if (within_budget)
            {
                std::cout << (*within_budget ? "  (within budget)" : "  (EXCEEDED)");
            }
            std::cout << "\n";
        }

        if (args.screen)
        {
            print_screen(screen_strategy, universe, eligible);
        }

        if (args.verbose && cache)
        {
            std::cout << "\nData cache: " << cache->hits() << " hits, "
                      << cache->misses() << " misses, "
                      << cache->size() << " entries held (ttl "
                      << cache->ttl().count() << "s)\n";
        }

        // ====================================================================
        // Summary
        // ====================================================================
        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "\n================================================================\n";
        std::cout << "Analysis completed successfully in "
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
    auto args = CommandLineArgs::parse(argc, argv);

    if (args.show_help || !args.is_valid())
    {
        print_banner();
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    if (!args.json)
    {
        print_banner();
    }

    return run(args);
}
