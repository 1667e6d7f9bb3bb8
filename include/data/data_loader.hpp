/**
 * @file data_loader.hpp
 * @brief Data loading and parsing utilities
 *
 * Provides functionality to load closing prices from CSV files, asset
 * records from CSV or JSON files, and configuration from JSON files, and
 * to assemble them into a DataSource.
 */

#ifndef ESG_DATA_DATA_LOADER_HPP
#define ESG_DATA_DATA_LOADER_HPP

#include "data/asset_record.hpp"
#include "data/data_source.hpp"
#include "data/market_data.hpp"
#include "analytics/performance_metrics.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>


namespace esg {
namespace data {

/**
 * @struct DataConfig
 * @brief Input files and analysis window
 */
struct DataConfig {
    std::string prices_file;                   ///< Path to price CSV (wide or long)
    std::string assets_file;                   ///< Path to asset records (.csv or .json)
    std::string start_date;                    ///< Start date filter, empty = unbounded
    std::string end_date;                      ///< End date filter, empty = unbounded
    std::string benchmark;                     ///< Benchmark ticker or catalogue name

    DateRange range() const { return DateRange{start_date, end_date}; }

    /**
     * @brief Load from JSON object
     */
    static DataConfig from_json(const nlohmann::json& j);
};

/**
 * @struct PortfolioConfig
 * @brief Holdings and investor preferences
 */
struct PortfolioConfig {
    std::map<std::string, double> weights;     ///< Ticker -> raw weight
    std::string strategy;                      ///< Sustainability strategy, empty = none
    std::string risk_profile;                  ///< prudent / balanced / dynamic, empty = none

    /**
     * @throws std::invalid_argument on a negative weight
     */
    static PortfolioConfig from_json(const nlohmann::json& j);
};

/**
 * @struct CacheConfig
 * @brief Data-source memoization
 */
struct CacheConfig {
    bool enabled = true;
    int ttl_seconds = 3600;

    /**
     * @throws std::invalid_argument if enabled with a non-positive TTL
     */
    static CacheConfig from_json(const nlohmann::json& j);
};

/**
 * @struct EsgFallbackConfig
 * @brief Scores assigned to records that carry no ESG data at all
 */
struct EsgFallbackConfig {
    bool enabled = true;
    double total = 19.0;
    double environmental = 10.0;
    double social = 4.0;
    double governance = 5.0;

    static EsgFallbackConfig from_json(const nlohmann::json& j);

    /**
     * @brief Fill all four scores if the record has none and fallback is enabled.
     * @return true if the record was modified
     */
    bool apply(AssetRecord& record) const;
};

/**
 * @struct AnalyzerConfig
 * @brief Complete analyzer configuration
 */
struct AnalyzerConfig {
    DataConfig data;
    PortfolioConfig portfolio;
    analytics::AnalyticsSettings analytics;
    CacheConfig cache;
    EsgFallbackConfig esg_fallback;

    /**
     * @brief Load complete configuration from JSON file
     */
    static AnalyzerConfig load_from_file(const std::string& config_path);
};

/**
 * @class DataLoader
 * @brief Loads and parses market data and asset records from files
 *
 * Price CSV files come in two layouts:
 * - Format 1: date, ticker1, ticker2, ... (wide format)
 * - Format 2: date, ticker, price (long format)
 */
class DataLoader {
public:
    DataLoader() = default;
    ~DataLoader() = default;

    // ========================================================================
    // Price Loading Methods
    // ========================================================================

    /**
     * @brief Load market data from CSV file (wide format)
     *
     * Expected format:
     * date,AAPL,MSFT,JPM,...
     * 2020-01-01,150.0,200.0,120.0,...
     *
     * Rows may appear in any order; they are sorted by date. Empty or
     * "nan" cells are missing prices.
     *
     * @param filepath Path to CSV file
     * @param tickers Optional list of tickers to load (loads all if empty)
     * @return MarketData object
     * @throws std::runtime_error if file cannot be loaded
     */
    static MarketData load_csv_wide(const std::string& filepath,
                                    const std::vector<std::string>& tickers = {});

    /**
     * @brief Load market data from CSV file (long format)
     *
     * Expected format:
     * date,ticker,price
     * 2020-01-01,AAPL,150.0
     * 2020-01-01,MSFT,200.0
     *
     * @param filepath Path to CSV file
     * @param tickers Optional list of tickers to load
     * @return MarketData object
     * @throws std::runtime_error if file cannot be loaded
     */
    static MarketData load_csv_long(const std::string& filepath,
                                    const std::vector<std::string>& tickers = {});

    /**
     * @brief Auto-detect CSV format and load
     * @param filepath Path to CSV file
     * @param tickers Optional list of tickers
     * @return MarketData object
     */
    static MarketData load_csv(const std::string& filepath,
                               const std::vector<std::string>& tickers = {});

    // ========================================================================
    // Asset Record Loading
    // ========================================================================

    /**
     * @brief Load asset records from CSV
     *
     * The header names the columns; only "ticker" is required. Unknown
     * columns are ignored. An empty score cell leaves the score absent.
     *
     * @throws std::runtime_error if the file cannot be read or has no ticker column
     */
    static std::vector<AssetRecord> load_asset_records_csv(const std::string& filepath);

    /**
     * @brief Load asset records from JSON: {"assets": [{...}, ...]}
     * @throws std::runtime_error if the file cannot be read or has no "assets" array
     */
    static std::vector<AssetRecord> load_asset_records_json(const std::string& filepath);

    /**
     * @brief Dispatch on file extension (.json, otherwise CSV)
     */
    static std::vector<AssetRecord> load_asset_records(const std::string& filepath);

    // ========================================================================
    // Configuration Loading
    // ========================================================================

    /**
     * @brief Load JSON configuration file
     * @param filepath Path to JSON config file
     * @return JSON object
     * @throws std::runtime_error if file cannot be loaded
     */
    static nlohmann::json load_json(const std::string& filepath);

    /**
     * @brief Load complete analyzer configuration
     * @param config_path Path to config JSON file
     * @return AnalyzerConfig struct
     */
    static AnalyzerConfig load_config(const std::string& config_path);

    // ========================================================================
    // Data Source Assembly
    // ========================================================================

    /**
     * @brief Populate an in-memory source from loaded prices and records
     *
     * Records without any ESG score receive the fallback scores. Records
     * with a price history but zero volatility, zero returns_1y or zero
     * price get trailing statistics and the last close filled in.
     */
    static std::shared_ptr<InMemoryDataSource> build_in_memory_source(
        const MarketData& market,
        std::vector<AssetRecord> records,
        const EsgFallbackConfig& fallback = EsgFallbackConfig(),
        int trading_days_per_year = 252);

private:
    // ========================
    // Private Helper Methods
    // ========================

    /**
     * @brief Parse CSV line into tokens
     * @param line CSV line string
     * @return Vector of tokens
     */
    static std::vector<std::string> parse_csv_line(const std::string& line);

    /**
     * @brief Validate date format (YYYY-MM-DD)
     * @param date Date string
     * @return true if valid
     */
    static bool is_valid_date_format(const std::string& date);

    /**
     * @brief Trim whitespace from string
     * @param str Input string
     * @return Trimmed string
     */
    static std::string trim(const std::string& str);

    /**
     * @brief Convert string to double safely
     * @param str String representation of number
     * @return Double value, or NaN if conversion fails
     */
    static double safe_stod(const std::string& str);
};

} // namespace data
} // namespace esg

#endif // ESG_DATA_DATA_LOADER_HPP
