/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader class and configuration structures
 */

#include "data/data_loader.hpp"
#include "analytics/return_series.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>
#include <limits>
#include <set>
#include <stdexcept>

namespace esg
{
    namespace data
    {

        namespace
        {
            // Asset CSV columns holding text; everything else is numeric
            const std::set<std::string> TEXT_COLUMNS = {
                "ticker", "name", "sector", "industry", "country", "currency"};
        } // anonymous namespace

        // =============================================
        // Configuration Structures - from_json Methods
        // =============================================

        DataConfig DataConfig::from_json(const nlohmann::json &j)
        {
            DataConfig config;
            config.prices_file = j.value("prices_file", "data/market/prices.csv");
            config.assets_file = j.value("assets_file", "data/esg/assets.csv");
            config.start_date = j.value("start_date", "");
            config.end_date = j.value("end_date", "");
            config.benchmark = j.value("benchmark", "");
            return config;
        }

        PortfolioConfig PortfolioConfig::from_json(const nlohmann::json &j)
        {
            PortfolioConfig config;
            config.weights = j.value("weights", std::map<std::string, double>{});
            config.strategy = j.value("strategy", "");
            config.risk_profile = j.value("risk_profile", "");

            for (const auto &w : config.weights)
            {
                if (w.second < 0.0)
                {
                    throw std::invalid_argument(
                        "Expected non-negative weight for '" + w.first + "', got: " + std::to_string(w.second));
                }
            }
            return config;
        }

        CacheConfig CacheConfig::from_json(const nlohmann::json &j)
        {
            CacheConfig config;
            config.enabled = j.value("enabled", true);
            config.ttl_seconds = j.value("ttl_seconds", 3600);
            if (config.enabled && config.ttl_seconds <= 0)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'ttl_seconds', got: " + std::to_string(config.ttl_seconds));
            }
            return config;
        }

        EsgFallbackConfig EsgFallbackConfig::from_json(const nlohmann::json &j)
        {
            EsgFallbackConfig config;
            config.enabled = j.value("enabled", true);
            config.total = j.value("total", 19.0);
            config.environmental = j.value("environmental", 10.0);
            config.social = j.value("social", 4.0);
            config.governance = j.value("governance", 5.0);
            return config;
        }

        bool EsgFallbackConfig::apply(AssetRecord &record) const
        {
            if (!enabled || record.has_esg_scores())
            {
                return false;
            }
            record.esg_score = total;
            record.environmental_score = environmental;
            record.social_score = social;
            record.governance_score = governance;
            return true;
        }

        AnalyzerConfig AnalyzerConfig::load_from_file(const std::string &config_path)
        {
            return DataLoader::load_config(config_path);
        }

        // ===========================
        // CSV Loading - Wide Format
        // ===========================

        MarketData DataLoader::load_csv_wide(const std::string &filepath,
                                             const std::vector<std::string> &tickers)
        {
            std::ifstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file: " + filepath);
            }

            std::string line;
            std::vector<std::string> all_tickers;
            std::map<std::string, std::vector<double>> rows_by_date;

            // Read header line
            if (!std::getline(file, line))
            {
                throw std::runtime_error("Empty CSV file: " + filepath);
            }

            auto header = parse_csv_line(line);
            if (header.empty() || trim(header[0]) != "date")
            {
                throw std::runtime_error("CSV must start with 'date' column: " + filepath);
            }

            for (size_t i = 1; i < header.size(); ++i)
            {
                all_tickers.push_back(trim(header[i]));
            }

            // Determine which columns to load
            std::vector<size_t> column_indices;
            std::vector<std::string> selected_tickers;

            if (tickers.empty())
            {
                for (size_t i = 0; i < all_tickers.size(); ++i)
                {
                    column_indices.push_back(i);
                    selected_tickers.push_back(all_tickers[i]);
                }
            }
            else
            {
                for (const auto &ticker : tickers)
                {
                    auto it = std::find(all_tickers.begin(), all_tickers.end(), ticker);
                    if (it != all_tickers.end())
                    {
                        column_indices.push_back(static_cast<size_t>(std::distance(all_tickers.begin(), it)));
                        selected_tickers.push_back(ticker);
                    }
                }

                if (column_indices.empty())
                {
                    throw std::runtime_error("None of the specified tickers found in CSV: " + filepath);
                }
            }

            // Read data rows
            while (std::getline(file, line))
            {
                if (trim(line).empty())
                    continue;

                auto fields = parse_csv_line(line);
                if (fields.size() < 2)
                    continue;

                std::string date = trim(fields[0]);
                if (!is_valid_date_format(date))
                {
                    std::cerr << "Warning: skipping row with invalid date '" << date << "' in " << filepath << "\n";
                    continue;
                }

                std::vector<double> row_prices;
                row_prices.reserve(column_indices.size());
                for (size_t idx : column_indices)
                {
                    if (idx + 1 < fields.size())
                    {
                        row_prices.push_back(safe_stod(fields[idx + 1]));
                    }
                    else
                    {
                        row_prices.push_back(std::numeric_limits<double>::quiet_NaN());
                    }
                }

                if (rows_by_date.count(date))
                {
                    std::cerr << "Warning: duplicate date " << date << " in " << filepath << ", keeping last row\n";
                }
                rows_by_date[date] = std::move(row_prices);
            }

            file.close();

            if (rows_by_date.empty())
            {
                throw std::runtime_error("No valid data found in CSV file: " + filepath);
            }

            // Convert to Eigen matrix
            std::vector<std::string> dates;
            dates.reserve(rows_by_date.size());
            Eigen::MatrixXd prices(static_cast<Eigen::Index>(rows_by_date.size()),
                                   static_cast<Eigen::Index>(selected_tickers.size()));
            Eigen::Index i = 0;
            for (const auto &row : rows_by_date)
            {
                dates.push_back(row.first);
                for (size_t j = 0; j < selected_tickers.size(); ++j)
                {
                    prices(i, static_cast<Eigen::Index>(j)) = row.second[j];
                }
                ++i;
            }

            return MarketData(prices, dates, selected_tickers);
        }

        // ===========================
        // CSV Loading - Long Format
        // ===========================

        MarketData DataLoader::load_csv_long(const std::string &filepath,
                                             const std::vector<std::string> &tickers)
        {
            std::ifstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file: " + filepath);
            }

            std::string line;
            std::map<std::string, std::map<std::string, double>> data_map; // date -> ticker -> price
            std::set<std::string> all_tickers;

            // Skip header
            std::getline(file, line);

            while (std::getline(file, line))
            {
                if (trim(line).empty())
                    continue;

                auto fields = parse_csv_line(line);
                if (fields.size() < 3)
                    continue;

                std::string date = trim(fields[0]);
                std::string ticker = trim(fields[1]);
                double price = safe_stod(fields[2]);

                if (!is_valid_date_format(date) || ticker.empty())
                    continue;

                if (!tickers.empty() &&
                    std::find(tickers.begin(), tickers.end(), ticker) == tickers.end())
                {
                    continue;
                }

                data_map[date][ticker] = price;
                all_tickers.insert(ticker);
            }

            file.close();

            if (data_map.empty() || all_tickers.empty())
            {
                throw std::runtime_error("No valid data found in CSV file: " + filepath);
            }

            std::vector<std::string> dates;
            dates.reserve(data_map.size());
            for (const auto &p : data_map)
            {
                dates.push_back(p.first);
            }
            std::vector<std::string> ticker_vec(all_tickers.begin(), all_tickers.end());

            Eigen::MatrixXd prices(static_cast<Eigen::Index>(dates.size()),
                                   static_cast<Eigen::Index>(ticker_vec.size()));
            prices.setConstant(std::numeric_limits<double>::quiet_NaN());

            for (size_t i = 0; i < dates.size(); ++i)
            {
                const auto &row = data_map.at(dates[i]);
                for (size_t j = 0; j < ticker_vec.size(); ++j)
                {
                    auto it = row.find(ticker_vec[j]);
                    if (it != row.end())
                    {
                        prices(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = it->second;
                    }
                }
            }

            return MarketData(prices, dates, ticker_vec);
        }

        // ========================
        // Auto-detect CSV Format
        // ========================

        MarketData DataLoader::load_csv(const std::string &filepath,
                                        const std::vector<std::string> &tickers)
        {
            std::ifstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file: " + filepath);
            }

            std::string line;
            std::getline(file, line);
            file.close();

            auto header = parse_csv_line(line);

            // Wide format: date, ticker1, ticker2, ...
            // Long format: date, ticker, price
            if (header.size() == 3 &&
                (trim(header[1]) == "ticker" || trim(header[1]) == "symbol"))
            {
                return load_csv_long(filepath, tickers);
            }
            return load_csv_wide(filepath, tickers);
        }

        // ===========================
        // Asset Record Loading
        // ===========================

        std::vector<AssetRecord> DataLoader::load_asset_records_csv(const std::string &filepath)
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

            std::vector<std::string> columns;
            for (const auto &h : parse_csv_line(line))
            {
                columns.push_back(trim(h));
            }
            if (std::find(columns.begin(), columns.end(), "ticker") == columns.end())
            {
                throw std::runtime_error("Asset CSV must have a 'ticker' column: " + filepath);
            }

            std::vector<AssetRecord> records;
            int line_number = 1;
            while (std::getline(file, line))
            {
                ++line_number;
                if (trim(line).empty())
                    continue;

                auto fields = parse_csv_line(line);
                nlohmann::json row = nlohmann::json::object();
                for (size_t i = 0; i < columns.size() && i < fields.size(); ++i)
                {
                    std::string value = trim(fields[i]);
                    if (value.empty())
                        continue;

                    if (TEXT_COLUMNS.count(columns[i]))
                    {
                        row[columns[i]] = value;
                    }
                    else
                    {
                        double number = safe_stod(value);
                        if (!std::isnan(number))
                        {
                            row[columns[i]] = number;
                        }
                    }
                }

                if (!row.contains("ticker"))
                {
                    std::cerr << "Warning: skipping line " << line_number << " without ticker in " << filepath << "\n";
                    continue;
                }
                records.push_back(AssetRecord::from_json(row));
            }

            return records;
        }

        std::vector<AssetRecord> DataLoader::load_asset_records_json(const std::string &filepath)
        {
            auto j = load_json(filepath);
            if (!j.contains("assets") || !j["assets"].is_array())
            {
                throw std::runtime_error("Asset JSON must contain an 'assets' array: " + filepath);
            }

            std::vector<AssetRecord> records;
            records.reserve(j["assets"].size());
            for (const auto &item : j["assets"])
            {
                records.push_back(AssetRecord::from_json(item));
            }
            return records;
        }

        std::vector<AssetRecord> DataLoader::load_asset_records(const std::string &filepath)
        {
            std::string lower = filepath;
            std::transform(lower.begin(), lower.end(), lower.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

            if (lower.size() >= 5 && lower.compare(lower.size() - 5, 5, ".json") == 0)
            {
                return load_asset_records_json(filepath);
            }
            return load_asset_records_csv(filepath);
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
                throw std::runtime_error("JSON parsing error in " + filepath + ": " + std::string(e.what()));
            }

            file.close();
            return j;
        }

        AnalyzerConfig DataLoader::load_config(const std::string &config_path)
        {
            auto j = load_json(config_path);

            AnalyzerConfig config;

            config.data = DataConfig::from_json(j.value("data", nlohmann::json::object()));
            config.portfolio = PortfolioConfig::from_json(j.value("portfolio", nlohmann::json::object()));

            if (j.contains("analytics"))
            {
                config.analytics = analytics::AnalyticsSettings::from_json(j["analytics"]);
            }

            if (j.contains("cache"))
            {
                config.cache = CacheConfig::from_json(j["cache"]);
            }

            if (j.contains("esg_fallback"))
            {
                config.esg_fallback = EsgFallbackConfig::from_json(j["esg_fallback"]);
            }

            return config;
        }

        // ===========================
        // Data Source Assembly
        // ===========================

        std::shared_ptr<InMemoryDataSource> DataLoader::build_in_memory_source(
            const MarketData &market,
            std::vector<AssetRecord> records,
            const EsgFallbackConfig &fallback,
            int trading_days_per_year)
        {
            auto source = std::make_shared<InMemoryDataSource>();

            for (const auto &ticker : market.get_tickers())
            {
                CloseSeries series = market.close_series(ticker);
                if (!series.empty())
                {
                    source->add_close_series(ticker, series);
                }
            }

            for (auto &record : records)
            {
                fallback.apply(record);

                CloseSeries series = market.close_series(record.ticker);
                if (series.size() > 1)
                {
                    auto stats = analytics::trailing_statistics(series, trading_days_per_year);
                    if (record.volatility == 0.0)
                    {
                        record.volatility = stats.annualized_volatility;
                    }
                    if (record.returns_1y == 0.0)
                    {
                        record.returns_1y = stats.mean_return_pct;
                    }
                }
                if (record.price == 0.0 && !series.empty())
                {
                    record.price = market.last_price(record.ticker);
                }

                source->add_asset_record(record);
            }

            return source;
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

        bool DataLoader::is_valid_date_format(const std::string &date)
        {
            // Simple check for YYYY-MM-DD format
            if (date.length() != 10)
                return false;
            if (date[4] != '-' || date[7] != '-')
                return false;

            for (size_t i = 0; i < date.length(); ++i)
            {
                if (i == 4 || i == 7)
                    continue;
                if (!std::isdigit(static_cast<unsigned char>(date[i])))
                    return false;
            }

            return true;
        }

        std::string DataLoader::trim(const std::string &str)
        {
            size_t first = str.find_first_not_of(" \t\r\n");
            if (first == std::string::npos)
                return "";

            size_t last = str.find_last_not_of(" \t\r\n");
            return str.substr(first, last - first + 1);
        }

        double DataLoader::safe_stod(const std::string &str)
        {
            std::string trimmed = trim(str);
            if (trimmed.empty() || trimmed == "nan" || trimmed == "NaN")
            {
                return std::numeric_limits<double>::quiet_NaN();
            }
            try
            {
                return std::stod(trimmed);
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

    } // namespace data
} // namespace esg
