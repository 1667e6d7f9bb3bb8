/**
 * @file portfolio_aggregator.cpp
 * @brief Implementation of PortfolioAggregator
 */

#include "analytics/portfolio_aggregator.hpp"
#include "data/exposure_mapper.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace esg
{
    namespace analytics
    {

        // ===================================================================
        // PortfolioMetrics export
        // ===================================================================

        nlohmann::json PortfolioMetrics::to_json() const
        {
            nlohmann::json j;
            j["esg_score"] = esg_score;
            j["environmental_score"] = environmental_score;
            j["social_score"] = social_score;
            j["governance_score"] = governance_score;
            j["sector_exposure"] = nlohmann::json::object();
            for (const auto &p : sector_exposure)
            {
                j["sector_exposure"][p.first] = p.second;
            }
            j["country_exposure"] = nlohmann::json::object();
            for (const auto &p : country_exposure)
            {
                j["country_exposure"][p.first] = p.second;
            }
            j["performance_metrics"] = performance.empty() ? nlohmann::json::object() : performance.to_json();
            j["holdings"] = holdings;
            return j;
        }

        std::string PortfolioMetrics::summary() const
        {
            std::ostringstream oss;
            oss << std::fixed;

            oss << "Portfolio ESG Profile\n";
            oss << "=====================\n";
            oss << "  Holdings:            " << holdings.size() << "\n";
            oss << "  ESG Risk Score:      " << std::setprecision(2) << esg_score << "\n";
            oss << "  Environmental:       " << std::setprecision(2) << environmental_score << "\n";
            oss << "  Social:              " << std::setprecision(2) << social_score << "\n";
            oss << "  Governance:          " << std::setprecision(2) << governance_score << "\n";
            oss << "\n";

            oss << "Sector Exposure:\n";
            for (const auto &p : sector_exposure)
            {
                oss << "  " << std::left << std::setw(21) << p.first << std::right
                    << std::setprecision(2) << p.second * 100.0 << "%\n";
            }
            oss << "\n";

            oss << "Country Exposure:\n";
            for (const auto &p : country_exposure)
            {
                oss << "  " << std::left << std::setw(21) << p.first << std::right
                    << std::setprecision(2) << p.second * 100.0 << "%\n";
            }
            oss << "\n";

            oss << performance.summary();
            return oss.str();
        }

        // ===================================================================
        // PortfolioAggregator
        // ===================================================================

        PortfolioAggregator::PortfolioAggregator(std::shared_ptr<const data::DataSource> source,
                                                 AnalyticsSettings settings)
            : source_(std::move(source)), settings_(settings)
        {
            if (!source_)
            {
                throw std::invalid_argument("PortfolioAggregator: data source must not be null");
            }
            if (settings_.trading_days_per_year <= 0)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'trading_days_per_year', got: " + std::to_string(settings_.trading_days_per_year));
            }
        }

        PortfolioMetrics PortfolioAggregator::aggregate(const PortfolioWeights &weights,
                                                        const data::DateRange &range,
                                                        const std::optional<std::string> &benchmark,
                                                        const std::optional<screening::SustainabilityStrategy> &strategy) const
        {
            PortfolioMetrics metrics;
            if (weights.empty())
            {
                return metrics;
            }

            std::vector<data::AssetRecord> records;
            for (const auto &w : weights)
            {
                auto record = safe_fetch_record(w.first);
                if (record)
                {
                    // Key everything by the requested ticker
                    record->ticker = w.first;
                    records.push_back(*record);
                }
            }

            PortfolioWeights holdings = weights;
            if (strategy)
            {
                records = screening::EligibilityFilter::filter(records, *strategy);
                holdings.clear();
                for (const auto &r : records)
                {
                    holdings[r.ticker] = weights.at(r.ticker);
                }
            }

            for (const auto &h : holdings)
            {
                metrics.holdings.push_back(h.first);
            }

            PortfolioSeries series = portfolio_series(holdings, range);
            if (!series.empty())
            {
                PerformanceCalculator calc(settings_.risk_free_rate, settings_.trading_days_per_year);
                if (benchmark && !benchmark->empty())
                {
                    PortfolioSeries bench = benchmark_series(*benchmark, range);
                    metrics.performance = calc.compute(series.returns, bench.returns);
                }
                else
                {
                    metrics.performance = calc.compute(series.returns);
                }
            }

            aggregate_esg(holdings, records, metrics);
            return metrics;
        }

        PortfolioSeries PortfolioAggregator::portfolio_series(const PortfolioWeights &weights,
                                                              const data::DateRange &range) const
        {
            std::vector<WeightedCloseSeries> constituents;
            constituents.reserve(weights.size());
            for (const auto &w : weights)
            {
                WeightedCloseSeries c;
                c.ticker = w.first;
                c.weight = w.second;
                c.closes = safe_fetch_series(w.first, range);
                constituents.push_back(std::move(c));
            }
            return build_portfolio_series(constituents);
        }

        PortfolioSeries PortfolioAggregator::benchmark_series(const std::string &ticker,
                                                              const data::DateRange &range) const
        {
            return build_benchmark_series(ticker, safe_fetch_series(ticker, range));
        }

        // ===================================================================
        // Private Helpers
        // ===================================================================

        std::optional<data::AssetRecord> PortfolioAggregator::safe_fetch_record(const std::string &ticker) const
        {
            try
            {
                return source_->fetch_asset_record(ticker);
            }
            catch (const std::exception &e)
            {
                std::cerr << "Warning: could not fetch record for '" << ticker << "': " << e.what() << "\n";
                return std::nullopt;
            }
        }

        data::CloseSeries PortfolioAggregator::safe_fetch_series(const std::string &ticker,
                                                                 const data::DateRange &range) const
        {
            try
            {
                return source_->fetch_close_series(ticker, range);
            }
            catch (const std::exception &e)
            {
                std::cerr << "Warning: could not fetch prices for '" << ticker << "': " << e.what() << "\n";
                return data::CloseSeries();
            }
        }

        void PortfolioAggregator::aggregate_esg(const PortfolioWeights &weights,
                                                const std::vector<data::AssetRecord> &records,
                                                PortfolioMetrics &metrics) const
        {
            double total_weight = 0.0;
            for (const auto &r : records)
            {
                total_weight += weights.at(r.ticker);
            }
            if (!(total_weight > 0.0))
            {
                return;
            }

            PortfolioWeights normalized;
            for (const auto &r : records)
            {
                double w = weights.at(r.ticker) / total_weight;
                normalized[r.ticker] = w;

                metrics.esg_score += r.total_or_zero() * w;
                metrics.environmental_score += r.environmental_or_zero() * w;
                metrics.social_score += r.social_or_zero() * w;
                metrics.governance_score += r.governance_or_zero() * w;
            }

            metrics.sector_exposure = data::ExposureMapping::from_records(records, data::GroupDimension::SECTOR)
                                          .exposure(normalized);
            metrics.country_exposure = data::ExposureMapping::from_records(records, data::GroupDimension::COUNTRY)
                                           .exposure(normalized);
        }

    } // namespace analytics
} // namespace esg
