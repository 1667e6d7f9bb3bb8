/**
 * @file portfolio_aggregator.hpp
 * @brief Portfolio-level ESG, exposure and performance metrics.
 *
 * The aggregator resolves a ticker -> weight map through a DataSource,
 * optionally restricts it to the assets eligible under a sustainability
 * strategy, and combines:
 *   - weighted ESG scores and sector/country exposure, and
 *   - performance metrics of the weighted return series.
 *
 * The two parts normalize weights independently. Series weights are
 * normalized over the holdings that have a price history; ESG and exposure
 * weights over the holdings that resolve to an AssetRecord. Without a
 * strategy, a holding with prices but no record still contributes to the
 * return series.
 */

#ifndef ESG_ANALYTICS_PORTFOLIO_AGGREGATOR_HPP
#define ESG_ANALYTICS_PORTFOLIO_AGGREGATOR_HPP

#include "analytics/performance_metrics.hpp"
#include "analytics/return_series.hpp"
#include "data/data_source.hpp"
#include "screening/eligibility_filter.hpp"

#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace esg
{
    namespace analytics
    {

        /// Ticker -> raw weight. Values are non-negative and need not sum to 1.
        using PortfolioWeights = std::map<std::string, double>;

        /**
         * @struct PortfolioMetrics
         * @brief Result of one aggregation. Zero-valued when nothing resolves.
         */
        struct PortfolioMetrics
        {
            double esg_score = 0.0;
            double environmental_score = 0.0;
            double social_score = 0.0;
            double governance_score = 0.0;
            std::map<std::string, double> sector_exposure;
            std::map<std::string, double> country_exposure;
            PerformanceMetrics performance;
            std::vector<std::string> holdings; ///< Effective weight set after filtering

            nlohmann::json to_json() const;
            std::string summary() const;
        };

        /**
         * @class PortfolioAggregator
         * @brief Computes PortfolioMetrics from weights and a data source.
         *
         * Usage:
         * @code
         *   PortfolioAggregator agg(source, settings);
         *   auto m = agg.aggregate({{"AAPL", 60}, {"MSFT", 40}}, range, "^GSPC",
         *                          screening::SustainabilityStrategy::NET_ZERO);
         * @endcode
         *
         * Never throws for missing data. A DataSource exception for one ticker
         * is logged to stderr and the ticker is treated as having no data.
         *
         * Thread safety: stateless apart from the shared source; concurrent
         * calls are safe if the source is.
         */
        class PortfolioAggregator
        {
        public:
            /**
             * @throws std::invalid_argument If source is null or settings are invalid.
             */
            explicit PortfolioAggregator(std::shared_ptr<const data::DataSource> source,
                                         AnalyticsSettings settings = AnalyticsSettings());

            /**
             * @brief Full portfolio analysis.
             * @param weights Ticker -> raw weight
             * @param range Inclusive date window for price histories
             * @param benchmark Benchmark ticker; beta/alpha are reported only if it has data
             * @param strategy Restricts holdings to eligible assets when set
             */
            PortfolioMetrics aggregate(const PortfolioWeights &weights,
                                       const data::DateRange &range,
                                       const std::optional<std::string> &benchmark = std::nullopt,
                                       const std::optional<screening::SustainabilityStrategy> &strategy = std::nullopt) const;

            /**
             * @brief Weighted return and base-100 value series of the holdings.
             */
            PortfolioSeries portfolio_series(const PortfolioWeights &weights,
                                             const data::DateRange &range) const;

            /**
             * @brief Benchmark returns and prices normalized to 100.
             */
            PortfolioSeries benchmark_series(const std::string &ticker,
                                             const data::DateRange &range) const;

            const AnalyticsSettings &settings() const { return settings_; }

        private:
            std::optional<data::AssetRecord> safe_fetch_record(const std::string &ticker) const;
            data::CloseSeries safe_fetch_series(const std::string &ticker,
                                                const data::DateRange &range) const;

            void aggregate_esg(const PortfolioWeights &weights,
                               const std::vector<data::AssetRecord> &records,
                               PortfolioMetrics &metrics) const;

            std::shared_ptr<const data::DataSource> source_;
            AnalyticsSettings settings_;
        };

    } // namespace analytics
} // namespace esg

#endif // ESG_ANALYTICS_PORTFOLIO_AGGREGATOR_HPP
