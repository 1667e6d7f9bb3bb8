/**
 * @file performance_metrics.hpp
 * @brief Risk and performance statistics of a daily return series.
 *
 * Provides annualized return, annualized volatility, Sharpe ratio and
 * maximum drawdown, plus beta and alpha against an optional benchmark.
 *
 * All annualized calculations default to 252 trading days per year.
 * Risk-free rate defaults to 2% annualized and is converted to a daily
 * rate by simple division where needed.
 */

#ifndef ESG_ANALYTICS_PERFORMANCE_METRICS_HPP
#define ESG_ANALYTICS_PERFORMANCE_METRICS_HPP

#include "data/time_series.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace esg
{
    namespace analytics
    {

        /**
         * @struct AnalyticsSettings
         * @brief Annualization parameters shared by all performance figures.
         */
        struct AnalyticsSettings
        {
            double risk_free_rate = 0.02;
            int trading_days_per_year = 252;

            /**
             * @brief Read settings from the "analytics" config section.
             * @throws std::invalid_argument If trading_days_per_year is not positive.
             */
            static AnalyticsSettings from_json(const nlohmann::json &j);

            nlohmann::json to_json() const;
        };

        /**
         * @struct PerformanceMetrics
         * @brief Fixed record of portfolio statistics.
         *
         * A default-constructed record (all zeros, no beta/alpha) stands for
         * "no usable return data".
         */
        struct PerformanceMetrics
        {
            double annualized_return = 0.0;     ///< (1 + mean daily return)^252 - 1
            double annualized_volatility = 0.0; ///< Sample std dev * sqrt(252)
            double sharpe_ratio = 0.0;          ///< 0 when volatility is zero
            double max_drawdown = 0.0;          ///< Non-positive fraction (e.g. -0.15)
            std::optional<double> beta;         ///< Present only with a benchmark
            std::optional<double> alpha;        ///< Present only with a benchmark
            int num_observations = 0;

            bool empty() const { return num_observations == 0; }

            nlohmann::json to_json() const;

            /**
             * @brief Formatted multi-line summary.
             */
            std::string summary() const;
        };

        /**
         * @class PerformanceCalculator
         * @brief Computes PerformanceMetrics from return series.
         *
         * Usage:
         * @code
         *   PerformanceCalculator calc;                 // rf = 2%, 252 days
         *   auto m = calc.compute(portfolio_returns, benchmark_returns);
         *   if (m.beta) { ... }
         * @endcode
         *
         * Never throws on data: empty input yields an empty record, and zero
         * dispersion yields the documented fallback values.
         *
         * Thread safety: immutable after construction.
         */
        class PerformanceCalculator
        {
        public:
            /// Standard deviations below this are treated as zero.
            static constexpr double ZERO_STD_DEV = 1e-12;

            /**
             * @param risk_free_rate Annualized risk-free rate (default 0.02 = 2%).
             * @param trading_days_per_year Number of trading days per year (default 252).
             * @throws std::invalid_argument If trading_days_per_year is not positive.
             */
            explicit PerformanceCalculator(double risk_free_rate = 0.02,
                                           int trading_days_per_year = 252);

            /**
             * @brief Metrics of a return series without benchmark statistics.
             */
            PerformanceMetrics compute(const data::ReturnSeries &returns) const;

            /**
             * @brief Metrics of a return series including beta and alpha.
             *
             * Beta and alpha are set when benchmark is non-empty. If the
             * benchmark has zero variance over the dates shared with returns,
             * beta is 1 and alpha is 0.
             */
            PerformanceMetrics compute(const data::ReturnSeries &returns,
                                       const data::ReturnSeries &benchmark) const;

            // ---------------------------------------------------------------
            // Individual statistics on raw daily returns
            // ---------------------------------------------------------------

            /** @brief (1 + mean)^trading_days - 1. Returns 0 for empty input. */
            double annualized_return(const std::vector<double> &returns) const;

            /** @brief Sample std dev * sqrt(trading_days). Returns 0 for fewer than 2 returns. */
            double annualized_volatility(const std::vector<double> &returns) const;

            /**
             * @brief sqrt(trading_days) * mean(r - rf/trading_days) / std dev.
             * @note Returns 0.0 if the standard deviation is zero.
             */
            double sharpe_ratio(const std::vector<double> &returns) const;

            /**
             * @brief Worst cumulative decline from the running peak.
             *
             * Wealth is the cumulative product of (1 + r) starting with the
             * first return; the running peak is an expanding maximum.
             *
             * @return Non-positive fraction, 0 for empty input.
             */
            static double max_drawdown(const std::vector<double> &returns);

            /**
             * @brief Drawdown at each date, wealth / running peak - 1.
             * @return Non-positive values, same length as returns.
             */
            static std::vector<double> drawdown_series(const std::vector<double> &returns);

            static double mean(const std::vector<double> &values);

            /** @brief Sample standard deviation (n - 1). Returns 0 for fewer than 2 values. */
            static double sample_std_dev(const std::vector<double> &values);

            double risk_free_rate() const { return risk_free_rate_; }
            int trading_days_per_year() const { return trading_days_per_year_; }

        private:
            double to_daily_rate(double annual_rate) const;

            double risk_free_rate_;
            int trading_days_per_year_;
        };

    } // namespace analytics
} // namespace esg

#endif // ESG_ANALYTICS_PERFORMANCE_METRICS_HPP
