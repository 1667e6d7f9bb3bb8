/**
 * @file benchmark_analysis.hpp
 * @brief Relative performance analysis against a benchmark.
 *
 * Computes beta, alpha, tracking error, information ratio and correlation
 * by comparing portfolio returns against a benchmark return series.
 *
 * The two series are paired on their common dates before any statistic is
 * computed. Beta is the sample covariance of the pairs divided by the
 * sample variance of the benchmark. Alpha follows the CAPM excess form:
 *
 *   alpha = (R_p - R_f) - beta * (R_b - R_f)
 *
 * where R_p is the portfolio's annualized return, R_b = (1 + mean daily
 * benchmark return)^252 - 1, and R_f is the risk-free rate.
 */

#ifndef ESG_ANALYTICS_BENCHMARK_ANALYSIS_HPP
#define ESG_ANALYTICS_BENCHMARK_ANALYSIS_HPP

#include "data/time_series.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace esg
{
    namespace analytics
    {

        /**
         * @class BenchmarkAnalysis
         * @brief Computes relative performance metrics against a benchmark.
         *
         * Usage:
         * @code
         *   BenchmarkAnalysis bench(portfolio_returns, benchmark_returns);
         *   double beta = bench.beta();
         *   double alpha = bench.alpha();
         *   double info_ratio = bench.information_ratio();
         * @endcode
         *
         * When fewer than two dates are shared, or the benchmark has zero
         * variance over them, the analysis is degenerate: beta is 1.0 and
         * alpha is 0.0.
         *
         * Thread safety: Instances are effectively immutable after construction.
         */
        class BenchmarkAnalysis
        {
        public:
            /**
             * @brief Construct from portfolio and benchmark return series.
             * @param portfolio Daily simple returns of the portfolio.
             * @param benchmark Daily simple returns of the benchmark.
             * @param risk_free_rate Annualized risk-free rate (default 0.02 = 2%).
             * @param trading_days_per_year Number of trading days per year (default 252).
             * @throws std::invalid_argument If trading_days_per_year is not positive.
             */
            BenchmarkAnalysis(const data::ReturnSeries &portfolio,
                              const data::ReturnSeries &benchmark,
                              double risk_free_rate = 0.02,
                              int trading_days_per_year = 252);

            /** @brief Default destructor. */
            ~BenchmarkAnalysis() = default;

            // ---------------------------------------------------------------
            // CAPM Metrics
            // ---------------------------------------------------------------

            /**
             * @brief CAPM beta (market sensitivity).
             *
             * A beta of 1.0 indicates market-equivalent sensitivity.
             */
            double beta() const { return beta_; }

            /**
             * @brief Annualized excess return not explained by beta.
             */
            double alpha() const { return alpha_; }

            /** @brief Sample covariance of paired daily returns. */
            double covariance() const { return covariance_; }

            /** @brief Sample variance of paired daily benchmark returns. */
            double benchmark_variance() const { return benchmark_variance_; }

            /**
             * @brief Pearson correlation of paired daily returns.
             * @note Returns 0.0 if either side has zero variance.
             */
            double correlation() const { return correlation_; }

            // ---------------------------------------------------------------
            // Tracking and Relative Risk
            // ---------------------------------------------------------------

            /**
             * @brief Tracking error (annualized).
             * @return Annualized standard deviation of portfolio minus benchmark returns.
             */
            double tracking_error() const { return tracking_error_; }

            /**
             * @brief Information ratio.
             * @return Annualized excess return / tracking error.
             *
             * @note Returns 0.0 if tracking error is zero.
             */
            double information_ratio() const { return information_ratio_; }

            /** @brief Annualized mean of daily excess returns. */
            double active_return() const { return active_return_; }

            // ---------------------------------------------------------------
            // Paired data
            // ---------------------------------------------------------------

            int num_observations() const { return static_cast<int>(paired_dates_.size()); }
            bool is_degenerate() const { return degenerate_; }

            const std::vector<std::string> &paired_dates() const { return paired_dates_; }

            /** @brief Daily portfolio minus benchmark returns on paired dates. */
            const std::vector<double> &excess_returns() const { return excess_returns_; }

            // ---------------------------------------------------------------
            // Export
            // ---------------------------------------------------------------

            std::string summary() const;
            nlohmann::json to_json() const;

        private:
            void pair_by_date(const data::ReturnSeries &portfolio,
                              const data::ReturnSeries &benchmark);
            void compute_capm(const data::ReturnSeries &portfolio);
            void compute_tracking_metrics();

            std::vector<std::string> paired_dates_;
            std::vector<double> portfolio_returns_;
            std::vector<double> benchmark_returns_;
            std::vector<double> excess_returns_;

            double risk_free_rate_;
            int trading_days_per_year_;

            double beta_ = 1.0;
            double alpha_ = 0.0;
            double covariance_ = 0.0;
            double benchmark_variance_ = 0.0;
            double correlation_ = 0.0;
            double tracking_error_ = 0.0;
            double information_ratio_ = 0.0;
            double active_return_ = 0.0;
            bool degenerate_ = true;
        };

    } // namespace analytics
} // namespace esg

#endif // ESG_ANALYTICS_BENCHMARK_ANALYSIS_HPP
