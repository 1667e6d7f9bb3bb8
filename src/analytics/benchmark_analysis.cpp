/**
 * @file benchmark_analysis.cpp
 * @brief Implementation of the BenchmarkAnalysis class.
 *
 * Pairs the two return series on common dates, then computes sample
 * (n - 1) covariance and variance for beta. Annualization uses
 * compounding for returns and sqrt(252) scaling for dispersion.
 */

#include "analytics/benchmark_analysis.hpp"
#include "analytics/performance_metrics.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace esg
{
    namespace analytics
    {

        namespace
        {
            const double ZERO_VARIANCE = 1e-18;
        } // anonymous namespace

        // ===================================================================
        // Constructors
        // ===================================================================

        BenchmarkAnalysis::BenchmarkAnalysis(const data::ReturnSeries &portfolio,
                                             const data::ReturnSeries &benchmark,
                                             double risk_free_rate,
                                             int trading_days_per_year)
            : risk_free_rate_(risk_free_rate), trading_days_per_year_(trading_days_per_year)
        {
            if (trading_days_per_year <= 0)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'trading_days_per_year', got: " + std::to_string(trading_days_per_year));
            }

            pair_by_date(portfolio, benchmark);
            compute_capm(portfolio);
            compute_tracking_metrics();
        }

        // ===================================================================
        // Export
        // ===================================================================

        std::string BenchmarkAnalysis::summary() const
        {
            std::ostringstream oss;
            oss << std::fixed;

            oss << "Benchmark Analysis Summary\n";
            oss << "==========================\n\n";

            oss << "CAPM:\n";
            oss << "  Alpha (annualized):  " << std::setprecision(4)
                << alpha_ * 100.0 << "%\n";
            oss << "  Beta:                " << std::setprecision(4)
                << beta_ << "\n";
            oss << "  Correlation:         " << std::setprecision(4)
                << correlation_ << "\n";
            oss << "  Observations:        " << num_observations();
            if (degenerate_)
            {
                oss << " (degenerate)";
            }
            oss << "\n\n";

            oss << "Relative Risk:\n";
            oss << "  Tracking Error:      " << std::setprecision(4)
                << tracking_error_ * 100.0 << "%\n";
            oss << "  Information Ratio:   " << std::setprecision(4)
                << information_ratio_ << "\n";
            oss << "  Active Return:       " << std::setprecision(4)
                << active_return_ * 100.0 << "%\n";

            return oss.str();
        }

        nlohmann::json BenchmarkAnalysis::to_json() const
        {
            nlohmann::json j;

            j["capm"]["alpha"] = alpha_;
            j["capm"]["beta"] = beta_;
            j["capm"]["covariance"] = covariance_;
            j["capm"]["benchmark_variance"] = benchmark_variance_;
            j["capm"]["correlation"] = correlation_;
            j["capm"]["degenerate"] = degenerate_;

            j["relative_risk"]["tracking_error"] = tracking_error_;
            j["relative_risk"]["information_ratio"] = information_ratio_;
            j["relative_risk"]["active_return"] = active_return_;

            j["settings"]["risk_free_rate"] = risk_free_rate_;
            j["settings"]["trading_days_per_year"] = trading_days_per_year_;
            j["settings"]["num_observations"] = num_observations();

            return j;
        }

        // ===================================================================
        // Private Helpers
        // ===================================================================

        void BenchmarkAnalysis::pair_by_date(const data::ReturnSeries &portfolio,
                                             const data::ReturnSeries &benchmark)
        {
            std::unordered_map<std::string, double> bench_by_date;
            for (size_t i = 0; i < benchmark.dates.size() && i < benchmark.returns.size(); ++i)
            {
                bench_by_date[benchmark.dates[i]] = benchmark.returns[i];
            }

            // Portfolio order is chronological, so the pairs are too
            for (size_t i = 0; i < portfolio.dates.size() && i < portfolio.returns.size(); ++i)
            {
                auto it = bench_by_date.find(portfolio.dates[i]);
                if (it == bench_by_date.end())
                {
                    continue;
                }
                paired_dates_.push_back(portfolio.dates[i]);
                portfolio_returns_.push_back(portfolio.returns[i]);
                benchmark_returns_.push_back(it->second);
                excess_returns_.push_back(portfolio.returns[i] - it->second);
            }
        }

        void BenchmarkAnalysis::compute_capm(const data::ReturnSeries &portfolio)
        {
            int n = num_observations();
            if (n < 2)
            {
                return;
            }

            double mean_p = PerformanceCalculator::mean(portfolio_returns_);
            double mean_b = PerformanceCalculator::mean(benchmark_returns_);

            double sum_pb = 0.0;
            double sum_bb = 0.0;
            double sum_pp = 0.0;
            for (int i = 0; i < n; ++i)
            {
                double dp = portfolio_returns_[i] - mean_p;
                double db = benchmark_returns_[i] - mean_b;
                sum_pb += dp * db;
                sum_bb += db * db;
                sum_pp += dp * dp;
            }

            double dof = static_cast<double>(n - 1);
            covariance_ = sum_pb / dof;
            benchmark_variance_ = sum_bb / dof;
            double portfolio_variance = sum_pp / dof;

            if (portfolio_variance > ZERO_VARIANCE && benchmark_variance_ > ZERO_VARIANCE)
            {
                correlation_ = covariance_ / std::sqrt(portfolio_variance * benchmark_variance_);
            }

            if (std::abs(benchmark_variance_) < ZERO_VARIANCE)
            {
                // Beta undefined: keep the market-neutral fallback
                return;
            }

            degenerate_ = false;
            beta_ = covariance_ / benchmark_variance_;

            PerformanceCalculator calc(risk_free_rate_, trading_days_per_year_);
            double portfolio_annual = calc.annualized_return(portfolio.returns);
            double benchmark_annual = calc.annualized_return(benchmark_returns_);

            alpha_ = (portfolio_annual - risk_free_rate_) - beta_ * (benchmark_annual - risk_free_rate_);
        }

        void BenchmarkAnalysis::compute_tracking_metrics()
        {
            if (excess_returns_.empty())
            {
                return;
            }

            double mean_excess = PerformanceCalculator::mean(excess_returns_);
            active_return_ = mean_excess * static_cast<double>(trading_days_per_year_);

            tracking_error_ = PerformanceCalculator::sample_std_dev(excess_returns_) *
                              std::sqrt(static_cast<double>(trading_days_per_year_));

            information_ratio_ = (tracking_error_ > ZERO_VARIANCE)
                                     ? (active_return_ / tracking_error_)
                                     : 0.0;
        }

    } // namespace analytics
} // namespace esg
