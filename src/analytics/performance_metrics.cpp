/**
 * @file performance_metrics.cpp
 * @brief Implementation of PerformanceMetrics and PerformanceCalculator.
 *
 * Annualized return compounds the mean daily return over
 * trading_days_per_year; dispersion scales by its square root.
 */

#include "analytics/performance_metrics.hpp"
#include "analytics/benchmark_analysis.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace esg
{
    namespace analytics
    {

        // ===================================================================
        // AnalyticsSettings
        // ===================================================================

        AnalyticsSettings AnalyticsSettings::from_json(const nlohmann::json &j)
        {
            AnalyticsSettings s;
            s.risk_free_rate = j.value("risk_free_rate", 0.02);
            s.trading_days_per_year = j.value("trading_days_per_year", 252);
            if (s.trading_days_per_year <= 0)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'trading_days_per_year', got: " + std::to_string(s.trading_days_per_year));
            }
            return s;
        }

        nlohmann::json AnalyticsSettings::to_json() const
        {
            return nlohmann::json{
                {"risk_free_rate", risk_free_rate},
                {"trading_days_per_year", trading_days_per_year}};
        }

        // ===================================================================
        // PerformanceMetrics export
        // ===================================================================

        nlohmann::json PerformanceMetrics::to_json() const
        {
            nlohmann::json j;
            j["annualized_return"] = annualized_return;
            j["annualized_volatility"] = annualized_volatility;
            j["sharpe_ratio"] = sharpe_ratio;
            j["max_drawdown"] = max_drawdown;
            j["beta"] = beta ? nlohmann::json(*beta) : nlohmann::json(nullptr);
            j["alpha"] = alpha ? nlohmann::json(*alpha) : nlohmann::json(nullptr);
            j["num_observations"] = num_observations;
            return j;
        }

        std::string PerformanceMetrics::summary() const
        {
            std::ostringstream oss;
            oss << std::fixed;

            oss << "Performance Summary\n";
            oss << "===================\n";

            if (empty())
            {
                oss << "  No return data\n";
                return oss.str();
            }

            oss << "  Annualized Return:   " << std::setprecision(4)
                << annualized_return * 100.0 << "%\n";
            oss << "  Annualized Vol:      " << std::setprecision(4)
                << annualized_volatility * 100.0 << "%\n";
            oss << "  Sharpe Ratio:        " << std::setprecision(4)
                << sharpe_ratio << "\n";
            oss << "  Max Drawdown:        " << std::setprecision(4)
                << max_drawdown * 100.0 << "%\n";
            if (beta)
            {
                oss << "  Beta:                " << std::setprecision(4) << *beta << "\n";
            }
            if (alpha)
            {
                oss << "  Alpha (annualized):  " << std::setprecision(4)
                    << *alpha * 100.0 << "%\n";
            }
            oss << "  Observations:        " << num_observations << "\n";

            return oss.str();
        }

        // ===================================================================
        // Constructors
        // ===================================================================

        PerformanceCalculator::PerformanceCalculator(double risk_free_rate,
                                                     int trading_days_per_year)
            : risk_free_rate_(risk_free_rate), trading_days_per_year_(trading_days_per_year)
        {
            if (trading_days_per_year <= 0)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'trading_days_per_year', got: " + std::to_string(trading_days_per_year));
            }
        }

        // ===================================================================
        // Aggregate computation
        // ===================================================================

        PerformanceMetrics PerformanceCalculator::compute(const data::ReturnSeries &returns) const
        {
            PerformanceMetrics m;
            if (returns.empty())
            {
                return m;
            }

            const std::vector<double> &r = returns.returns;
            m.annualized_return = annualized_return(r);
            m.annualized_volatility = annualized_volatility(r);
            m.sharpe_ratio = sharpe_ratio(r);
            m.max_drawdown = max_drawdown(r);
            m.num_observations = static_cast<int>(r.size());
            return m;
        }

        PerformanceMetrics PerformanceCalculator::compute(const data::ReturnSeries &returns,
                                                          const data::ReturnSeries &benchmark) const
        {
            PerformanceMetrics m = compute(returns);
            if (m.empty() || benchmark.empty())
            {
                return m;
            }

            BenchmarkAnalysis bench(returns, benchmark, risk_free_rate_, trading_days_per_year_);
            m.beta = bench.beta();
            m.alpha = bench.alpha();
            return m;
        }

        // ===================================================================
        // Individual statistics
        // ===================================================================

        double PerformanceCalculator::annualized_return(const std::vector<double> &returns) const
        {
            if (returns.empty())
            {
                return 0.0;
            }
            return std::pow(1.0 + mean(returns), static_cast<double>(trading_days_per_year_)) - 1.0;
        }

        double PerformanceCalculator::annualized_volatility(const std::vector<double> &returns) const
        {
            return sample_std_dev(returns) * std::sqrt(static_cast<double>(trading_days_per_year_));
        }

        double PerformanceCalculator::sharpe_ratio(const std::vector<double> &returns) const
        {
            double std_dev = sample_std_dev(returns);
            if (returns.size() < 2 || std::abs(std_dev) < ZERO_STD_DEV)
            {
                return 0.0;
            }

            double daily_rf = to_daily_rate(risk_free_rate_);
            double mean_excess = mean(returns) - daily_rf;
            return std::sqrt(static_cast<double>(trading_days_per_year_)) * mean_excess / std_dev;
        }

        double PerformanceCalculator::max_drawdown(const std::vector<double> &returns)
        {
            std::vector<double> dd = drawdown_series(returns);
            if (dd.empty())
            {
                return 0.0;
            }
            return std::min(0.0, *std::min_element(dd.begin(), dd.end()));
        }

        std::vector<double> PerformanceCalculator::drawdown_series(const std::vector<double> &returns)
        {
            std::vector<double> result;
            result.reserve(returns.size());

            double wealth = 1.0;
            double peak = 0.0;
            for (size_t i = 0; i < returns.size(); ++i)
            {
                wealth *= (1.0 + returns[i]);
                if (i == 0 || wealth > peak)
                {
                    peak = wealth;
                }
                result.push_back(peak != 0.0 ? wealth / peak - 1.0 : 0.0);
            }
            return result;
        }

        double PerformanceCalculator::mean(const std::vector<double> &values)
        {
            if (values.empty())
            {
                return 0.0;
            }
            return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
        }

        double PerformanceCalculator::sample_std_dev(const std::vector<double> &values)
        {
            int n = static_cast<int>(values.size());
            if (n < 2)
            {
                return 0.0;
            }

            double mu = mean(values);
            double sum_sq = 0.0;
            for (double v : values)
            {
                double diff = v - mu;
                sum_sq += diff * diff;
            }
            return std::sqrt(sum_sq / static_cast<double>(n - 1));
        }

        // ===================================================================
        // Private Helpers
        // ===================================================================

        double PerformanceCalculator::to_daily_rate(double annual_rate) const
        {
            return annual_rate / static_cast<double>(trading_days_per_year_);
        }

    } // namespace analytics
} // namespace esg
