/**
 * @file return_series.cpp
 * @brief Implementation of return-series transforms and basket aggregation
 */

#include "analytics/return_series.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>
#include <stdexcept>

namespace esg
{
    namespace analytics
    {

        data::ReturnSeries simple_returns(const data::CloseSeries &closes)
        {
            data::ReturnSeries result;
            size_t n = std::min(closes.dates.size(), closes.prices.size());
            if (n < 2)
            {
                return result;
            }

            result.dates.reserve(n - 1);
            result.returns.reserve(n - 1);

            for (size_t i = 1; i < n; ++i)
            {
                double p_t = closes.prices[i];
                double p_tm1 = closes.prices[i - 1];

                if (!std::isfinite(p_t) || !std::isfinite(p_tm1) || p_tm1 == 0.0)
                {
                    continue;
                }
                if (result.dates.empty())
                {
                    result.base_date = closes.dates[i - 1];
                }
                result.dates.push_back(closes.dates[i]);
                result.returns.push_back(p_t / p_tm1 - 1.0);
            }
            return result;
        }

        data::ValueSeries cumulative_value(const data::ReturnSeries &returns)
        {
            data::ValueSeries result;
            if (returns.empty())
            {
                return result;
            }

            result.dates.reserve(returns.size() + 1);
            result.values.reserve(returns.size() + 1);

            result.dates.push_back(returns.base_date);
            result.values.push_back(VALUE_BASE);

            double level = VALUE_BASE;
            for (size_t i = 0; i < returns.size(); ++i)
            {
                level *= (1.0 + returns.returns[i]);
                result.dates.push_back(returns.dates[i]);
                result.values.push_back(level);
            }
            return result;
        }

        data::ValueSeries normalized_prices(const data::CloseSeries &closes)
        {
            data::ValueSeries result;
            if (closes.empty() || closes.prices.front() == 0.0)
            {
                return result;
            }

            const double first = closes.prices.front();
            result.dates = closes.dates;
            result.values.reserve(closes.prices.size());
            for (double p : closes.prices)
            {
                result.values.push_back(p / first * VALUE_BASE);
            }
            return result;
        }

        AlignedReturns align_returns(const std::vector<std::string> &tickers,
                                     const std::vector<data::ReturnSeries> &series)
        {
            if (tickers.size() != series.size())
            {
                throw std::invalid_argument(
                    "Ticker count (" + std::to_string(tickers.size()) + ") must match series count (" + std::to_string(series.size()) + ")");
            }

            AlignedReturns aligned;
            aligned.tickers = tickers;

            // date -> row, ordered chronologically
            std::map<std::string, Eigen::Index> date_rows;
            for (const auto &s : series)
            {
                for (const auto &d : s.dates)
                {
                    date_rows.emplace(d, 0);
                }
                if (!s.empty() && (aligned.base_date.empty() || s.base_date < aligned.base_date))
                {
                    aligned.base_date = s.base_date;
                }
            }

            Eigen::Index row = 0;
            aligned.dates.reserve(date_rows.size());
            for (auto &p : date_rows)
            {
                p.second = row++;
                aligned.dates.push_back(p.first);
            }

            aligned.returns = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(date_rows.size()),
                                                    static_cast<Eigen::Index>(series.size()));
            for (size_t j = 0; j < series.size(); ++j)
            {
                const auto &s = series[j];
                for (size_t i = 0; i < s.dates.size(); ++i)
                {
                    aligned.returns(date_rows.at(s.dates[i]), static_cast<Eigen::Index>(j)) = s.returns[i];
                }
            }
            return aligned;
        }

        PortfolioSeries build_portfolio_series(const std::vector<WeightedCloseSeries> &constituents)
        {
            PortfolioSeries result;

            std::vector<std::string> tickers;
            std::vector<data::ReturnSeries> series;
            std::vector<double> raw_weights;

            for (const auto &c : constituents)
            {
                if (c.closes.empty())
                {
                    continue;
                }
                tickers.push_back(c.ticker);
                series.push_back(simple_returns(c.closes));
                raw_weights.push_back(c.weight);
            }

            double total_weight = std::accumulate(raw_weights.begin(), raw_weights.end(), 0.0);
            if (tickers.empty() || !(total_weight > 0.0))
            {
                return result;
            }

            Eigen::VectorXd weights(static_cast<Eigen::Index>(raw_weights.size()));
            for (size_t j = 0; j < raw_weights.size(); ++j)
            {
                weights(static_cast<Eigen::Index>(j)) = raw_weights[j] / total_weight;
            }

            result.tickers = tickers;
            result.weights.assign(weights.data(), weights.data() + weights.size());

            AlignedReturns aligned = align_returns(tickers, series);
            if (aligned.dates.empty())
            {
                return result;
            }

            Eigen::VectorXd portfolio_returns = aligned.returns * weights;

            result.returns.base_date = aligned.base_date;
            result.returns.dates = aligned.dates;
            result.returns.returns.assign(portfolio_returns.data(),
                                          portfolio_returns.data() + portfolio_returns.size());
            result.values = cumulative_value(result.returns);
            return result;
        }

        PortfolioSeries build_benchmark_series(const std::string &ticker, const data::CloseSeries &closes)
        {
            PortfolioSeries result;
            if (closes.empty())
            {
                return result;
            }

            result.tickers = {ticker};
            result.weights = {1.0};
            result.returns = simple_returns(closes);
            result.values = normalized_prices(closes);
            return result;
        }

        TrailingStatistics trailing_statistics(const data::CloseSeries &closes, int trading_days_per_year)
        {
            if (trading_days_per_year <= 0)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'trading_days_per_year', got: " + std::to_string(trading_days_per_year));
            }

            TrailingStatistics stats;
            data::ReturnSeries returns = simple_returns(closes);
            int n = static_cast<int>(returns.size());
            stats.num_returns = n;
            if (n == 0)
            {
                return stats;
            }

            double mean = std::accumulate(returns.returns.begin(), returns.returns.end(), 0.0) / static_cast<double>(n);
            stats.mean_return_pct = mean * static_cast<double>(trading_days_per_year) * 100.0;

            if (n > 1)
            {
                double sum_sq = 0.0;
                for (double r : returns.returns)
                {
                    double diff = r - mean;
                    sum_sq += diff * diff;
                }
                stats.annualized_volatility = std::sqrt(sum_sq / static_cast<double>(n - 1)) *
                                              std::sqrt(static_cast<double>(trading_days_per_year));
            }
            return stats;
        }

    } // namespace analytics
} // namespace esg
