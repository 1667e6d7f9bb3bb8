/**
 * @file return_series.hpp
 * @brief Price-to-return transforms and weighted basket aggregation.
 *
 * Converts closing-price histories into simple-return series, combines
 * several assets into a weighted portfolio return series, and builds the
 * base-100 cumulative value series used for charting.
 *
 * Portfolio aggregation joins assets on dates, not on positions: the
 * portfolio return on a date is the weighted sum of the returns observed
 * on that date, and an asset without an observation contributes zero.
 */

#ifndef ESG_ANALYTICS_RETURN_SERIES_HPP
#define ESG_ANALYTICS_RETURN_SERIES_HPP

#include "data/time_series.hpp"

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace esg
{
    namespace analytics
    {

        /// Starting level of every normalized value series.
        constexpr double VALUE_BASE = 100.0;

        /**
         * @struct WeightedCloseSeries
         * @brief One basket constituent: ticker, price history and raw weight.
         */
        struct WeightedCloseSeries
        {
            std::string ticker;
            data::CloseSeries closes;
            double weight = 0.0; ///< Non-negative, not required to sum to 1
        };

        /**
         * @struct AlignedReturns
         * @brief Per-asset returns joined on the union of return dates.
         *
         * returns(i, j) is the return of tickers[j] on dates[i], or 0 if
         * that asset has no observation on that date.
         */
        struct AlignedReturns
        {
            std::string base_date;
            std::vector<std::string> dates;
            std::vector<std::string> tickers;
            Eigen::MatrixXd returns; ///< dates x tickers
        };

        /**
         * @struct PortfolioSeries
         * @brief Return series and matching base-100 value series.
         */
        struct PortfolioSeries
        {
            data::ReturnSeries returns;
            data::ValueSeries values;
            std::vector<std::string> tickers; ///< Constituents that had data
            std::vector<double> weights;      ///< Normalized weights, same order as tickers

            bool empty() const { return returns.empty(); }
        };

        /**
         * @struct TrailingStatistics
         * @brief Annualized statistics of a single price history.
         */
        struct TrailingStatistics
        {
            double annualized_volatility = 0.0; ///< Sample std dev * sqrt(trading days)
            double mean_return_pct = 0.0;       ///< Mean daily return * trading days * 100
            int num_returns = 0;
        };

        /**
         * @brief Simple returns of a price series.
         *
         * return[i] = price[i] / price[i-1] - 1. The first date has no return
         * and becomes base_date. A date whose previous price is zero or not
         * finite yields no return.
         *
         * @param closes Closing prices ordered by date.
         * @return Return series, empty if fewer than two prices.
         */
        data::ReturnSeries simple_returns(const data::CloseSeries &closes);

        /**
         * @brief Base-100 cumulative value of a return series.
         *
         * The first point is VALUE_BASE at returns.base_date; each following
         * point is VALUE_BASE * prod(1 + r_j) up to that return date.
         *
         * @return Value series of size returns.size() + 1, or empty if returns is empty.
         */
        data::ValueSeries cumulative_value(const data::ReturnSeries &returns);

        /**
         * @brief Prices rescaled so that the first observation equals VALUE_BASE.
         * @return Empty if closes is empty or the first price is zero.
         */
        data::ValueSeries normalized_prices(const data::CloseSeries &closes);

        /**
         * @brief Join per-asset return series on dates.
         * @param tickers Asset identifiers, same order as series.
         * @param series Per-asset return series.
         * @throws std::invalid_argument If the two vectors differ in length.
         */
        AlignedReturns align_returns(const std::vector<std::string> &tickers,
                                     const std::vector<data::ReturnSeries> &series);

        /**
         * @brief Weighted portfolio return and value series.
         *
         * Constituents with an empty price series are dropped. Remaining
         * weights are divided by their sum; if that sum is not positive, or
         * nothing remains, both output series are empty.
         */
        PortfolioSeries build_portfolio_series(const std::vector<WeightedCloseSeries> &constituents);

        /**
         * @brief Returns and normalized prices of a single benchmark series.
         */
        PortfolioSeries build_benchmark_series(const std::string &ticker, const data::CloseSeries &closes);

        /**
         * @brief Trailing annualized volatility and mean return of a price series.
         * @param closes Closing prices ordered by date.
         * @param trading_days_per_year Annualization factor (default 252).
         */
        TrailingStatistics trailing_statistics(const data::CloseSeries &closes,
                                               int trading_days_per_year = 252);

    } // namespace analytics
} // namespace esg

#endif // ESG_ANALYTICS_RETURN_SERIES_HPP
