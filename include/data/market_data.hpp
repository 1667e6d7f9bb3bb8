/*
 * @file market_data.hpp
 * @brief Multi-asset closing-price panel.
 *
 * Stores historical closing prices as an Eigen matrix (dates x tickers)
 * with associated date and ticker indices, as loaded from price files.
 * Per-ticker CloseSeries are extracted from the panel for the analytics
 * layer.
 */

#ifndef ESG_DATA_MARKET_DATA_HPP
#define ESG_DATA_MARKET_DATA_HPP

#include "data/time_series.hpp"

#include <Eigen/Dense>
#include <map>
#include <string>
#include <vector>

namespace esg
{
    namespace data
    {

        /**
         * @class MarketData
         * @brief Container for multi-asset closing prices.
         *
         * @note Dates are kept in ascending order.
         * @note Missing prices are represented as NaN values.
         */
        class MarketData
        {
        public:
            /**
             * @brief Constructor with dimensions, all prices NaN.
             * @param num_dates Number of time periods.
             * @param num_assets Number of assets.
             */
            MarketData(size_t num_dates, size_t num_assets);

            /**
             * @brief Constructor with data.
             * @param prices Price matrix (dates x assets).
             * @param dates Vector of date strings, ascending.
             * @param tickers Vector of asset ticker symbols.
             * @throws std::invalid_argument If dimensions disagree or dates are not ascending.
             */
            MarketData(const Eigen::MatrixXd &prices,
                       const std::vector<std::string> &dates,
                       const std::vector<std::string> &tickers);

            ~MarketData() = default;

            /** ===========================================
             *  Data Access Methods
             *  ===========================================
             */

            /** @brief Full price matrix (dates x assets). */
            const Eigen::MatrixXd &prices() const
            {
                return prices_;
            }

            const std::vector<std::string> &get_dates() const
            {
                return dates_;
            }

            const std::vector<std::string> &get_tickers() const
            {
                return tickers_;
            }

            size_t num_dates() const
            {
                return static_cast<size_t>(prices_.rows());
            }

            size_t num_assets() const
            {
                return static_cast<size_t>(prices_.cols());
            }

            bool has_ticker(const std::string &ticker) const
            {
                return find_ticker_index(ticker) >= 0;
            }

            /**
             * @brief Closing-price series for one asset, missing prices skipped.
             * @param ticker Asset ticker.
             * @return Series ordered by date, empty if the ticker is unknown.
             */
            CloseSeries close_series(const std::string &ticker) const;

            /**
             * @brief Most recent non-missing price for an asset.
             * @return Price, or NaN if the asset has no prices.
             */
            double last_price(const std::string &ticker) const;

            /** ===========================================
             *  Filtering
             *  ===========================================
             */

            /**
             * @brief Keep only dates inside an inclusive window.
             * @param range Date window; empty bounds are unbounded.
             * @return New MarketData (possibly with zero dates).
             */
            MarketData filter_by_date(const DateRange &range) const;

            /** ===========================================
             *  Validation
             *  ===========================================
             */

            bool is_valid() const;

            /** @brief Number of NaN entries in the price matrix. */
            size_t count_missing() const;

            void print_summary() const;

        private:
            int find_ticker_index(const std::string &ticker) const;
            void build_index_maps();

            Eigen::MatrixXd prices_;                     ///< Price matrix (dates x assets)
            std::vector<std::string> dates_;             ///< Date strings
            std::vector<std::string> tickers_;           ///< Asset tickers
            std::map<std::string, size_t> ticker_index_; ///< Ticker to index map
        };

    } // namespace data
} // namespace esg

#endif // ESG_DATA_MARKET_DATA_HPP
