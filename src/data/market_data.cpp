/**
 * @file market_data.cpp
 * @brief Implementation of MarketData class
 */

#include "data/market_data.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace esg
{
    namespace data
    {

        // ============================================================================
        // Constructors
        // ============================================================================

        MarketData::MarketData(size_t num_dates, size_t num_assets)
            : prices_(num_dates, num_assets)
        {
            prices_.setConstant(std::numeric_limits<double>::quiet_NaN());
        }

        MarketData::MarketData(const Eigen::MatrixXd &prices,
                               const std::vector<std::string> &dates,
                               const std::vector<std::string> &tickers)
            : prices_(prices), dates_(dates), tickers_(tickers)
        {
            if (prices_.rows() != static_cast<Eigen::Index>(dates_.size()))
            {
                throw std::invalid_argument("Price matrix rows must match dates vector size");
            }
            if (prices_.cols() != static_cast<Eigen::Index>(tickers_.size()))
            {
                throw std::invalid_argument("Price matrix columns must match tickers vector size");
            }
            for (size_t i = 1; i < dates_.size(); ++i)
            {
                if (dates_[i] <= dates_[i - 1])
                {
                    throw std::invalid_argument("Dates must be strictly ascending, got '" + dates_[i - 1] + "' before '" + dates_[i] + "'");
                }
            }

            build_index_maps();
        }

        // ============================================================================
        // Data Access Methods
        // ============================================================================

        CloseSeries MarketData::close_series(const std::string &ticker) const
        {
            CloseSeries series;
            int idx = find_ticker_index(ticker);
            if (idx < 0)
            {
                return series;
            }

            for (Eigen::Index i = 0; i < prices_.rows(); ++i)
            {
                double p = prices_(i, idx);
                if (!std::isnan(p))
                {
                    series.dates.push_back(dates_[static_cast<size_t>(i)]);
                    series.prices.push_back(p);
                }
            }
            return series;
        }

        double MarketData::last_price(const std::string &ticker) const
        {
            int idx = find_ticker_index(ticker);
            if (idx >= 0)
            {
                for (Eigen::Index i = prices_.rows() - 1; i >= 0; --i)
                {
                    if (!std::isnan(prices_(i, idx)))
                    {
                        return prices_(i, idx);
                    }
                }
            }
            return std::numeric_limits<double>::quiet_NaN();
        }

        // ================================
        // Filtering
        // ================================

        MarketData MarketData::filter_by_date(const DateRange &range) const
        {
            std::vector<Eigen::Index> rows;
            std::vector<std::string> filtered_dates;
            for (size_t i = 0; i < dates_.size(); ++i)
            {
                if (range.contains(dates_[i]))
                {
                    rows.push_back(static_cast<Eigen::Index>(i));
                    filtered_dates.push_back(dates_[i]);
                }
            }

            Eigen::MatrixXd filtered_prices(static_cast<Eigen::Index>(rows.size()), prices_.cols());
            for (size_t i = 0; i < rows.size(); ++i)
            {
                filtered_prices.row(static_cast<Eigen::Index>(i)) = prices_.row(rows[i]);
            }

            return MarketData(filtered_prices, filtered_dates, tickers_);
        }

        // ===================
        // Validation Methods
        // ===================

        bool MarketData::is_valid() const
        {
            if (prices_.rows() == 0 || prices_.cols() == 0)
            {
                return false;
            }
            if (dates_.size() != static_cast<size_t>(prices_.rows()))
            {
                return false;
            }
            if (tickers_.size() != static_cast<size_t>(prices_.cols()))
            {
                return false;
            }
            return true;
        }

        size_t MarketData::count_missing() const
        {
            return static_cast<size_t>(prices_.array().isNaN().count());
        }

        void MarketData::print_summary() const
        {
            std::cout << "\n=== Market Data Summary ===\n";
            std::cout << "Dimensions: " << prices_.rows() << " dates x "
                      << prices_.cols() << " assets\n";
            if (!dates_.empty())
            {
                std::cout << "Date range: " << dates_.front() << " to " << dates_.back() << "\n";
            }
            std::cout << "Assets: ";
            for (const auto &ticker : tickers_)
            {
                std::cout << ticker << " ";
            }
            std::cout << "\nMissing values: " << count_missing() << "\n";
            std::cout << "==========================\n"
                      << std::endl;
        }

        // =========================
        // Private Helper Methods
        // =========================

        int MarketData::find_ticker_index(const std::string &ticker) const
        {
            auto it = ticker_index_.find(ticker);
            if (it != ticker_index_.end())
            {
                return static_cast<int>(it->second);
            }
            return -1;
        }

        void MarketData::build_index_maps()
        {
            ticker_index_.clear();

            for (size_t i = 0; i < tickers_.size(); ++i)
            {
                ticker_index_[tickers_[i]] = i;
            }
        }

    } // namespace data
} // namespace esg
