/**
 * @file time_series.hpp
 * @brief Date-indexed series types shared by the data and analytics layers.
 *
 * Dates are ISO strings (YYYY-MM-DD) so that lexicographic order equals
 * chronological order. Every series stores dates and values as parallel
 * vectors ordered by date.
 */

#ifndef ESG_DATA_TIME_SERIES_HPP
#define ESG_DATA_TIME_SERIES_HPP

#include <string>
#include <vector>

namespace esg
{
    namespace data
    {

        /**
         * @struct DateRange
         * @brief Inclusive calendar window. An empty bound is unbounded.
         */
        struct DateRange
        {
            std::string start; ///< First date included (YYYY-MM-DD), or empty
            std::string end;   ///< Last date included (YYYY-MM-DD), or empty

            /**
             * @brief Check whether a date falls inside the window.
             * @param date Date string (YYYY-MM-DD).
             */
            bool contains(const std::string &date) const
            {
                return (start.empty() || date >= start) && (end.empty() || date <= end);
            }
        };

        /**
         * @struct CloseSeries
         * @brief Closing prices ordered by date.
         */
        struct CloseSeries
        {
            std::vector<std::string> dates;
            std::vector<double> prices;

            bool empty() const { return dates.empty(); }
            size_t size() const { return dates.size(); }
        };

        /**
         * @struct ReturnSeries
         * @brief Fractional simple returns ordered by date.
         *
         * base_date is the date of the price observation that the first
         * return is measured from. It anchors the base-100 value series.
         */
        struct ReturnSeries
        {
            std::string base_date;
            std::vector<std::string> dates;
            std::vector<double> returns;

            bool empty() const { return dates.empty(); }
            size_t size() const { return dates.size(); }
        };

        /**
         * @struct ValueSeries
         * @brief Normalized cumulative value (base 100) ordered by date.
         */
        struct ValueSeries
        {
            std::vector<std::string> dates;
            std::vector<double> values;

            bool empty() const { return dates.empty(); }
            size_t size() const { return dates.size(); }
        };

    } // namespace data
} // namespace esg

#endif // ESG_DATA_TIME_SERIES_HPP
