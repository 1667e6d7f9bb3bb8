/**
 * @file eligibility_filter.hpp
 * @brief ESG screening of candidate assets under a sustainability strategy.
 *
 * Each strategy is a fixed conjunction of "score below threshold" tests on
 * the environmental, social, governance and total ESG scores. Scores use
 * the risk-rating convention (lower is better). A score the provider did
 * not report is read as 0 and therefore passes every threshold.
 */

#ifndef ESG_SCREENING_ELIGIBILITY_FILTER_HPP
#define ESG_SCREENING_ELIGIBILITY_FILTER_HPP

#include "data/asset_record.hpp"

#include <string>
#include <vector>

namespace esg
{
    namespace screening
    {

        /**
         * @enum SustainabilityStrategy
         * @brief Named sustainability preference.
         */
        enum class SustainabilityStrategy
        {
            NET_ZERO,           ///< Strong environmental focus
            MULTI_THEMATIC_ESG, ///< Balanced scores across pillars
            SOLIDARITY,         ///< Social and governance focus
            DEFAULT             ///< Fallback for any other name
        };

        /**
         * @struct FilterThresholds
         * @brief Screening limits per strategy. All tests are strict (<).
         */
        struct FilterThresholds
        {
            // Net Zero
            static constexpr double NET_ZERO_MAX_ENVIRONMENTAL = 4.0;
            static constexpr double NET_ZERO_MAX_TOTAL = 20.0;
            static constexpr double NET_ZERO_MAX_SOCIAL_GOVERNANCE = 12.0;

            // Multi-thematic ESG
            static constexpr double MULTI_THEMATIC_MAX_TOTAL = 22.0;
            static constexpr double MULTI_THEMATIC_MAX_PILLAR = 10.0;
            static constexpr double MULTI_THEMATIC_STRONG_ENVIRONMENTAL = 8.0;
            static constexpr double MULTI_THEMATIC_STRONG_SOCIAL = 8.0;
            static constexpr double MULTI_THEMATIC_STRONG_GOVERNANCE = 5.0;

            // Solidarity
            static constexpr double SOLIDARITY_MAX_SOCIAL = 8.0;
            static constexpr double SOLIDARITY_MAX_GOVERNANCE = 6.0;
            static constexpr double SOLIDARITY_MAX_TOTAL = 25.0;

            // Default
            static constexpr double DEFAULT_MAX_TOTAL = 25.0;
            static constexpr double DEFAULT_MAX_PILLAR = 15.0;
        };

        /**
         * @class EligibilityFilter
         * @brief Stateless strategy-based asset screen.
         *
         * Usage:
         * @code
         *   auto strategy = EligibilityFilter::parse_strategy("Net Zero");
         *   auto eligible = EligibilityFilter::filter(candidates, strategy);
         * @endcode
         *
         * Thread safety: all members are static and pure.
         */
        class EligibilityFilter
        {
        public:
            /**
             * @brief Test a single asset.
             * @param asset Candidate asset.
             * @param strategy Sustainability strategy.
             * @return true if the asset may enter a portfolio under the strategy.
             */
            static bool is_eligible(const data::AssetRecord &asset, SustainabilityStrategy strategy);

            /**
             * @brief Keep the eligible assets, preserving input order.
             */
            static std::vector<data::AssetRecord> filter(const std::vector<data::AssetRecord> &assets,
                                                         SustainabilityStrategy strategy);

            /**
             * @brief Map a strategy name to the enumeration.
             *
             * Case-insensitive; spaces, dashes and underscores are ignored and
             * accented letters are folded, so "Net Zero", "net_zero" and
             * "Net Zéro" are equivalent. Unrecognized names map to DEFAULT.
             */
            static SustainabilityStrategy parse_strategy(const std::string &name);

            /** @brief Canonical name ("NetZero", "MultiThematicESG", "Solidarity", "Default"). */
            static std::string to_string(SustainabilityStrategy strategy);

        private:
            static std::string normalize_name(const std::string &name);
        };

    } // namespace screening
} // namespace esg

#endif // ESG_SCREENING_ELIGIBILITY_FILTER_HPP
