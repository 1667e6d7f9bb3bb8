/**
 * @file asset_record.hpp
 * @brief Static per-ticker snapshot of fundamentals and ESG scores.
 */

#ifndef ESG_DATA_ASSET_RECORD_HPP
#define ESG_DATA_ASSET_RECORD_HPP

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace esg
{
    namespace data
    {

        /// Placeholder used by the provider for unknown sector/country/industry.
        inline const std::string UNKNOWN_GROUP = "N/A";

        /**
         * @struct AssetRecord
         * @brief Read-only snapshot of one asset as delivered by a DataSource.
         *
         * ESG sub-scores follow the provider's risk-rating convention: lower
         * is better. The total score is sum-like and is not bounded by the
         * sub-scores. A sub-score the provider did not report is left empty;
         * consumers read it as 0.
         */
        struct AssetRecord
        {
            std::string ticker;
            std::string name;
            std::string sector = UNKNOWN_GROUP;
            std::string industry = UNKNOWN_GROUP;
            std::string country = UNKNOWN_GROUP;
            double market_cap = 0.0;
            double beta = 1.0;       ///< Provider beta
            double volatility = 0.0; ///< Trailing annualized volatility (fraction)

            std::optional<double> esg_score;           ///< Total ESG risk score
            std::optional<double> environmental_score;
            std::optional<double> social_score;
            std::optional<double> governance_score;

            double price = 0.0;
            std::string currency = "USD";
            double returns_1y = 0.0; ///< Trailing annualized mean return, in percent

            /** @brief True if at least one ESG score is present. */
            bool has_esg_scores() const
            {
                return esg_score || environmental_score || social_score || governance_score;
            }

            double total_or_zero() const { return esg_score.value_or(0.0); }
            double environmental_or_zero() const { return environmental_score.value_or(0.0); }
            double social_or_zero() const { return social_score.value_or(0.0); }
            double governance_or_zero() const { return governance_score.value_or(0.0); }

            /**
             * @brief Build a record from a JSON object.
             * @param j Object with at least a "ticker" string.
             * @throws std::invalid_argument If "ticker" is missing or empty.
             */
            static AssetRecord from_json(const nlohmann::json &j);

            /** @brief Serialize to JSON. Absent scores are written as null. */
            nlohmann::json to_json() const;
        };

    } // namespace data
} // namespace esg

#endif // ESG_DATA_ASSET_RECORD_HPP
