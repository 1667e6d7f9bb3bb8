/**
 * @file asset_record.cpp
 * @brief JSON conversion for AssetRecord
 */

#include "data/asset_record.hpp"

#include <stdexcept>

namespace esg
{
    namespace data
    {

        namespace
        {

            std::optional<double> optional_number(const nlohmann::json &j, const char *key)
            {
                if (!j.contains(key) || j[key].is_null())
                {
                    return std::nullopt;
                }
                return j[key].get<double>();
            }

            nlohmann::json optional_to_json(const std::optional<double> &value)
            {
                return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
            }

        } // anonymous namespace

        AssetRecord AssetRecord::from_json(const nlohmann::json &j)
        {
            if (!j.contains("ticker") || !j["ticker"].is_string() || j["ticker"].get<std::string>().empty())
            {
                throw std::invalid_argument("Asset record must specify a non-empty 'ticker'");
            }

            AssetRecord record;
            record.ticker = j["ticker"].get<std::string>();
            record.name = j.value("name", record.ticker);
            record.sector = j.value("sector", UNKNOWN_GROUP);
            record.industry = j.value("industry", UNKNOWN_GROUP);
            record.country = j.value("country", UNKNOWN_GROUP);
            record.market_cap = j.value("market_cap", 0.0);
            record.beta = j.value("beta", 1.0);
            record.volatility = j.value("volatility", 0.0);

            record.esg_score = optional_number(j, "esg_score");
            record.environmental_score = optional_number(j, "environmental_score");
            record.social_score = optional_number(j, "social_score");
            record.governance_score = optional_number(j, "governance_score");

            record.price = j.value("price", 0.0);
            record.currency = j.value("currency", "USD");
            record.returns_1y = j.value("returns_1y", 0.0);
            return record;
        }

        nlohmann::json AssetRecord::to_json() const
        {
            nlohmann::json j;
            j["ticker"] = ticker;
            j["name"] = name;
            j["sector"] = sector;
            j["industry"] = industry;
            j["country"] = country;
            j["market_cap"] = market_cap;
            j["beta"] = beta;
            j["volatility"] = volatility;
            j["esg_score"] = optional_to_json(esg_score);
            j["environmental_score"] = optional_to_json(environmental_score);
            j["social_score"] = optional_to_json(social_score);
            j["governance_score"] = optional_to_json(governance_score);
            j["price"] = price;
            j["currency"] = currency;
            j["returns_1y"] = returns_1y;
            return j;
        }

    } // namespace data
} // namespace esg
