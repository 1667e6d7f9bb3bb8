/**
 * @file test_asset_record.cpp
 * @brief Unit tests for AssetRecord JSON conversion
 */

#include <catch2/catch_test_macros.hpp>
#include "data/asset_record.hpp"

using namespace esg::data;

TEST_CASE("Record from JSON", "[AssetRecord]") {
    SECTION("Missing fields take defaults") {
        auto r = AssetRecord::from_json({{"ticker", "AAPL"}});

        REQUIRE(r.name == "AAPL");
        REQUIRE(r.sector == UNKNOWN_GROUP);
        REQUIRE(r.country == UNKNOWN_GROUP);
        REQUIRE(r.beta == 1.0);
        REQUIRE(r.currency == "USD");
        REQUIRE_FALSE(r.has_esg_scores());
        REQUIRE(r.total_or_zero() == 0.0);
    }

    SECTION("Scores are read when present") {
        auto r = AssetRecord::from_json({{"ticker", "XOM"},
                                         {"sector", "Energy"},
                                         {"esg_score", 41.6},
                                         {"environmental_score", nullptr},
                                         {"social_score", 10.1}});

        REQUIRE(r.has_esg_scores());
        REQUIRE(*r.esg_score == 41.6);
        REQUIRE_FALSE(r.environmental_score.has_value());
        REQUIRE(r.social_or_zero() == 10.1);
        REQUIRE(r.governance_or_zero() == 0.0);
    }

    SECTION("Ticker is required") {
        REQUIRE_THROWS_AS(AssetRecord::from_json({{"name", "Nameless"}}), std::invalid_argument);
        REQUIRE_THROWS_AS(AssetRecord::from_json({{"ticker", ""}}), std::invalid_argument);
    }
}

TEST_CASE("Record to JSON", "[AssetRecord]") {
    AssetRecord r;
    r.ticker = "TTE";
    r.country = "France";
    r.governance_score = 5.5;

    auto j = r.to_json();

    REQUIRE(j["ticker"] == "TTE");
    REQUIRE(j["country"] == "France");
    REQUIRE(j["esg_score"].is_null());
    REQUIRE(j["governance_score"] == 5.5);

    auto back = AssetRecord::from_json(j);
    REQUIRE(*back.governance_score == 5.5);
    REQUIRE_FALSE(back.esg_score.has_value());
}
