/**
 * @file test_exposure_mapper.cpp
 * @brief Unit tests for ExposureMapping
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "data/exposure_mapper.hpp"

using namespace esg::data;
using Catch::Matchers::WithinAbs;

namespace {

AssetRecord make_record(const std::string& ticker, const std::string& sector, const std::string& country)
{
    AssetRecord r;
    r.ticker = ticker;
    r.sector = sector;
    r.country = country;
    return r;
}

} // namespace

TEST_CASE("Mapping from records", "[ExposureMapping]") {
    std::vector<AssetRecord> records = {
        make_record("AAPL", "Technology", "United States"),
        make_record("TTE", "Energy", "France"),
        make_record("UNK", UNKNOWN_GROUP, "")};

    auto sectors = ExposureMapping::from_records(records, GroupDimension::SECTOR);
    auto countries = ExposureMapping::from_records(records, GroupDimension::COUNTRY);

    REQUIRE(sectors.size() == 3);
    REQUIRE(sectors.exposure({{"TTE", 1.0}}).at("Energy") == 1.0);
    REQUIRE(countries.exposure({{"TTE", 1.0}}).at("France") == 1.0);

    REQUIRE(ExposureMapping().empty());
    REQUIRE(ExposureMapping::is_ungrouped(""));
    REQUIRE(ExposureMapping::is_ungrouped("N/A"));
    REQUIRE_FALSE(ExposureMapping::is_ungrouped("Energy"));
}

TEST_CASE("Group exposure", "[ExposureMapping]") {
    auto mapping = ExposureMapping::from_records(
        {make_record("AAPL", "Technology", ""),
         make_record("MSFT", "Technology", ""),
         make_record("XOM", "Energy", ""),
         make_record("UNK", UNKNOWN_GROUP, "")},
        GroupDimension::SECTOR);

    auto exp = mapping.exposure({{"AAPL", 0.3}, {"MSFT", 0.2}, {"XOM", 0.4}, {"UNK", 0.1}, {"OTHER", 0.5}});

    REQUIRE(exp.size() == 2);
    REQUIRE_THAT(exp.at("Technology"), WithinAbs(0.5, 1e-12));
    REQUIRE_THAT(exp.at("Energy"), WithinAbs(0.4, 1e-12));
    REQUIRE(mapping.exposure({}).empty());
}

TEST_CASE("Tickers are matched exactly as given", "[ExposureMapping]") {
    std::vector<AssetRecord> records = {
        make_record("AAPL ", "Technology", ""),
        make_record(" ", "Energy", ""),
        make_record("", "Utilities", "")};

    ExposureMapping mapping;
    REQUIRE_NOTHROW(mapping = ExposureMapping::from_records(records, GroupDimension::SECTOR));
    REQUIRE(mapping.size() == 3);

    auto exp = mapping.exposure({{"AAPL ", 0.5}, {" ", 0.25}, {"", 0.25}});
    REQUIRE_THAT(exp.at("Technology"), WithinAbs(0.5, 1e-12));
    REQUIRE_THAT(exp.at("Energy"), WithinAbs(0.25, 1e-12));
    REQUIRE_THAT(exp.at("Utilities"), WithinAbs(0.25, 1e-12));

    // The trimmed key is a different ticker
    REQUIRE(mapping.exposure({{"AAPL", 1.0}}).empty());
}

TEST_CASE("Duplicate tickers keep the last group", "[ExposureMapping]") {
    auto mapping = ExposureMapping::from_records(
        {make_record("AAPL", "Technology", ""), make_record("AAPL", "Consumer", "")},
        GroupDimension::SECTOR);

    REQUIRE(mapping.size() == 1);
    REQUIRE(mapping.exposure({{"AAPL", 1.0}}).count("Consumer") == 1);
}
