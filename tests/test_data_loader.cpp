/**
 * @file test_data_loader.cpp
 * @brief Unit tests for DataLoader and MarketData classes
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "data/data_loader.hpp"
#include "data/market_data.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <cstdio>
#include <algorithm>
#include <fstream>

using namespace esg;
using namespace esg::data;
using Catch::Matchers::WithinAbs;

namespace {

/// Writes a file under /tmp and removes it at scope exit
class TempFile {
public:
    TempFile(const std::string& name, const std::string& contents)
        : path_("/tmp/esg_test_" + name) {
        std::ofstream out(path_);
        out << contents;
    }
    ~TempFile() { std::remove(path_.c_str()); }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

MarketData sample_market() {
    Eigen::MatrixXd prices(4, 2);
    prices << 100.0, 200.0,
              110.0, std::nan(""),
              105.0, 220.0,
              115.0, 215.0;

    std::vector<std::string> dates = {"2024-01-02", "2024-01-03", "2024-01-04", "2024-01-05"};
    std::vector<std::string> tickers = {"AAPL", "MSFT"};
    return MarketData(prices, dates, tickers);
}

/// Price cell for a date and ticker, both of which must exist
double price_at(const MarketData& data, const std::string& ticker, const std::string& date) {
    const auto& dates = data.get_dates();
    const auto& tickers = data.get_tickers();
    auto row = std::find(dates.begin(), dates.end(), date) - dates.begin();
    auto col = std::find(tickers.begin(), tickers.end(), ticker) - tickers.begin();
    REQUIRE(static_cast<size_t>(row) < dates.size());
    REQUIRE(static_cast<size_t>(col) < tickers.size());
    return data.prices()(row, col);
}

} // namespace

// ============================================================================
// MarketData
// ============================================================================

TEST_CASE("MarketData construction", "[MarketData]") {
    SECTION("Sized constructor starts all-missing") {
        MarketData data(10, 5);
        REQUIRE(data.num_dates() == 10);
        REQUIRE(data.num_assets() == 5);
        REQUIRE(data.count_missing() == 50);
    }

    SECTION("Constructor with data") {
        auto data = sample_market();

        REQUIRE(data.num_dates() == 4);
        REQUIRE(data.num_assets() == 2);
        REQUIRE(data.is_valid());
        REQUIRE(data.has_ticker("MSFT"));
        REQUIRE_FALSE(data.has_ticker("JPM"));
        REQUIRE(data.count_missing() == 1);
    }

    SECTION("Dimension and ordering checks") {
        Eigen::MatrixXd prices(2, 1);
        prices << 1.0, 2.0;

        REQUIRE_THROWS_AS(MarketData(prices, {"2024-01-02"}, {"A"}), std::invalid_argument);
        REQUIRE_THROWS_AS(MarketData(prices, {"2024-01-02", "2024-01-03"}, {"A", "B"}), std::invalid_argument);
        REQUIRE_THROWS_AS(MarketData(prices, {"2024-01-03", "2024-01-02"}, {"A"}), std::invalid_argument);
    }
}

TEST_CASE("MarketData access", "[MarketData]") {
    auto data = sample_market();

    SECTION("Close series skips missing prices") {
        auto s = data.close_series("MSFT");
        REQUIRE(s.dates == std::vector<std::string>{"2024-01-02", "2024-01-04", "2024-01-05"});
        REQUIRE(s.prices[1] == 220.0);

        REQUIRE(data.close_series("JPM").empty());
    }

    SECTION("Last price") {
        REQUIRE(data.last_price("MSFT") == 215.0);
        REQUIRE(std::isnan(data.last_price("JPM")));
    }

    SECTION("Filter by date range") {
        auto filtered = data.filter_by_date(DateRange{"2024-01-03", "2024-01-04"});
        REQUIRE(filtered.num_dates() == 2);
        REQUIRE(filtered.get_dates().front() == "2024-01-03");
        REQUIRE(price_at(filtered, "AAPL", "2024-01-04") == 105.0);
        REQUIRE(filtered.close_series("MSFT").dates == std::vector<std::string>{"2024-01-04"});

        REQUIRE(data.filter_by_date(DateRange{"2024-01-04", ""}).num_dates() == 2);
        REQUIRE(data.filter_by_date(DateRange{"2025-01-01", ""}).num_dates() == 0);
    }
}

// ============================================================================
// Price CSV loading
// ============================================================================

TEST_CASE("Load wide price CSV", "[DataLoader]") {
    TempFile csv("wide.csv",
                 "date,AAPL,MSFT\n"
                 "2024-01-03,101.0,201.0\n"
                 "2024-01-02,100.0,200.0\n"
                 "bad-date,1.0,1.0\n"
                 "2024-01-04,102.0,nan\n"
                 "\n");

    SECTION("All tickers, rows sorted by date") {
        auto data = DataLoader::load_csv(csv.path());

        REQUIRE(data.num_dates() == 3);
        REQUIRE(data.get_dates().front() == "2024-01-02");
        REQUIRE(data.get_tickers() == std::vector<std::string>{"AAPL", "MSFT"});
        REQUIRE(price_at(data, "AAPL", "2024-01-03") == 101.0);
        REQUIRE(std::isnan(price_at(data, "MSFT", "2024-01-04")));
    }

    SECTION("Ticker subset") {
        auto data = DataLoader::load_csv_wide(csv.path(), {"MSFT"});
        REQUIRE(data.num_assets() == 1);
        REQUIRE_THROWS_AS(DataLoader::load_csv_wide(csv.path(), {"JPM"}), std::runtime_error);
    }
}

TEST_CASE("Load long price CSV", "[DataLoader]") {
    TempFile csv("long.csv",
                 "date,ticker,price\n"
                 "2024-01-02,AAPL,100.0\n"
                 "2024-01-02,MSFT,200.0\n"
                 "2024-01-03,AAPL,101.0\n");

    auto data = DataLoader::load_csv(csv.path());

    REQUIRE(data.num_dates() == 2);
    REQUIRE(data.num_assets() == 2);
    REQUIRE(price_at(data, "AAPL", "2024-01-03") == 101.0);
    REQUIRE(std::isnan(price_at(data, "MSFT", "2024-01-03")));
}

TEST_CASE("Price loading errors", "[DataLoader]") {
    REQUIRE_THROWS_AS(DataLoader::load_csv("/tmp/esg_test_does_not_exist.csv"), std::runtime_error);

    TempFile no_date("nodate.csv", "day,AAPL\n2024-01-02,1.0\n");
    REQUIRE_THROWS_AS(DataLoader::load_csv_wide(no_date.path()), std::runtime_error);

    TempFile header_only("header.csv", "date,AAPL\n");
    REQUIRE_THROWS_AS(DataLoader::load_csv_wide(header_only.path()), std::runtime_error);
}

// ============================================================================
// Asset records
// ============================================================================

TEST_CASE("Load asset records from CSV", "[DataLoader]") {
    TempFile csv("assets.csv",
                 "ticker,name,sector,country,esg_score,environmental_score,social_score,governance_score,price,extra\n"
                 "AAPL,Apple Inc.,Technology,United States,17.2,0.6,7.4,9.2,185.5,x\n"
                 "XOM,\"Exxon Mobil, Corp\",Energy,United States,41.6,,10.1,8.3,,\n"
                 ",Nameless,Energy,France,10,1,1,1,,\n");

    auto records = DataLoader::load_asset_records(csv.path());

    REQUIRE(records.size() == 2);
    REQUIRE(records[0].ticker == "AAPL");
    REQUIRE(records[0].sector == "Technology");
    REQUIRE(records[0].price == 185.5);
    REQUIRE(*records[0].esg_score == 17.2);

    REQUIRE(records[1].name == "Exxon Mobil, Corp");
    REQUIRE_FALSE(records[1].environmental_score.has_value());
    REQUIRE(records[1].environmental_or_zero() == 0.0);
    REQUIRE(records[1].industry == UNKNOWN_GROUP);

    TempFile no_ticker("assets_noticker.csv", "name,sector\nApple,Technology\n");
    REQUIRE_THROWS_AS(DataLoader::load_asset_records_csv(no_ticker.path()), std::runtime_error);
}

TEST_CASE("Load asset records from JSON", "[DataLoader]") {
    TempFile json("assets.json", R"({
        "assets": [
            {"ticker": "MSFT", "sector": "Technology", "esg_score": 15.0, "governance_score": null},
            {"ticker": "TTE", "country": "France"}
        ]
    })");

    auto records = DataLoader::load_asset_records(json.path());

    REQUIRE(records.size() == 2);
    REQUIRE(*records[0].esg_score == 15.0);
    REQUIRE_FALSE(records[0].governance_score.has_value());
    REQUIRE_FALSE(records[1].has_esg_scores());
    REQUIRE(records[1].country == "France");

    TempFile bad("assets_bad.json", R"({"rows": []})");
    REQUIRE_THROWS_AS(DataLoader::load_asset_records_json(bad.path()), std::runtime_error);

    TempFile missing_ticker("assets_missing.json", R"({"assets": [{"name": "X"}]})");
    REQUIRE_THROWS_AS(DataLoader::load_asset_records_json(missing_ticker.path()), std::invalid_argument);
}

// ============================================================================
// Configuration
// ============================================================================

TEST_CASE("Load analyzer config", "[DataLoader]") {
    SECTION("Full config") {
        TempFile json("config.json", R"({
            "data": {"prices_file": "p.csv", "assets_file": "a.json",
                     "start_date": "2024-01-01", "benchmark": "MSCI World"},
            "portfolio": {"weights": {"AAPL": 60, "MSFT": 40}, "strategy": "NetZero", "risk_profile": "prudent"},
            "analytics": {"risk_free_rate": 0.03, "trading_days_per_year": 260},
            "cache": {"enabled": false, "ttl_seconds": 0},
            "esg_fallback": {"enabled": false}
        })");

        auto config = AnalyzerConfig::load_from_file(json.path());

        REQUIRE(config.data.prices_file == "p.csv");
        REQUIRE(config.data.range().start == "2024-01-01");
        REQUIRE(config.data.range().end.empty());
        REQUIRE(config.data.benchmark == "MSCI World");
        REQUIRE(config.portfolio.weights.at("AAPL") == 60.0);
        REQUIRE(config.portfolio.strategy == "NetZero");
        REQUIRE(config.analytics.risk_free_rate == 0.03);
        REQUIRE(config.analytics.trading_days_per_year == 260);
        REQUIRE_FALSE(config.cache.enabled);
        REQUIRE_FALSE(config.esg_fallback.enabled);
    }

    SECTION("Defaults for omitted sections") {
        TempFile json("config_min.json", R"({"portfolio": {"weights": {"AAPL": 1}}})");

        auto config = DataLoader::load_config(json.path());

        REQUIRE(config.data.prices_file == "data/market/prices.csv");
        REQUIRE(config.analytics.trading_days_per_year == 252);
        REQUIRE(config.cache.enabled);
        REQUIRE(config.cache.ttl_seconds == 3600);
        REQUIRE(config.esg_fallback.total == 19.0);
    }

    SECTION("Invalid values") {
        REQUIRE_THROWS_AS(PortfolioConfig::from_json({{"weights", {{"AAPL", -1.0}}}}), std::invalid_argument);
        REQUIRE_THROWS_AS(CacheConfig::from_json({{"ttl_seconds", 0}}), std::invalid_argument);

        TempFile broken("config_broken.json", "{ not json");
        REQUIRE_THROWS_AS(DataLoader::load_json(broken.path()), std::runtime_error);
    }
}

// ============================================================================
// Source assembly
// ============================================================================

TEST_CASE("ESG fallback scores", "[DataLoader]") {
    EsgFallbackConfig fallback;

    AssetRecord bare;
    bare.ticker = "NEW";
    REQUIRE(fallback.apply(bare));
    REQUIRE(*bare.esg_score == 19.0);
    REQUIRE(*bare.environmental_score == 10.0);
    REQUIRE(*bare.social_score == 4.0);
    REQUIRE(*bare.governance_score == 5.0);

    AssetRecord partial;
    partial.ticker = "PART";
    partial.social_score = 2.0;
    REQUIRE_FALSE(fallback.apply(partial));
    REQUIRE_FALSE(partial.esg_score.has_value());

    EsgFallbackConfig disabled;
    disabled.enabled = false;
    AssetRecord other;
    other.ticker = "OTHER";
    REQUIRE_FALSE(disabled.apply(other));
    REQUIRE_FALSE(other.has_esg_scores());
}

TEST_CASE("Build in-memory source", "[DataLoader]") {
    auto market = sample_market();

    AssetRecord aapl;
    aapl.ticker = "AAPL";
    aapl.esg_score = 17.0;

    AssetRecord msft;
    msft.ticker = "MSFT";
    msft.volatility = 0.3;
    msft.price = 1.0;

    AssetRecord orphan;
    orphan.ticker = "ORPHAN";

    auto source = DataLoader::build_in_memory_source(market, {aapl, msft, orphan});

    REQUIRE(source->asset_records().size() == 3);
    REQUIRE(source->fetch_close_series("AAPL", DateRange{}).size() == 4);
    REQUIRE(source->fetch_close_series("MSFT", DateRange{}).size() == 3);
    REQUIRE(source->fetch_close_series("ORPHAN", DateRange{}).empty());

    auto a = *source->fetch_asset_record("AAPL");
    REQUIRE(a.price == 115.0);
    REQUIRE(a.volatility > 0.0);
    REQUIRE(a.returns_1y != 0.0);
    REQUIRE_FALSE(a.environmental_score.has_value());

    auto m = *source->fetch_asset_record("MSFT");
    REQUIRE(m.volatility == 0.3);
    REQUIRE(m.price == 1.0);
    REQUIRE(*m.esg_score == 19.0);

    auto o = *source->fetch_asset_record("ORPHAN");
    REQUIRE(o.price == 0.0);
    REQUIRE(o.volatility == 0.0);

    auto s = source->fetch_close_series("MSFT", DateRange{"2024-01-03", ""});
    REQUIRE(s.dates == std::vector<std::string>{"2024-01-04", "2024-01-05"});
}
