/**
 * @file data_source.cpp
 * @brief In-memory and caching DataSource implementations
 */

#include "data/data_source.hpp"

#include <iterator>
#include <stdexcept>

namespace esg {
namespace data {

// ============================================================================
// InMemoryDataSource
// ============================================================================

void InMemoryDataSource::add_asset_record(const AssetRecord& record)
{
    if (record.ticker.empty())
    {
        throw std::invalid_argument("InMemoryDataSource: asset record has an empty ticker");
    }
    records_[record.ticker] = record;
}

void InMemoryDataSource::add_close_series(const std::string& ticker, const CloseSeries& series)
{
    if (series.dates.size() != series.prices.size())
    {
        throw std::invalid_argument(
            "InMemoryDataSource: series for '" + ticker + "' has " + std::to_string(series.dates.size()) +
            " dates but " + std::to_string(series.prices.size()) + " prices");
    }
    for (size_t i = 1; i < series.dates.size(); ++i)
    {
        if (series.dates[i] <= series.dates[i - 1])
        {
            throw std::invalid_argument(
                "InMemoryDataSource: dates for '" + ticker + "' are not strictly increasing at " + series.dates[i]);
        }
    }
    series_[ticker] = series;
}

std::optional<AssetRecord> InMemoryDataSource::fetch_asset_record(const std::string& ticker) const
{
    auto it = records_.find(ticker);
    if (it == records_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

CloseSeries InMemoryDataSource::fetch_close_series(const std::string& ticker,
                                                   const DateRange& range) const
{
    CloseSeries result;
    auto it = series_.find(ticker);
    if (it == series_.end())
    {
        return result;
    }

    const CloseSeries& full = it->second;
    for (size_t i = 0; i < full.dates.size(); ++i)
    {
        if (range.contains(full.dates[i]))
        {
            result.dates.push_back(full.dates[i]);
            result.prices.push_back(full.prices[i]);
        }
    }
    return result;
}

std::vector<AssetRecord> InMemoryDataSource::asset_records() const
{
    std::vector<AssetRecord> records;
    records.reserve(records_.size());
    for (const auto& p : records_)
    {
        records.push_back(p.second);
    }
    return records;
}

// ============================================================================
// CachingDataSource
// ============================================================================

CachingDataSource::CachingDataSource(std::shared_ptr<const DataSource> source,
                                     std::chrono::seconds ttl,
                                     TimeProvider now)
    : source_(std::move(source)), ttl_(ttl), now_(std::move(now))
{
    if (!source_)
    {
        throw std::invalid_argument("CachingDataSource: wrapped source cannot be null");
    }
    if (ttl_.count() <= 0)
    {
        throw std::invalid_argument(
            "Expected positive value for parameter 'ttl', got: " + std::to_string(ttl_.count()));
    }
    if (!now_)
    {
        now_ = [] { return Clock::now(); };
    }
}

bool CachingDataSource::is_fresh(Clock::time_point cached_at) const
{
    return now_() - cached_at < ttl_;
}

void CachingDataSource::evict_expired() const
{
    for (auto it = record_cache_.begin(); it != record_cache_.end();)
    {
        it = is_fresh(it->second.cached_at) ? std::next(it) : record_cache_.erase(it);
    }
    for (auto it = series_cache_.begin(); it != series_cache_.end();)
    {
        it = is_fresh(it->second.cached_at) ? std::next(it) : series_cache_.erase(it);
    }
}

std::optional<AssetRecord> CachingDataSource::fetch_asset_record(const std::string& ticker) const
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = record_cache_.find(ticker);
        if (it != record_cache_.end())
        {
            if (is_fresh(it->second.cached_at))
            {
                ++hits_;
                return it->second.value;
            }
            record_cache_.erase(it);
        }
        ++misses_;
    }

    auto record = source_->fetch_asset_record(ticker);

    std::lock_guard<std::mutex> lock(mutex_);
    evict_expired();
    record_cache_[ticker] = CacheEntry<std::optional<AssetRecord>>{record, now_()};
    return record;
}

CloseSeries CachingDataSource::fetch_close_series(const std::string& ticker,
                                                  const DateRange& range) const
{
    // '|' never appears in tickers or ISO dates
    const std::string key = ticker + "|" + range.start + "|" + range.end;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = series_cache_.find(key);
        if (it != series_cache_.end())
        {
            if (is_fresh(it->second.cached_at))
            {
                ++hits_;
                return it->second.value;
            }
            series_cache_.erase(it);
        }
        ++misses_;
    }

    CloseSeries series = source_->fetch_close_series(ticker, range);

    std::lock_guard<std::mutex> lock(mutex_);
    evict_expired();
    series_cache_[key] = CacheEntry<CloseSeries>{series, now_()};
    return series;
}

void CachingDataSource::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    record_cache_.clear();
    series_cache_.clear();
}

size_t CachingDataSource::hits() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

size_t CachingDataSource::misses() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return misses_;
}

size_t CachingDataSource::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return record_cache_.size() + series_cache_.size();
}

} // namespace data
} // namespace esg
