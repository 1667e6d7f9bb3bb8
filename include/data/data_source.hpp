/**
 * @file data_source.hpp
 * @brief Data-source interface consumed by the analytics core.
 *
 * A DataSource resolves tickers to AssetRecord snapshots and closing-price
 * histories. Implementations may block (file or network I/O) and may throw;
 * the analytics layer treats a throw the same as "no data for this ticker".
 *
 * Two implementations are provided:
 * - InMemoryDataSource: records and price series held in maps, populated
 *   programmatically or by DataLoader.
 * - CachingDataSource: decorator that memoizes another source with a
 *   time-to-live per entry.
 */

#ifndef ESG_DATA_DATA_SOURCE_HPP
#define ESG_DATA_DATA_SOURCE_HPP

#include "data/asset_record.hpp"
#include "data/time_series.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace esg {
namespace data {

/**
 * @class DataSource
 * @brief Abstract provider of asset records and closing prices.
 */
class DataSource {
public:
    virtual ~DataSource() = default;

    /**
     * @brief Resolve a ticker to its static record.
     * @param ticker Asset identifier
     * @return Record, or std::nullopt if the ticker is unknown
     */
    virtual std::optional<AssetRecord> fetch_asset_record(const std::string& ticker) const = 0;

    /**
     * @brief Closing prices for a ticker inside a date window.
     * @param ticker Asset identifier
     * @param range Inclusive date window
     * @return Series ordered by date, empty if no data
     */
    virtual CloseSeries fetch_close_series(const std::string& ticker,
                                           const DateRange& range) const = 0;
};

/**
 * @class InMemoryDataSource
 * @brief DataSource backed by in-process maps.
 *
 * Thread safety: safe for concurrent reads once populated. The add_*
 * methods are not synchronized.
 */
class InMemoryDataSource : public DataSource {
public:
    InMemoryDataSource() = default;

    /**
     * @brief Register or replace an asset record.
     * @throws std::invalid_argument if the ticker is empty
     */
    void add_asset_record(const AssetRecord& record);

    /**
     * @brief Register or replace a full price history.
     * @throws std::invalid_argument if dates and prices differ in length
     *         or dates are not strictly increasing
     */
    void add_close_series(const std::string& ticker, const CloseSeries& series);

    std::optional<AssetRecord> fetch_asset_record(const std::string& ticker) const override;

    CloseSeries fetch_close_series(const std::string& ticker,
                                   const DateRange& range) const override;

    /** @brief All registered records, ordered by ticker. */
    std::vector<AssetRecord> asset_records() const;

private:
    std::map<std::string, AssetRecord> records_;
    std::map<std::string, CloseSeries> series_;
};

/**
 * @class CachingDataSource
 * @brief Memoizing decorator with per-entry expiry.
 *
 * Records are cached per ticker, price series per (ticker, range). Absent
 * results are cached too, so an unknown ticker is not re-queried until its
 * entry expires. Exceptions from the wrapped source are not cached.
 * Expired entries are erased when looked up, and every insert sweeps the
 * remaining expired entries of both caches.
 *
 * Thread safety: all methods lock an internal mutex; one instance can be
 * shared between callers. The wrapped source is called outside the lock.
 */
class CachingDataSource : public DataSource {
public:
    using Clock = std::chrono::steady_clock;
    using TimeProvider = std::function<Clock::time_point()>;

    /**
     * @brief Wrap a source.
     * @param source Underlying data source (must not be null)
     * @param ttl Entry lifetime (must be positive)
     * @param now Time provider, defaults to steady_clock::now
     * @throws std::invalid_argument on null source or non-positive ttl
     */
    CachingDataSource(std::shared_ptr<const DataSource> source,
                      std::chrono::seconds ttl,
                      TimeProvider now = {});

    std::optional<AssetRecord> fetch_asset_record(const std::string& ticker) const override;

    CloseSeries fetch_close_series(const std::string& ticker,
                                   const DateRange& range) const override;

    /** @brief Drop every cached entry. */
    void clear();

    /** @brief Number of requests answered from the cache. */
    size_t hits() const;

    /** @brief Number of requests forwarded to the wrapped source. */
    size_t misses() const;

    /** @brief Number of entries currently held, records and series together. */
    size_t size() const;

    std::chrono::seconds ttl() const { return ttl_; }

private:
    template <typename T>
    struct CacheEntry {
        T value;
        Clock::time_point cached_at;
    };

    bool is_fresh(Clock::time_point cached_at) const;

    /// Caller must hold mutex_
    void evict_expired() const;

    std::shared_ptr<const DataSource> source_;
    std::chrono::seconds ttl_;
    TimeProvider now_;

    mutable std::mutex mutex_;
    mutable std::map<std::string, CacheEntry<std::optional<AssetRecord>>> record_cache_;
    mutable std::map<std::string, CacheEntry<CloseSeries>> series_cache_;
    mutable size_t hits_ = 0;
    mutable size_t misses_ = 0;
};

} // namespace data
} // namespace esg

#endif // ESG_DATA_DATA_SOURCE_HPP
