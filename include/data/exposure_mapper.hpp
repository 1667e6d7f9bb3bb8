/**
 * @file exposure_mapper.hpp
 * @brief Asset to sector/country mapping and weighted exposure tables
 *
 * Provides mapping from assets to sectors or countries, and the
 * aggregation of portfolio weights into per-group exposure.
 */

#ifndef ESG_DATA_EXPOSURE_MAPPER_HPP
#define ESG_DATA_EXPOSURE_MAPPER_HPP

#include <map>
#include <string>
#include <vector>
#include <unordered_map>
#include "data/asset_record.hpp"

namespace esg {
namespace data {

/// Record field used to group assets.
enum class GroupDimension {
    SECTOR,
    COUNTRY
};

/**
 * @class ExposureMapping
 * @brief Maps assets to sectors/countries for exposure reporting
 *
 * Purpose:
 * - Store the mapping from asset identifiers (tickers) to group names.
 * - Sum portfolio weights per group.
 *
 * Tickers are stored exactly as the records carry them, so the weight map
 * passed to exposure() must use the same keys. Assets whose group is "N/A"
 * or empty are kept in the mapping but contribute to no exposure bucket.
 *
 * Thread safety:
 * - Instances are safe for concurrent read-only access after construction.
 *
 * Usage example:
 * @code
 * auto sectors = ExposureMapping::from_records(records, GroupDimension::SECTOR);
 * auto exposure = sectors.exposure({{"AAPL", 0.6}, {"MSFT", 0.4}});
 * // exposure["Technology"] == 1.0
 * @endcode
 */
class ExposureMapping {
public:
    /**
     * @brief Default constructor
     * Creates an empty mapping.
     */
    ExposureMapping() = default;

    /**
     * @brief Factory: group asset records by sector or country
     *
     * Never throws. A ticker that appears twice keeps the group of its
     * last record.
     */
    static ExposureMapping from_records(const std::vector<AssetRecord>& records,
                                        GroupDimension dimension);

    /**
     * @brief True for "N/A" and empty group names
     */
    static bool is_ungrouped(const std::string& group);

    /**
     * @brief Sum of weights per group
     *
     * Weights are used as given; callers normalize them first. Tickers not
     * in the mapping, or mapped to an ungrouped entry, are skipped.
     *
     * @param weights Ticker -> weight
     * @return Group -> summed weight, only groups with at least one holding
     */
    std::map<std::string, double> exposure(const std::map<std::string, double>& weights) const;

    size_t size() const { return asset_to_group_.size(); }
    bool empty() const { return asset_to_group_.empty(); }

private:
    std::unordered_map<std::string, std::string> asset_to_group_; ///< Map asset -> group
};

} // namespace data
} // namespace esg

#endif // ESG_DATA_EXPOSURE_MAPPER_HPP
