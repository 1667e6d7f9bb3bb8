/**
 * @file exposure_mapper.cpp
 * @brief Implementation of ExposureMapping for asset->group mappings
 */

#include "data/exposure_mapper.hpp"

namespace esg {
namespace data {

ExposureMapping ExposureMapping::from_records(const std::vector<AssetRecord>& records,
                                              GroupDimension dimension)
{
    ExposureMapping mapping;
    for (const auto& r : records)
    {
        mapping.asset_to_group_[r.ticker] = (dimension == GroupDimension::SECTOR) ? r.sector : r.country;
    }
    return mapping;
}

bool ExposureMapping::is_ungrouped(const std::string& group)
{
    return group.empty() || group == UNKNOWN_GROUP;
}

std::map<std::string, double> ExposureMapping::exposure(const std::map<std::string, double>& weights) const
{
    std::map<std::string, double> result;
    for (const auto& w : weights)
    {
        auto it = asset_to_group_.find(w.first);
        if (it == asset_to_group_.end() || is_ungrouped(it->second))
            continue;

        result[it->second] += w.second;
    }
    return result;
}

} // namespace data
} // namespace esg
