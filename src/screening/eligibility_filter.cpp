/**
 * @file eligibility_filter.cpp
 * @brief Implementation of the strategy-based ESG screen
 */

#include "screening/eligibility_filter.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace esg
{
    namespace screening
    {

        bool EligibilityFilter::is_eligible(const data::AssetRecord &asset, SustainabilityStrategy strategy)
        {
            using T = FilterThresholds;

            const double env = asset.environmental_or_zero();
            const double soc = asset.social_or_zero();
            const double gov = asset.governance_or_zero();
            const double total = asset.total_or_zero();
            const double max_pillar = std::max({env, soc, gov});

            switch (strategy)
            {
            case SustainabilityStrategy::NET_ZERO:
                return env < T::NET_ZERO_MAX_ENVIRONMENTAL &&
                       total < T::NET_ZERO_MAX_TOTAL &&
                       std::max(soc, gov) < T::NET_ZERO_MAX_SOCIAL_GOVERNANCE;

            case SustainabilityStrategy::MULTI_THEMATIC_ESG:
                return total < T::MULTI_THEMATIC_MAX_TOTAL &&
                       max_pillar < T::MULTI_THEMATIC_MAX_PILLAR &&
                       (env < T::MULTI_THEMATIC_STRONG_ENVIRONMENTAL ||
                        soc < T::MULTI_THEMATIC_STRONG_SOCIAL ||
                        gov < T::MULTI_THEMATIC_STRONG_GOVERNANCE);

            case SustainabilityStrategy::SOLIDARITY:
                return soc < T::SOLIDARITY_MAX_SOCIAL &&
                       gov < T::SOLIDARITY_MAX_GOVERNANCE &&
                       total < T::SOLIDARITY_MAX_TOTAL;

            case SustainabilityStrategy::DEFAULT:
            default:
                return total < T::DEFAULT_MAX_TOTAL &&
                       max_pillar < T::DEFAULT_MAX_PILLAR;
            }
        }

        std::vector<data::AssetRecord> EligibilityFilter::filter(const std::vector<data::AssetRecord> &assets,
                                                                 SustainabilityStrategy strategy)
        {
            std::vector<data::AssetRecord> eligible;
            eligible.reserve(assets.size());
            std::copy_if(assets.begin(), assets.end(), std::back_inserter(eligible),
                         [strategy](const data::AssetRecord &asset)
                         { return is_eligible(asset, strategy); });
            return eligible;
        }

        std::string EligibilityFilter::normalize_name(const std::string &name)
        {
            std::string normalized;
            normalized.reserve(name.size());

            for (size_t i = 0; i < name.size(); ++i)
            {
                unsigned char c = static_cast<unsigned char>(name[i]);

                // UTF-8 e-acute / E-acute (0xC3 0xA9 / 0xC3 0x89)
                if (c == 0xC3 && i + 1 < name.size())
                {
                    unsigned char next = static_cast<unsigned char>(name[i + 1]);
                    if (next == 0xA9 || next == 0x89)
                    {
                        normalized += 'e';
                        ++i;
                        continue;
                    }
                }

                if (c == ' ' || c == '-' || c == '_')
                {
                    continue;
                }
                normalized += static_cast<char>(std::tolower(c));
            }
            return normalized;
        }

        SustainabilityStrategy EligibilityFilter::parse_strategy(const std::string &name)
        {
            const std::string normalized = normalize_name(name);

            if (normalized == "netzero")
            {
                return SustainabilityStrategy::NET_ZERO;
            }
            else if (normalized == "multithematicesg" || normalized == "multithematic" ||
                     normalized == "multithematiqueesg")
            {
                return SustainabilityStrategy::MULTI_THEMATIC_ESG;
            }
            else if (normalized == "solidarity" || normalized == "solidaire")
            {
                return SustainabilityStrategy::SOLIDARITY;
            }
            return SustainabilityStrategy::DEFAULT;
        }

        std::string EligibilityFilter::to_string(SustainabilityStrategy strategy)
        {
            switch (strategy)
            {
            case SustainabilityStrategy::NET_ZERO:
                return "NetZero";
            case SustainabilityStrategy::MULTI_THEMATIC_ESG:
                return "MultiThematicESG";
            case SustainabilityStrategy::SOLIDARITY:
                return "Solidarity";
            case SustainabilityStrategy::DEFAULT:
            default:
                return "Default";
            }
        }

    } // namespace screening
} // namespace esg
