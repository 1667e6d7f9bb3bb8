#pragma once

#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace esg {
namespace screening {

enum class RiskProfile {
    PRUDENT,
    BALANCED,
    DYNAMIC
};

/// Strategic allocation and risk budget of a profile.
struct ProfileTargets {
    double equities = 0.0;
    double bonds = 0.0;
    double money_market = 0.0;
    double max_volatility = 0.0;     ///< Annualized, as a fraction
    std::string default_benchmark;   ///< Benchmark ticker
    std::string description;

    nlohmann::json to_json() const;
};

class InvestorProfiles {
public:
    /// Throws std::invalid_argument for an unknown name.
    static RiskProfile parse_profile(const std::string& name);
    static std::string to_string(RiskProfile profile);

    static ProfileTargets targets(RiskProfile profile);

    /// Display name -> ticker of the supported benchmark indices.
    static const std::map<std::string, std::string>& benchmark_catalogue();

    /// Resolve a display name ("MSCI World") or pass a ticker through unchanged.
    static std::string resolve_benchmark(const std::string& name_or_ticker);

    static bool within_volatility_budget(RiskProfile profile, double annualized_volatility);
};

} // namespace screening
} // namespace esg
