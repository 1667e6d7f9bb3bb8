#include "screening/investor_profile.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace esg {
namespace screening {

nlohmann::json ProfileTargets::to_json() const
{
    return nlohmann::json{
        {"equities", equities},
        {"bonds", bonds},
        {"money_market", money_market},
        {"max_volatility", max_volatility},
        {"default_benchmark", default_benchmark},
        {"description", description}};
}

RiskProfile InvestorProfiles::parse_profile(const std::string& name)
{
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "prudent" || lower == "conservative") {
        return RiskProfile::PRUDENT;
    } else if (lower == "balanced" || lower == "\xc3\xa9quilibr\xc3\xa9" || lower == "equilibre") {
        return RiskProfile::BALANCED;
    } else if (lower == "dynamic" || lower == "dynamique" || lower == "aggressive") {
        return RiskProfile::DYNAMIC;
    }
    throw std::invalid_argument("Unknown risk profile: '" + name + "'. Valid options: prudent, balanced, dynamic");
}

std::string InvestorProfiles::to_string(RiskProfile profile)
{
    switch (profile) {
        case RiskProfile::PRUDENT: return "prudent";
        case RiskProfile::BALANCED: return "balanced";
        case RiskProfile::DYNAMIC: return "dynamic";
        default: return "balanced";
    }
}

ProfileTargets InvestorProfiles::targets(RiskProfile profile)
{
    ProfileTargets t;
    switch (profile) {
        case RiskProfile::PRUDENT:
            t.equities = 0.30;
            t.bonds = 0.60;
            t.money_market = 0.10;
            t.max_volatility = 0.10;
            t.default_benchmark = "^GSPC";
            t.description = "Capital preservation with limited equity exposure";
            break;
        case RiskProfile::BALANCED:
            t.equities = 0.60;
            t.bonds = 0.35;
            t.money_market = 0.05;
            t.max_volatility = 0.15;
            t.default_benchmark = "URTH";
            t.description = "Trade-off between return and risk";
            break;
        case RiskProfile::DYNAMIC:
            t.equities = 0.90;
            t.bonds = 0.10;
            t.money_market = 0.00;
            t.max_volatility = 0.25;
            t.default_benchmark = "^IXIC";
            t.description = "Maximizes expected return with high equity exposure";
            break;
    }
    return t;
}

const std::map<std::string, std::string>& InvestorProfiles::benchmark_catalogue()
{
    static const std::map<std::string, std::string> catalogue = {
        {"S&P 500", "^GSPC"},
        {"NASDAQ Composite", "^IXIC"},
        {"Dow Jones", "^DJI"},
        {"MSCI World", "URTH"},
        {"MSCI ESG Leaders", "SUSA"}};
    return catalogue;
}

std::string InvestorProfiles::resolve_benchmark(const std::string& name_or_ticker)
{
    const auto& catalogue = benchmark_catalogue();
    auto it = catalogue.find(name_or_ticker);
    return it != catalogue.end() ? it->second : name_or_ticker;
}

bool InvestorProfiles::within_volatility_budget(RiskProfile profile, double annualized_volatility)
{
    return annualized_volatility <= targets(profile).max_volatility;
}

} // namespace screening
} // namespace esg
