#include "pattern_analyzer.hpp"
#include <algorithm>
#include <cctype>
#include <optional>

namespace comparables_rag {

using json = nlohmann::json;

namespace {

void count_into(Distribution& dist, const std::optional<std::string>& value) {
    if (!value) return;
    auto it = std::find_if(dist.begin(), dist.end(),
                           [&](const auto& entry) { return entry.first == *value; });
    if (it != dist.end()) {
        it->second++;
    } else {
        dist.emplace_back(*value, 1);
    }
}

json distribution_json(const Distribution& dist) {
    json j = json::object();
    for (const auto& [key, count] : dist) j[key] = count;
    return j;
}

} // namespace

std::vector<std::string> ComparisonPatterns::industries() const {
    std::vector<std::string> names;
    for (const auto& entry : industry_distribution) names.push_back(entry.first);
    return names;
}

json ComparisonPatterns::to_json() const {
    return json{
        {"industry_distribution", distribution_json(industry_distribution)},
        {"size_distribution", {
            {"large", size_distribution.large},
            {"medium", size_distribution.medium},
            {"small", size_distribution.small}
        }},
        {"geographic_distribution", distribution_json(geographic_distribution)},
        {"business_model_distribution", distribution_json(business_model_distribution)},
        {"total_companies", total_companies}
    };
}

void PatternAnalyzer::bucket_size(const std::string& company_size, SizeDistribution& sizes) {
    std::string size = company_size;
    std::transform(size.begin(), size.end(), size.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (size.find("large") != std::string::npos || size.find("enterprise") != std::string::npos) {
        sizes.large++;
    } else if (size.find("medium") != std::string::npos || size.find("mid") != std::string::npos) {
        sizes.medium++;
    } else {
        sizes.small++;
    }
}

ComparisonPatterns PatternAnalyzer::analyze(const ComparisonContext& context) {
    ComparisonPatterns patterns;
    const auto& companies = context.comparable_companies;
    patterns.total_companies = static_cast<int>(companies.size());

    for (const auto& company : companies) {
        count_into(patterns.industry_distribution, company.industry);
        count_into(patterns.geographic_distribution, company.geographic_presence);
        count_into(patterns.business_model_distribution, company.business_model);
        // Companies without a size stay out of every bucket.
        if (company.company_size) bucket_size(*company.company_size, patterns.size_distribution);
    }
    return patterns;
}

} // namespace comparables_rag
