#pragma once
#include <string>
#include <vector>
#include <utility>
#include <nlohmann/json.hpp>
#include "comparison_types.hpp"

namespace comparables_rag {

// Exact-string counts, first-seen order.
using Distribution = std::vector<std::pair<std::string, int>>;

struct SizeDistribution {
    int large = 0;
    int medium = 0;
    int small = 0;
};

struct ComparisonPatterns {
    Distribution industry_distribution;
    SizeDistribution size_distribution;
    Distribution geographic_distribution;
    Distribution business_model_distribution;
    int total_companies = 0;

    bool empty() const { return total_companies == 0; }
    std::vector<std::string> industries() const;
    nlohmann::json to_json() const;
};

class PatternAnalyzer {
public:
    // Counts over comparable_companies only; the target is not included.
    static ComparisonPatterns analyze(const ComparisonContext& context);

    // "large"/"enterprise" -> large, "medium"/"mid" -> medium, anything else -> small.
    static void bucket_size(const std::string& company_size, SizeDistribution& sizes);
};

} // namespace comparables_rag
