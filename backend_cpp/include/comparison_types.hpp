#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <nlohmann/json.hpp>

namespace comparables_rag {

struct TargetCompany {
    std::string name;
    std::string description;
    std::optional<std::string> industry;
    std::optional<std::string> business_model;
    std::optional<std::string> company_size;
    std::optional<std::string> geographic_presence;

    bool empty() const {
        return name.empty() && description.empty() && !industry && !business_model &&
               !company_size && !geographic_presence;
    }

    nlohmann::json to_json() const;
    static TargetCompany from_json(const nlohmann::json& j);
};

struct CompanyRecord {
    std::optional<std::string> name;
    std::optional<std::string> ticker;
    std::string rationale;
    std::optional<std::string> industry;
    std::optional<std::string> business_model;
    std::optional<std::string> company_size;
    std::optional<std::string> geographic_presence;
    // Raw provider values; may hold numbers, numeric strings or "N/A".
    std::map<std::string, nlohmann::json> financial_metrics;

    std::string display_name() const { return name.value_or("Unknown"); }
    std::string display_ticker() const { return ticker.value_or("N/A"); }
    bool has_financial_metrics() const { return !financial_metrics.empty(); }

    nlohmann::json to_json() const;
    static CompanyRecord from_json(const nlohmann::json& j);
};

struct ComparisonContext {
    TargetCompany target_company;
    std::vector<CompanyRecord> comparable_companies;
    nlohmann::json financial_data = nlohmann::json::object();
    std::optional<std::string> analysis_timestamp;
    std::map<std::string, std::vector<std::string>> filters_applied;

    bool has_financial_data() const;

    // Lenient: wrong-typed fields are treated as absent, never throws on a JSON object.
    static ComparisonContext from_json(const nlohmann::json& j);
};

enum class DocumentKind {
    TargetCompany,
    ComparableCompany,
    FinancialMetrics,
    BusinessProfile
};

std::string to_string(DocumentKind kind);
// "financial_metrics" -> "Financial Metrics"
std::string kind_title(DocumentKind kind);

struct DocumentMetadata {
    DocumentKind kind;
    std::string company_ref;
};

struct Document {
    std::string text;
    DocumentMetadata metadata;
};

struct RetrievedDocument {
    Document document;
    float score;
    long position;
};

struct ConversationTurn {
    std::string timestamp;
    std::string user;
    std::string assistant;

    nlohmann::json to_json() const;
};

} // namespace comparables_rag
