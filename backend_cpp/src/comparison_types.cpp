#include "comparison_types.hpp"
#include <spdlog/spdlog.h>

namespace comparables_rag {

using json = nlohmann::json;

namespace {

// Missing keys, non-string values and empty strings all read as absent.
std::optional<std::string> optional_text(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    auto value = it->get<std::string>();
    if (value.empty()) return std::nullopt;
    return value;
}

std::string text_or_empty(const json& j, const char* key) {
    return optional_text(j, key).value_or("");
}

void put_optional(json& j, const char* key, const std::optional<std::string>& value) {
    if (value) j[key] = *value;
}

} // namespace

json TargetCompany::to_json() const {
    json j = {
        {"name", name},
        {"description", description}
    };
    put_optional(j, "industry", industry);
    put_optional(j, "business_model", business_model);
    put_optional(j, "company_size", company_size);
    put_optional(j, "geographic_presence", geographic_presence);
    return j;
}

TargetCompany TargetCompany::from_json(const json& j) {
    TargetCompany target;
    if (!j.is_object()) return target;
    target.name = text_or_empty(j, "name");
    target.description = text_or_empty(j, "description");
    target.industry = optional_text(j, "industry");
    target.business_model = optional_text(j, "business_model");
    target.company_size = optional_text(j, "company_size");
    target.geographic_presence = optional_text(j, "geographic_presence");
    return target;
}

json CompanyRecord::to_json() const {
    json j = {{"rationale", rationale}};
    put_optional(j, "name", name);
    put_optional(j, "ticker", ticker);
    put_optional(j, "industry", industry);
    put_optional(j, "business_model", business_model);
    put_optional(j, "company_size", company_size);
    put_optional(j, "geographic_presence", geographic_presence);
    if (!financial_metrics.empty()) j["financial_metrics"] = financial_metrics;
    return j;
}

CompanyRecord CompanyRecord::from_json(const json& j) {
    CompanyRecord record;
    record.name = optional_text(j, "name");
    record.ticker = optional_text(j, "ticker");
    record.rationale = text_or_empty(j, "rationale");
    record.industry = optional_text(j, "industry");
    record.business_model = optional_text(j, "business_model");
    record.company_size = optional_text(j, "company_size");
    record.geographic_presence = optional_text(j, "geographic_presence");

    auto metrics = j.find("financial_metrics");
    if (metrics != j.end() && metrics->is_object()) {
        for (auto it = metrics->begin(); it != metrics->end(); ++it) {
            record.financial_metrics[it.key()] = it.value();
        }
    }
    return record;
}

bool ComparisonContext::has_financial_data() const {
    if (financial_data.is_null()) return false;
    if (financial_data.is_object() || financial_data.is_array() || financial_data.is_string()) {
        return !financial_data.empty();
    }
    return true;
}

ComparisonContext ComparisonContext::from_json(const json& j) {
    ComparisonContext ctx;
    if (!j.is_object()) return ctx;

    if (j.contains("target_company")) {
        ctx.target_company = TargetCompany::from_json(j["target_company"]);
    }

    auto companies = j.find("comparable_companies");
    if (companies != j.end() && companies->is_array()) {
        for (const auto& entry : *companies) {
            if (!entry.is_object()) {
                spdlog::warn("Skipping comparable company entry of type {}", entry.type_name());
                continue;
            }
            ctx.comparable_companies.push_back(CompanyRecord::from_json(entry));
        }
    }

    if (j.contains("financial_data") && !j["financial_data"].is_null()) {
        ctx.financial_data = j["financial_data"];
    }
    ctx.analysis_timestamp = optional_text(j, "analysis_timestamp");

    auto filters = j.find("filters");
    if (filters != j.end() && filters->is_object()) {
        for (auto it = filters->begin(); it != filters->end(); ++it) {
            std::vector<std::string> values;
            if (it.value().is_string()) {
                values.push_back(it.value().get<std::string>());
            } else if (it.value().is_array()) {
                for (const auto& v : it.value()) {
                    if (v.is_string()) values.push_back(v.get<std::string>());
                    else values.push_back(v.dump());
                }
            }
            ctx.filters_applied[it.key()] = std::move(values);
        }
    }
    return ctx;
}

std::string to_string(DocumentKind kind) {
    switch (kind) {
        case DocumentKind::TargetCompany: return "target_company";
        case DocumentKind::ComparableCompany: return "comparable_company";
        case DocumentKind::FinancialMetrics: return "financial_metrics";
        case DocumentKind::BusinessProfile: return "business_profile";
    }
    return "unknown";
}

std::string kind_title(DocumentKind kind) {
    switch (kind) {
        case DocumentKind::TargetCompany: return "Target Company";
        case DocumentKind::ComparableCompany: return "Comparable Company";
        case DocumentKind::FinancialMetrics: return "Financial Metrics";
        case DocumentKind::BusinessProfile: return "Business Profile";
    }
    return "Unknown";
}

json ConversationTurn::to_json() const {
    return json{
        {"timestamp", timestamp},
        {"user", user},
        {"assistant", assistant}
    };
}

} // namespace comparables_rag
