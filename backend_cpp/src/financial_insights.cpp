#include "financial_insights.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <functional>
#include <optional>
#include <spdlog/spdlog.h>

namespace comparables_rag {

using json = nlohmann::json;

namespace {

std::string trim_lower(const std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    std::string out = s.substr(start, end - start);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

MetricReading malformed() { return {MetricStatus::Malformed, 0.0}; }
MetricReading not_available() { return {MetricStatus::NotAvailable, 0.0}; }
MetricReading value_of(double v) {
    if (!std::isfinite(v)) return malformed();
    return {MetricStatus::Value, v};
}

struct MetricRule {
    const char* key;
    std::function<std::optional<std::string>(double)> classify;
};

const std::vector<MetricRule>& metric_rules() {
    static const std::vector<MetricRule> rules = {
        {"market_cap", [](double v) -> std::optional<std::string> {
            if (v > 10e9) return std::string("Large-cap company (>$10B market cap)");
            if (v > 2e9) return std::string("Mid-cap company ($2B-$10B market cap)");
            return std::string("Small-cap company (<$2B market cap)");
        }},
        {"pe_ratio", [](double v) -> std::optional<std::string> {
            if (v < 15) return std::string("Low P/E ratio (<15) - potentially undervalued");
            if (v > 25) return std::string("High P/E ratio (>25) - growth expectations");
            return std::nullopt;
        }},
        {"pb_ratio", [](double v) -> std::optional<std::string> {
            if (v < 1) return std::string("Trading below book value (P/B < 1)");
            if (v > 3) return std::string("High P/B ratio (>3) - premium valuation");
            return std::nullopt;
        }},
        {"roe", [](double v) -> std::optional<std::string> {
            if (v > 15) return std::string("Strong ROE (>15%) - efficient use of equity");
            if (v < 5) return std::string("Low ROE (<5%) - efficiency concerns");
            return std::nullopt;
        }},
        {"net_margin", [](double v) -> std::optional<std::string> {
            if (v > 20) return std::string("High net margin (>20%) - strong profitability");
            if (v < 5) return std::string("Low net margin (<5%) - thin margins");
            return std::nullopt;
        }},
    };
    return rules;
}

} // namespace

MetricReading parse_metric(const json& raw) {
    if (raw.is_null()) return not_available();
    if (raw.is_number()) return value_of(raw.get<double>());
    if (!raw.is_string()) return malformed();

    std::string text = trim_lower(raw.get<std::string>());
    if (text.empty() || text == "n/a" || text == "not available") return not_available();

    const char* begin = text.c_str();
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || errno == ERANGE) return malformed();
    return value_of(v);
}

MetricReading read_metric(const CompanyRecord& company, const std::string& key) {
    auto it = company.financial_metrics.find(key);
    if (it == company.financial_metrics.end()) return not_available();
    return parse_metric(it->second);
}

std::vector<std::string> extract_financial_insights(const CompanyRecord& company) {
    std::vector<std::string> insights;
    if (!company.has_financial_metrics()) return insights;

    for (const auto& rule : metric_rules()) {
        auto reading = read_metric(company, rule.key);
        if (reading.status == MetricStatus::Malformed) {
            spdlog::debug("Ignoring malformed {} for {}", rule.key, company.display_name());
        }
        if (!reading.has_value()) continue;
        if (auto label = rule.classify(reading.value)) {
            insights.push_back(*label);
        }
    }
    return insights;
}

} // namespace comparables_rag
