#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "comparison_types.hpp"

namespace comparables_rag {

enum class MetricStatus {
    Value,
    NotAvailable,
    Malformed
};

struct MetricReading {
    MetricStatus status = MetricStatus::NotAvailable;
    double value = 0.0;

    bool has_value() const { return status == MetricStatus::Value; }
};

// Numbers and numeric strings read as values; null, "", "N/A" and
// "not available" (any case) as NotAvailable; anything else as Malformed.
MetricReading parse_metric(const nlohmann::json& raw);

// Reads `key` from the record's metrics; a missing key is NotAvailable.
MetricReading read_metric(const CompanyRecord& company, const std::string& key);

// At most one label per metric, in the order market cap, P/E, P/B, ROE, net margin.
std::vector<std::string> extract_financial_insights(const CompanyRecord& company);

} // namespace comparables_rag
