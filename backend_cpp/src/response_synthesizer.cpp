#include "response_synthesizer.hpp"
#include "financial_insights.hpp"
#include "embedding_service.hpp"
#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

namespace comparables_rag {

const std::string ResponseSynthesizer::kNoContextMessage =
    "I don't have any company comparison data to work with. Please run a comparison first.";

namespace {

const char* kFollowUpMenu =
    "\n**You can ask me about:**\n"
    "- Specific companies and their metrics\n"
    "- Financial comparisons between companies\n"
    "- Industry trends and patterns\n"
    "- Investment insights and recommendations\n";

const char* kGeneralMenu =
    "\n\nYou can ask me about:\n"
    "- Summary and overview of the comparison\n"
    "- Financial metrics and ratios\n"
    "- Industry and business model analysis\n"
    "- Company comparisons and differences\n"
    "- Recommendations and suggestions\n";

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

std::string size_line(const SizeDistribution& sizes) {
    return "- Company sizes: " + std::to_string(sizes.large) + " large, " +
           std::to_string(sizes.medium) + " medium, " +
           std::to_string(sizes.small) + " small\n";
}

std::string top_insight(const CompanyRecord& company) {
    auto insights = extract_financial_insights(company);
    return insights.empty() ? std::string() : insights.front();
}

} // namespace

std::string to_string(QueryIntent intent) {
    switch (intent) {
        case QueryIntent::Summary: return "summary";
        case QueryIntent::Financial: return "financial";
        case QueryIntent::Industry: return "industry";
        case QueryIntent::Comparison: return "comparison";
        case QueryIntent::Recommendation: return "recommendation";
        case QueryIntent::General: return "general";
    }
    return "general";
}

ResponseSynthesizer::ResponseSynthesizer(const ComparisonContext* context, const RetrievalEngine& retrieval)
    : context_(context), retrieval_(retrieval) {
    if (context_) patterns_ = PatternAnalyzer::analyze(*context_);
}

const std::vector<ResponseSynthesizer::IntentRoute>& ResponseSynthesizer::routes() {
    // Evaluated top to bottom; the first row with a matching keyword wins.
    static const std::vector<IntentRoute> table = {
        {QueryIntent::Summary, {"summary", "overview", "what", "tell me"}, &ResponseSynthesizer::handle_summary},
        {QueryIntent::Financial, {"financial", "metrics", "ratios", "valuation"}, &ResponseSynthesizer::handle_financial},
        {QueryIntent::Industry, {"industry", "sector", "business"}, &ResponseSynthesizer::handle_industry},
        {QueryIntent::Comparison, {"compare", "difference", "similar"}, &ResponseSynthesizer::handle_comparison},
        {QueryIntent::Recommendation, {"recommend", "suggest", "best"}, &ResponseSynthesizer::handle_recommendation},
    };
    return table;
}

QueryIntent ResponseSynthesizer::classify(const std::string& query) {
    const std::string lowered = to_lower(query);
    for (const auto& route : routes()) {
        for (const auto& keyword : route.keywords) {
            if (lowered.find(keyword) != std::string::npos) return route.intent;
        }
    }
    return QueryIntent::General;
}

std::string ResponseSynthesizer::respond(const std::string& query) const {
    if (!context_) return kNoContextMessage;

    try {
        auto docs = retrieval_.retrieve(query, kTopK);
        if (!docs.empty()) {
            spdlog::debug("Answering from {} retrieved documents", docs.size());
            return enhanced_response(query, docs, context_summary(), patterns_);
        }
        return fallback_response(query);
    } catch (const std::exception& e) {
        spdlog::error("❌ Response synthesis failed: {}", e.what());
        return "I ran into a problem while analyzing the comparison data. Please try rephrasing your question.";
    }
}

std::string ResponseSynthesizer::fallback_response(const std::string& query) const {
    if (!context_) return kNoContextMessage;

    auto intent = classify(query);
    spdlog::debug("Routing query to {} handler", to_string(intent));
    for (const auto& route : routes()) {
        if (route.intent == intent) return (this->*route.handler)(query);
    }
    return handle_general(query);
}

std::string ResponseSynthesizer::context_summary() const {
    if (!context_) return "No comparison data available.";

    const auto& target = context_->target_company;
    const auto& companies = context_->comparable_companies;

    std::string summary = "Current analysis: " + (target.name.empty() ? std::string("Unknown company") : target.name) + "\n";
    summary += "Found " + std::to_string(companies.size()) + " comparable companies\n\n";

    if (!target.description.empty()) {
        summary += "Target company description: " + utf8_safe_substr(target.description, 200) + "...\n\n";
    }

    size_t shown = std::min<size_t>(companies.size(), 3);
    for (size_t i = 0; i < shown; ++i) {
        const auto& company = companies[i];
        auto insight = top_insight(company);
        summary += company.display_name() + " (" + company.display_ticker() + "): ";
        summary += insight.empty() ? std::string("Financial data available") : insight;
        summary += "\n";
    }
    return summary;
}

std::string ResponseSynthesizer::enhanced_response(const std::string& query,
                                                   const std::vector<RetrievedDocument>& docs,
                                                   const std::string& summary,
                                                   const ComparisonPatterns& patterns) const {
    std::string response = "Based on your query: '" + query + "'\n\n";

    response += "**Relevant Information Found:**\n";
    for (size_t i = 0; i < docs.size(); ++i) {
        const auto& doc = docs[i].document;
        const std::string company = doc.metadata.company_ref.empty() ? "Unknown" : doc.metadata.company_ref;
        response += std::to_string(i + 1) + ". " + kind_title(doc.metadata.kind) + " for " + company + ":\n";
        response += "   " + utf8_safe_substr(doc.text, 200) + "...\n\n";
    }

    response += "**Context Summary:**\n";
    response += summary + "\n\n";

    if (!patterns.empty()) {
        response += "**Key Patterns:**\n";
        if (!patterns.industry_distribution.empty()) {
            response += "- Industry focus: " + join(patterns.industries(), ", ") + "\n";
        }
        response += size_line(patterns.size_distribution);
    }

    response += kFollowUpMenu;
    return response;
}

std::string ResponseSynthesizer::handle_summary(const std::string&) const {
    std::string response = context_summary() + "\n\n";

    if (!patterns_.empty()) {
        response += "Key patterns:\n";
        if (!patterns_.industry_distribution.empty()) {
            response += "- Industry focus: " + join(patterns_.industries(), ", ") + "\n";
        }
        response += size_line(patterns_.size_distribution);
        if (!patterns_.geographic_distribution.empty()) {
            std::vector<std::string> regions;
            for (const auto& entry : patterns_.geographic_distribution) regions.push_back(entry.first);
            response += "- Geographic presence: " + join(regions, ", ") + "\n";
        }
    }
    return response;
}

std::string ResponseSynthesizer::handle_financial(const std::string&) const {
    const auto& companies = context_->comparable_companies;
    if (companies.empty()) {
        return "No comparable companies available for financial analysis.";
    }

    std::string response = "Financial analysis of comparable companies:\n\n";
    size_t shown = std::min<size_t>(companies.size(), 5);
    for (size_t i = 0; i < shown; ++i) {
        const auto& company = companies[i];
        response += "**" + company.display_name() + " (" + company.display_ticker() + ")**\n";
        if (company.has_financial_metrics()) {
            auto insight = top_insight(company);
            response += insight.empty() ? std::string("- Financial data available\n") : "- " + insight + "\n";
        } else {
            response += "- No financial data available\n";
        }
        response += "\n";
    }
    return response;
}

std::string ResponseSynthesizer::handle_industry(const std::string&) const {
    if (patterns_.industry_distribution.empty()) {
        return "No industry data available for analysis.";
    }

    std::string response = "Industry and business model analysis:\n\n";
    response += "**Industry Distribution:**\n";
    for (const auto& [industry, count] : patterns_.industry_distribution) {
        response += "- " + industry + ": " + std::to_string(count) + " companies\n";
    }

    response += "\n**Business Characteristics:**\n";
    for (const auto& [model, count] : patterns_.business_model_distribution) {
        response += "- " + model + ": " + std::to_string(count) + " companies\n";
    }
    return response;
}

std::string ResponseSynthesizer::handle_comparison(const std::string&) const {
    const auto& companies = context_->comparable_companies;
    if (companies.size() < 2) {
        return "Need at least 2 companies for comparison analysis.";
    }

    std::string response = "Company comparison analysis:\n\n";
    size_t shown = std::min<size_t>(companies.size(), 3);
    for (size_t i = 0; i < shown; ++i) {
        const auto& company = companies[i];
        response += "**" + company.display_name() + " (" + company.display_ticker() + ")**\n";
        response += "Rationale: " + utf8_safe_substr(company.rationale, 150) + "...\n";
        auto insight = top_insight(company);
        if (!insight.empty()) {
            response += "Key insight: " + insight + "\n";
        }
        response += "\n";
    }
    return response;
}

std::string ResponseSynthesizer::handle_recommendation(const std::string&) const {
    const auto& companies = context_->comparable_companies;
    if (companies.empty()) {
        return "No companies available for recommendations.";
    }

    std::string response = "Based on the current comparison data:\n\n";

    std::vector<const CompanyRecord*> with_financials;
    for (const auto& company : companies) {
        if (company.has_financial_metrics()) with_financials.push_back(&company);
    }

    if (!with_financials.empty()) {
        response += "**Companies with comprehensive financial data:**\n";
        size_t shown = std::min<size_t>(with_financials.size(), 3);
        for (size_t i = 0; i < shown; ++i) {
            response += "- " + with_financials[i]->display_name() + " (" + with_financials[i]->display_ticker() + ")\n";
        }
        response += "\n**Recommendations:**\n";
        response += "1. Focus on companies with complete financial metrics for detailed analysis\n";
        response += "2. Consider industry alignment with your target company\n";
        response += "3. Evaluate geographic presence for market expansion insights\n";
    } else {
        response += "**Recommendations:**\n";
        response += "1. Run comparison with financial data enabled for deeper insights\n";
        response += "2. Use filters to narrow down to specific industries or company sizes\n";
        response += "3. Consider refining your search criteria for better matches\n";
    }
    return response;
}

std::string ResponseSynthesizer::handle_general(const std::string& query) const {
    std::string response = "I understand you're asking about: " + query + "\n\n";
    response += "Here's what I can tell you about the current comparison:\n\n";
    response += context_summary();
    response += kGeneralMenu;
    return response;
}

} // namespace comparables_rag
