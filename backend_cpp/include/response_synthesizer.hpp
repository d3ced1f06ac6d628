#pragma once
#include <string>
#include <vector>
#include "comparison_types.hpp"
#include "pattern_analyzer.hpp"
#include "retrieval_engine.hpp"

namespace comparables_rag {

enum class QueryIntent {
    Summary,
    Financial,
    Industry,
    Comparison,
    Recommendation,
    General
};

std::string to_string(QueryIntent intent);

// Answers a query about the active comparison. With retrieved documents the
// answer is built around them; otherwise the query is routed by keywords.
class ResponseSynthesizer {
public:
    static const std::string kNoContextMessage;
    // Retrieved snippets per answer.
    static constexpr int kTopK = 3;

    // `context` may be null (no comparison loaded yet).
    ResponseSynthesizer(const ComparisonContext* context, const RetrievalEngine& retrieval);

    // Never throws, never returns an empty string.
    std::string respond(const std::string& query) const;

    // First matching row of the routing table, General when nothing matches.
    static QueryIntent classify(const std::string& query);

    std::string context_summary() const;
    std::string enhanced_response(const std::string& query,
                                  const std::vector<RetrievedDocument>& docs,
                                  const std::string& summary,
                                  const ComparisonPatterns& patterns) const;
    std::string fallback_response(const std::string& query) const;

private:
    using Handler = std::string (ResponseSynthesizer::*)(const std::string&) const;

    struct IntentRoute {
        QueryIntent intent;
        std::vector<std::string> keywords;
        Handler handler;
    };

    static const std::vector<IntentRoute>& routes();

    std::string handle_summary(const std::string& query) const;
    std::string handle_financial(const std::string& query) const;
    std::string handle_industry(const std::string& query) const;
    std::string handle_comparison(const std::string& query) const;
    std::string handle_recommendation(const std::string& query) const;
    std::string handle_general(const std::string& query) const;

    const ComparisonContext* context_;
    const RetrievalEngine& retrieval_;
    ComparisonPatterns patterns_;
};

} // namespace comparables_rag
