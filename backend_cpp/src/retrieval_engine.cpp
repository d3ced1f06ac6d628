#include "retrieval_engine.hpp"
#include <chrono>
#include <spdlog/spdlog.h>

namespace comparables_rag {

std::vector<RetrievedDocument> RetrievalEngine::retrieve(const std::string& query, int top_k) const {
    const auto& provider = indexer_.provider();
    if (!provider || indexer_.indexed_count() == 0) return {};

    auto start = std::chrono::high_resolution_clock::now();

    std::vector<RetrievedDocument> results;
    try {
        auto query_embedding = provider->generate_embedding(query);
        results = indexer_.search(query_embedding, top_k);
    } catch (const std::exception& e) {
        spdlog::warn("⚠️ Retrieval degraded to rule-based routing: {}", e.what());
        return {};
    }

    auto end = std::chrono::high_resolution_clock::now();
    double duration = std::chrono::duration<double, std::milli>(end - start).count();
    spdlog::debug("⏱️ Retrieval: {} documents in {:.2f} ms", results.size(), duration);
    return results;
}

} // namespace comparables_rag
