#pragma once
#include "document_indexer.hpp"
#include <string>
#include <vector>

namespace comparables_rag {

class RetrievalEngine {
public:
    explicit RetrievalEngine(const DocumentIndexer& indexer) : indexer_(indexer) {}

    // Embeds the query and returns the top-k documents. Any embedding or
    // search failure is logged and yields an empty result.
    std::vector<RetrievedDocument> retrieve(const std::string& query, int top_k = 3) const;

private:
    const DocumentIndexer& indexer_;
};

} // namespace comparables_rag
