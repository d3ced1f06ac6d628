#pragma once
#include <memory>
#include <string>
#include <vector>
#include "comparison_types.hpp"
#include "embedding_service.hpp"
#include "faiss_vector_store.hpp"

namespace comparables_rag {

struct IndexingReport {
    size_t documents_built = 0;
    size_t documents_indexed = 0;
    size_t documents_skipped = 0;
};

// Owns the document storage and the vector index as one parallel pair:
// documents()[i] was embedded into vector position i.
class DocumentIndexer {
public:
    // A null provider disables embedding; index() then keeps nothing.
    explicit DocumentIndexer(std::shared_ptr<EmbeddingProvider> provider);

    static std::vector<Document> build_documents(const ComparisonContext& context);

    // Full rebuild: drops every stored document and vector first.
    IndexingReport index(const ComparisonContext& context);
    void reset();

    std::vector<RetrievedDocument> search(const std::vector<float>& query_vector, int k) const;

    const std::vector<Document>& documents() const { return documents_; }
    long indexed_count() const;
    bool has_provider() const { return provider_ != nullptr; }
    const std::shared_ptr<EmbeddingProvider>& provider() const { return provider_; }

private:
    std::shared_ptr<EmbeddingProvider> provider_;
    std::unique_ptr<FaissVectorStore> store_;
    std::vector<Document> documents_;
};

} // namespace comparables_rag
