#include "faiss_vector_store.hpp"
#include <faiss/IndexFlat.h>
#include <faiss/utils/distances.h>
#include <algorithm>
#include <stdexcept>
#include <string>
#include <spdlog/spdlog.h>

namespace comparables_rag {

FaissVectorStore::FaissVectorStore(int dimension) : dimension_(dimension) {
    if (dimension <= 0) {
        throw std::invalid_argument("Vector dimension must be positive, got " + std::to_string(dimension));
    }
    index_ = std::make_unique<faiss::IndexFlatIP>(dimension);
}

FaissVectorStore::~FaissVectorStore() {
}

void FaissVectorStore::reset() {
    index_->reset();
}

std::vector<float> FaissVectorStore::normalized(const std::vector<float>& vector) const {
    if (static_cast<int>(vector.size()) != dimension_) {
        throw std::invalid_argument("Vector dimension mismatch: expected " + std::to_string(dimension_) +
                                    ", got " + std::to_string(vector.size()));
    }
    std::vector<float> copy = vector;
    // Zero vectors are left untouched by FAISS.
    faiss::fvec_renorm_L2(dimension_, 1, copy.data());
    return copy;
}

long FaissVectorStore::add(const std::vector<float>& vector) {
    auto prepared = normalized(vector);
    long position = static_cast<long>(index_->ntotal);
    index_->add(1, prepared.data());
    return position;
}

std::vector<FaissSearchResult> FaissVectorStore::search(const std::vector<float>& query_vector, int k) const {
    if (index_->ntotal == 0 || k <= 0) return {};

    auto query_copy = normalized(query_vector);

    // Rank the whole index so ties at the cut-off resolve by position, not heap order.
    faiss::idx_t total = index_->ntotal;
    std::vector<float> scores(total);
    std::vector<faiss::idx_t> indices(total);
    index_->search(1, query_copy.data(), total, scores.data(), indices.data());

    std::vector<FaissSearchResult> results;
    results.reserve(total);
    for (faiss::idx_t i = 0; i < total; ++i) {
        if (indices[i] == -1) continue;
        results.push_back({scores[i], static_cast<long>(indices[i])});
    }

    std::sort(results.begin(), results.end(), [](const FaissSearchResult& a, const FaissSearchResult& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.position < b.position;
    });

    if (results.size() > static_cast<size_t>(k)) {
        results.resize(k);
    }
    spdlog::debug("Vector search returned {} of {} entries", results.size(), total);
    return results;
}

long FaissVectorStore::count() const {
    return static_cast<long>(index_->ntotal);
}

} // namespace comparables_rag
