#pragma once

#include <vector>
#include <memory> // Required for std::unique_ptr

// Forward declare FAISS Index
namespace faiss { struct IndexFlatIP; }

namespace comparables_rag {

struct FaissSearchResult {
    float score;
    long position;
};

// Inner-product index over L2-normalized vectors. Positions are assigned in
// insertion order and stay parallel to the caller's document storage.
class FaissVectorStore {
public:
    explicit FaissVectorStore(int dimension);
    ~FaissVectorStore(); // Destructor must be defined in .cpp

    FaissVectorStore(const FaissVectorStore&) = delete;
    FaissVectorStore& operator=(const FaissVectorStore&) = delete;

    void reset();
    long add(const std::vector<float>& vector);

    // Up to min(k, count()) hits, best score first, lower position on ties.
    std::vector<FaissSearchResult> search(const std::vector<float>& query_vector, int k) const;

    long count() const;
    int dimension() const { return dimension_; }

private:
    int dimension_;
    std::unique_ptr<faiss::IndexFlatIP> index_;

    std::vector<float> normalized(const std::vector<float>& vector) const;
};

} // namespace comparables_rag
