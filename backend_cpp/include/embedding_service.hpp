#pragma once
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <unordered_map>
#include "engine_config.hpp"

namespace comparables_rag {

std::string utf8_safe_substr(const std::string& str, size_t length);

// Text -> fixed-dimension vector. Implementations throw std::runtime_error
// when a vector cannot be produced; callers decide how to degrade.
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    virtual std::vector<float> generate_embedding(const std::string& text) = 0;
    virtual int dimension() const = 0;
    virtual std::string name() const = 0;
};

// Remote embedding model (Gemini embedContent). One request per text, no
// retries: a failed call throws and the caller degrades. Vectors already
// fetched by this instance (one model, one dimension) are memoized.
class EmbeddingService : public EmbeddingProvider {
public:
    static constexpr size_t kMemoLimit = 1000;

    EmbeddingService(std::string api_key, std::string model, int dimension,
                     std::string base_url = "https://generativelanguage.googleapis.com/v1beta/models/");

    std::vector<float> generate_embedding(const std::string& text) override;
    int dimension() const override { return dimension_; }
    std::string name() const override { return "gemini:" + model_; }

private:
    std::string api_key_;
    std::string model_;
    int dimension_;
    std::string base_url_;
    std::unordered_map<std::string, std::vector<float>> memo_;
    std::mutex memo_mtx_;

    std::string get_endpoint_url() const;
    void remember(const std::string& text, const std::vector<float>& embedding);
};

// Deterministic local embedder: lower-cased alphanumeric tokens and their
// bigrams are hashed into buckets, then the vector is L2-normalized.
class HashingEmbedder : public EmbeddingProvider {
public:
    explicit HashingEmbedder(int dimension = 384);

    std::vector<float> generate_embedding(const std::string& text) override;
    int dimension() const override { return dimension_; }
    std::string name() const override { return "hashing"; }

private:
    int dimension_;
};

// nullptr when embeddings are disabled or the provider cannot be built.
std::shared_ptr<EmbeddingProvider> create_embedding_provider(const EngineConfig& config);

} // namespace comparables_rag
