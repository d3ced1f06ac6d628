#include "embedding_service.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <stdexcept>

namespace comparables_rag {

using json = nlohmann::json;

std::string utf8_safe_substr(const std::string& str, size_t length) {
    if (str.length() <= length) return str;
    std::string sub = str.substr(0, length);
    if (sub.empty()) return sub;
    // Drop a trailing partial multi-byte sequence.
    size_t i = sub.size();
    size_t continuation = 0;
    while (i > 0 && (static_cast<unsigned char>(sub[i - 1]) & 0xC0) == 0x80) {
        --i;
        ++continuation;
    }
    if (i == 0) return "";
    unsigned char lead = static_cast<unsigned char>(sub[i - 1]);
    if (lead < 0x80) {
        sub.resize(i);
        return sub;
    }
    size_t expected = (lead >= 0xF0) ? 3 : (lead >= 0xE0) ? 2 : (lead >= 0xC0) ? 1 : 0;
    if (continuation < expected) sub.resize(i - 1);
    return sub;
}

EmbeddingService::EmbeddingService(std::string api_key, std::string model, int dimension, std::string base_url)
    : api_key_(std::move(api_key)),
      model_(std::move(model)),
      dimension_(dimension),
      base_url_(std::move(base_url)) {}

std::string EmbeddingService::get_endpoint_url() const {
    return base_url_ + model_ + ":embedContent?key=" + api_key_;
}

void EmbeddingService::remember(const std::string& text, const std::vector<float>& embedding) {
    std::lock_guard<std::mutex> lock(memo_mtx_);
    if (memo_.size() >= kMemoLimit) memo_.clear();
    memo_[text] = embedding;
}

std::vector<float> EmbeddingService::generate_embedding(const std::string& text) {
    {
        std::lock_guard<std::mutex> lock(memo_mtx_);
        auto it = memo_.find(text);
        if (it != memo_.end()) return it->second;
    }

    auto r = cpr::Post(cpr::Url{get_endpoint_url()},
                       cpr::Body(json{
                           {"model", "models/" + model_},
                           {"content", {{"parts", {{{"text", text}}}}}},
                           {"outputDimensionality", dimension_}
                       }.dump(-1, ' ', false, json::error_handler_t::replace)),
                       cpr::Header{{"Content-Type", "application/json"}});

    if (r.status_code != 200) {
        spdlog::error("❌ Embedding API error [{}]: {}", r.status_code,
                      r.error ? r.error.message : utf8_safe_substr(r.text, 300));
        throw std::runtime_error("Embedding request failed with status " + std::to_string(r.status_code));
    }

    std::vector<float> embedding;
    try {
        auto response_json = json::parse(r.text);
        embedding = response_json.at("embedding").at("values").get<std::vector<float>>();
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Malformed embedding response: ") + e.what());
    }

    if (static_cast<int>(embedding.size()) != dimension_) {
        throw std::runtime_error("Embedding model returned " + std::to_string(embedding.size()) +
                                 " values, expected " + std::to_string(dimension_));
    }
    remember(text, embedding);
    return embedding;
}

namespace {

uint64_t fnv1a(const std::string& s) {
    uint64_t h = 1469598103934665603ULL;
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return h;
}

std::vector<std::string> tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    for (unsigned char c : text) {
        if (std::isalnum(c) || c >= 0x80) {
            current += static_cast<char>(std::tolower(c));
        } else if (!current.empty()) {
            tokens.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) tokens.push_back(current);
    return tokens;
}

} // namespace

HashingEmbedder::HashingEmbedder(int dimension) : dimension_(dimension) {
    if (dimension <= 0) throw std::invalid_argument("HashingEmbedder dimension must be positive");
}

std::vector<float> HashingEmbedder::generate_embedding(const std::string& text) {
    std::vector<float> vec(dimension_, 0.0f);
    auto tokens = tokenize(text);

    auto accumulate = [&](const std::string& feature, float weight) {
        uint64_t h = fnv1a(feature);
        size_t bucket = static_cast<size_t>(h % static_cast<uint64_t>(dimension_));
        float sign = (h >> 63) ? -1.0f : 1.0f;
        vec[bucket] += sign * weight;
    };

    for (size_t i = 0; i < tokens.size(); ++i) {
        accumulate(tokens[i], 1.0f);
        if (i + 1 < tokens.size()) accumulate(tokens[i] + " " + tokens[i + 1], 0.5f);
    }

    double norm = 0.0;
    for (float v : vec) norm += static_cast<double>(v) * v;
    if (norm > 0.0) {
        float inv = static_cast<float>(1.0 / std::sqrt(norm));
        for (auto& v : vec) v *= inv;
    }
    return vec;
}

std::shared_ptr<EmbeddingProvider> create_embedding_provider(const EngineConfig& config) {
    try {
        if (config.embedding_provider == "none") {
            spdlog::warn("⚠️ Embeddings disabled by config; rule-based routing only");
            return nullptr;
        }
        if (config.embedding_provider == "hashing") {
            return std::make_shared<HashingEmbedder>(config.embedding_dimension);
        }
        if (config.embedding_provider == "gemini") {
            if (config.api_key.empty()) {
                spdlog::error("🚨 Gemini embeddings selected but no api_key configured; rule-based routing only");
                return nullptr;
            }
            return std::make_shared<EmbeddingService>(config.api_key, config.embedding_model,
                                                      config.embedding_dimension);
        }
        spdlog::error("🚨 Unknown embedding provider '{}'; rule-based routing only", config.embedding_provider);
    } catch (const std::exception& e) {
        spdlog::error("💥 Failed to build embedding provider: {}", e.what());
    }
    return nullptr;
}

} // namespace comparables_rag
