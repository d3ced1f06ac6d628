#include <gtest/gtest.h>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <cmath>
#include <string>
#include <thread>
#include "embedding_service.hpp"

namespace comparables_rag {
namespace {

double norm(const std::vector<float>& v) {
    double sum = 0.0;
    for (float x : v) sum += static_cast<double>(x) * x;
    return std::sqrt(sum);
}

double dot(const std::vector<float>& a, const std::vector<float>& b) {
    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) sum += static_cast<double>(a[i]) * b[i];
    return sum;
}

TEST(HashingEmbedderTest, DeterministicAndNormalized) {
    HashingEmbedder embedder(64);
    auto a = embedder.generate_embedding("Cloud computing platform");
    auto b = embedder.generate_embedding("Cloud computing platform");

    ASSERT_EQ(a.size(), 64u);
    EXPECT_EQ(a, b);
    EXPECT_NEAR(norm(a), 1.0, 1e-5);
}

TEST(HashingEmbedderTest, CaseAndPunctuationInsensitive) {
    HashingEmbedder embedder(128);
    EXPECT_EQ(embedder.generate_embedding("Market Cap!"), embedder.generate_embedding("market cap"));
}

TEST(HashingEmbedderTest, EmptyTextIsZeroVector) {
    HashingEmbedder embedder(16);
    auto v = embedder.generate_embedding("  ,, ");
    ASSERT_EQ(v.size(), 16u);
    EXPECT_EQ(norm(v), 0.0);
}

TEST(HashingEmbedderTest, SharedVocabularyScoresHigher) {
    HashingEmbedder embedder(384);
    auto query = embedder.generate_embedding("grocery retail chain");
    auto close = embedder.generate_embedding("Regional grocery retail chain in the midwest");
    auto far = embedder.generate_embedding("Semiconductor fabrication equipment");
    EXPECT_GT(dot(query, close), dot(query, far));
}

TEST(HashingEmbedderTest, RejectsNonPositiveDimension) {
    EXPECT_THROW(HashingEmbedder(0), std::invalid_argument);
}

TEST(Utf8SafeSubstrTest, NeverSplitsMultiByteSequences) {
    EXPECT_EQ(utf8_safe_substr("hello", 10), "hello");
    EXPECT_EQ(utf8_safe_substr("hello", 3), "hel");
    // "né" is 3 bytes; cutting at 2 would leave half of the é.
    EXPECT_EQ(utf8_safe_substr("n\xC3\xA9", 2), "n");
    EXPECT_EQ(utf8_safe_substr("n\xC3\xA9x", 3), "n\xC3\xA9");
    // Euro sign, 3 bytes.
    EXPECT_EQ(utf8_safe_substr("a\xE2\x82\xAC", 3), "a");
}

// Local stand-in for the embedContent endpoint, counting requests.
class EmbeddingServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_.Post(".*", [this](const httplib::Request& req, httplib::Response& res) {
            hits_++;
            last_body_ = req.body;
            res.status = status_;
            res.set_content(R"({"embedding": {"values": [0.1, 0.2, 0.3, 0.4]}})", "application/json");
        });
        port_ = server_.bind_to_any_port("127.0.0.1");
        ASSERT_GT(port_, 0);
        thread_ = std::thread([this]() { server_.listen_after_bind(); });
        server_.wait_until_ready();
    }

    void TearDown() override {
        server_.stop();
        if (thread_.joinable()) thread_.join();
    }

    EmbeddingService service(int dimension = 4) {
        return EmbeddingService("test-key", "test-model", dimension,
                                "http://127.0.0.1:" + std::to_string(port_) + "/models/");
    }

    httplib::Server server_;
    std::thread thread_;
    int port_ = 0;
    std::atomic<int> status_{200};
    std::atomic<int> hits_{0};
    std::string last_body_;
};

TEST_F(EmbeddingServiceTest, ReturnsVectorAndSendsRequestedDimension) {
    auto svc = service();
    auto v = svc.generate_embedding("cloud software");
    ASSERT_EQ(v.size(), 4u);
    EXPECT_FLOAT_EQ(v[3], 0.4f);

    auto body = nlohmann::json::parse(last_body_);
    EXPECT_EQ(body["outputDimensionality"], 4);
    EXPECT_EQ(body["content"]["parts"][0]["text"], "cloud software");
}

TEST_F(EmbeddingServiceTest, OverloadedServiceFailsAfterOneRequest) {
    status_ = 503;
    auto svc = service();
    EXPECT_THROW(svc.generate_embedding("query"), std::runtime_error);
    EXPECT_EQ(hits_.load(), 1);

    status_ = 429;
    EXPECT_THROW(svc.generate_embedding("query"), std::runtime_error);
    EXPECT_EQ(hits_.load(), 2);
}

TEST_F(EmbeddingServiceTest, RepeatedTextIsMemoized) {
    auto svc = service();
    auto first = svc.generate_embedding("same text");
    auto second = svc.generate_embedding("same text");
    EXPECT_EQ(first, second);
    EXPECT_EQ(hits_.load(), 1);

    svc.generate_embedding("other text");
    EXPECT_EQ(hits_.load(), 2);
}

TEST_F(EmbeddingServiceTest, FailedRequestIsNotMemoized) {
    status_ = 500;
    auto svc = service();
    EXPECT_THROW(svc.generate_embedding("flaky"), std::runtime_error);

    status_ = 200;
    EXPECT_EQ(svc.generate_embedding("flaky").size(), 4u);
    EXPECT_EQ(hits_.load(), 2);
}

TEST_F(EmbeddingServiceTest, DimensionMismatchThrows) {
    auto svc = service(8);
    EXPECT_THROW(svc.generate_embedding("text"), std::runtime_error);
}

TEST(EmbeddingProviderFactoryTest, BuildsFromConfig) {
    EngineConfig cfg;
    cfg.embedding_provider = "hashing";
    cfg.embedding_dimension = 32;
    auto provider = create_embedding_provider(cfg);
    ASSERT_NE(provider, nullptr);
    EXPECT_EQ(provider->dimension(), 32);
    EXPECT_EQ(provider->name(), "hashing");

    cfg.embedding_provider = "none";
    EXPECT_EQ(create_embedding_provider(cfg), nullptr);

    cfg.embedding_provider = "gemini";
    cfg.api_key.clear();
    EXPECT_EQ(create_embedding_provider(cfg), nullptr);

    cfg.api_key = "test-key";
    auto remote = create_embedding_provider(cfg);
    ASSERT_NE(remote, nullptr);
    EXPECT_EQ(remote->name(), "gemini:text-embedding-004");

    cfg.embedding_provider = "word2vec";
    EXPECT_EQ(create_embedding_provider(cfg), nullptr);

    cfg.embedding_provider = "hashing";
    cfg.embedding_dimension = -1;
    EXPECT_EQ(create_embedding_provider(cfg), nullptr);
}

} // namespace
} // namespace comparables_rag
