#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "comparison_types.hpp"
#include "conversation_memory.hpp"
#include "document_indexer.hpp"
#include "embedding_service.hpp"

namespace comparables_rag {

struct ContextInfo {
    bool has_context = false;
    std::string target_company = "None";
    size_t comparable_count = 0;
    bool has_financial_data = false;
    size_t conversation_turns = 0;

    nlohmann::json to_json() const;
};

struct ContextUpdateResult {
    bool success = false;
    std::string message;
    ContextInfo context_info;
    IndexingReport indexing;

    nlohmann::json to_json() const;
};

struct ChatResult {
    std::string response;
    std::vector<ConversationTurn> conversation_history;
    ContextInfo context_info;

    nlohmann::json to_json() const;
};

// One active comparison, its derived documents and index, and the chat
// history. Every public call holds the session mutex for its whole duration,
// so a context rebuild never interleaves with a query.
class RagSession {
public:
    explicit RagSession(std::shared_ptr<EmbeddingProvider> provider);

    ContextUpdateResult set_context(const nlohmann::json& comparison_data);
    ChatResult query(const std::string& message);
    void clear_conversation();
    std::vector<ConversationTurn> conversation_history() const;
    ContextInfo context_info() const;

    // Read-only views for diagnostics and tests.
    std::vector<Document> documents() const;
    long indexed_count() const;

private:
    ContextInfo context_info_locked() const;

    mutable std::mutex mtx_;
    std::optional<ComparisonContext> context_;
    DocumentIndexer indexer_;
    ConversationMemory memory_;
};

} // namespace comparables_rag
