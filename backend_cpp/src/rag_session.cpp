#include "rag_session.hpp"
#include "response_synthesizer.hpp"
#include "retrieval_engine.hpp"
#include <chrono>
#include <spdlog/spdlog.h>

namespace comparables_rag {

using json = nlohmann::json;

json ContextInfo::to_json() const {
    return json{
        {"has_context", has_context},
        {"target_company", target_company},
        {"comparable_count", comparable_count},
        {"has_financial_data", has_financial_data},
        {"conversation_turns", conversation_turns}
    };
}

json ContextUpdateResult::to_json() const {
    return json{
        {"success", success},
        {"message", message},
        {"context_info", context_info.to_json()}
    };
}

json ChatResult::to_json() const {
    json history = json::array();
    for (const auto& turn : conversation_history) history.push_back(turn.to_json());
    return json{
        {"response", response},
        {"conversation_history", history},
        {"context_info", context_info.to_json()}
    };
}

RagSession::RagSession(std::shared_ptr<EmbeddingProvider> provider)
    : indexer_(std::move(provider)) {
    spdlog::info("🧠 RAG session ready (embeddings: {}, top_k: {}, history: {})",
                 indexer_.has_provider() ? indexer_.provider()->name() : "disabled",
                 ResponseSynthesizer::kTopK, ConversationMemory::capacity());
}

ContextUpdateResult RagSession::set_context(const json& comparison_data) {
    std::lock_guard<std::mutex> lock(mtx_);

    ContextUpdateResult result;
    if (!comparison_data.is_object()) {
        spdlog::error("❌ Context update rejected: expected a JSON object, got {}", comparison_data.type_name());
        result.message = "Context update error: comparison data must be a JSON object";
        result.context_info = context_info_locked();
        return result;
    }

    auto start = std::chrono::high_resolution_clock::now();

    context_ = ComparisonContext::from_json(comparison_data);
    result.indexing = indexer_.index(*context_);

    auto end = std::chrono::high_resolution_clock::now();
    double duration = std::chrono::duration<double, std::milli>(end - start).count();
    spdlog::info("🔄 Context set: {} with {} comparables ({:.2f} ms)",
                 context_->target_company.name.empty() ? "Unknown" : context_->target_company.name,
                 context_->comparable_companies.size(), duration);

    result.success = true;
    result.message = "RAG context updated successfully";
    result.context_info = context_info_locked();
    return result;
}

ChatResult RagSession::query(const std::string& message) {
    std::lock_guard<std::mutex> lock(mtx_);

    RetrievalEngine retrieval(indexer_);
    ResponseSynthesizer synthesizer(context_ ? &*context_ : nullptr, retrieval);
    std::string response = synthesizer.respond(message);

    memory_.append(message, response);

    ChatResult result;
    result.response = std::move(response);
    result.conversation_history = memory_.history();
    result.context_info = context_info_locked();
    return result;
}

void RagSession::clear_conversation() {
    std::lock_guard<std::mutex> lock(mtx_);
    memory_.clear();
    spdlog::info("🧹 Conversation history cleared");
}

std::vector<ConversationTurn> RagSession::conversation_history() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return memory_.history();
}

ContextInfo RagSession::context_info() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return context_info_locked();
}

std::vector<Document> RagSession::documents() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return indexer_.documents();
}

long RagSession::indexed_count() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return indexer_.indexed_count();
}

ContextInfo RagSession::context_info_locked() const {
    ContextInfo info;
    info.conversation_turns = memory_.size();
    if (!context_) return info;

    info.has_context = true;
    info.target_company = context_->target_company.name.empty() ? "None" : context_->target_company.name;
    info.comparable_count = context_->comparable_companies.size();
    info.has_financial_data = context_->has_financial_data();
    return info;
}

} // namespace comparables_rag
