#include "document_indexer.hpp"
#include <chrono>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace comparables_rag {

namespace {

std::string metric_text(const CompanyRecord& company, const char* key) {
    auto it = company.financial_metrics.find(key);
    if (it == company.financial_metrics.end() || it->second.is_null()) return "N/A";
    if (it->second.is_string()) return it->second.get<std::string>();
    return it->second.dump();
}

} // namespace

DocumentIndexer::DocumentIndexer(std::shared_ptr<EmbeddingProvider> provider)
    : provider_(std::move(provider)) {
    if (provider_) {
        store_ = std::make_unique<FaissVectorStore>(provider_->dimension());
    }
}

std::vector<Document> DocumentIndexer::build_documents(const ComparisonContext& context) {
    std::vector<Document> docs;
    const auto& target = context.target_company;
    const std::string target_name = target.name.empty() ? "Unknown" : target.name;

    if (!target.empty()) {
        docs.push_back({"Target company: " + target_name + " - " + target.description,
                        {DocumentKind::TargetCompany, target_name}});
    }

    for (const auto& company : context.comparable_companies) {
        const std::string name = company.display_name();

        docs.push_back({"Company: " + name + " (" + company.display_ticker() + ") - " + company.rationale,
                        {DocumentKind::ComparableCompany, name}});

        if (company.has_financial_metrics()) {
            std::string text = "Financial metrics for " + name + ": ";
            text += "Market cap: " + metric_text(company, "market_cap") + ", ";
            text += "P/E ratio: " + metric_text(company, "pe_ratio") + ", ";
            text += "ROE: " + metric_text(company, "roe") + ", ";
            text += "Net margin: " + metric_text(company, "net_margin");
            docs.push_back({text, {DocumentKind::FinancialMetrics, name}});
        }

        std::vector<std::string> fields;
        if (company.industry) fields.push_back("Industry: " + *company.industry);
        if (company.business_model) fields.push_back("Business model: " + *company.business_model);
        if (company.company_size) fields.push_back("Size: " + *company.company_size);
        if (company.geographic_presence) fields.push_back("Geography: " + *company.geographic_presence);
        if (!fields.empty()) {
            std::string text = "Business profile for " + name + ": ";
            for (size_t i = 0; i < fields.size(); ++i) {
                if (i > 0) text += ", ";
                text += fields[i];
            }
            docs.push_back({text, {DocumentKind::BusinessProfile, name}});
        }
    }
    return docs;
}

void DocumentIndexer::reset() {
    documents_.clear();
    if (store_) store_->reset();
}

IndexingReport DocumentIndexer::index(const ComparisonContext& context) {
    reset();

    IndexingReport report;
    auto docs = build_documents(context);
    report.documents_built = docs.size();

    if (!provider_) {
        spdlog::warn("⚠️ No embedding provider; skipping indexing of {} documents", docs.size());
        report.documents_skipped = docs.size();
        return report;
    }

    auto start = std::chrono::high_resolution_clock::now();

    for (auto& doc : docs) {
        try {
            auto embedding = provider_->generate_embedding(doc.text);
            store_->add(embedding);
            documents_.push_back(std::move(doc));
            report.documents_indexed++;
        } catch (const std::exception& e) {
            report.documents_skipped++;
            spdlog::warn("⚠️ Skipping {} document for {}: {}",
                         to_string(doc.metadata.kind), doc.metadata.company_ref, e.what());
        }
    }

    auto end = std::chrono::high_resolution_clock::now();
    double duration = std::chrono::duration<double, std::milli>(end - start).count();
    spdlog::info("✅ Indexed {} of {} documents in {:.2f} ms ({} skipped)",
                 report.documents_indexed, report.documents_built, duration, report.documents_skipped);
    return report;
}

std::vector<RetrievedDocument> DocumentIndexer::search(const std::vector<float>& query_vector, int k) const {
    if (!store_) return {};

    std::vector<RetrievedDocument> results;
    for (const auto& hit : store_->search(query_vector, k)) {
        if (hit.position < 0 || hit.position >= static_cast<long>(documents_.size())) continue;
        results.push_back({documents_[hit.position], hit.score, hit.position});
    }
    return results;
}

long DocumentIndexer::indexed_count() const {
    return store_ ? store_->count() : 0;
}

} // namespace comparables_rag
