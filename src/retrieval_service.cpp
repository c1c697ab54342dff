#include "retrieval_service.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <ctime>
#include <mutex>

namespace pulse_rag {

namespace {

std::string now_iso8601() {
    std::time_t now = std::time(nullptr);
    std::tm utc{};
    gmtime_r(&now, &utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buf;
}

Document make_document(const RawDocument& raw, const std::string& default_source) {
    Document doc;
    doc.content = raw.content;
    doc.module = raw.module.value_or("");
    doc.sub_module = raw.sub_module.value_or("");
    doc.issue_type = raw.issue_type.value_or("");
    doc.sub_issue_type = raw.sub_issue_type.value_or("");

    if (raw.source && !raw.source->empty()) {
        doc.source = *raw.source;
    } else if (!default_source.empty()) {
        doc.source = default_source;
    } else {
        doc.source = "Unknown";
    }
    return doc;
}

} // namespace

RetrievalService::RetrievalService(std::shared_ptr<Embedder> embedder, RetrievalOptions options)
    : embedder_(embedder),
      cache_(embedder, options.cache_capacity, options.cache_shards, options.cache_dir),
      index_(static_cast<int>(embedder->dimension())),
      snapshots_(options.storage_dir, embedder->model_name()) {}

void RetrievalService::initialize() {
    std::unique_lock lock(mutex_);
    snapshots_.load(index_, documents_);
    ready_ = true;
    spdlog::info("🚀 Retrieval service ready: {} documents, model {}, dimension {}",
                 documents_.count(), embedder_->model_name(), embedder_->dimension());
}

void RetrievalService::require_ready() const {
    if (!ready_) throw ServiceStateError("Retrieval service is not initialized");
}

long RetrievalService::append_pair(const std::vector<float>& vector, Document doc) {
    long position = index_.append(vector);
    long doc_position = documents_.append(std::move(doc));
    if (position != doc_position) {
        // Unreachable while every append goes through here under the lock.
        spdlog::critical("Index/document misalignment: vector {} vs document {}", position, doc_position);
    }
    return position;
}

bool RetrievalService::persist_locked() {
    try {
        snapshots_.save(index_, documents_);
        return true;
    } catch (const PersistenceError& e) {
        spdlog::error("❌ {}. In-memory state remains authoritative.", e.what());
        return false;
    }
}

AddResult RetrievalService::add_documents(const std::vector<RawDocument>& raw_documents,
                                          const std::string& default_source) {
    require_ready();
    spdlog::info("Adding {} documents (source: {})", raw_documents.size(),
                 default_source.empty() ? "Unknown" : default_source);

    struct Pending {
        Document doc;
        std::vector<float> vector;
    };

    AddResult result;
    std::vector<Pending> pending;
    pending.reserve(raw_documents.size());
    std::string last_error;

    for (const auto& raw : raw_documents) {
        if (is_blank(raw.content)) {
            result.skipped_count++;
            continue;
        }

        Document doc = make_document(raw, default_source);
        try {
            auto vector = cache_.get_or_compute(doc.content);
            pending.push_back({std::move(doc), std::move(vector)});
        } catch (const EmbeddingError& e) {
            result.failed_count++;
            last_error = e.what();
            spdlog::error("❌ Skipping document, embedding failed: {}", e.what());
        }
    }

    if (pending.empty()) {
        if (result.failed_count > 0) {
            throw EmbeddingError("No documents could be embedded: " + last_error);
        }
        spdlog::warn("⚠️ No valid documents to add ({} skipped)", result.skipped_count);
        std::shared_lock lock(mutex_);
        result.total_documents = documents_.count();
        return result;
    }

    std::unique_lock lock(mutex_);
    result.start_position = index_.size();
    for (auto& item : pending) {
        append_pair(item.vector, std::move(item.doc));
    }
    result.added_count = static_cast<long>(pending.size());
    result.total_documents = documents_.count();
    last_updated_ = now_iso8601();
    result.persisted = persist_locked();

    spdlog::info("✅ Added {} documents ({} skipped, {} failed). Total: {}",
                 result.added_count, result.skipped_count, result.failed_count, result.total_documents);
    return result;
}

std::vector<RetrievalResult> RetrievalService::retrieve(const std::string& query,
                                                        int k,
                                                        const MetadataFilter& filter) {
    require_ready();
    if (is_blank(query)) throw ValidationError("Query cannot be empty");
    if (k < 1) throw ValidationError("k must be a positive integer");

    {
        std::shared_lock lock(mutex_);
        if (index_.size() == 0) {
            spdlog::warn("No documents in index");
            return {};
        }
    }

    auto start = std::chrono::steady_clock::now();
    auto query_vector = cache_.get_or_compute(query);

    std::vector<RetrievalResult> results;
    {
        std::shared_lock lock(mutex_);
        auto hits = index_.search(query_vector, k);
        results.reserve(hits.size());
        for (const auto& hit : hits) {
            const Document& doc = documents_.get(hit.position);
            if (!filter.empty() && !matches_filter(doc, filter)) continue;
            results.push_back({hit.position, hit.score, static_cast<int>(results.size()) + 1, doc});
        }
    }

    double duration = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    spdlog::debug("⏱️ Retrieved {} results for k={} in {:.2f} ms", results.size(), k, duration);
    return results;
}

HealthReport RetrievalService::health_check() const noexcept {
    HealthReport report;
    try {
        report.dimension = embedder_->dimension();
        report.model = embedder_->model_name();
        if (!ready_) {
            report.status = "uninitialized";
            return report;
        }

        std::shared_lock lock(mutex_);
        report.document_count = documents_.count();
        report.index_size = index_.size();
        report.cache_entries = cache_.size();
        report.embedding_model_ready = true;
        report.consistent = report.document_count == report.index_size;
        if (report.consistent) {
            report.status = "healthy";
        } else {
            report.status = "unhealthy";
            report.error = "document count " + std::to_string(report.document_count) +
                           " does not match index size " + std::to_string(report.index_size);
        }
    } catch (const std::exception& e) {
        report.status = "unhealthy";
        report.error = e.what();
    }
    return report;
}

long RetrievalService::document_count() const {
    require_ready();
    std::shared_lock lock(mutex_);
    return documents_.count();
}

ServiceStats RetrievalService::stats() const {
    require_ready();
    ServiceStats s;
    s.embedding_model = embedder_->model_name();
    s.index_dimension = embedder_->dimension();
    s.cache_entries = cache_.size();
    s.cache_hits = cache_.hits();
    s.cache_misses = cache_.misses();

    std::shared_lock lock(mutex_);
    s.index_size = index_.size();
    s.documents_count = documents_.count();
    s.last_updated = last_updated_;
    return s;
}

void RetrievalService::reset() {
    require_ready();
    std::unique_lock lock(mutex_);
    long dropped = documents_.count();
    index_.clear();
    documents_.clear();
    last_updated_ = now_iso8601();
    snapshots_.remove();
    spdlog::info("🧹 Cleared {} documents and removed the snapshot in {}", dropped, snapshots_.dir().string());
}

} // namespace pulse_rag
