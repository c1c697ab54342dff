#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>
#include "cache_manager.hpp"
#include "document.hpp"
#include "document_store.hpp"
#include "embedding_service.hpp"
#include "snapshot_store.hpp"
#include "vector_index.hpp"

namespace pulse_rag {

struct RetrievalOptions {
    std::filesystem::path storage_dir = "rag/indexes";
    std::filesystem::path cache_dir;   // empty disables the disk tier
    size_t cache_capacity = 10000;     // 0 = unbounded
    size_t cache_shards = 16;
};

struct AddResult {
    long added_count = 0;
    long skipped_count = 0;   // empty or whitespace-only content
    long failed_count = 0;    // embedding failed
    long start_position = -1; // position of the first added document, -1 if none
    long total_documents = 0;
    bool persisted = false;
};

struct RetrievalResult {
    long position;
    float score;
    int rank;            // 1-based over the returned list
    Document document;
};

struct HealthReport {
    std::string status = "uninitialized"; // healthy | unhealthy | uninitialized
    long document_count = 0;
    long index_size = 0;
    size_t dimension = 0;
    bool embedding_model_ready = false;
    std::string model;
    size_t cache_entries = 0;
    bool consistent = true;
    std::string error;
};

struct ServiceStats {
    long index_size = 0;
    long documents_count = 0;
    std::string embedding_model;
    size_t index_dimension = 0;
    size_t cache_entries = 0;
    uint64_t cache_hits = 0;
    uint64_t cache_misses = 0;
    std::string last_updated; // ISO-8601 UTC, empty until the first mutation
};

/**
 * Owns the embedding cache, vector index, document store and their
 * snapshot, and keeps the index and store aligned row for row.
 *
 * Writers (add_documents, reset) hold the lock exclusively while they
 * append and persist. Readers share it. Embedding happens before the lock
 * is taken so a slow model doesn't stall queries.
 */
class RetrievalService {
public:
    RetrievalService(std::shared_ptr<Embedder> embedder, RetrievalOptions options);

    // Loads the snapshot from storage_dir, or starts empty. Moves to Ready.
    void initialize();
    bool ready() const { return ready_.load(); }

    AddResult add_documents(const std::vector<RawDocument>& raw_documents,
                            const std::string& default_source = "");

    std::vector<RetrievalResult> retrieve(const std::string& query,
                                          int k,
                                          const MetadataFilter& filter = {});

    HealthReport health_check() const noexcept;
    long document_count() const;
    ServiceStats stats() const;

    // Drops every document and vector and deletes the snapshot.
    void reset();

private:
    void require_ready() const;

    // Caller must hold mutex_ exclusively. The only way either collection grows.
    long append_pair(const std::vector<float>& vector, Document doc);

    // Caller must hold mutex_ exclusively.
    bool persist_locked();

    mutable std::shared_mutex mutex_;
    std::shared_ptr<Embedder> embedder_;
    EmbeddingCache cache_;
    VectorIndex index_;
    DocumentStore documents_;
    SnapshotStore snapshots_;
    std::atomic<bool> ready_{false};
    std::string last_updated_;
};

} // namespace pulse_rag
