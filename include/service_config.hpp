#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "embedding_service.hpp"
#include "retrieval_service.hpp"

namespace pulse_rag {

struct ServiceConfig {
    std::string host = "127.0.0.1";
    int port = 5000;
    int worker_threads = 8;

    std::string storage_dir = "rag/indexes";
    std::string cache_dir = "rag/cache";
    size_t cache_capacity = 10000;
    size_t cache_shards = 16;

    std::string embedding_backend = "hashing"; // hashing, ollama
    std::string embedding_model = "nomic-embed-text";
    std::string embedding_endpoint = "http://127.0.0.1:11434/api/embeddings";
    int embedding_timeout_ms = 30000;
    int embedding_max_retries = 4;
    int embedding_retry_delay_ms = 2000;
    size_t dimension = 384;

    int default_k = 3;
    std::string log_level = "info";

    // Missing file gives the defaults. A malformed file throws.
    static ServiceConfig load(const std::filesystem::path& path);
    static ServiceConfig from_json(const nlohmann::json& j);

    // PORT, PULSE_RAG_STORAGE_DIR, PULSE_RAG_LOG_LEVEL. Re-validates afterwards.
    void apply_env_overrides();

    // Throws std::runtime_error on an out-of-range port, zero dimension,
    // default_k below 1 or a log level spdlog doesn't know.
    void validate() const;

    RetrievalOptions retrieval_options() const;
};

// Throws std::invalid_argument on an unknown backend.
std::unique_ptr<Embedder> create_embedder(const ServiceConfig& config);

} // namespace pulse_rag
