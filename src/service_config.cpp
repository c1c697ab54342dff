#include "service_config.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace pulse_rag {

using json = nlohmann::json;

ServiceConfig ServiceConfig::load(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) return ServiceConfig{};

    std::ifstream f(path);
    if (!f) throw std::runtime_error("Cannot open config " + path.string());
    try {
        return from_json(json::parse(f));
    } catch (const json::exception& e) {
        throw std::runtime_error("Invalid config " + path.string() + ": " + e.what());
    }
}

ServiceConfig ServiceConfig::from_json(const json& j) {
    ServiceConfig cfg;
    cfg.host = j.value("host", cfg.host);
    cfg.port = j.value("port", cfg.port);
    cfg.worker_threads = j.value("worker_threads", cfg.worker_threads);
    cfg.storage_dir = j.value("storage_dir", cfg.storage_dir);
    cfg.cache_dir = j.value("cache_dir", cfg.cache_dir);
    cfg.cache_capacity = j.value("cache_capacity", cfg.cache_capacity);
    cfg.cache_shards = j.value("cache_shards", cfg.cache_shards);
    cfg.embedding_backend = j.value("embedding_backend", cfg.embedding_backend);
    cfg.embedding_model = j.value("embedding_model", cfg.embedding_model);
    cfg.embedding_endpoint = j.value("embedding_endpoint", cfg.embedding_endpoint);
    cfg.embedding_timeout_ms = j.value("embedding_timeout_ms", cfg.embedding_timeout_ms);
    cfg.embedding_max_retries = j.value("embedding_max_retries", cfg.embedding_max_retries);
    cfg.embedding_retry_delay_ms = j.value("embedding_retry_delay_ms", cfg.embedding_retry_delay_ms);
    cfg.dimension = j.value("dimension", cfg.dimension);
    cfg.default_k = j.value("default_k", cfg.default_k);
    cfg.log_level = j.value("log_level", cfg.log_level);

    cfg.validate();
    return cfg;
}

void ServiceConfig::validate() const {
    if (port <= 0 || port > 65535) throw std::runtime_error("port out of range: " + std::to_string(port));
    if (dimension == 0) throw std::runtime_error("dimension must be positive");
    if (default_k < 1) throw std::runtime_error("default_k must be positive");

    // from_str falls back to `off` for names it doesn't know
    if (spdlog::level::from_str(log_level) == spdlog::level::off && log_level != "off") {
        throw std::runtime_error("Unknown log_level '" + log_level + "'");
    }
}

void ServiceConfig::apply_env_overrides() {
    if (const char* env_port = std::getenv("PORT")) {
        try {
            size_t used = 0;
            port = std::stoi(env_port, &used);
            if (env_port[used] != '\0') throw std::invalid_argument(env_port);
        } catch (const std::logic_error&) {
            throw std::runtime_error(std::string("PORT is not a number: ") + env_port);
        }
    }
    if (const char* env_storage = std::getenv("PULSE_RAG_STORAGE_DIR")) {
        storage_dir = env_storage;
    }
    if (const char* env_level = std::getenv("PULSE_RAG_LOG_LEVEL")) {
        log_level = env_level;
    }
    validate();
}

RetrievalOptions ServiceConfig::retrieval_options() const {
    RetrievalOptions opts;
    opts.storage_dir = storage_dir;
    opts.cache_dir = cache_dir;
    opts.cache_capacity = cache_capacity;
    opts.cache_shards = cache_shards;
    return opts;
}

std::unique_ptr<Embedder> create_embedder(const ServiceConfig& config) {
    if (config.embedding_backend == "hashing") {
        return create_hashing_embedder(config.dimension);
    }
    if (config.embedding_backend == "ollama") {
        OllamaOptions opts;
        opts.endpoint = config.embedding_endpoint;
        opts.model = config.embedding_model;
        opts.dimension = config.dimension;
        opts.timeout_ms = config.embedding_timeout_ms;
        opts.max_retries = config.embedding_max_retries;
        opts.retry_delay_ms = config.embedding_retry_delay_ms;
        return create_ollama_embedder(opts);
    }
    throw std::invalid_argument("Unknown embedding_backend '" + config.embedding_backend + "'");
}

} // namespace pulse_rag
