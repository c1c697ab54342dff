#include <gtest/gtest.h>
#include <cstdlib>
#include <fstream>
#include "service_config.hpp"
#include "test_helpers.hpp"

using namespace pulse_rag;
using test_support::TempDir;

TEST(ServiceConfigTest, MissingFileGivesDefaults) {
    TempDir dir;
    auto cfg = ServiceConfig::load(dir / "config.json");
    EXPECT_EQ(cfg.host, "127.0.0.1");
    EXPECT_EQ(cfg.port, 5000);
    EXPECT_EQ(cfg.storage_dir, "rag/indexes");
    EXPECT_EQ(cfg.cache_capacity, 10000u);
    EXPECT_EQ(cfg.embedding_backend, "hashing");
    EXPECT_EQ(cfg.dimension, 384u);
    EXPECT_EQ(cfg.default_k, 3);
}

TEST(ServiceConfigTest, ReadsFileValues) {
    TempDir dir;
    {
        std::ofstream out(dir / "config.json");
        out << R"({"port": 6001, "storage_dir": "/srv/rag", "embedding_backend": "ollama",
                   "dimension": 768, "default_k": 5, "cache_capacity": 0})";
    }
    auto cfg = ServiceConfig::load(dir / "config.json");
    EXPECT_EQ(cfg.port, 6001);
    EXPECT_EQ(cfg.storage_dir, "/srv/rag");
    EXPECT_EQ(cfg.embedding_backend, "ollama");
    EXPECT_EQ(cfg.dimension, 768u);
    EXPECT_EQ(cfg.default_k, 5);

    auto opts = cfg.retrieval_options();
    EXPECT_EQ(opts.storage_dir.string(), "/srv/rag");
    EXPECT_EQ(opts.cache_capacity, 0u);
}

TEST(ServiceConfigTest, MalformedFileThrows) {
    TempDir dir;
    {
        std::ofstream out(dir / "config.json");
        out << "{\"port\": ";
    }
    EXPECT_THROW(ServiceConfig::load(dir / "config.json"), std::runtime_error);
}

TEST(ServiceConfigTest, RejectsOutOfRangeValues) {
    EXPECT_THROW(ServiceConfig::from_json({{"port", 70000}}), std::runtime_error);
    EXPECT_THROW(ServiceConfig::from_json({{"dimension", 0}}), std::runtime_error);
    EXPECT_THROW(ServiceConfig::from_json({{"default_k", 0}}), std::runtime_error);
}

TEST(ServiceConfigTest, RejectsUnknownLogLevel) {
    EXPECT_THROW(ServiceConfig::from_json({{"log_level", "verbose"}}), std::runtime_error);
    EXPECT_EQ(ServiceConfig::from_json({{"log_level", "debug"}}).log_level, "debug");
    EXPECT_EQ(ServiceConfig::from_json({{"log_level", "off"}}).log_level, "off");
}

TEST(ServiceConfigTest, EnvironmentValuesAreValidated) {
    ServiceConfig cfg;
    setenv("PORT", "70000", 1);
    EXPECT_THROW(cfg.apply_env_overrides(), std::runtime_error);
    setenv("PORT", "50x", 1);
    EXPECT_THROW(cfg.apply_env_overrides(), std::runtime_error);
    unsetenv("PORT");

    ServiceConfig fresh;
    setenv("PULSE_RAG_LOG_LEVEL", "loud", 1);
    EXPECT_THROW(fresh.apply_env_overrides(), std::runtime_error);
    unsetenv("PULSE_RAG_LOG_LEVEL");
}

TEST(ServiceConfigTest, EnvironmentOverridesFile) {
    setenv("PORT", "7123", 1);
    setenv("PULSE_RAG_STORAGE_DIR", "/tmp/pulse_rag_env", 1);
    ServiceConfig cfg;
    cfg.apply_env_overrides();
    unsetenv("PORT");
    unsetenv("PULSE_RAG_STORAGE_DIR");

    EXPECT_EQ(cfg.port, 7123);
    EXPECT_EQ(cfg.storage_dir, "/tmp/pulse_rag_env");
}

TEST(ServiceConfigTest, CreatesConfiguredEmbedder) {
    ServiceConfig cfg;
    cfg.dimension = 32;
    auto hashing = create_embedder(cfg);
    EXPECT_EQ(hashing->dimension(), 32u);

    cfg.embedding_backend = "ollama";
    cfg.embedding_model = "nomic-embed-text";
    auto ollama = create_embedder(cfg);
    EXPECT_EQ(ollama->model_name(), "nomic-embed-text");
    EXPECT_EQ(ollama->dimension(), 32u);

    cfg.embedding_backend = "word2vec";
    EXPECT_THROW(create_embedder(cfg), std::invalid_argument);
}
