#pragma once
#include <memory>
#include <string>
#include <vector>

namespace pulse_rag {

/**
 * Text to vector seam. Implementations must be safe to call from several
 * request threads at once and always return `dimension()` floats.
 */
class Embedder {
public:
    virtual ~Embedder() = default;

    // Raw, un-normalized vector. Throws on failure.
    virtual std::vector<float> embed(const std::string& text) = 0;

    virtual size_t dimension() const = 0;
    virtual std::string model_name() const = 0;
};

struct OllamaOptions {
    std::string endpoint = "http://127.0.0.1:11434/api/embeddings";
    std::string model = "nomic-embed-text";
    size_t dimension = 768;
    int timeout_ms = 30000;
    int max_retries = 4;
    int retry_delay_ms = 2000;
};

// Deterministic bag-of-words feature hashing. No model, no network.
std::unique_ptr<Embedder> create_hashing_embedder(size_t dimension);

// POSTs {"model", "prompt"} to an Ollama compatible embeddings endpoint.
std::unique_ptr<Embedder> create_ollama_embedder(const OllamaOptions& options);

} // namespace pulse_rag
