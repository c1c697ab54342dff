#include "embedding_service.hpp"
#include "errors.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <thread>

namespace pulse_rag {

using json = nlohmann::json;

namespace {

bool is_retryable(const cpr::Response& r) {
    // status 0 means the request never got an HTTP answer (refused, timeout)
    return r.status_code == 0 || r.status_code == 429 || r.status_code == 503;
}

template<typename Func>
cpr::Response perform_request_with_retry(Func request_factory, int max_retries, int retry_delay_ms) {
    cpr::Response r;
    for (int i = 0; i < max_retries; ++i) {
        r = request_factory();
        if (r.status_code == 200) return r;
        if (is_retryable(r) && i + 1 < max_retries) {
            spdlog::warn("⚠️ Embedding endpoint returned {} ({}). Retrying (Attempt {}/{})...",
                         r.status_code, r.error.message.empty() ? "busy" : r.error.message,
                         i + 1, max_retries);
            // Linear backoff: delay, 1.5x delay, 2x delay...
            std::this_thread::sleep_for(std::chrono::milliseconds(retry_delay_ms + (i * retry_delay_ms / 2)));
            continue;
        }
        break;
    }
    return r;
}

class OllamaEmbedder : public Embedder {
public:
    explicit OllamaEmbedder(OllamaOptions options) : options_(std::move(options)) {
        if (options_.max_retries < 1) options_.max_retries = 1;
    }

    std::vector<float> embed(const std::string& text) override {
        auto start = std::chrono::steady_clock::now();

        std::string payload = json{
            {"model", options_.model},
            {"prompt", text}
        }.dump(-1, ' ', false, json::error_handler_t::replace);

        auto r = perform_request_with_retry([&]() {
            return cpr::Post(cpr::Url{options_.endpoint},
                             cpr::Body{payload},
                             cpr::Header{{"Content-Type", "application/json"}},
                             cpr::Timeout{options_.timeout_ms});
        }, options_.max_retries, options_.retry_delay_ms);

        if (r.status_code != 200) {
            spdlog::error("❌ Embedding API error [{}]: {}", r.status_code,
                          r.status_code == 0 ? r.error.message : r.text);
            throw EmbeddingError("Embedding request failed with status " + std::to_string(r.status_code));
        }

        std::vector<float> embedding;
        try {
            auto body = json::parse(r.text);
            if (body.contains("embedding")) {
                embedding = body["embedding"].get<std::vector<float>>();
            } else if (body.contains("embeddings") && !body["embeddings"].empty()) {
                // newer /api/embed shape
                embedding = body["embeddings"][0].get<std::vector<float>>();
            }
        } catch (const json::exception& e) {
            throw EmbeddingError(std::string("Malformed embedding response: ") + e.what());
        }

        if (embedding.size() != options_.dimension) {
            throw EmbeddingError("Model '" + options_.model + "' returned " + std::to_string(embedding.size()) +
                                 " dimensions, expected " + std::to_string(options_.dimension));
        }

        double elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
        spdlog::debug("Embedded {} chars in {:.2f} ms", text.size(), elapsed);
        return embedding;
    }

    size_t dimension() const override { return options_.dimension; }
    std::string model_name() const override { return options_.model; }

private:
    OllamaOptions options_;
};

} // namespace

std::unique_ptr<Embedder> create_ollama_embedder(const OllamaOptions& options) {
    return std::make_unique<OllamaEmbedder>(options);
}

} // namespace pulse_rag
