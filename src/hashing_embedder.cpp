#include "embedding_service.hpp"
#include <cctype>
#include <cstdint>
#include <stdexcept>

namespace pulse_rag {

namespace {

// FNV-1a keeps bucket assignment stable across builds, which matters
// because vectors outlive the process in the snapshot and the disk cache.
uint64_t fnv1a(const std::string& token) {
    uint64_t h = 14695981039346656037ULL;
    for (unsigned char c : token) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return h;
}

std::vector<std::string> tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isalnum(c)) {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else if (!current.empty()) {
            tokens.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) tokens.push_back(current);
    return tokens;
}

class HashingEmbedder : public Embedder {
public:
    explicit HashingEmbedder(size_t dimension) : dimension_(dimension) {
        if (dimension_ == 0) throw std::invalid_argument("Embedding dimension must be positive");
    }

    std::vector<float> embed(const std::string& text) override {
        std::vector<float> vec(dimension_, 0.0f);
        for (const auto& token : tokenize(text)) {
            vec[fnv1a(token) % dimension_] += 1.0f;
        }
        return vec;
    }

    size_t dimension() const override { return dimension_; }
    std::string model_name() const override { return "hashing-bow-" + std::to_string(dimension_); }

private:
    size_t dimension_;
};

} // namespace

std::unique_ptr<Embedder> create_hashing_embedder(size_t dimension) {
    return std::make_unique<HashingEmbedder>(dimension);
}

} // namespace pulse_rag
