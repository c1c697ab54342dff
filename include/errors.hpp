#pragma once
#include <stdexcept>
#include <string>

namespace pulse_rag {

// Empty or missing required input. Raised before any state is touched.
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& what) : std::runtime_error(what) {}
};

// The embedder failed or handed back a vector we can't index. Retryable.
class EmbeddingError : public std::runtime_error {
public:
    explicit EmbeddingError(const std::string& what) : std::runtime_error(what) {}
};

class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string& what) : std::runtime_error(what) {}
};

// Operation called before RetrievalService::initialize().
class ServiceStateError : public std::runtime_error {
public:
    explicit ServiceStateError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace pulse_rag
