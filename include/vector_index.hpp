#pragma once

#include <memory>
#include <string>
#include <vector>

// Forward declare FAISS Index
namespace faiss { struct IndexFlatIP; }

namespace pulse_rag {

struct IndexHit {
    long position;
    float score;
};

/**
 * Append-only flat inner-product index. Row i holds the vector appended
 * i-th; positions are never reused.
 *
 * Not internally synchronized. RetrievalService guards it.
 */
class VectorIndex {
public:
    explicit VectorIndex(int dimension);
    ~VectorIndex(); // Destructor must be defined in .cpp

    VectorIndex(VectorIndex&&) noexcept;
    VectorIndex& operator=(VectorIndex&&) noexcept;

    // L2-normalizes a copy of `vector` and stores it. Returns its position.
    long append(const std::vector<float>& vector);

    /**
     * Exact top-k by cosine similarity.
     * @return at most min(k, size()) hits, score descending, equal scores
     *         ordered by position; hits with score <= 0 are dropped.
     */
    std::vector<IndexHit> search(const std::vector<float>& query_vector, int k) const;

    long size() const;
    int dimension() const { return dimension_; }
    void clear();

    void save(const std::string& path) const;
    // Replaces the contents only if the file is readable and has our dimension.
    void load(const std::string& path);

private:
    int dimension_;
    std::unique_ptr<faiss::IndexFlatIP> index_;
};

} // namespace pulse_rag
