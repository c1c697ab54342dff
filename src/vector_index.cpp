#include "vector_index.hpp"
#include <faiss/IndexFlat.h>
#include <faiss/index_io.h>
#include <faiss/utils/distances.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace pulse_rag {

VectorIndex::VectorIndex(int dimension) : dimension_(dimension) {
    if (dimension <= 0) throw std::invalid_argument("Index dimension must be positive");
    index_ = std::make_unique<faiss::IndexFlatIP>(dimension);
}

VectorIndex::~VectorIndex() = default;
VectorIndex::VectorIndex(VectorIndex&&) noexcept = default;
VectorIndex& VectorIndex::operator=(VectorIndex&&) noexcept = default;

long VectorIndex::append(const std::vector<float>& vector) {
    if (vector.size() != static_cast<size_t>(dimension_)) {
        throw std::invalid_argument("Vector dimension mismatch. Expected " + std::to_string(dimension_) +
                                    ", got " + std::to_string(vector.size()));
    }

    std::vector<float> normalized = vector;
    faiss::fvec_renorm_L2(dimension_, 1, normalized.data());

    long position = index_->ntotal;
    index_->add(1, normalized.data());
    return position;
}

std::vector<IndexHit> VectorIndex::search(const std::vector<float>& query_vector, int k) const {
    const long total = index_->ntotal;
    if (total == 0 || k <= 0) return {};
    if (query_vector.size() != static_cast<size_t>(dimension_)) {
        throw std::invalid_argument("Query dimension mismatch. Expected " + std::to_string(dimension_) +
                                    ", got " + std::to_string(query_vector.size()));
    }

    std::vector<float> query_copy = query_vector;
    faiss::fvec_renorm_L2(dimension_, 1, query_copy.data());

    // Score every row ourselves rather than going through Index::search so
    // equal scores come back in insertion order.
    std::vector<float> scores(total);
    faiss::fvec_inner_products_ny(scores.data(), query_copy.data(), index_->get_xb(), dimension_, total);

    const long top = std::min<long>(k, total);
    std::vector<long> order(total);
    std::iota(order.begin(), order.end(), 0L);
    std::partial_sort(order.begin(), order.begin() + top, order.end(), [&](long a, long b) {
        if (scores[a] != scores[b]) return scores[a] > scores[b];
        return a < b;
    });

    std::vector<IndexHit> hits;
    hits.reserve(top);
    for (long i = 0; i < top; ++i) {
        float score = scores[order[i]];
        if (score <= 0.0f) break;
        hits.push_back({order[i], score});
    }
    return hits;
}

long VectorIndex::size() const {
    return index_->ntotal;
}

void VectorIndex::clear() {
    index_->reset();
}

void VectorIndex::save(const std::string& path) const {
    faiss::write_index(index_.get(), path.c_str());
}

void VectorIndex::load(const std::string& path) {
    std::unique_ptr<faiss::Index> raw(faiss::read_index(path.c_str()));

    auto* flat = dynamic_cast<faiss::IndexFlatIP*>(raw.get());
    if (!flat) {
        throw std::runtime_error("Index at " + path + " is not a flat inner-product index");
    }
    if (flat->d != dimension_) {
        throw std::runtime_error("Index at " + path + " has dimension " + std::to_string(flat->d) +
                                 ", expected " + std::to_string(dimension_));
    }

    raw.release();
    index_.reset(flat);
    spdlog::info("✅ Loaded FAISS index with {} vectors from {}", index_->ntotal, path);
}

} // namespace pulse_rag
