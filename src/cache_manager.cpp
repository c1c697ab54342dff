#include "cache_manager.hpp"
#include "content_hash.hpp"
#include "errors.hpp"
#include <faiss/utils/distances.h>
#include <spdlog/spdlog.h>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <functional>
#include <stdexcept>
#include <thread>

namespace fs = std::filesystem;

namespace pulse_rag {

namespace {

// One subdirectory per model: readable prefix plus a digest so that names
// differing only in punctuation don't share vectors.
std::string model_dir_name(const std::string& model) {
    std::string readable;
    for (unsigned char c : model) {
        readable.push_back(std::isalnum(c) || c == '-' || c == '.' ? static_cast<char>(c) : '_');
    }
    if (readable.size() > 48) readable.resize(48);
    return readable + "-" + sha256_hex(model).substr(0, 12);
}

} // namespace

EmbeddingCache::EmbeddingCache(std::shared_ptr<Embedder> embedder,
                               size_t capacity,
                               size_t shard_count,
                               fs::path disk_dir)
    : embedder_(std::move(embedder)), disk_dir_(std::move(disk_dir)) {
    if (!embedder_) throw std::invalid_argument("EmbeddingCache requires an embedder");
    if (shard_count == 0) shard_count = 1;

    // Round up so the shards together hold at least `capacity` entries.
    size_t per_shard = capacity == 0 ? 0 : (capacity + shard_count - 1) / shard_count;
    shards_.reserve(shard_count);
    for (size_t i = 0; i < shard_count; ++i) {
        shards_.push_back(std::make_unique<Shard>(per_shard));
    }

    if (!disk_dir_.empty()) {
        disk_dir_ /= model_dir_name(embedder_->model_name());
        std::error_code ec;
        fs::create_directories(disk_dir_, ec);
        if (ec) {
            spdlog::warn("⚠️ Embedding cache dir {} unavailable ({}). Disk tier disabled.", disk_dir_.string(), ec.message());
            disk_dir_.clear();
        }
    }
}

EmbeddingCache::Shard& EmbeddingCache::shard_for(const std::string& key) {
    // key is hex, the leading 8 digits are uniformly distributed
    unsigned long bucket = std::stoul(key.substr(0, 8), nullptr, 16);
    return *shards_[bucket % shards_.size()];
}

std::vector<float> EmbeddingCache::get_or_compute(const std::string& text) {
    const std::string key = sha256_hex(text);
    Shard& shard = shard_for(key);

    if (auto cached = shard.get(key)) {
        hits_++;
        return *cached;
    }

    if (auto on_disk = read_disk(key)) {
        hits_++;
        shard.set(key, *on_disk);
        return *on_disk;
    }

    misses_++;
    // Two threads missing on the same text both compute; the results are
    // identical so whichever set() lands last is harmless.
    std::vector<float> vec = compute(text);
    shard.set(key, vec);
    write_disk(key, vec);
    return vec;
}

std::vector<float> EmbeddingCache::compute(const std::string& text) const {
    std::vector<float> vec;
    try {
        vec = embedder_->embed(text);
    } catch (const EmbeddingError&) {
        throw;
    } catch (const std::exception& e) {
        throw EmbeddingError(std::string("Embedder failed: ") + e.what());
    }

    if (vec.size() != embedder_->dimension()) {
        throw EmbeddingError("Embedder returned " + std::to_string(vec.size()) +
                             " dimensions, expected " + std::to_string(embedder_->dimension()));
    }
    for (float v : vec) {
        if (!std::isfinite(v)) throw EmbeddingError("Embedder returned a non-finite value");
    }

    float norm_sqr = faiss::fvec_norm_L2sqr(vec.data(), vec.size());
    if (norm_sqr <= 0.0f) {
        throw EmbeddingError("Embedder returned a zero vector");
    }
    faiss::fvec_renorm_L2(vec.size(), 1, vec.data());
    return vec;
}

std::optional<std::vector<float>> EmbeddingCache::read_disk(const std::string& key) const {
    if (disk_dir_.empty()) return std::nullopt;

    fs::path file = disk_dir_ / (key + ".vec");
    std::ifstream in(file, std::ios::binary);
    if (!in) return std::nullopt;

    uint32_t dim = 0;
    in.read(reinterpret_cast<char*>(&dim), sizeof(dim));
    if (!in || dim != embedder_->dimension()) {
        spdlog::warn("⚠️ Ignoring cached embedding {} (bad header)", file.string());
        return std::nullopt;
    }

    std::vector<float> vec(dim);
    in.read(reinterpret_cast<char*>(vec.data()), static_cast<std::streamsize>(dim * sizeof(float)));
    if (!in || in.peek() != std::ifstream::traits_type::eof()) {
        spdlog::warn("⚠️ Ignoring cached embedding {} (truncated or oversized)", file.string());
        return std::nullopt;
    }
    return vec;
}

void EmbeddingCache::write_disk(const std::string& key, const std::vector<float>& vec) const {
    if (disk_dir_.empty()) return;

    fs::path file = disk_dir_ / (key + ".vec");
    fs::path tmp = disk_dir_ / (key + ".vec.tmp." + std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id())));
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        uint32_t dim = static_cast<uint32_t>(vec.size());
        out.write(reinterpret_cast<const char*>(&dim), sizeof(dim));
        out.write(reinterpret_cast<const char*>(vec.data()), static_cast<std::streamsize>(vec.size() * sizeof(float)));
        if (!out) {
            spdlog::warn("⚠️ Failed to write cached embedding {}", tmp.string());
            std::error_code ec;
            fs::remove(tmp, ec);
            return;
        }
    }

    std::error_code ec;
    fs::rename(tmp, file, ec);
    if (ec) {
        spdlog::warn("⚠️ Failed to publish cached embedding {}: {}", file.string(), ec.message());
        fs::remove(tmp, ec);
    }
}

size_t EmbeddingCache::size() const {
    size_t total = 0;
    for (const auto& shard : shards_) total += shard->size();
    return total;
}

void EmbeddingCache::clear() {
    for (auto& shard : shards_) shard->clear();
}

} // namespace pulse_rag
