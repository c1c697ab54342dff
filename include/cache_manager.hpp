#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "embedding_service.hpp"

namespace pulse_rag {

// Thread-safe LRU map. A max_size of 0 means no eviction.
template<typename Key, typename Value>
class LRUCache {
public:
    explicit LRUCache(size_t max_size) : max_size_(max_size) {}

    std::optional<Value> get(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = cache_map_.find(key);
        if (it == cache_map_.end()) {
            return std::nullopt;
        }

        // Move to front (most recently used)
        cache_list_.splice(cache_list_.begin(), cache_list_, it->second.list_it);
        return it->second.value;
    }

    void set(const Key& key, const Value& value) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = cache_map_.find(key);
        if (it != cache_map_.end()) {
            it->second.value = value;
            cache_list_.splice(cache_list_.begin(), cache_list_, it->second.list_it);
            return;
        }

        if (max_size_ > 0 && cache_map_.size() >= max_size_) {
            // Evict LRU
            auto lru_key = cache_list_.back();
            cache_list_.pop_back();
            cache_map_.erase(lru_key);
        }

        cache_list_.push_front(key);
        cache_map_[key] = {value, cache_list_.begin()};
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        cache_map_.clear();
        cache_list_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cache_map_.size();
    }

private:
    struct CacheEntry {
        Value value;
        typename std::list<Key>::iterator list_it;
    };

    size_t max_size_;
    std::list<Key> cache_list_;
    std::unordered_map<Key, CacheEntry> cache_map_;
    mutable std::mutex mutex_;
};

/**
 * Memoizes Embedder::embed by SHA-256 of the exact text.
 *
 * Vectors are validated and L2-normalized before they are stored, so a hit
 * returns exactly what a fresh embed + normalize would. Entries live in
 * independently locked LRU shards; the optional disk tier keeps one
 * `<hash>.vec` file per entry under a subdirectory named for the model, and
 * is consulted before the embedder.
 */
class EmbeddingCache {
public:
    EmbeddingCache(std::shared_ptr<Embedder> embedder,
                   size_t capacity,
                   size_t shard_count = 16,
                   std::filesystem::path disk_dir = {});

    // Throws EmbeddingError; nothing is cached when it does.
    std::vector<float> get_or_compute(const std::string& text);

    size_t size() const;
    size_t dimension() const { return embedder_->dimension(); }
    std::string model_name() const { return embedder_->model_name(); }
    uint64_t hits() const { return hits_.load(); }
    uint64_t misses() const { return misses_.load(); }

    // Per-model directory holding the `<hash>.vec` files, empty when disabled.
    const std::filesystem::path& disk_dir() const { return disk_dir_; }

    // Drops in-memory entries only.
    void clear();

private:
    using Shard = LRUCache<std::string, std::vector<float>>;

    Shard& shard_for(const std::string& key);
    std::vector<float> compute(const std::string& text) const;
    std::optional<std::vector<float>> read_disk(const std::string& key) const;
    void write_disk(const std::string& key, const std::vector<float>& vec) const;

    std::shared_ptr<Embedder> embedder_;
    std::vector<std::unique_ptr<Shard>> shards_;
    std::filesystem::path disk_dir_;
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
};

} // namespace pulse_rag
