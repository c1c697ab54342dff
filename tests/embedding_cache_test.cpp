#include <gtest/gtest.h>
#include <atomic>
#include <cmath>
#include <cstring>
#include <fstream>
#include <thread>
#include "cache_manager.hpp"
#include "content_hash.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

using namespace pulse_rag;
using test_support::FakeEmbedder;
using test_support::TempDir;

namespace {

float norm(const std::vector<float>& v) {
    double sum = 0;
    for (float x : v) sum += double(x) * x;
    return static_cast<float>(std::sqrt(sum));
}

} // namespace

TEST(EmbeddingCacheTest, SecondLookupIsAHitAndBitIdentical) {
    auto embedder = std::make_shared<FakeEmbedder>();
    embedder->script("Camera crashes on zoom", {3, 4, 0, 0});
    EmbeddingCache cache(embedder, 100);

    auto first = cache.get_or_compute("Camera crashes on zoom");
    auto second = cache.get_or_compute("Camera crashes on zoom");

    EXPECT_EQ(embedder->calls(), 1);
    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(std::memcmp(&first[i], &second[i], sizeof(float)), 0);
    }
    EXPECT_EQ(cache.hits(), 1u);
    EXPECT_EQ(cache.misses(), 1u);
}

TEST(EmbeddingCacheTest, StoresNormalizedVectors) {
    auto embedder = std::make_shared<FakeEmbedder>();
    embedder->script("t", {3, 4, 0, 0});
    EmbeddingCache cache(embedder, 100);

    auto vec = cache.get_or_compute("t");
    EXPECT_NEAR(norm(vec), 1.0f, 1e-6);
    EXPECT_NEAR(vec[0], 0.6f, 1e-6);
    EXPECT_NEAR(vec[1], 0.8f, 1e-6);
}

TEST(EmbeddingCacheTest, KeyIsCaseAndWhitespaceSensitive) {
    auto embedder = std::make_shared<FakeEmbedder>();
    EmbeddingCache cache(embedder, 100);

    cache.get_or_compute("battery drain");
    cache.get_or_compute("Battery drain");
    cache.get_or_compute("battery drain ");
    cache.get_or_compute("battery drain");

    EXPECT_EQ(embedder->calls(), 3);
    EXPECT_EQ(cache.size(), 3u);
}

TEST(EmbeddingCacheTest, FailedEmbeddingIsNotCached) {
    auto embedder = std::make_shared<FakeEmbedder>();
    embedder->fail_on("flaky");
    EmbeddingCache cache(embedder, 100);

    EXPECT_THROW(cache.get_or_compute("flaky"), EmbeddingError);
    EXPECT_EQ(cache.size(), 0u);

    embedder->heal("flaky");
    EXPECT_NO_THROW(cache.get_or_compute("flaky"));
    EXPECT_EQ(embedder->calls(), 2);
    EXPECT_EQ(cache.size(), 1u);
}

TEST(EmbeddingCacheTest, RejectsUnusableVectors) {
    auto embedder = std::make_shared<FakeEmbedder>();
    embedder->script("zero", {0, 0, 0, 0});
    embedder->script("short", {1, 0});
    embedder->script("nan", {1, std::nanf(""), 0, 0});
    EmbeddingCache cache(embedder, 100);

    EXPECT_THROW(cache.get_or_compute("zero"), EmbeddingError);
    EXPECT_THROW(cache.get_or_compute("short"), EmbeddingError);
    EXPECT_THROW(cache.get_or_compute("nan"), EmbeddingError);
    EXPECT_EQ(cache.size(), 0u);
}

TEST(EmbeddingCacheTest, EvictsLeastRecentlyUsedEntry) {
    auto embedder = std::make_shared<FakeEmbedder>();
    EmbeddingCache cache(embedder, 2, 1);

    cache.get_or_compute("a");
    cache.get_or_compute("b");
    cache.get_or_compute("a");  // a is now most recent
    cache.get_or_compute("c");  // evicts b
    EXPECT_EQ(cache.size(), 2u);
    EXPECT_EQ(embedder->calls(), 3);

    cache.get_or_compute("a");
    EXPECT_EQ(embedder->calls(), 3);
    cache.get_or_compute("b");
    EXPECT_EQ(embedder->calls(), 4);
}

TEST(EmbeddingCacheTest, ZeroCapacityNeverEvicts) {
    auto embedder = std::make_shared<FakeEmbedder>();
    EmbeddingCache cache(embedder, 0, 4);
    for (int i = 0; i < 50; ++i) cache.get_or_compute("issue " + std::to_string(i));
    EXPECT_EQ(cache.size(), 50u);
}

TEST(EmbeddingCacheTest, DiskTierSurvivesANewInstance) {
    TempDir dir;
    auto first_embedder = std::make_shared<FakeEmbedder>();
    std::vector<float> original;
    {
        EmbeddingCache cache(first_embedder, 100, 4, dir.path());
        original = cache.get_or_compute("Display flickers at low brightness");
    }

    auto second_embedder = std::make_shared<FakeEmbedder>();
    EmbeddingCache cache(second_embedder, 100, 4, dir.path());
    EXPECT_TRUE(std::filesystem::exists(cache.disk_dir() / (sha256_hex("Display flickers at low brightness") + ".vec")));
    auto restored = cache.get_or_compute("Display flickers at low brightness");

    EXPECT_EQ(second_embedder->calls(), 0);
    EXPECT_EQ(restored, original);
}

TEST(EmbeddingCacheTest, DiskTierIsNotSharedAcrossModels) {
    TempDir dir;
    auto model_a = std::make_shared<FakeEmbedder>(4, "model-a");
    model_a->script("x", {1, 0, 0, 0});
    auto model_b = std::make_shared<FakeEmbedder>(4, "model-b");
    model_b->script("x", {0, 1, 0, 0});

    EmbeddingCache cache_a(model_a, 100, 4, dir.path());
    auto from_a = cache_a.get_or_compute("x");

    EmbeddingCache cache_b(model_b, 100, 4, dir.path());
    auto from_b = cache_b.get_or_compute("x");

    EXPECT_EQ(model_b->calls(), 1);
    EXPECT_NE(cache_a.disk_dir().string(), cache_b.disk_dir().string());
    EXPECT_FLOAT_EQ(from_a[0], 1.0f);
    EXPECT_FLOAT_EQ(from_b[1], 1.0f);
    EXPECT_FLOAT_EQ(from_b[0], 0.0f);
}

TEST(EmbeddingCacheTest, CorruptDiskEntryIsTreatedAsAMiss) {
    TempDir dir;
    auto embedder = std::make_shared<FakeEmbedder>();
    EmbeddingCache cache(embedder, 100, 4, dir.path());
    {
        std::ofstream out(cache.disk_dir() / (sha256_hex("garbled") + ".vec"), std::ios::binary);
        out << "not a vector";
    }

    auto vec = cache.get_or_compute("garbled");

    EXPECT_EQ(embedder->calls(), 1);
    EXPECT_NEAR(norm(vec), 1.0f, 1e-6);
}

TEST(EmbeddingCacheTest, ConcurrentLookupsAgree) {
    auto embedder = std::make_shared<FakeEmbedder>(16);
    EmbeddingCache cache(embedder, 1000, 8);

    std::vector<std::string> texts;
    for (int i = 0; i < 10; ++i) texts.push_back("report number " + std::to_string(i));

    std::vector<std::vector<float>> expected;
    for (const auto& t : texts) expected.push_back(cache.get_or_compute(t));

    std::atomic<int> mismatches{0};
    std::vector<std::thread> workers;
    for (int w = 0; w < 8; ++w) {
        workers.emplace_back([&]() {
            for (int i = 0; i < 200; ++i) {
                size_t idx = static_cast<size_t>(i) % texts.size();
                if (cache.get_or_compute(texts[idx]) != expected[idx]) mismatches++;
            }
        });
    }
    for (auto& t : workers) t.join();

    EXPECT_EQ(mismatches.load(), 0);
    EXPECT_EQ(embedder->calls(), 10);
    EXPECT_EQ(cache.size(), 10u);
}
