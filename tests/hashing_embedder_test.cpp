#include <gtest/gtest.h>
#include "embedding_service.hpp"

using namespace pulse_rag;

TEST(HashingEmbedderTest, IsDeterministicAndCaseInsensitive) {
    auto embedder = create_hashing_embedder(64);
    EXPECT_EQ(embedder->dimension(), 64u);
    EXPECT_EQ(embedder->embed("Camera crashes"), embedder->embed("camera CRASHES"));
    EXPECT_EQ(embedder->embed("Camera crashes"), create_hashing_embedder(64)->embed("Camera crashes"));
}

TEST(HashingEmbedderTest, CountsTokens) {
    auto embedder = create_hashing_embedder(384);
    auto vec = embedder->embed("zoom, zoom; ZOOM!");
    float total = 0;
    for (float v : vec) total += v;
    EXPECT_FLOAT_EQ(total, 3.0f);
}

TEST(HashingEmbedderTest, TextWithoutTokensIsZero) {
    auto vec = create_hashing_embedder(8)->embed("  ?! ");
    for (float v : vec) EXPECT_EQ(v, 0.0f);
}

TEST(HashingEmbedderTest, RejectsZeroDimension) {
    EXPECT_THROW(create_hashing_embedder(0), std::invalid_argument);
}
