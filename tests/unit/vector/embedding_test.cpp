#include <gtest/gtest.h>
#include <verity/vector/hash_embedder.h>
#include <verity/vector/similarity.h>

#include <cmath>

using namespace verity;
using namespace verity::vector;

TEST(HashEmbedderTest, IsDeterministicAndUnitLength) {
    HashEmbedder embedder(768);
    auto a = embedder.generateEmbedding("notice period for termination");
    auto b = embedder.generateEmbedding("notice period for termination");
    ASSERT_TRUE(a && b);
    ASSERT_EQ(a.value().size(), 768u);
    EXPECT_EQ(a.value(), b.value());
    EXPECT_NEAR(l2Norm(a.value()), 1.0, 1e-5);
    EXPECT_EQ(embedder.getProviderName(), "Hash");
    EXPECT_EQ(embedder.getEmbeddingDimension(), 768u);
}

TEST(HashEmbedderTest, DifferentTextsGiveDifferentVectors) {
    HashEmbedder embedder(64);
    auto a = embedder.generateEmbedding("lease");
    auto b = embedder.generateEmbedding("lease ");
    ASSERT_TRUE(a && b);
    EXPECT_NE(a.value(), b.value());
    EXPECT_LT(cosineSimilarity(a.value(), b.value()), 0.99);
}

TEST(HashEmbedderTest, BatchPreservesOrder) {
    HashEmbedder embedder(32);
    auto batch = embedder.generateBatchEmbeddings({"one", "two", "three"});
    ASSERT_TRUE(batch);
    ASSERT_EQ(batch.value().size(), 3u);
    EXPECT_EQ(batch.value()[1], embedder.generateEmbedding("two").value());
}

TEST(HashEmbedderTest, ZeroDimensionIsAnError) {
    HashEmbedder embedder(0);
    auto r = embedder.generateEmbedding("x");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidState);
}

TEST(SimilarityTest, CosineOfKnownVectors) {
    Embedding x{1.0f, 0.0f};
    Embedding y{0.0f, 2.0f};
    Embedding negX{-3.0f, 0.0f};
    EXPECT_NEAR(cosineSimilarity(x, x), 1.0, 1e-12);
    EXPECT_NEAR(cosineSimilarity(x, y), 0.0, 1e-12);
    EXPECT_NEAR(cosineSimilarity(x, negX), -1.0, 1e-12);
    EXPECT_NEAR(cosineDistance(x, y), 1.0, 1e-12);
    EXPECT_NEAR(cosineDistance(x, negX), 2.0, 1e-12);
}

TEST(SimilarityTest, DegenerateInputsAreUnrelated) {
    Embedding x{1.0f, 0.0f};
    EXPECT_EQ(cosineSimilarity(x, Embedding{}), 0.0);
    EXPECT_EQ(cosineSimilarity(x, Embedding{0.0f, 0.0f}), 0.0);
    EXPECT_EQ(cosineSimilarity(x, Embedding{1.0f, 0.0f, 0.0f}), 0.0);
    EXPECT_NEAR(l2Norm(Embedding{3.0f, 4.0f}), 5.0, 1e-12);
}
