#pragma once

#include <verity/vector/embedder.h>

namespace verity::vector {

/**
 * Deterministic embedder for tests and model-free deployments. The SHA-256 digest of the text
 * seeds a normal distribution (first eight digest bytes, big-endian); the sampled vector is
 * scaled to unit length. Identical texts always produce identical vectors, unrelated texts are
 * nearly orthogonal.
 */
class HashEmbedder final : public IEmbedder {
public:
    explicit HashEmbedder(size_t dimension = 768);

    Result<Embedding> generateEmbedding(const std::string& text) override;

    bool isAvailable() const override { return true; }
    std::string getProviderName() const override { return "Hash"; }
    size_t getEmbeddingDimension() const override { return dimension_; }

private:
    size_t dimension_;
};

} // namespace verity::vector
