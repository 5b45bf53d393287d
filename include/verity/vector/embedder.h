#pragma once

#include <verity/core/types.h>

#include <memory>
#include <string>
#include <vector>

namespace verity::vector {

/**
 * Abstract interface for text embedders. The retrieval pipeline embeds queries through it and the
 * ingestor embeds passages through it, so both sides must use the same implementation and
 * dimension.
 */
class IEmbedder {
public:
    virtual ~IEmbedder() = default;

    /**
     * Generate embedding for a single text
     * @param text Input text to embed
     * @return Vector of getEmbeddingDimension() floats or error
     */
    virtual Result<Embedding> generateEmbedding(const std::string& text) = 0;

    /**
     * Generate embeddings for a batch of texts, in input order
     */
    virtual Result<std::vector<Embedding>>
    generateBatchEmbeddings(const std::vector<std::string>& texts) {
        std::vector<Embedding> out;
        out.reserve(texts.size());
        for (const auto& text : texts) {
            auto r = generateEmbedding(text);
            if (!r) {
                return r.error();
            }
            out.push_back(std::move(r).value());
        }
        return out;
    }

    virtual bool isAvailable() const = 0;

    // e.g. "Hash", "ONNX"
    virtual std::string getProviderName() const = 0;

    virtual size_t getEmbeddingDimension() const = 0;
};

} // namespace verity::vector
