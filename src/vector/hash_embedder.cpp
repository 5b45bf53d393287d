#include <spdlog/spdlog.h>
#include <cmath>
#include <random>
#include <verity/crypto/hasher.h>
#include <verity/vector/hash_embedder.h>

namespace verity::vector {

HashEmbedder::HashEmbedder(size_t dimension) : dimension_(dimension) {
    spdlog::debug("HashEmbedder created with dimension {}", dimension);
}

Result<Embedding> HashEmbedder::generateEmbedding(const std::string& text) {
    if (dimension_ == 0) {
        return Error{ErrorCode::InvalidState, "HashEmbedder has zero dimension"};
    }

    auto digest = crypto::Sha256Hasher::digest(text);
    uint64_t seed = 0;
    for (size_t i = 0; i < 8; ++i) {
        seed = (seed << 8) | digest[i];
    }

    std::mt19937_64 gen(seed);
    std::normal_distribution<double> dist(0.0, 1.0);

    std::vector<double> values(dimension_);
    double norm = 0.0;
    for (auto& v : values) {
        v = dist(gen);
        norm += v * v;
    }
    norm = std::sqrt(norm) + 1e-9;

    Embedding embedding(dimension_);
    for (size_t i = 0; i < dimension_; ++i) {
        embedding[i] = static_cast<float>(values[i] / norm);
    }
    return embedding;
}

} // namespace verity::vector
