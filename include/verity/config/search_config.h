#pragma once

#include <verity/core/types.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace verity::config {

enum class RerankerMode { Overlap, CrossEncoder };
enum class UnavailablePolicy { Fail, Fallback };
enum class EmbedderMode { Hash, Onnx };

const char* toString(RerankerMode mode);
const char* toString(UnavailablePolicy policy);
const char* toString(EmbedderMode mode);

Result<RerankerMode> parseRerankerMode(const std::string& value);
Result<UnavailablePolicy> parseUnavailablePolicy(const std::string& value);
Result<EmbedderMode> parseEmbedderMode(const std::string& value);

/**
 * @brief Retrieval pipeline defaults ([search] section)
 */
struct SearchSettings {
    double alpha = 0.5;   // Lexical weight in fusion; semantic gets 1 - alpha
    double lambda = 0.7;  // MMR relevance/diversity trade-off
    size_t preK = 200;    // Initial candidate pool per retrieval signal
    size_t mmrK = 20;     // Diversity-selected pool handed to the reranker
    size_t topN = 8;      // Final result count
    std::optional<double> minScore; // Reranker score threshold
    std::chrono::milliseconds retrievalTimeout{5000}; // 0 disables
    std::chrono::milliseconds rerankTimeout{10000};   // 0 disables
    bool parallelRetrieval = true;
    size_t workerThreads = 2;
};

struct RerankerSettings {
    RerankerMode mode = RerankerMode::Overlap;
    UnavailablePolicy onUnavailable = UnavailablePolicy::Fail;
    std::filesystem::path modelPath; // Directory holding model.onnx and vocab.txt
    size_t maxSequenceLength = 512;
    size_t batchSize = 16;
    int numThreads = 4;
};

struct EmbedderSettings {
    EmbedderMode mode = EmbedderMode::Hash;
    std::filesystem::path modelPath;
    size_t dimension = 768;
    size_t maxSequenceLength = 512;
    int numThreads = 4;
};

struct StorageSettings {
    std::filesystem::path dbPath; // Empty: <data dir>/verity.db
    double headingWeight = 2.0;   // FTS5 column weight for headings (body is 1.0)
};

struct SearchConfig {
    SearchSettings search;
    RerankerSettings reranker;
    EmbedderSettings embedder;
    StorageSettings storage;

    // Range checks; InvalidConfiguration on the first offending value
    Result<void> validate() const;
};

/**
 * @brief Load configuration from a TOML file, then apply VERITY_* environment overrides.
 *
 * A missing file is not an error: defaults are used. The returned config has been validated and
 * has a non-empty storage.dbPath.
 */
Result<SearchConfig> loadSearchConfig(const std::filesystem::path& path);

// Overlay VERITY_ALPHA, VERITY_LAMBDA, VERITY_PRE_K, VERITY_MMR_K, VERITY_TOP_N, VERITY_RERANKER,
// VERITY_RERANK_MODEL, VERITY_EMBED_MODEL and VERITY_DB onto config
Result<void> applyEnvironmentOverrides(SearchConfig& config);

// Render the effective configuration in the same TOML layout loadSearchConfig reads
std::string toToml(const SearchConfig& config);

} // namespace verity::config
