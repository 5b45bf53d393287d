#pragma once

#include <verity/config/search_config.h>
#include <verity/search/candidate_source.h>
#include <verity/search/passage.h>
#include <verity/search/reranker.h>
#include <verity/vector/embedder.h>

#include <memory>
#include <string>
#include <vector>

namespace verity::search {

/**
 * @brief Hybrid retrieval: lexical + semantic candidates, z-score fusion, MMR diversity selection
 * and pairwise reranking.
 *
 * Budgets are clamped so that top_n <= mmr_k <= pre_k. An empty or whitespace query, or a source
 * with no matches, yields an empty result rather than an error. Retrieval failures and timeouts
 * are surfaced as errors, never as empty lists.
 *
 * The pipeline holds no per-query state; search() may be called from several threads.
 */
class RetrievalPipeline {
public:
    RetrievalPipeline(std::shared_ptr<ICandidateSource> source,
                      std::shared_ptr<vector::IEmbedder> embedder,
                      std::shared_ptr<IReranker> reranker, config::SearchSettings settings = {});
    ~RetrievalPipeline();

    RetrievalPipeline(const RetrievalPipeline&) = delete;
    RetrievalPipeline& operator=(const RetrievalPipeline&) = delete;

    Result<std::vector<RankedResult>> search(const QuerySpec& query) const;

    // A QuerySpec carrying the configured budgets and threshold
    QuerySpec makeQuery(std::string text) const;

    const config::SearchSettings& settings() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace verity::search
