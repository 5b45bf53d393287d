#include <spdlog/spdlog.h>
#include <algorithm>
#include <limits>
#include <boost/asio/thread_pool.hpp>
#include <verity/config/config_helpers.h>
#include <verity/search/async_task.h>
#include <verity/search/diversity_selector.h>
#include <verity/search/fusion_engine.h>
#include <verity/search/rerank_stage.h>
#include <verity/search/retrieval_pipeline.h>

namespace verity::search {

namespace {

// Keep the error kind for timeouts, tag everything else as a retrieval failure of that signal
Error retrievalError(const Error& err, const char* signal) {
    if (err.code == ErrorCode::Timeout) {
        return Error{ErrorCode::Timeout, fmt::format("{} retrieval timed out", signal)};
    }
    return Error{ErrorCode::RetrievalFailed,
                 fmt::format("{} retrieval failed: {}", signal, err.message)};
}

// Budgets past INT_MAX saturate instead of wrapping negative
int budgetToInt(size_t budget) {
    return static_cast<int>(std::min<size_t>(budget, std::numeric_limits<int>::max()));
}

} // namespace

struct RetrievalPipeline::Impl {
    std::shared_ptr<ICandidateSource> source;
    std::shared_ptr<vector::IEmbedder> embedder;
    std::shared_ptr<IReranker> reranker;
    config::SearchSettings settings;
    std::unique_ptr<boost::asio::thread_pool> pool;

    std::optional<boost::asio::any_io_executor> executor() const {
        if (!pool)
            return std::nullopt;
        return boost::asio::any_io_executor(pool->get_executor());
    }
};

RetrievalPipeline::RetrievalPipeline(std::shared_ptr<ICandidateSource> source,
                                     std::shared_ptr<vector::IEmbedder> embedder,
                                     std::shared_ptr<IReranker> reranker,
                                     config::SearchSettings settings)
    : pImpl(std::make_unique<Impl>()) {
    pImpl->source = std::move(source);
    pImpl->embedder = std::move(embedder);
    pImpl->reranker = std::move(reranker);
    pImpl->settings = std::move(settings);

    const auto& s = pImpl->settings;
    const bool needsPool = s.parallelRetrieval || s.retrievalTimeout.count() > 0 ||
                           s.rerankTimeout.count() > 0;
    if (needsPool) {
        pImpl->pool =
            std::make_unique<boost::asio::thread_pool>(std::max<size_t>(2, s.workerThreads));
    }
    spdlog::debug("RetrievalPipeline ready (parallel={}, retrieval_timeout={}ms, "
                  "rerank_timeout={}ms, reranker={})",
                  s.parallelRetrieval, s.retrievalTimeout.count(), s.rerankTimeout.count(),
                  pImpl->reranker ? pImpl->reranker->name() : "none");
}

RetrievalPipeline::~RetrievalPipeline() {
    if (pImpl && pImpl->pool) {
        pImpl->pool->join();
    }
}

const config::SearchSettings& RetrievalPipeline::settings() const {
    return pImpl->settings;
}

QuerySpec RetrievalPipeline::makeQuery(std::string text) const {
    const auto& s = pImpl->settings;
    QuerySpec query;
    query.text = std::move(text);
    query.preK = budgetToInt(s.preK);
    query.mmrK = budgetToInt(s.mmrK);
    query.topN = budgetToInt(s.topN);
    query.threshold = s.minScore;
    return query;
}

Result<std::vector<RankedResult>> RetrievalPipeline::search(const QuerySpec& query) const {
    if (auto v = query.validate(); !v) {
        return v.error();
    }
    if (!pImpl->source || !pImpl->embedder || !pImpl->reranker) {
        return Error{ErrorCode::NotInitialized, "Retrieval pipeline is missing a component"};
    }

    std::vector<RankedResult> empty;
    std::string queryText = query.text;
    config::trim(queryText);
    if (queryText.empty()) {
        spdlog::debug("Empty query, returning no results");
        return empty;
    }

    const auto& s = pImpl->settings;
    const size_t preK = static_cast<size_t>(query.preK);
    const size_t mmrK = std::min(static_cast<size_t>(query.mmrK), preK);
    const size_t topN = std::min(static_cast<size_t>(query.topN), mmrK);
    if (mmrK != static_cast<size_t>(query.mmrK) || topN != static_cast<size_t>(query.topN)) {
        spdlog::debug("Clamped budgets: pre_k={} mmr_k={}->{} top_n={}->{}", preK, query.mmrK, mmrK,
                      query.topN, topN);
    }
    if (topN == 0) {
        return empty;
    }

    const double alpha = query.alpha.value_or(s.alpha);
    const double lambda = query.lambda.value_or(s.lambda);

    auto queryEmbedding = pImpl->embedder->generateEmbedding(queryText);
    if (!queryEmbedding) {
        spdlog::error("Query embedding failed: {}", queryEmbedding.error().message);
        return retrievalError(queryEmbedding.error(), "semantic");
    }

    // Tasks own copies of everything they touch so an abandoned task stays valid
    auto source = pImpl->source;
    auto filter = query.filter;
    auto lexicalTask = [source, queryText, filter, preK]() {
        return source->lexicalSearch(queryText, filter, preK);
    };
    auto semanticTask = [source, embedding = std::move(queryEmbedding).value(), filter, preK]() {
        return source->semanticSearch(embedding, filter, preK);
    };

    const bool offThread = s.parallelRetrieval || s.retrievalTimeout.count() > 0;
    const auto executor = offThread ? pImpl->executor() : std::nullopt;

    Result<std::vector<LexicalHit>> lexical = std::vector<LexicalHit>{};
    Result<std::vector<SemanticHit>> semantic = std::vector<SemanticHit>{};

    if (s.parallelRetrieval) {
        const auto deadline = deadlineAfter(s.retrievalTimeout);
        auto lexFuture = postTask(executor, lexicalTask);
        auto semFuture = postTask(executor, semanticTask);
        lexical = awaitTask(lexFuture, deadline, "Lexical retrieval");
        semantic = awaitTask(semFuture, deadline, "Semantic retrieval");
    } else {
        auto lexFuture = postTask(executor, lexicalTask);
        lexical = awaitTask(lexFuture, deadlineAfter(s.retrievalTimeout), "Lexical retrieval");
        if (lexical) {
            auto semFuture = postTask(executor, semanticTask);
            semantic =
                awaitTask(semFuture, deadlineAfter(s.retrievalTimeout), "Semantic retrieval");
        }
    }

    if (!lexical) {
        spdlog::error("Lexical retrieval failed: {}", lexical.error().message);
        return retrievalError(lexical.error(), "lexical");
    }
    if (!semantic) {
        spdlog::error("Semantic retrieval failed: {}", semantic.error().message);
        return retrievalError(semantic.error(), "semantic");
    }

    spdlog::debug("Retrieved {} lexical and {} semantic candidates", lexical.value().size(),
                  semantic.value().size());
    if (lexical.value().empty() && semantic.value().empty()) {
        return empty;
    }

    auto fused = FusionEngine(alpha).fuse(lexical.value(), semantic.value(), preK);
    auto selected = DiversitySelector(lambda).select(std::move(fused), mmrK);

    RerankOptions options;
    options.topN = topN;
    options.threshold = query.threshold;
    options.timeout = s.rerankTimeout;
    RerankStage stage(pImpl->reranker, pImpl->executor());
    auto ranked = stage.rerank(queryText, std::move(selected), options);
    if (!ranked) {
        spdlog::error("Reranking failed: {}", ranked.error().message);
        return ranked.error();
    }
    return ranked;
}

} // namespace verity::search
