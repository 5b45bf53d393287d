#include <spdlog/spdlog.h>
#include <algorithm>
#include <verity/search/async_task.h>
#include <verity/search/rerank_stage.h>

namespace verity::search {

RerankStage::RerankStage(std::shared_ptr<IReranker> reranker,
                         std::optional<boost::asio::any_io_executor> executor)
    : reranker_(std::move(reranker)), executor_(std::move(executor)) {}

std::string RerankStage::buildRerankText(const Passage& passage) {
    std::string prefix = passage.title;
    if (passage.heading && !passage.heading->empty()) {
        if (!prefix.empty())
            prefix += " > ";
        prefix += *passage.heading;
    }
    if (prefix.empty())
        return passage.text;
    if (passage.text.empty())
        return prefix;
    return prefix + ": " + passage.text;
}

Result<std::vector<RankedResult>> RerankStage::rerank(const std::string& query,
                                                      std::vector<ScoredCandidate> candidates,
                                                      const RerankOptions& options) const {
    std::vector<RankedResult> results;
    if (candidates.empty() || options.topN == 0) {
        return results;
    }
    if (!reranker_ || !reranker_->isReady()) {
        return Error{ErrorCode::RerankerUnavailable, "Reranker is not ready"};
    }

    std::vector<std::string> texts;
    texts.reserve(candidates.size());
    for (const auto& c : candidates) {
        texts.push_back(buildRerankText(c.passage));
    }

    // Scoring runs off-thread only when a timeout has to be enforced
    auto reranker = reranker_;
    auto executor = options.timeout.count() > 0 ? executor_ : std::nullopt;
    auto future = postTask(executor, [reranker, query, texts = std::move(texts)]() {
        return reranker->scoreDocuments(query, texts);
    });
    auto scored = awaitTask(future, deadlineAfter(options.timeout), "Reranking");
    if (!scored) {
        return scored.error();
    }

    auto& scores = scored.value();
    if (scores.size() != candidates.size()) {
        return Error{ErrorCode::InternalError,
                     fmt::format("Reranker '{}' returned {} scores for {} candidates",
                                 reranker_->name(), scores.size(), candidates.size())};
    }

    results.reserve(candidates.size());
    for (size_t i = 0; i < candidates.size(); ++i) {
        RankedResult r;
        r.candidate = std::move(candidates[i]);
        r.rerankScore = scores[i].score;
        r.rawRerankScore = scores[i].raw;
        results.push_back(std::move(r));
    }

    std::sort(results.begin(), results.end(), [](const RankedResult& a, const RankedResult& b) {
        if (a.rerankScore != b.rerankScore)
            return a.rerankScore > b.rerankScore;
        if (a.candidate.fusedScore != b.candidate.fusedScore)
            return a.candidate.fusedScore > b.candidate.fusedScore;
        return a.id() < b.id();
    });

    if (options.threshold) {
        const double t = *options.threshold;
        results.erase(std::remove_if(results.begin(), results.end(),
                                     [t](const RankedResult& r) { return r.rerankScore < t; }),
                      results.end());
    }
    if (results.size() > options.topN) {
        results.resize(options.topN);
    }

    spdlog::debug("Rerank ({}): {} candidates -> {} results", reranker_->name(), candidates.size(),
                  results.size());
    return results;
}

} // namespace verity::search
