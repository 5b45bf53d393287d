#pragma once

#include <verity/search/passage.h>
#include <verity/search/reranker.h>

#include <boost/asio/any_io_executor.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace verity::search {

struct RerankOptions {
    size_t topN = 8;
    std::optional<double> threshold;          // Drop results scoring below this
    std::chrono::milliseconds timeout{0};     // 0 disables
};

/**
 * @brief Final ordering stage: scores diversity-selected candidates with an IReranker, sorts by
 * score descending (ties by fused score, then passage id), drops results below the threshold and
 * keeps at most topN.
 */
class RerankStage {
public:
    explicit RerankStage(std::shared_ptr<IReranker> reranker,
                         std::optional<boost::asio::any_io_executor> executor = std::nullopt);

    Result<std::vector<RankedResult>> rerank(const std::string& query,
                                             std::vector<ScoredCandidate> candidates,
                                             const RerankOptions& options) const;

    const IReranker& reranker() const { return *reranker_; }

    // "<title> > <heading>: <text>", empty parts omitted
    static std::string buildRerankText(const Passage& passage);

private:
    std::shared_ptr<IReranker> reranker_;
    std::optional<boost::asio::any_io_executor> executor_;
};

} // namespace verity::search
