#pragma once

#include <verity/search/passage.h>

#include <vector>

namespace verity::search {

/**
 * @brief Maximal Marginal Relevance selection.
 *
 * Seeds with the best fused candidate, then repeatedly takes the candidate maximizing
 * lambda * fused - (1 - lambda) * max cosine similarity to anything already selected. Ties go to
 * the higher fused score, then the lower passage id. Each candidate's running maximum similarity is
 * updated once per selection, so the cost is O(pool * k) similarity evaluations.
 */
class DiversitySelector {
public:
    explicit DiversitySelector(double lambda = 0.7) : lambda_(lambda) {}

    /**
     * @return At most k candidates, in selection order. When k covers the whole pool the pool is
     * returned in fused order.
     */
    std::vector<ScoredCandidate> select(std::vector<ScoredCandidate> candidates, size_t k) const;

    double lambda() const { return lambda_; }

private:
    double lambda_;
};

} // namespace verity::search
