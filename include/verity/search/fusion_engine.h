#pragma once

#include <verity/search/passage.h>

#include <vector>

namespace verity::search {

/**
 * Canonical candidate order: fused score descending, then passage id ascending
 */
inline bool fusedOrder(const ScoredCandidate& a, const ScoredCandidate& b) {
    if (a.fusedScore != b.fusedScore)
        return a.fusedScore > b.fusedScore;
    return a.passage.id < b.passage.id;
}

/**
 * @brief Merges lexical and semantic hit lists into one ranked candidate set.
 *
 * Each list is deduplicated (first occurrence wins) and z-score normalized on its own; semantic
 * scores are taken as -distance first. A passage found by both lists becomes one candidate with
 * fused = alpha * lexical_norm + (1 - alpha) * semantic_norm; a passage found by only one list
 * uses 0 for the missing normalized signal.
 */
class FusionEngine {
public:
    explicit FusionEngine(double alpha = 0.5) : alpha_(alpha) {}

    /**
     * @return Candidates in fusedOrder(), at most limit of them
     */
    std::vector<ScoredCandidate> fuse(const std::vector<LexicalHit>& lexical,
                                      const std::vector<SemanticHit>& semantic,
                                      size_t limit) const;

    double alpha() const { return alpha_; }

private:
    double alpha_;
};

} // namespace verity::search
