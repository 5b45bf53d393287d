#include <spdlog/spdlog.h>
#include <algorithm>
#include <limits>
#include <verity/search/diversity_selector.h>
#include <verity/search/fusion_engine.h>
#include <verity/vector/similarity.h>

namespace verity::search {

std::vector<ScoredCandidate> DiversitySelector::select(std::vector<ScoredCandidate> candidates,
                                                       size_t k) const {
    std::sort(candidates.begin(), candidates.end(), fusedOrder);
    if (k >= candidates.size()) {
        return candidates;
    }

    std::vector<ScoredCandidate> selected;
    if (k == 0) {
        return selected;
    }
    selected.reserve(k);

    const size_t n = candidates.size();
    std::vector<bool> taken(n, false);
    std::vector<double> maxSim(n, -std::numeric_limits<double>::infinity());

    auto take = [&](size_t idx) {
        taken[idx] = true;
        const auto& chosen = candidates[idx].passage.embedding;
        for (size_t i = 0; i < n; ++i) {
            if (taken[i])
                continue;
            double sim = vector::cosineSimilarity(candidates[i].passage.embedding, chosen);
            maxSim[i] = std::max(maxSim[i], sim);
        }
        selected.push_back(candidates[idx]);
    };

    // The first selection has no redundancy term; the seed is the top fused candidate
    take(0);

    while (selected.size() < k) {
        size_t best = n;
        double bestScore = -std::numeric_limits<double>::infinity();
        // Candidates are in fused order, so a strict comparison keeps the tie-break
        for (size_t i = 0; i < n; ++i) {
            if (taken[i])
                continue;
            double score = lambda_ * candidates[i].fusedScore - (1.0 - lambda_) * maxSim[i];
            if (best == n || score > bestScore) {
                best = i;
                bestScore = score;
            }
        }
        if (best == n)
            break;
        take(best);
    }

    spdlog::debug("MMR selected {} of {} candidates (lambda={})", selected.size(), n, lambda_);
    return selected;
}

} // namespace verity::search
