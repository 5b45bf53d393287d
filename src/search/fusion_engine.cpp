#include <spdlog/spdlog.h>
#include <algorithm>
#include <unordered_map>
#include <unordered_set>
#include <verity/search/fusion_engine.h>
#include <verity/search/score_normalizer.h>

namespace verity::search {

namespace {

// Keep the first (best-ranked) occurrence of each passage id
template <typename Hit> std::vector<const Hit*> uniqueHits(const std::vector<Hit>& hits) {
    std::vector<const Hit*> out;
    out.reserve(hits.size());
    std::unordered_set<PassageId> seen;
    for (const auto& h : hits) {
        if (seen.insert(h.passage.id).second) {
            out.push_back(&h);
        }
    }
    return out;
}

} // namespace

std::vector<ScoredCandidate> FusionEngine::fuse(const std::vector<LexicalHit>& lexical,
                                                const std::vector<SemanticHit>& semantic,
                                                size_t limit) const {
    auto lex = uniqueHits(lexical);
    auto sem = uniqueHits(semantic);

    std::vector<double> lexRaw;
    lexRaw.reserve(lex.size());
    for (const auto* h : lex)
        lexRaw.push_back(h->score);

    std::vector<double> semRaw;
    semRaw.reserve(sem.size());
    for (const auto* h : sem)
        semRaw.push_back(normalize::semanticFromDistance(h->distance));

    const auto lexNorm = normalize::zScore(lexRaw);
    const auto semNorm = normalize::zScore(semRaw);

    std::vector<ScoredCandidate> candidates;
    candidates.reserve(lex.size() + sem.size());
    std::unordered_map<PassageId, size_t> index;

    for (size_t i = 0; i < lex.size(); ++i) {
        ScoredCandidate c;
        c.passage = lex[i]->passage;
        c.lexicalScore = lex[i]->score;
        c.lexicalNorm = lexNorm[i];
        index.emplace(c.passage.id, candidates.size());
        candidates.push_back(std::move(c));
    }

    for (size_t i = 0; i < sem.size(); ++i) {
        auto [it, inserted] = index.emplace(sem[i]->passage.id, candidates.size());
        if (inserted) {
            ScoredCandidate c;
            c.passage = sem[i]->passage;
            candidates.push_back(std::move(c));
        }
        auto& c = candidates[it->second];
        c.distance = sem[i]->distance;
        c.semanticScore = semRaw[i];
        c.semanticNorm = semNorm[i];
        // The lexical store may not carry embeddings; prefer whichever copy has one
        if (c.passage.embedding.empty()) {
            c.passage.embedding = sem[i]->passage.embedding;
        }
    }

    for (auto& c : candidates) {
        c.fusedScore = alpha_ * c.lexicalNorm + (1.0 - alpha_) * c.semanticNorm;
    }

    std::sort(candidates.begin(), candidates.end(), fusedOrder);
    if (candidates.size() > limit) {
        candidates.resize(limit);
    }

    spdlog::debug("Fusion: {} lexical + {} semantic -> {} candidates (alpha={})", lex.size(),
                  sem.size(), candidates.size(), alpha_);
    return candidates;
}

} // namespace verity::search
