#pragma once

#include <verity/core/types.h>

#include <optional>
#include <string>
#include <vector>

namespace verity::search {

/**
 * @brief One indexed unit of retrievable text.
 */
struct Passage {
    PassageId id = 0;
    DocumentId docId = 0;
    std::string title; // Owning document's title
    std::optional<std::string> heading;
    std::optional<int> sectionNo;
    std::string text; // Searchable text
    std::optional<std::string> parentText;
    Embedding embedding;
    std::optional<int> year;
    std::optional<std::string> category;

    // Surrounding context for consumers; the passage text itself when no parent text exists
    const std::string& contextText() const {
        return parentText && !parentText->empty() ? *parentText : text;
    }
};

/**
 * @brief Exact-match metadata constraints. Unset fields do not constrain.
 */
struct MetadataFilter {
    std::optional<int> year;
    std::optional<std::string> category;

    bool empty() const { return !year && !category; }

    bool matches(const Passage& p) const {
        if (year && p.year != year)
            return false;
        if (category && p.category != category)
            return false;
        return true;
    }
};

struct LexicalHit {
    Passage passage;
    double score = 0.0; // Raw lexical relevance, higher is better
};

struct SemanticHit {
    Passage passage;
    double distance = 0.0; // Raw cosine distance, lower is better
};

/**
 * @brief A candidate after normalization and fusion. Raw signals are kept for observability; a
 * signal the candidate was not retrieved by is absent and contributes 0 to the fused score.
 */
struct ScoredCandidate {
    Passage passage;
    std::optional<double> lexicalScore;
    std::optional<double> distance;
    std::optional<double> semanticScore; // -distance
    double lexicalNorm = 0.0;
    double semanticNorm = 0.0;
    double fusedScore = 0.0;
};

struct RankedResult {
    ScoredCandidate candidate;
    double rerankScore = 0.0;
    std::optional<double> rawRerankScore; // Model output before normalization, when reported

    PassageId id() const { return candidate.passage.id; }
};

/**
 * @brief One retrieval request.
 *
 * Budgets are signed so that negative values can be reported as configuration errors rather than
 * wrapping. Unset alpha/lambda fall back to the pipeline defaults.
 */
struct QuerySpec {
    std::string text;
    MetadataFilter filter;
    int preK = 200;
    int mmrK = 20;
    int topN = 8;
    std::optional<double> threshold;
    std::optional<double> alpha;
    std::optional<double> lambda;

    // InvalidConfiguration for negative budgets, alpha/lambda outside [0, 1] or a non-finite
    // threshold
    Result<void> validate() const;
};

} // namespace verity::search
