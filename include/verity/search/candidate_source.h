#pragma once

#include <verity/core/types.h>
#include <verity/search/passage.h>

#include <string>
#include <vector>

namespace verity::search {

/**
 * @brief Supplies independently scored lexical and semantic candidates for a query.
 *
 * Implementations must tolerate the two calls running concurrently.
 */
class ICandidateSource {
public:
    virtual ~ICandidateSource() = default;

    /**
     * @brief Passages matching the query terms, best first
     * @return At most limit hits with raw lexical scores, descending
     */
    virtual Result<std::vector<LexicalHit>>
    lexicalSearch(const std::string& query, const MetadataFilter& filter, size_t limit) = 0;

    /**
     * @brief Passages nearest to the query embedding
     * @return At most limit hits with raw cosine distances, ascending
     */
    virtual Result<std::vector<SemanticHit>>
    semanticSearch(const Embedding& queryEmbedding, const MetadataFilter& filter,
                   size_t limit) = 0;
};

} // namespace verity::search
