#pragma once

#include <verity/storage/passage_store.h>

#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace verity::storage {

/**
 * @brief In-process passage store for tests and small corpora.
 *
 * Lexical scores are BM25 (k1 = 1.2, b = 0.75) with heading term frequencies scaled by the heading
 * weight; every query term must occur in the passage. Semantic scores are exact cosine distances.
 */
class InMemoryPassageStore final : public IPassageStore {
public:
    explicit InMemoryPassageStore(size_t dimension = 768, double headingWeight = 2.0);

    Result<std::vector<search::LexicalHit>> lexicalSearch(const std::string& query,
                                                          const search::MetadataFilter& filter,
                                                          size_t limit) override;

    Result<std::vector<search::SemanticHit>> semanticSearch(const Embedding& queryEmbedding,
                                                            const search::MetadataFilter& filter,
                                                            size_t limit) override;

    Result<InsertStats> insertDocument(const DocumentRecord& document,
                                       const std::vector<PassageRecord>& passages) override;

    Result<bool> hasPassageChecksum(const std::string& checksum) override;

    Result<size_t> passageCount() override;
    Result<size_t> documentCount() override;

    size_t embeddingDimension() const override { return dimension_; }

    // Add a fully formed passage, keeping its id; used to build fixtures
    Result<void> addPassage(search::Passage passage);

private:
    struct Entry {
        search::Passage passage;
        std::unordered_map<std::string, size_t> headingTf;
        std::unordered_map<std::string, size_t> textTf;
        double length = 0.0;
    };

    void indexEntry(Entry& entry);
    double bm25(const Entry& entry, const std::vector<std::string>& terms) const;

    size_t dimension_;
    double headingWeight_;
    double k1_ = 1.2;
    double b_ = 0.75;

    mutable std::shared_mutex mutex_;
    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> documentFrequency_;
    std::unordered_set<std::string> passageChecksums_;
    std::unordered_set<std::string> documentChecksums_;
    double totalLength_ = 0.0;
    DocumentId nextDocId_ = 1;
    PassageId nextPassageId_ = 1;
};

} // namespace verity::storage
