#pragma once

#include <verity/core/types.h>
#include <verity/search/candidate_source.h>
#include <verity/storage/database.h>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace verity::storage {

/**
 * @brief A source document as ingested
 */
struct DocumentRecord {
    std::string filename;
    std::string title;
    std::optional<int> year;
    std::optional<std::string> category;
    std::string checksum; // Identity for idempotent re-ingest
};

/**
 * @brief A passage to insert. Year and category are denormalized from the owning document.
 */
struct PassageRecord {
    std::optional<int> sectionNo;
    std::optional<std::string> heading;
    std::string text;
    std::optional<std::string> parentText;
    Embedding embedding;
    size_t tokenCount = 0;
    std::string checksum;
};

struct InsertStats {
    DocumentId docId = 0;
    size_t inserted = 0;
    size_t skipped = 0;            // Passages whose checksum was already stored
    bool duplicateDocument = false; // Whole document already stored
};

/**
 * @brief Writable passage index that also serves as a candidate source.
 */
class IPassageStore : public search::ICandidateSource {
public:
    /**
     * @brief Insert a document and its passages atomically.
     *
     * A document whose checksum is already present is skipped entirely. Passages whose checksum is
     * already present are skipped individually.
     */
    virtual Result<InsertStats> insertDocument(const DocumentRecord& document,
                                               const std::vector<PassageRecord>& passages) = 0;

    virtual Result<bool> hasPassageChecksum(const std::string& checksum) = 0;

    virtual Result<size_t> passageCount() = 0;
    virtual Result<size_t> documentCount() = 0;

    virtual size_t embeddingDimension() const = 0;
};

struct SqliteStoreConfig {
    std::string path;          // ":memory:" for a private in-memory database
    size_t dimension = 768;    // Fixed embedding dimension for the store
    double headingWeight = 2.0; // bm25 column weight of headings; body text is 1.0
};

/**
 * @brief SQLite-backed passage store.
 *
 * Lexical retrieval runs against an FTS5 external-content index over (heading, text) with porter
 * stemming; all query terms are required and the score is the negated bm25 rank so that higher is
 * better. Semantic retrieval computes cosine distances against float32 embedding blobs. All access
 * to the connection is serialized.
 */
class SqlitePassageStore final : public IPassageStore {
public:
    ~SqlitePassageStore() override;

    /**
     * @brief Open (creating if needed) a store. Fails with InvalidArgument when the database was
     * created with a different embedding dimension, NotSupported when SQLite lacks FTS5.
     */
    static Result<std::unique_ptr<SqlitePassageStore>> open(const SqliteStoreConfig& config);

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

    size_t embeddingDimension() const override { return config_.dimension; }

    // Look up a single passage by id
    Result<search::Passage> getPassage(PassageId id);

private:
    explicit SqlitePassageStore(SqliteStoreConfig config);

    Result<void> initSchema();
    Result<void> checkDimension();
    Result<size_t> countRows(const char* sql);
    Result<bool> checksumExists(const char* sql, const std::string& checksum);

    SqliteStoreConfig config_;
    Database db_;
    std::mutex mutex_;
};

// FTS5 MATCH expression requiring every query term; empty when the query has no terms
std::string buildMatchExpression(const std::string& query);

// float32 little-endian blob encoding
std::vector<std::byte> encodeEmbedding(const Embedding& embedding);
Embedding decodeEmbedding(const std::vector<std::byte>& blob);

} // namespace verity::storage
