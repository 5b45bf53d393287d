#include <spdlog/spdlog.h>
#include <algorithm>
#include <bit>
#include <cstring>
#include <filesystem>
#include <verity/storage/passage_store.h>
#include <verity/text/word_tokenizer.h>
#include <verity/vector/similarity.h>

namespace verity::storage {

namespace {

constexpr const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS store_meta (
    key TEXT PRIMARY KEY,
    value TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS documents (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    filename TEXT,
    title TEXT NOT NULL DEFAULT '',
    year INTEGER,
    category TEXT,
    checksum TEXT NOT NULL UNIQUE,
    created_at INTEGER NOT NULL DEFAULT (CAST(strftime('%s', 'now') AS INTEGER))
);

CREATE TABLE IF NOT EXISTS passages (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    doc_id INTEGER NOT NULL REFERENCES documents(id) ON DELETE CASCADE,
    section_no INTEGER,
    heading TEXT,
    text TEXT NOT NULL,
    parent_text TEXT,
    embedding BLOB NOT NULL,
    year INTEGER,
    category TEXT,
    token_count INTEGER NOT NULL DEFAULT 0,
    checksum TEXT NOT NULL UNIQUE
);

CREATE INDEX IF NOT EXISTS idx_passages_doc ON passages(doc_id);
CREATE INDEX IF NOT EXISTS idx_passages_year ON passages(year);
CREATE INDEX IF NOT EXISTS idx_passages_category ON passages(category);

CREATE VIRTUAL TABLE IF NOT EXISTS passages_fts USING fts5(
    heading, text,
    content='passages', content_rowid='id',
    tokenize='porter unicode61'
);

CREATE TRIGGER IF NOT EXISTS passages_ai AFTER INSERT ON passages BEGIN
    INSERT INTO passages_fts(rowid, heading, text) VALUES (new.id, new.heading, new.text);
END;

CREATE TRIGGER IF NOT EXISTS passages_ad AFTER DELETE ON passages BEGIN
    INSERT INTO passages_fts(passages_fts, rowid, heading, text)
    VALUES ('delete', old.id, old.heading, old.text);
END;
)SQL";

// Column list shared by every passage query; readPassage() depends on this order
constexpr const char* kPassageColumns =
    "p.id, p.doc_id, d.title, p.heading, p.section_no, p.text, p.parent_text, p.embedding, "
    "p.year, p.category";

search::Passage readPassage(const Statement& stmt) {
    search::Passage p;
    p.id = stmt.int64At(0);
    p.docId = stmt.int64At(1);
    p.title = stmt.textAt(2);
    p.heading = stmt.optionalTextAt(3);
    if (auto s = stmt.optionalInt64At(4))
        p.sectionNo = static_cast<int>(*s);
    p.text = stmt.textAt(5);
    p.parentText = stmt.optionalTextAt(6);
    p.embedding = decodeEmbedding(stmt.blobAt(7));
    if (auto y = stmt.optionalInt64At(8))
        p.year = static_cast<int>(*y);
    p.category = stmt.optionalTextAt(9);
    return p;
}

// " AND p.year = ? AND p.category = ?" for the set filter fields
std::string filterClause(const search::MetadataFilter& filter) {
    std::string clause;
    if (filter.year)
        clause += " AND p.year = ?";
    if (filter.category)
        clause += " AND p.category = ?";
    return clause;
}

Result<void> bindFilter(Statement& stmt, int& index, const search::MetadataFilter& filter) {
    if (filter.year) {
        if (auto r = stmt.bind(index++, *filter.year); !r)
            return r;
    }
    if (filter.category) {
        if (auto r = stmt.bind(index++, *filter.category); !r)
            return r;
    }
    return {};
}

} // namespace

std::string buildMatchExpression(const std::string& query) {
    std::string expr;
    for (const auto& term : text::tokenizeWords(query)) {
        if (!expr.empty())
            expr += ' ';
        // Tokens never contain '"'; FTS5 re-tokenizes each phrase with unicode61
        expr += '"';
        expr += term;
        expr += '"';
    }
    return expr;
}

std::vector<std::byte> encodeEmbedding(const Embedding& embedding) {
    std::vector<std::byte> blob(embedding.size() * sizeof(float));
    std::memcpy(blob.data(), embedding.data(), blob.size());
    if constexpr (std::endian::native == std::endian::big) {
        for (size_t i = 0; i < blob.size(); i += sizeof(float)) {
            std::reverse(blob.begin() + static_cast<std::ptrdiff_t>(i),
                         blob.begin() + static_cast<std::ptrdiff_t>(i + sizeof(float)));
        }
    }
    return blob;
}

Embedding decodeEmbedding(const std::vector<std::byte>& blob) {
    std::vector<std::byte> bytes(blob.begin(),
                                 blob.begin() + static_cast<std::ptrdiff_t>(
                                                    blob.size() - blob.size() % sizeof(float)));
    if constexpr (std::endian::native == std::endian::big) {
        for (size_t i = 0; i < bytes.size(); i += sizeof(float)) {
            std::reverse(bytes.begin() + static_cast<std::ptrdiff_t>(i),
                         bytes.begin() + static_cast<std::ptrdiff_t>(i + sizeof(float)));
        }
    }
    Embedding out(bytes.size() / sizeof(float));
    std::memcpy(out.data(), bytes.data(), bytes.size());
    return out;
}

SqlitePassageStore::SqlitePassageStore(SqliteStoreConfig config) : config_(std::move(config)) {}

SqlitePassageStore::~SqlitePassageStore() = default;

Result<std::unique_ptr<SqlitePassageStore>>
SqlitePassageStore::open(const SqliteStoreConfig& config) {
    if (config.dimension == 0) {
        return Error{ErrorCode::InvalidArgument, "Embedding dimension must be positive"};
    }
    if (config.headingWeight <= 0.0) {
        return Error{ErrorCode::InvalidArgument, "Heading weight must be positive"};
    }

    const bool inMemory = config.path.empty() || config.path == ":memory:";
    if (!inMemory) {
        std::error_code ec;
        auto parent = std::filesystem::path(config.path).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                return Error{ErrorCode::DatabaseError,
                             fmt::format("Cannot create directory {}: {}", parent.string(),
                                         ec.message())};
            }
        }
    }

    std::unique_ptr<SqlitePassageStore> store(new SqlitePassageStore(config));
    auto opened = store->db_.open(config.path, inMemory ? OpenMode::InMemory : OpenMode::Create);
    if (!opened) {
        return opened.error();
    }

    auto fts = store->db_.hasFTS5();
    if (!fts || !fts.value()) {
        return Error{ErrorCode::NotSupported, "SQLite was built without FTS5"};
    }

    if (!inMemory) {
        if (auto r = store->db_.enableWAL(); !r) {
            spdlog::warn("Could not enable WAL on {}: {}", config.path, r.error().message);
        }
    }
    if (auto r = store->db_.execute("PRAGMA foreign_keys=ON"); !r) {
        return r.error();
    }
    if (auto r = store->initSchema(); !r) {
        return r.error();
    }
    if (auto r = store->checkDimension(); !r) {
        return r.error();
    }

    spdlog::debug("Passage store ready at {} (dim={}, heading_weight={})",
                  inMemory ? ":memory:" : config.path, config.dimension, config.headingWeight);
    return store;
}

Result<void> SqlitePassageStore::initSchema() {
    return db_.execute(kSchema);
}

Result<void> SqlitePassageStore::checkDimension() {
    auto stmtResult = db_.prepare("SELECT value FROM store_meta WHERE key = 'embedding_dim'");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();

    auto row = stmt.step();
    if (!row)
        return row.error();

    if (row.value()) {
        const std::string stored = stmt.textAt(0);
        if (stored != std::to_string(config_.dimension)) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("Store was created with embedding dimension {}, requested {}",
                                     stored, config_.dimension)};
        }
        return {};
    }

    auto insert = db_.prepare("INSERT INTO store_meta(key, value) VALUES ('embedding_dim', ?)");
    if (!insert)
        return insert.error();
    auto ins = std::move(insert).value();
    if (auto r = ins.bind(1, std::to_string(config_.dimension)); !r)
        return r;
    return ins.execute();
}

Result<std::vector<search::LexicalHit>>
SqlitePassageStore::lexicalSearch(const std::string& query, const search::MetadataFilter& filter,
                                  size_t limit) {
    std::vector<search::LexicalHit> hits;
    const auto match = buildMatchExpression(query);
    if (match.empty() || limit == 0) {
        return hits;
    }

    // bm25() is more negative for better matches
    const std::string sql = fmt::format(
        "SELECT {}, -bm25(passages_fts, {:.6f}, 1.0) AS lex "
        "FROM passages_fts "
        "JOIN passages p ON p.id = passages_fts.rowid "
        "JOIN documents d ON d.id = p.doc_id "
        "WHERE passages_fts MATCH ?{} "
        "ORDER BY lex DESC, p.id ASC LIMIT ?",
        kPassageColumns, config_.headingWeight, filterClause(filter));

    std::lock_guard<std::mutex> lock(mutex_);
    auto stmtResult = db_.prepare(sql);
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();

    int index = 1;
    if (auto r = stmt.bind(index++, match); !r)
        return r.error();
    if (auto r = bindFilter(stmt, index, filter); !r)
        return r.error();
    if (auto r = stmt.bind(index++, static_cast<int64_t>(limit)); !r)
        return r.error();

    while (true) {
        auto row = stmt.step();
        if (!row)
            return row.error();
        if (!row.value())
            break;
        search::LexicalHit hit;
        hit.passage = readPassage(stmt);
        hit.score = stmt.doubleAt(10);
        hits.push_back(std::move(hit));
    }

    spdlog::debug("Lexical search '{}' matched {} passages", match, hits.size());
    return hits;
}

Result<std::vector<search::SemanticHit>>
SqlitePassageStore::semanticSearch(const Embedding& queryEmbedding,
                                   const search::MetadataFilter& filter, size_t limit) {
    std::vector<search::SemanticHit> hits;
    if (queryEmbedding.size() != config_.dimension) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("Query embedding has dimension {}, store expects {}",
                                 queryEmbedding.size(), config_.dimension)};
    }
    if (limit == 0) {
        return hits;
    }

    const std::string sql =
        fmt::format("SELECT {} FROM passages p JOIN documents d ON d.id = p.doc_id WHERE 1 = 1{}",
                    kPassageColumns, filterClause(filter));

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto stmtResult = db_.prepare(sql);
        if (!stmtResult)
            return stmtResult.error();
        auto stmt = std::move(stmtResult).value();

        int index = 1;
        if (auto r = bindFilter(stmt, index, filter); !r)
            return r.error();

        while (true) {
            auto row = stmt.step();
            if (!row)
                return row.error();
            if (!row.value())
                break;
            search::SemanticHit hit;
            hit.passage = readPassage(stmt);
            hit.distance = vector::cosineDistance(queryEmbedding, hit.passage.embedding);
            hits.push_back(std::move(hit));
        }
    }

    auto closer = [](const search::SemanticHit& a, const search::SemanticHit& b) {
        if (a.distance != b.distance)
            return a.distance < b.distance;
        return a.passage.id < b.passage.id;
    };
    if (hits.size() > limit) {
        std::partial_sort(hits.begin(), hits.begin() + static_cast<std::ptrdiff_t>(limit),
                          hits.end(), closer);
        hits.resize(limit);
    } else {
        std::sort(hits.begin(), hits.end(), closer);
    }
    return hits;
}

Result<bool> SqlitePassageStore::checksumExists(const char* sql, const std::string& checksum) {
    auto stmtResult = db_.prepare(sql);
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    if (auto r = stmt.bind(1, checksum); !r)
        return r.error();
    auto row = stmt.step();
    if (!row)
        return row.error();
    return row.value();
}

Result<bool> SqlitePassageStore::hasPassageChecksum(const std::string& checksum) {
    std::lock_guard<std::mutex> lock(mutex_);
    return checksumExists("SELECT 1 FROM passages WHERE checksum = ?", checksum);
}

Result<InsertStats> SqlitePassageStore::insertDocument(const DocumentRecord& document,
                                                       const std::vector<PassageRecord>& passages) {
    for (const auto& p : passages) {
        if (p.embedding.size() != config_.dimension) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("Passage embedding has dimension {}, store expects {}",
                                     p.embedding.size(), config_.dimension)};
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    InsertStats stats;

    auto dup = checksumExists("SELECT 1 FROM documents WHERE checksum = ?", document.checksum);
    if (!dup)
        return dup.error();
    if (dup.value()) {
        stats.duplicateDocument = true;
        stats.skipped = passages.size();
        return stats;
    }

    auto txResult = db_.transaction([&]() -> Result<void> {
        auto docStmt = db_.prepare(
            "INSERT INTO documents(filename, title, year, category, checksum) VALUES (?, ?, ?, ?, ?)");
        if (!docStmt)
            return docStmt.error();
        auto ds = std::move(docStmt).value();
        if (auto r = ds.bindAll(document.filename, document.title, document.year,
                                document.category, document.checksum);
            !r)
            return r;
        if (auto r = ds.execute(); !r)
            return r;
        stats.docId = db_.lastInsertRowId();

        auto passageStmt = db_.prepare(
            "INSERT OR IGNORE INTO passages(doc_id, section_no, heading, text, parent_text, "
            "embedding, year, category, token_count, checksum) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
        if (!passageStmt)
            return passageStmt.error();
        auto ps = std::move(passageStmt).value();

        for (const auto& p : passages) {
            auto blob = encodeEmbedding(p.embedding);
            if (auto r = ps.bindAll(stats.docId, p.sectionNo, p.heading, p.text, p.parentText,
                                    std::span<const std::byte>(blob), document.year,
                                    document.category, static_cast<int64_t>(p.tokenCount),
                                    p.checksum);
                !r)
                return r;
            if (auto r = ps.execute(); !r)
                return r;
            if (db_.changes() > 0) {
                ++stats.inserted;
            } else {
                ++stats.skipped;
            }
            if (auto r = ps.reset(); !r)
                return r;
        }
        return {};
    });

    if (!txResult) {
        spdlog::error("Failed to insert document '{}': {}", document.title,
                      txResult.error().message);
        return txResult.error();
    }
    return stats;
}

Result<size_t> SqlitePassageStore::countRows(const char* sql) {
    auto stmtResult = db_.prepare(sql);
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    auto row = stmt.step();
    if (!row)
        return row.error();
    return static_cast<size_t>(stmt.int64At(0));
}

Result<size_t> SqlitePassageStore::passageCount() {
    std::lock_guard<std::mutex> lock(mutex_);
    return countRows("SELECT COUNT(*) FROM passages");
}

Result<size_t> SqlitePassageStore::documentCount() {
    std::lock_guard<std::mutex> lock(mutex_);
    return countRows("SELECT COUNT(*) FROM documents");
}

Result<search::Passage> SqlitePassageStore::getPassage(PassageId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmtResult = db_.prepare(
        fmt::format("SELECT {} FROM passages p JOIN documents d ON d.id = p.doc_id WHERE p.id = ?",
                    kPassageColumns));
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    if (auto r = stmt.bind(1, static_cast<int64_t>(id)); !r)
        return r.error();
    auto row = stmt.step();
    if (!row)
        return row.error();
    if (!row.value())
        return Error{ErrorCode::NotFound, fmt::format("Passage {} not found", id)};
    return readPassage(stmt);
}

} // namespace verity::storage
