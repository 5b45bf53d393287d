#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <mutex>
#include <verity/storage/memory_passage_store.h>
#include <verity/text/word_tokenizer.h>
#include <verity/vector/similarity.h>

namespace verity::storage {

InMemoryPassageStore::InMemoryPassageStore(size_t dimension, double headingWeight)
    : dimension_(dimension), headingWeight_(headingWeight) {}

void InMemoryPassageStore::indexEntry(Entry& entry) {
    std::unordered_set<std::string> seen;
    if (entry.passage.heading) {
        for (auto& t : text::tokenizeWords(*entry.passage.heading)) {
            entry.headingTf[t]++;
            entry.length += 1.0;
            seen.insert(std::move(t));
        }
    }
    for (auto& t : text::tokenizeWords(entry.passage.text)) {
        entry.textTf[t]++;
        entry.length += 1.0;
        seen.insert(std::move(t));
    }
    for (const auto& t : seen) {
        documentFrequency_[t]++;
    }
    totalLength_ += entry.length;
}

double InMemoryPassageStore::bm25(const Entry& entry, const std::vector<std::string>& terms) const {
    const double n = static_cast<double>(entries_.size());
    const double avgLength = entries_.empty() ? 0.0 : totalLength_ / n;
    double score = 0.0;

    for (const auto& term : terms) {
        double tf = 0.0;
        if (auto it = entry.headingTf.find(term); it != entry.headingTf.end())
            tf += headingWeight_ * static_cast<double>(it->second);
        if (auto it = entry.textTf.find(term); it != entry.textTf.end())
            tf += static_cast<double>(it->second);
        if (tf == 0.0)
            return 0.0; // Conjunctive: every term must match

        auto dfIt = documentFrequency_.find(term);
        double df = dfIt != documentFrequency_.end() ? static_cast<double>(dfIt->second) : 0.0;
        double idf = std::log(1.0 + (n - df + 0.5) / (df + 0.5));
        double norm = avgLength > 0.0 ? entry.length / avgLength : 1.0;
        score += idf * (tf * (k1_ + 1.0)) / (tf + k1_ * (1.0 - b_ + b_ * norm));
    }
    return score;
}

Result<std::vector<search::LexicalHit>>
InMemoryPassageStore::lexicalSearch(const std::string& query, const search::MetadataFilter& filter,
                                    size_t limit) {
    auto tokens = text::tokenizeWords(query);
    std::sort(tokens.begin(), tokens.end());
    tokens.erase(std::unique(tokens.begin(), tokens.end()), tokens.end());

    std::vector<search::LexicalHit> hits;
    if (tokens.empty() || limit == 0) {
        return hits;
    }

    std::shared_lock lock(mutex_);
    for (const auto& entry : entries_) {
        if (!filter.matches(entry.passage))
            continue;
        double score = bm25(entry, tokens);
        if (score > 0.0) {
            hits.push_back({entry.passage, score});
        }
    }

    std::sort(hits.begin(), hits.end(), [](const auto& a, const auto& b) {
        if (a.score != b.score)
            return a.score > b.score;
        return a.passage.id < b.passage.id;
    });
    if (hits.size() > limit)
        hits.resize(limit);
    return hits;
}

Result<std::vector<search::SemanticHit>>
InMemoryPassageStore::semanticSearch(const Embedding& queryEmbedding,
                                     const search::MetadataFilter& filter, size_t limit) {
    if (queryEmbedding.size() != dimension_) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("Query embedding has dimension {}, store expects {}",
                                 queryEmbedding.size(), dimension_)};
    }

    std::vector<search::SemanticHit> hits;
    if (limit == 0) {
        return hits;
    }

    std::shared_lock lock(mutex_);
    for (const auto& entry : entries_) {
        if (!filter.matches(entry.passage))
            continue;
        hits.push_back(
            {entry.passage, vector::cosineDistance(queryEmbedding, entry.passage.embedding)});
    }
    lock.unlock();

    std::sort(hits.begin(), hits.end(), [](const auto& a, const auto& b) {
        if (a.distance != b.distance)
            return a.distance < b.distance;
        return a.passage.id < b.passage.id;
    });
    if (hits.size() > limit)
        hits.resize(limit);
    return hits;
}

Result<InsertStats> InMemoryPassageStore::insertDocument(const DocumentRecord& document,
                                                         const std::vector<PassageRecord>& passages) {
    for (const auto& p : passages) {
        if (p.embedding.size() != dimension_) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("Passage embedding has dimension {}, store expects {}",
                                     p.embedding.size(), dimension_)};
        }
    }

    std::unique_lock lock(mutex_);
    InsertStats stats;
    if (!documentChecksums_.insert(document.checksum).second) {
        stats.duplicateDocument = true;
        stats.skipped = passages.size();
        return stats;
    }

    stats.docId = nextDocId_++;
    for (const auto& rec : passages) {
        if (!passageChecksums_.insert(rec.checksum).second) {
            ++stats.skipped;
            continue;
        }
        Entry entry;
        auto& p = entry.passage;
        p.id = nextPassageId_++;
        p.docId = stats.docId;
        p.title = document.title;
        p.heading = rec.heading;
        p.sectionNo = rec.sectionNo;
        p.text = rec.text;
        p.parentText = rec.parentText;
        p.embedding = rec.embedding;
        p.year = document.year;
        p.category = document.category;
        indexEntry(entry);
        entries_.push_back(std::move(entry));
        ++stats.inserted;
    }
    return stats;
}

Result<void> InMemoryPassageStore::addPassage(search::Passage passage) {
    if (!passage.embedding.empty() && passage.embedding.size() != dimension_) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("Passage {} has embedding dimension {}, store expects {}",
                                 passage.id, passage.embedding.size(), dimension_)};
    }

    std::unique_lock lock(mutex_);
    if (passage.id == 0) {
        passage.id = nextPassageId_;
    }
    for (const auto& e : entries_) {
        if (e.passage.id == passage.id) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("Duplicate passage id {}", passage.id)};
        }
    }
    nextPassageId_ = std::max(nextPassageId_, passage.id + 1);

    Entry entry;
    entry.passage = std::move(passage);
    indexEntry(entry);
    entries_.push_back(std::move(entry));
    return Result<void>();
}

Result<bool> InMemoryPassageStore::hasPassageChecksum(const std::string& checksum) {
    std::shared_lock lock(mutex_);
    return passageChecksums_.count(checksum) > 0;
}

Result<size_t> InMemoryPassageStore::passageCount() {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

Result<size_t> InMemoryPassageStore::documentCount() {
    std::shared_lock lock(mutex_);
    return documentChecksums_.size();
}

} // namespace verity::storage
