#pragma once

#include <verity/core/types.h>
#include <verity/storage/passage_store.h>
#include <verity/text/text_splitter.h>
#include <verity/vector/embedder.h>

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <istream>
#include <memory>
#include <string>

namespace verity::ingest {

struct IngestConfig {
    std::string titleKey = "title";
    std::string textKey = "text";
    std::string yearKey = "year";
    std::string categoryKey = "category";
    std::string headingKey = "heading";   // Optional single heading for the whole text
    std::string sectionsKey = "sections"; // Optional [{heading, text}, ...]
    text::SplitterConfig splitter;        // 600-token chunks, 50-token overlap
};

struct IngestStats {
    size_t documents = 0; // Documents newly stored
    size_t passages = 0;  // Passages newly stored
    size_t skipped = 0;   // Passages already present
    size_t malformed = 0; // Lines that were not usable records
};

/**
 * @brief Loads a JSON-lines corpus into a passage store.
 *
 * Each line is one document. Its text (or each entry of its sections array) is split into
 * passages. Every passage is embedded as "title\nheading\nchunk" and keyed by the SHA-256 of that
 * string, so re-ingesting the same file stores nothing new. Malformed lines are counted and
 * logged; store and embedder failures abort the run.
 */
class JsonlIngestor {
public:
    JsonlIngestor(std::shared_ptr<storage::IPassageStore> store,
                  std::shared_ptr<vector::IEmbedder> embedder, IngestConfig config = {});

    Result<IngestStats> ingestFile(const std::filesystem::path& path);
    Result<IngestStats> ingestStream(std::istream& in, const std::string& filename);

private:
    // Splits one record into embedded passages not yet stored; InvalidData when the record has no
    // usable text. Passages already stored are counted in alreadyStored.
    Result<std::vector<storage::PassageRecord>> buildPassages(const nlohmann::json& record,
                                                              const std::string& title,
                                                              size_t& alreadyStored);

    std::shared_ptr<storage::IPassageStore> store_;
    std::shared_ptr<vector::IEmbedder> embedder_;
    IngestConfig config_;
    text::RecursiveTextSplitter splitter_;
};

} // namespace verity::ingest
