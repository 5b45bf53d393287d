#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <verity/config/config_helpers.h>
#include <verity/crypto/hasher.h>
#include <verity/ingest/jsonl_ingestor.h>

namespace verity::ingest {

namespace {

std::optional<std::string> stringField(const nlohmann::json& rec, const std::string& key) {
    auto it = rec.find(key);
    if (it == rec.end() || it->is_null())
        return std::nullopt;
    if (it->is_string())
        return it->get<std::string>();
    if (it->is_number())
        return it->dump();
    return std::nullopt;
}

// Integer years, also accepted as numeric strings such as "2019"
std::optional<int> yearField(const nlohmann::json& rec, const std::string& key) {
    auto it = rec.find(key);
    if (it == rec.end())
        return std::nullopt;
    if (it->is_number_integer())
        return it->get<int>();
    if (it->is_number_float())
        return static_cast<int>(it->get<double>());
    if (it->is_string()) {
        const auto& s = it->get_ref<const std::string&>();
        try {
            size_t pos = 0;
            int year = std::stoi(s, &pos);
            if (pos == s.size())
                return year;
        } catch (const std::exception&) {
            spdlog::debug("Ignoring non-numeric year '{}'", s);
        }
    }
    return std::nullopt;
}

std::string embeddingInput(const std::string& title, const std::optional<std::string>& heading,
                           const std::string& chunk) {
    std::string s = title + "\n" + heading.value_or("") + "\n" + chunk;
    config::trim(s);
    return s;
}

} // namespace

JsonlIngestor::JsonlIngestor(std::shared_ptr<storage::IPassageStore> store,
                             std::shared_ptr<vector::IEmbedder> embedder, IngestConfig config)
    : store_(std::move(store)), embedder_(std::move(embedder)), config_(std::move(config)),
      splitter_(config_.splitter) {}

Result<IngestStats> JsonlIngestor::ingestFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::FileNotFound, fmt::format("Cannot open {}", path.string())};
    }
    spdlog::info("Ingesting {}", path.string());
    return ingestStream(in, path.filename().string());
}

Result<std::vector<storage::PassageRecord>>
JsonlIngestor::buildPassages(const nlohmann::json& record, const std::string& title,
                             size_t& alreadyStored) {
    struct Section {
        std::optional<std::string> heading;
        std::optional<int> sectionNo;
        std::string text;
        bool keepParent = false;
    };
    std::vector<Section> sections;

    auto sectionsIt = record.find(config_.sectionsKey);
    if (sectionsIt != record.end() && sectionsIt->is_array()) {
        int no = 0;
        for (const auto& entry : *sectionsIt) {
            ++no;
            if (!entry.is_object())
                continue;
            auto text = stringField(entry, "text");
            if (!text || text->empty())
                continue;
            sections.push_back({stringField(entry, "heading"), no, *text, true});
        }
    } else if (auto text = stringField(record, config_.textKey); text && !text->empty()) {
        sections.push_back({stringField(record, config_.headingKey), std::nullopt, *text, false});
    }

    if (sections.empty()) {
        return Error{ErrorCode::InvalidData, "record has no text"};
    }

    std::vector<storage::PassageRecord> passages;
    std::vector<std::string> inputs;
    for (const auto& section : sections) {
        for (auto& chunk : splitter_.split(section.text)) {
            auto input = embeddingInput(title, section.heading, chunk.content);
            storage::PassageRecord p;
            p.sectionNo = section.sectionNo;
            p.heading = section.heading;
            p.tokenCount = chunk.tokenCount;
            p.checksum = crypto::Sha256Hasher::hex(input);
            p.text = std::move(chunk.content);
            if (section.keepParent)
                p.parentText = section.text;

            auto exists = store_->hasPassageChecksum(p.checksum);
            if (!exists)
                return exists.error();
            if (exists.value()) {
                ++alreadyStored;
                continue;
            }

            inputs.push_back(std::move(input));
            passages.push_back(std::move(p));
        }
    }

    if (!inputs.empty()) {
        auto embeddings = embedder_->generateBatchEmbeddings(inputs);
        if (!embeddings) {
            return Error{ErrorCode::EmbeddingFailed,
                         "Passage embedding failed: " + embeddings.error().message};
        }
        if (embeddings.value().size() != passages.size()) {
            return Error{ErrorCode::EmbeddingFailed, "Embedder returned a short batch"};
        }
        for (size_t i = 0; i < passages.size(); ++i) {
            passages[i].embedding = std::move(embeddings.value()[i]);
        }
    }
    return passages;
}

Result<IngestStats> JsonlIngestor::ingestStream(std::istream& in, const std::string& filename) {
    if (!store_ || !embedder_) {
        return Error{ErrorCode::NotInitialized, "Ingestor needs a store and an embedder"};
    }
    if (embedder_->getEmbeddingDimension() != store_->embeddingDimension()) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("Embedder dimension {} does not match store dimension {}",
                                 embedder_->getEmbeddingDimension(),
                                 store_->embeddingDimension())};
    }

    IngestStats stats;
    std::string line;
    size_t lineNo = 0;

    while (std::getline(in, line)) {
        ++lineNo;
        config::trim(line);
        if (line.empty())
            continue;

        auto record = nlohmann::json::parse(line, nullptr, false);
        if (record.is_discarded() || !record.is_object()) {
            spdlog::warn("{}:{}: not a JSON object, skipping", filename, lineNo);
            ++stats.malformed;
            continue;
        }

        storage::DocumentRecord doc;
        doc.filename = filename;
        doc.title = stringField(record, config_.titleKey).value_or("");
        doc.year = yearField(record, config_.yearKey);
        doc.category = stringField(record, config_.categoryKey);
        doc.checksum = crypto::Sha256Hasher::hex(record.dump());

        size_t alreadyStored = 0;
        auto passages = buildPassages(record, doc.title, alreadyStored);
        if (!passages) {
            if (passages.error().code == ErrorCode::InvalidData) {
                spdlog::warn("{}:{}: {}, skipping", filename, lineNo, passages.error().message);
                ++stats.malformed;
                continue;
            }
            return passages.error();
        }

        auto inserted = store_->insertDocument(doc, passages.value());
        if (!inserted) {
            return inserted.error();
        }
        const auto& ins = inserted.value();
        if (!ins.duplicateDocument) {
            ++stats.documents;
        }
        stats.passages += ins.inserted;
        stats.skipped += ins.skipped + alreadyStored;
    }

    spdlog::info("Ingested {}: {} documents, {} passages ({} skipped, {} malformed)", filename,
                 stats.documents, stats.passages, stats.skipped, stats.malformed);
    return stats;
}

} // namespace verity::ingest
