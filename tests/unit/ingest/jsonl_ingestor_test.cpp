#include <gtest/gtest.h>
#include <verity/crypto/hasher.h>
#include <verity/ingest/jsonl_ingestor.h>
#include <verity/storage/memory_passage_store.h>
#include <verity/vector/hash_embedder.h>

#include "../../common/temp_dir_scope.h"

#include <fstream>
#include <sstream>

using namespace verity;
using namespace verity::ingest;

namespace {

constexpr size_t kDim = 16;

const char* kCorpus =
    R"({"title": "Lease Agreement", "year": 2020, "category": "legal", "text": "The tenant shall pay rent monthly."})"
    "\n"
    R"({"title": "Clinical Note", "year": "2019", "category": "medical", "heading": "Dosage", "text": "Take two tablets daily."})"
    "\n"
    "\n"
    R"({"title": "Broken", "text": )"
    "\n"
    R"(["not", "an", "object"])"
    "\n"
    R"({"title": "No body", "year": 2021})"
    "\n";

class JsonlIngestorTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<storage::InMemoryPassageStore>(kDim);
        embedder_ = std::make_shared<vector::HashEmbedder>(kDim);
    }

    Result<IngestStats> ingest(const std::string& jsonl, IngestConfig config = {}) {
        JsonlIngestor ingestor(store_, embedder_, std::move(config));
        std::istringstream in(jsonl);
        return ingestor.ingestStream(in, "corpus.jsonl");
    }

    std::shared_ptr<storage::InMemoryPassageStore> store_;
    std::shared_ptr<vector::HashEmbedder> embedder_;
};

} // namespace

TEST_F(JsonlIngestorTest, IngestsRecordsAndCountsMalformedLines) {
    auto stats = ingest(kCorpus);
    ASSERT_TRUE(stats) << stats.error().message;
    EXPECT_EQ(stats.value().documents, 2u);
    EXPECT_EQ(stats.value().passages, 2u);
    EXPECT_EQ(stats.value().skipped, 0u);
    EXPECT_EQ(stats.value().malformed, 3u);
    EXPECT_EQ(store_->documentCount().value(), 2u);

    search::MetadataFilter medical;
    medical.category = "medical";
    auto hits = store_->lexicalSearch("tablets", medical, 10);
    ASSERT_TRUE(hits);
    ASSERT_EQ(hits.value().size(), 1u);
    const auto& p = hits.value()[0].passage;
    EXPECT_EQ(p.title, "Clinical Note");
    EXPECT_EQ(p.heading, std::optional<std::string>("Dosage"));
    EXPECT_EQ(p.year, std::optional<int>(2019));
    EXPECT_FALSE(p.parentText.has_value());
}

TEST_F(JsonlIngestorTest, ReingestIsIdempotent) {
    ASSERT_TRUE(ingest(kCorpus));
    auto again = ingest(kCorpus);
    ASSERT_TRUE(again);
    EXPECT_EQ(again.value().documents, 0u);
    EXPECT_EQ(again.value().passages, 0u);
    EXPECT_EQ(again.value().skipped, 2u);
    EXPECT_EQ(store_->passageCount().value(), 2u);
}

TEST_F(JsonlIngestorTest, EmbedsTitleHeadingAndChunk) {
    ASSERT_TRUE(ingest(kCorpus));
    const std::string input = "Clinical Note\nDosage\nTake two tablets daily.";
    auto expected = embedder_->generateEmbedding(input);
    ASSERT_TRUE(expected);

    auto hits = store_->semanticSearch(expected.value(), {}, 1);
    ASSERT_TRUE(hits);
    ASSERT_EQ(hits.value().size(), 1u);
    EXPECT_NEAR(hits.value()[0].distance, 0.0, 1e-6);
    EXPECT_TRUE(store_->hasPassageChecksum(crypto::Sha256Hasher::hex(input)).value());

    // Without a heading the middle line stays empty
    auto lease = embedder_->generateEmbedding("Lease Agreement\n\nThe tenant shall pay rent monthly.");
    ASSERT_TRUE(lease);
    hits = store_->semanticSearch(lease.value(), {}, 1);
    ASSERT_TRUE(hits);
    EXPECT_NEAR(hits.value()[0].distance, 0.0, 1e-6);
}

TEST_F(JsonlIngestorTest, SectionsBecomePassagesWithParentText) {
    const std::string jsonl =
        R"({"title": "Statute", "category": "legal", "sections": [)"
        R"({"heading": "Definitions", "text": "A tenant is a person who rents."},)"
        R"({"heading": "Duties", "text": "Every tenant must keep the premises clean."}]})"
        "\n";
    auto stats = ingest(jsonl);
    ASSERT_TRUE(stats);
    EXPECT_EQ(stats.value().passages, 2u);

    auto hits = store_->lexicalSearch("tenant premises", {}, 10);
    ASSERT_TRUE(hits);
    ASSERT_EQ(hits.value().size(), 1u);
    const auto& p = hits.value()[0].passage;
    EXPECT_EQ(p.heading, std::optional<std::string>("Duties"));
    EXPECT_EQ(p.sectionNo, std::optional<int>(2));
    ASSERT_TRUE(p.parentText.has_value());
    EXPECT_EQ(*p.parentText, "Every tenant must keep the premises clean.");
}

TEST_F(JsonlIngestorTest, LongTextIsChunked) {
    std::string body;
    for (int i = 0; i < 200; ++i)
        body += "Clause " + std::to_string(i) + " applies. ";
    IngestConfig config;
    config.splitter.chunkTokens = 50;
    config.splitter.overlapTokens = 5;
    auto stats = ingest(R"({"title": "Long", "text": ")" + body + "\"}\n", config);
    ASSERT_TRUE(stats);
    EXPECT_EQ(stats.value().documents, 1u);
    EXPECT_GT(stats.value().passages, 5u);
}

TEST_F(JsonlIngestorTest, CustomKeys) {
    IngestConfig config;
    config.titleKey = "name";
    config.textKey = "body";
    config.categoryKey = "kind";
    auto stats = ingest(R"({"name": "Memo", "kind": "internal", "body": "Quarterly budget review."})"
                        "\n",
                        config);
    ASSERT_TRUE(stats);
    EXPECT_EQ(stats.value().documents, 1u);
    search::MetadataFilter filter;
    filter.category = "internal";
    auto hits = store_->lexicalSearch("budget", filter, 10);
    ASSERT_TRUE(hits);
    ASSERT_EQ(hits.value().size(), 1u);
    EXPECT_EQ(hits.value()[0].passage.title, "Memo");
}

TEST_F(JsonlIngestorTest, DimensionMismatchIsRejected) {
    JsonlIngestor ingestor(store_, std::make_shared<vector::HashEmbedder>(kDim * 2));
    std::istringstream in(kCorpus);
    auto stats = ingestor.ingestStream(in, "corpus.jsonl");
    ASSERT_FALSE(stats);
    EXPECT_EQ(stats.error().code, ErrorCode::InvalidArgument);
}

TEST_F(JsonlIngestorTest, IngestFileReadsFromDisk) {
    verity::test::TempDirScope dir("verity-ingest");
    auto path = dir.path() / "corpus.jsonl";
    {
        std::ofstream out(path);
        out << kCorpus;
    }
    JsonlIngestor ingestor(store_, embedder_);
    auto stats = ingestor.ingestFile(path);
    ASSERT_TRUE(stats);
    EXPECT_EQ(stats.value().documents, 2u);

    auto missing = ingestor.ingestFile(dir.path() / "absent.jsonl");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::FileNotFound);
}
