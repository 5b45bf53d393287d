#include <gtest/gtest.h>
#include <verity/search/rerank_stage.h>

#include <boost/asio/thread_pool.hpp>

#include <chrono>
#include <map>
#include <thread>

using namespace verity;
using namespace verity::search;

namespace {

// Scores each document by a fixed table keyed on the text
class TableReranker final : public IReranker {
public:
    std::map<std::string, double> table;
    std::chrono::milliseconds delay{0};
    bool ready = true;
    std::vector<std::string> lastDocuments;

    Result<std::vector<RerankScore>> scoreDocuments(const std::string&,
                                                    const std::vector<std::string>& docs) override {
        if (delay.count() > 0)
            std::this_thread::sleep_for(delay);
        lastDocuments = docs;
        std::vector<RerankScore> out;
        for (const auto& d : docs) {
            auto it = table.find(d);
            out.push_back({it == table.end() ? 0.0 : it->second, std::nullopt});
        }
        return out;
    }

    bool isReady() const override { return ready; }
    std::string name() const override { return "table"; }
};

ScoredCandidate candidate(PassageId id, double fused) {
    ScoredCandidate c;
    c.passage.id = id;
    c.passage.text = "p" + std::to_string(id);
    c.fusedScore = fused;
    return c;
}

std::vector<PassageId> ids(const std::vector<RankedResult>& rs) {
    std::vector<PassageId> out;
    for (const auto& r : rs)
        out.push_back(r.id());
    return out;
}

} // namespace

TEST(RerankStageTest, BuildsTitleHeadingPrefixedText) {
    Passage p;
    p.title = "Smith v Jones";
    p.heading = "Damages";
    p.text = "The court awarded costs.";
    EXPECT_EQ(RerankStage::buildRerankText(p), "Smith v Jones > Damages: The court awarded costs.");

    p.heading.reset();
    EXPECT_EQ(RerankStage::buildRerankText(p), "Smith v Jones: The court awarded costs.");

    p.title.clear();
    EXPECT_EQ(RerankStage::buildRerankText(p), "The court awarded costs.");
}

TEST(RerankStageTest, SortsByScoreThenFusedThenId) {
    auto reranker = std::make_shared<TableReranker>();
    reranker->table = {{"p1", 0.2}, {"p2", 0.9}, {"p3", 0.5}, {"p4", 0.5}, {"p5", 0.5}};
    RerankStage stage(reranker);

    RerankOptions options;
    options.topN = 10;
    auto ranked = stage.rerank("q", {candidate(1, 0.0), candidate(2, 0.0), candidate(3, 0.1),
                                     candidate(4, 0.3), candidate(5, 0.1)},
                               options);
    ASSERT_TRUE(ranked);
    EXPECT_EQ(ids(ranked.value()), (std::vector<PassageId>{2, 4, 3, 5, 1}));
    EXPECT_DOUBLE_EQ(ranked.value()[0].rerankScore, 0.9);
}

TEST(RerankStageTest, ThresholdDropsLowScoresBeforeTruncation) {
    auto reranker = std::make_shared<TableReranker>();
    reranker->table = {{"p1", 0.8}, {"p2", 0.4}, {"p3", 0.6}, {"p4", 0.1}};
    RerankStage stage(reranker);

    RerankOptions options;
    options.topN = 2;
    options.threshold = 0.5;
    auto ranked = stage.rerank("q", {candidate(1, 0), candidate(2, 0), candidate(3, 0),
                                     candidate(4, 0)},
                               options);
    ASSERT_TRUE(ranked);
    EXPECT_EQ(ids(ranked.value()), (std::vector<PassageId>{1, 3}));

    options.topN = 8;
    options.threshold = 0.6; // inclusive
    ranked = stage.rerank("q", {candidate(1, 0), candidate(2, 0), candidate(3, 0)}, options);
    ASSERT_TRUE(ranked);
    EXPECT_EQ(ids(ranked.value()), (std::vector<PassageId>{1, 3}));
}

TEST(RerankStageTest, NotReadyRerankerIsAnError) {
    auto reranker = std::make_shared<TableReranker>();
    reranker->ready = false;
    RerankStage stage(reranker);
    auto ranked = stage.rerank("q", {candidate(1, 0)}, RerankOptions{});
    ASSERT_FALSE(ranked);
    EXPECT_EQ(ranked.error().code, ErrorCode::RerankerUnavailable);
}

TEST(RerankStageTest, EmptyInputSkipsReranker) {
    auto reranker = std::make_shared<TableReranker>();
    reranker->ready = false;
    RerankStage stage(reranker);
    auto ranked = stage.rerank("q", {}, RerankOptions{});
    ASSERT_TRUE(ranked);
    EXPECT_TRUE(ranked.value().empty());
}

TEST(RerankStageTest, SlowRerankerTimesOut) {
    boost::asio::thread_pool pool(1);
    auto reranker = std::make_shared<TableReranker>();
    reranker->delay = std::chrono::milliseconds(300);
    RerankStage stage(reranker, boost::asio::any_io_executor(pool.get_executor()));

    RerankOptions options;
    options.timeout = std::chrono::milliseconds(20);
    auto ranked = stage.rerank("q", {candidate(1, 0)}, options);
    ASSERT_FALSE(ranked);
    EXPECT_EQ(ranked.error().code, ErrorCode::Timeout);
    pool.join();
}
