#include <gtest/gtest.h>
#include <verity/search/result_json.h>

#include <nlohmann/json.hpp>

using namespace verity::search;

TEST(ResultJsonTest, RendersPassageAndScores) {
    RankedResult r;
    auto& p = r.candidate.passage;
    p.id = 12;
    p.docId = 3;
    p.title = "Lease Agreement";
    p.heading = "Termination";
    p.text = "Either party may terminate.";
    p.parentText = "Section 9. Either party may terminate. Notice applies.";
    p.year = 2020;
    r.candidate.lexicalScore = 4.5;
    r.candidate.lexicalNorm = 1.2;
    r.candidate.fusedScore = 0.6;
    r.rerankScore = 0.8;
    r.rawRerankScore = 1.386;

    auto j = toJson(r);
    EXPECT_EQ(j["id"], 12);
    EXPECT_EQ(j["doc_id"], 3);
    EXPECT_EQ(j["heading"], "Termination");
    EXPECT_TRUE(j["section_no"].is_null());
    EXPECT_TRUE(j["category"].is_null());
    EXPECT_EQ(j["parent_text"], "Section 9. Either party may terminate. Notice applies.");
    EXPECT_DOUBLE_EQ(j["scores"]["lexical"].get<double>(), 4.5);
    EXPECT_TRUE(j["scores"]["distance"].is_null());
    EXPECT_DOUBLE_EQ(j["scores"]["fused"].get<double>(), 0.6);
    EXPECT_DOUBLE_EQ(j["scores"]["rerank_raw"].get<double>(), 1.386);
}

TEST(ResultJsonTest, ParentTextFallsBackToPassageText) {
    Passage p;
    p.text = "Standalone passage.";
    EXPECT_EQ(toJson(p)["parent_text"], "Standalone passage.");
    EXPECT_TRUE(toJson(std::vector<RankedResult>{}).is_array());
}
