#include <gtest/gtest.h>
#include <verity/search/fusion_engine.h>

#include "../../common/corpus_fixture.h"

#include <algorithm>
#include <set>

using namespace verity;
using namespace verity::search;
using verity::test::CorpusBuilder;

namespace {

LexicalHit lex(PassageId id, double score) {
    return {CorpusBuilder::withEmbedding(id, {}), score};
}

SemanticHit sem(PassageId id, double distance) {
    return {CorpusBuilder::withEmbedding(id, {1.0f, 0.0f}), distance};
}

const ScoredCandidate* find(const std::vector<ScoredCandidate>& cs, PassageId id) {
    auto it = std::find_if(cs.begin(), cs.end(),
                           [id](const ScoredCandidate& c) { return c.passage.id == id; });
    return it == cs.end() ? nullptr : &*it;
}

} // namespace

TEST(FusionEngineTest, MergesOverlappingPassagesIntoOneCandidate) {
    FusionEngine engine(0.5);
    auto fused = engine.fuse({lex(1, 3.0), lex(2, 2.0), lex(3, 1.0)},
                             {sem(2, 0.1), sem(4, 0.2), sem(5, 0.3)}, 100);
    ASSERT_EQ(fused.size(), 5u);

    std::set<PassageId> ids;
    for (const auto& c : fused)
        ids.insert(c.passage.id);
    EXPECT_EQ(ids.size(), 5u);

    const auto* both = find(fused, 2);
    ASSERT_NE(both, nullptr);
    EXPECT_TRUE(both->lexicalScore.has_value());
    EXPECT_TRUE(both->distance.has_value());
    EXPECT_NEAR(*both->semanticScore, -0.1, 1e-12);
    EXPECT_NEAR(both->fusedScore, 0.5 * both->lexicalNorm + 0.5 * both->semanticNorm, 1e-12);
    // Embedding comes from the semantic copy when the lexical copy has none
    EXPECT_EQ(both->passage.embedding.size(), 2u);
}

TEST(FusionEngineTest, MissingSignalContributesZero) {
    FusionEngine engine(0.3);
    auto fused = engine.fuse({lex(1, 5.0), lex(2, 1.0)}, {sem(3, 0.2), sem(4, 0.4)}, 100);

    const auto* lexOnly = find(fused, 1);
    ASSERT_NE(lexOnly, nullptr);
    EXPECT_FALSE(lexOnly->distance.has_value());
    EXPECT_EQ(lexOnly->semanticNorm, 0.0);
    EXPECT_NEAR(lexOnly->fusedScore, 0.3 * lexOnly->lexicalNorm, 1e-12);

    const auto* semOnly = find(fused, 3);
    ASSERT_NE(semOnly, nullptr);
    EXPECT_FALSE(semOnly->lexicalScore.has_value());
    EXPECT_EQ(semOnly->lexicalNorm, 0.0);
    EXPECT_NEAR(semOnly->fusedScore, 0.7 * semOnly->semanticNorm, 1e-12);
}

TEST(FusionEngineTest, SmallerDistanceGivesHigherSemanticNorm) {
    FusionEngine engine(0.0);
    auto fused = engine.fuse({}, {sem(1, 0.9), sem(2, 0.1), sem(3, 0.5)}, 10);
    ASSERT_EQ(fused.size(), 3u);
    EXPECT_EQ(fused[0].passage.id, 2);
    EXPECT_EQ(fused[1].passage.id, 3);
    EXPECT_EQ(fused[2].passage.id, 1);
}

TEST(FusionEngineTest, AlphaOneRanksPurelyLexically) {
    FusionEngine engine(1.0);
    auto fused = engine.fuse({lex(1, 1.0), lex(2, 3.0), lex(3, 2.0)},
                             {sem(1, 0.0), sem(3, 0.5), sem(2, 0.9)}, 10);
    ASSERT_EQ(fused.size(), 3u);
    EXPECT_EQ(fused[0].passage.id, 2);
    EXPECT_EQ(fused[1].passage.id, 3);
    EXPECT_EQ(fused[2].passage.id, 1);
}

TEST(FusionEngineTest, AlphaOneFusedScoreIsExactlyTheLexicalNorm) {
    FusionEngine engine(1.0);
    // Overlapping ids plus lexical-only and semantic-only hits
    auto fused = engine.fuse({lex(1, 4.0), lex(2, 2.5), lex(3, 1.0)},
                             {sem(2, 0.1), sem(3, 0.7), sem(4, 0.2)}, 10);
    ASSERT_EQ(fused.size(), 4u);
    for (const auto& c : fused) {
        EXPECT_EQ(c.fusedScore, c.lexicalNorm) << "passage " << c.passage.id;
    }
    const auto* semOnly = find(fused, 4);
    ASSERT_NE(semOnly, nullptr);
    EXPECT_NE(semOnly->semanticNorm, 0.0);
    EXPECT_EQ(semOnly->fusedScore, 0.0);
}

TEST(FusionEngineTest, AlphaZeroFusedScoreIsExactlyTheSemanticNorm) {
    FusionEngine engine(0.0);
    auto fused = engine.fuse({lex(1, 4.0), lex(2, 2.5), lex(3, 1.0)},
                             {sem(2, 0.1), sem(3, 0.7), sem(4, 0.2)}, 10);
    ASSERT_EQ(fused.size(), 4u);
    for (const auto& c : fused) {
        EXPECT_EQ(c.fusedScore, c.semanticNorm) << "passage " << c.passage.id;
    }
    const auto* lexOnly = find(fused, 1);
    ASSERT_NE(lexOnly, nullptr);
    EXPECT_NE(lexOnly->lexicalNorm, 0.0);
    EXPECT_EQ(lexOnly->fusedScore, 0.0);
}

TEST(FusionEngineTest, DuplicateHitsKeepFirstOccurrence) {
    FusionEngine engine(1.0);
    auto fused = engine.fuse({lex(1, 4.0), lex(2, 2.0), lex(1, 0.5)}, {}, 10);
    ASSERT_EQ(fused.size(), 2u);
    const auto* c = find(fused, 1);
    ASSERT_NE(c, nullptr);
    EXPECT_DOUBLE_EQ(*c->lexicalScore, 4.0);
}

TEST(FusionEngineTest, SingleHitNormalizesToZero) {
    FusionEngine engine(0.5);
    auto fused = engine.fuse({lex(7, 12.0)}, {}, 10);
    ASSERT_EQ(fused.size(), 1u);
    EXPECT_EQ(fused[0].lexicalNorm, 0.0);
    EXPECT_EQ(fused[0].fusedScore, 0.0);
}

TEST(FusionEngineTest, TiesBreakByPassageIdAndLimitTruncates) {
    FusionEngine engine(0.5);
    // Constant scores normalize to zero, so every candidate ties
    auto fused = engine.fuse({lex(9, 1.0), lex(4, 1.0), lex(6, 1.0)}, {sem(2, 0.3), sem(5, 0.3)},
                             3);
    ASSERT_EQ(fused.size(), 3u);
    EXPECT_EQ(fused[0].passage.id, 2);
    EXPECT_EQ(fused[1].passage.id, 4);
    EXPECT_EQ(fused[2].passage.id, 5);
}

TEST(FusionEngineTest, EmptyInputsGiveNoCandidates) {
    FusionEngine engine;
    EXPECT_TRUE(engine.fuse({}, {}, 10).empty());
    EXPECT_TRUE(engine.fuse({lex(1, 1.0)}, {}, 0).empty());
}
