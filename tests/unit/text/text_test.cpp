#include <gtest/gtest.h>
#include <verity/text/text_splitter.h>
#include <verity/text/utf8.h>
#include <verity/text/word_tokenizer.h>
#include <verity/text/wordpiece_tokenizer.h>

#include "../../common/temp_dir_scope.h"

#include <fmt/format.h>

#include <fstream>

using namespace verity;
using namespace verity::text;

TEST(WordTokenizerTest, LowercasesAlphanumericRuns) {
    auto tokens = tokenizeWords("Section 4(b): Tenant's DUTIES, re-let");
    EXPECT_EQ(tokens, (std::vector<std::string>{"section", "4", "b", "tenant", "s", "duties", "re",
                                                "let"}));
    EXPECT_TRUE(tokenizeWords("  ,;  ").empty());
}

TEST(WordTokenizerTest, KeepsNonAsciiLettersInsideWords) {
    // U+2013 en dash and U+00AB/U+00BB guillemets separate words like ASCII punctuation
    auto tokens = tokenizeWords("Droit de propri\u00e9t\u00e9 \u2013 \u00abinviolable\u00bb");
    EXPECT_EQ(tokens,
              (std::vector<std::string>{"droit", "de", "propri\u00e9t\u00e9", "inviolable"}));

    EXPECT_EQ(tokenizeWords("\u4e2d\u6587 text"),
              (std::vector<std::string>{"\u4e2d\u6587", "text"}));
    EXPECT_EQ(tokenizeWords("ab\xff" "cd"), (std::vector<std::string>{"ab", "cd"}));
}

TEST(WordTokenizerTest, JaccardUsesSets) {
    EXPECT_DOUBLE_EQ(jaccard("a a b", "b c"), 1.0 / 3.0);
    EXPECT_DOUBLE_EQ(jaccard("Lease", "lease"), 1.0);
    EXPECT_DOUBLE_EQ(jaccard("", "lease"), 0.0);
    EXPECT_EQ(countWords("  two\twords\n"), 2u);
}

namespace {

WordPieceTokenizer smallTokenizer() {
    return WordPieceTokenizer({{"[PAD]", 0},
                               {"[UNK]", 1},
                               {"[CLS]", 2},
                               {"[SEP]", 3},
                               {"the", 4},
                               {"contract", 5},
                               {"##s", 6},
                               {"breach", 7},
                               {",", 8},
                               {"un", 9},
                               {"##able", 10}});
}

} // namespace

TEST(WordPieceTokenizerTest, SplitsIntoLongestVocabularyPieces) {
    auto tok = smallTokenizer();
    EXPECT_EQ(tok.tokenize("Contracts, UNABLE"), (std::vector<int64_t>{5, 6, 8, 9, 10}));
    EXPECT_EQ(tok.tokenize("zzz the"), (std::vector<int64_t>{1, 4}));
    EXPECT_EQ(tok.clsId(), 2);
    EXPECT_EQ(tok.sepId(), 3);
}

TEST(WordPieceTokenizerTest, EncodePadsAndMasks) {
    auto tok = smallTokenizer();
    auto seq = tok.encode("contracts", 8);
    EXPECT_EQ(seq.inputIds, (std::vector<int64_t>{2, 5, 6, 3, 0, 0, 0, 0}));
    EXPECT_EQ(seq.attentionMask, (std::vector<int64_t>{1, 1, 1, 1, 0, 0, 0, 0}));
    EXPECT_EQ(seq.tokenTypeIds, std::vector<int64_t>(8, 0));

    auto truncated = tok.encode("the the the the the the", 4);
    EXPECT_EQ(truncated.inputIds, (std::vector<int64_t>{2, 4, 4, 3}));
}

TEST(WordPieceTokenizerTest, EncodePairMarksSegments) {
    auto tok = smallTokenizer();
    auto seq = tok.encodePair("the breach", "contracts", 12);
    EXPECT_EQ(seq.inputIds, (std::vector<int64_t>{2, 4, 7, 3, 5, 6, 3, 0, 0, 0, 0, 0}));
    EXPECT_EQ(seq.tokenTypeIds, (std::vector<int64_t>{0, 0, 0, 0, 1, 1, 1, 0, 0, 0, 0, 0}));
    EXPECT_EQ(seq.attentionMask, (std::vector<int64_t>{1, 1, 1, 1, 1, 1, 1, 0, 0, 0, 0, 0}));
}

TEST(WordPieceTokenizerTest, EncodePairCapsQueryAtAThird) {
    auto tok = smallTokenizer();
    auto seq = tok.encodePair("the the the the the the", "breach breach breach breach breach", 9);
    // Query keeps 3 tokens, document gets the remaining 3
    EXPECT_EQ(seq.inputIds, (std::vector<int64_t>{2, 4, 4, 4, 3, 7, 7, 7, 3}));
}

TEST(WordPieceTokenizerTest, LoadsVocabularyFile) {
    verity::test::TempDirScope dir("verity-vocab");
    auto path = dir.path() / "vocab.txt";
    {
        std::ofstream out(path);
        out << "[PAD]\n[UNK]\n[CLS]\n[SEP]\nlease\n";
    }
    auto tok = WordPieceTokenizer::fromFile(path);
    ASSERT_TRUE(tok);
    EXPECT_EQ(tok.value().vocabSize(), 5u);
    EXPECT_EQ(tok.value().tokenize("Lease"), (std::vector<int64_t>{4}));

    auto missing = WordPieceTokenizer::fromFile(dir.path() / "none.txt");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::FileNotFound);
}

TEST(TextSplitterTest, ShortTextIsOneChunk) {
    RecursiveTextSplitter splitter;
    auto chunks = splitter.split("  A short clause.  ");
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].content, "A short clause.");
    EXPECT_EQ(chunks[0].index, 0u);
    EXPECT_EQ(chunks[0].tokenCount, estimateTokenCount("A short clause."));
    EXPECT_TRUE(splitter.split("   ").empty());
}

TEST(TextSplitterTest, DefaultsMatchSixHundredTokenChunks) {
    RecursiveTextSplitter splitter;
    EXPECT_EQ(splitter.chunkChars(), 2400u);
    EXPECT_EQ(splitter.overlapChars(), 200u);
}

TEST(TextSplitterTest, LongTextIsSplitWithOverlap) {
    SplitterConfig config;
    config.chunkTokens = 10;  // 40 characters
    config.overlapTokens = 2; // 8 characters
    RecursiveTextSplitter splitter(config);

    std::string text;
    for (int i = 0; i < 30; ++i) {
        if (i > 0)
            text += ' ';
        text += fmt::format("w{:02d}", i);
    }
    auto chunks = splitter.split(text);
    ASSERT_GT(chunks.size(), 3u);

    for (size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].index, i);
        EXPECT_LE(chunks[i].content.size(), 40u);
        if (i + 1 < chunks.size()) {
            auto firstWord = chunks[i + 1].content.substr(0, 3);
            EXPECT_NE(chunks[i].content.find(firstWord), std::string::npos)
                << "chunk " << i + 1 << " does not overlap its predecessor";
        }
    }
    EXPECT_EQ(chunks.front().content.substr(0, 3), "w00");
    EXPECT_EQ(chunks.back().content.substr(chunks.back().content.size() - 3), "w29");
}

TEST(TextSplitterTest, PrefersParagraphBoundaries) {
    SplitterConfig config;
    config.chunkTokens = 10;
    config.overlapTokens = 0;
    RecursiveTextSplitter splitter(config);
    auto chunks = splitter.split("First paragraph here.\n\nSecond paragraph here.");
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].content, "First paragraph here.");
    EXPECT_EQ(chunks[1].content, "Second paragraph here.");
}

TEST(TextSplitterTest, UnbrokenTextFallsBackToCharacters) {
    SplitterConfig config;
    config.chunkTokens = 5; // 20 characters
    config.overlapTokens = 0;
    RecursiveTextSplitter splitter(config);
    auto chunks = splitter.split(std::string(50, 'x'));
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].content.size(), 20u);
    EXPECT_EQ(chunks[2].content.size(), 10u);
}

TEST(TextSplitterTest, UnbrokenMultibyteTextSplitsOnCodePoints) {
    std::string text;
    for (int i = 0; i < 1500; ++i) {
        text += "\u4e2d"; // three bytes in UTF-8
    }
    RecursiveTextSplitter splitter;
    auto chunks = splitter.split(text);
    ASSERT_GE(chunks.size(), 2u);
    for (const auto& chunk : chunks) {
        EXPECT_TRUE(isValidUtf8(chunk.content)) << "chunk " << chunk.index;
        EXPECT_EQ(chunk.content.size() % 3, 0u);
        EXPECT_LE(chunk.content.size(), splitter.chunkChars());
    }
}

TEST(Utf8Test, MeasuresAndValidatesSequences) {
    EXPECT_EQ(utf8SequenceLength("a", 0), 1u);
    EXPECT_EQ(utf8SequenceLength("\u00e9", 0), 2u);
    EXPECT_EQ(utf8SequenceLength("\u4e2d", 0), 3u);
    EXPECT_EQ(utf8SequenceLength("\U0001F600", 0), 4u);
    EXPECT_EQ(decodeUtf8("\u4e2d", 0, 3), U'\u4e2d');

    const std::string truncated = std::string("\u4e2d").substr(0, 2);
    EXPECT_EQ(utf8SequenceLength(truncated, 0), 0u);
    EXPECT_FALSE(isValidUtf8(truncated));
    EXPECT_FALSE(isValidUtf8("\x80"));
    EXPECT_TRUE(isValidUtf8("propri\u00e9t\u00e9"));
    EXPECT_EQ(splitCodePoints("a\u00e9\u4e2d").size(), 3u);
}
