#pragma once

#include <verity/core/types.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace verity::text {

/**
 * @brief Model inputs for one encoded sequence, padded to a fixed length
 */
struct EncodedSequence {
    std::vector<int64_t> inputIds;
    std::vector<int64_t> attentionMask;
    std::vector<int64_t> tokenTypeIds;
};

/**
 * @brief BERT-style WordPiece tokenizer driven by a vocab.txt (one token per line, id = line
 * number).
 *
 * Basic tokenization lower-cases, splits on whitespace, and isolates ASCII punctuation. Each word is
 * then split greedily into the longest vocabulary prefixes, continuation pieces carrying the "##"
 * marker. Words with no valid split map to [UNK].
 */
class WordPieceTokenizer {
public:
    explicit WordPieceTokenizer(std::unordered_map<std::string, int64_t> vocab);

    static Result<WordPieceTokenizer> fromFile(const std::filesystem::path& vocabPath);

    std::vector<int64_t> tokenize(std::string_view text) const;

    // [CLS] text [SEP] [PAD]...
    EncodedSequence encode(std::string_view text, size_t maxLength) const;

    // [CLS] query [SEP] document [SEP] [PAD]...; the query keeps at most a third of the budget
    EncodedSequence encodePair(std::string_view query, std::string_view document,
                               size_t maxLength) const;

    size_t vocabSize() const { return vocab_.size(); }
    int64_t clsId() const { return clsId_; }
    int64_t sepId() const { return sepId_; }
    int64_t padId() const { return padId_; }
    int64_t unkId() const { return unkId_; }

private:
    std::vector<std::string> basicTokenize(std::string_view text) const;
    void wordPiece(const std::string& word, std::vector<int64_t>& out) const;
    int64_t idOr(const std::string& token, int64_t fallback) const;

    std::unordered_map<std::string, int64_t> vocab_;
    int64_t clsId_ = 101;
    int64_t sepId_ = 102;
    int64_t padId_ = 0;
    int64_t unkId_ = 100;
    size_t maxWordChars_ = 100;
};

} // namespace verity::text
