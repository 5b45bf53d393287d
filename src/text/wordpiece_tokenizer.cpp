#include <spdlog/spdlog.h>
#include <verity/text/wordpiece_tokenizer.h>

#include <cctype>
#include <fstream>

namespace verity::text {

WordPieceTokenizer::WordPieceTokenizer(std::unordered_map<std::string, int64_t> vocab)
    : vocab_(std::move(vocab)) {
    clsId_ = idOr("[CLS]", clsId_);
    sepId_ = idOr("[SEP]", sepId_);
    padId_ = idOr("[PAD]", padId_);
    unkId_ = idOr("[UNK]", unkId_);
}

Result<WordPieceTokenizer> WordPieceTokenizer::fromFile(const std::filesystem::path& vocabPath) {
    std::ifstream in(vocabPath);
    if (!in) {
        return Error{ErrorCode::FileNotFound,
                     fmt::format("Cannot open vocabulary file: {}", vocabPath.string())};
    }

    std::unordered_map<std::string, int64_t> vocab;
    std::string line;
    int64_t id = 0;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        vocab.emplace(line, id++);
    }
    if (vocab.empty()) {
        return Error{ErrorCode::InvalidData,
                     fmt::format("Vocabulary file is empty: {}", vocabPath.string())};
    }
    spdlog::debug("[Tokenizer] Loaded {} vocabulary entries from {}", vocab.size(),
                  vocabPath.string());
    return WordPieceTokenizer(std::move(vocab));
}

int64_t WordPieceTokenizer::idOr(const std::string& token, int64_t fallback) const {
    auto it = vocab_.find(token);
    return it == vocab_.end() ? fallback : it->second;
}

std::vector<std::string> WordPieceTokenizer::basicTokenize(std::string_view text) const {
    std::vector<std::string> words;
    std::string current;
    auto flush = [&]() {
        if (!current.empty()) {
            words.push_back(std::move(current));
            current.clear();
        }
    };

    for (char ch : text) {
        auto c = static_cast<unsigned char>(ch);
        if (std::isspace(c) || std::iscntrl(c)) {
            flush();
        } else if (c < 0x80 && std::ispunct(c)) {
            flush();
            words.emplace_back(1, static_cast<char>(c));
        } else {
            current.push_back(static_cast<char>(std::tolower(c)));
        }
    }
    flush();
    return words;
}

void WordPieceTokenizer::wordPiece(const std::string& word, std::vector<int64_t>& out) const {
    if (word.size() > maxWordChars_) {
        out.push_back(unkId_);
        return;
    }

    std::vector<int64_t> pieces;
    size_t start = 0;
    while (start < word.size()) {
        size_t end = word.size();
        int64_t found = -1;
        while (start < end) {
            std::string sub = word.substr(start, end - start);
            if (start > 0) {
                sub.insert(0, "##");
            }
            auto it = vocab_.find(sub);
            if (it != vocab_.end()) {
                found = it->second;
                break;
            }
            --end;
        }
        if (found < 0) {
            out.push_back(unkId_);
            return;
        }
        pieces.push_back(found);
        start = end;
    }
    out.insert(out.end(), pieces.begin(), pieces.end());
}

std::vector<int64_t> WordPieceTokenizer::tokenize(std::string_view text) const {
    std::vector<int64_t> ids;
    for (const auto& word : basicTokenize(text)) {
        wordPiece(word, ids);
    }
    return ids;
}

EncodedSequence WordPieceTokenizer::encode(std::string_view text, size_t maxLength) const {
    EncodedSequence seq;
    auto tokens = tokenize(text);
    const size_t budget = maxLength > 2 ? maxLength - 2 : 0;
    if (tokens.size() > budget) {
        tokens.resize(budget);
    }

    seq.inputIds.reserve(maxLength);
    seq.inputIds.push_back(clsId_);
    seq.inputIds.insert(seq.inputIds.end(), tokens.begin(), tokens.end());
    seq.inputIds.push_back(sepId_);

    seq.attentionMask.assign(seq.inputIds.size(), 1);
    seq.tokenTypeIds.assign(maxLength, 0);
    seq.inputIds.resize(maxLength, padId_);
    seq.attentionMask.resize(maxLength, 0);
    return seq;
}

EncodedSequence WordPieceTokenizer::encodePair(std::string_view query, std::string_view document,
                                               size_t maxLength) const {
    EncodedSequence seq;
    auto queryTokens = tokenize(query);
    auto docTokens = tokenize(document);

    const size_t maxQueryLen = maxLength / 3;
    const size_t maxDocLen = maxLength > maxQueryLen + 3 ? maxLength - maxQueryLen - 3 : 0;
    if (queryTokens.size() > maxQueryLen) {
        queryTokens.resize(maxQueryLen);
    }
    // Unused query budget goes to the document
    const size_t docBudget = maxDocLen + (maxQueryLen - queryTokens.size());
    if (docTokens.size() > docBudget) {
        docTokens.resize(docBudget);
    }

    seq.inputIds.reserve(maxLength);
    seq.tokenTypeIds.reserve(maxLength);

    seq.inputIds.push_back(clsId_);
    seq.inputIds.insert(seq.inputIds.end(), queryTokens.begin(), queryTokens.end());
    seq.inputIds.push_back(sepId_);
    seq.tokenTypeIds.assign(seq.inputIds.size(), 0);

    seq.inputIds.insert(seq.inputIds.end(), docTokens.begin(), docTokens.end());
    seq.inputIds.push_back(sepId_);
    seq.tokenTypeIds.resize(seq.inputIds.size(), 1);

    seq.attentionMask.assign(seq.inputIds.size(), 1);
    seq.inputIds.resize(maxLength, padId_);
    seq.attentionMask.resize(maxLength, 0);
    seq.tokenTypeIds.resize(maxLength, 0);
    return seq;
}

} // namespace verity::text
