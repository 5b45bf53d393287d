#include <verity/config/config_helpers.h>
#include <verity/text/text_splitter.h>
#include <verity/text/utf8.h>

#include <deque>

namespace verity::text {

namespace {

std::vector<std::string> splitOnSeparator(const std::string& text, const std::string& separator) {
    std::vector<std::string> parts;
    if (separator.empty()) {
        return splitCodePoints(text);
    }

    size_t start = 0;
    size_t pos = 0;
    while ((pos = text.find(separator, start)) != std::string::npos) {
        if (pos > start) {
            parts.push_back(text.substr(start, pos - start));
        }
        start = pos + separator.size();
    }
    if (start < text.size()) {
        parts.push_back(text.substr(start));
    }
    return parts;
}

std::string join(const std::deque<std::string>& parts, const std::string& separator) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out += separator;
        }
        out += parts[i];
    }
    return out;
}

} // namespace

RecursiveTextSplitter::RecursiveTextSplitter(SplitterConfig config)
    : config_(std::move(config)), chunkChars_(std::max<size_t>(1, config_.chunkTokens * 4)),
      overlapChars_(config_.overlapTokens * 4) {
    if (overlapChars_ >= chunkChars_) {
        overlapChars_ = chunkChars_ / 2;
    }
    if (config_.separators.empty() || !config_.separators.back().empty()) {
        config_.separators.emplace_back();
    }
}

std::vector<TextChunk> RecursiveTextSplitter::split(const std::string& text) const {
    std::vector<TextChunk> chunks;
    for (auto& piece : recursiveSplit(text, 0)) {
        config::trim(piece);
        if (piece.empty()) {
            continue;
        }
        TextChunk chunk;
        chunk.index = chunks.size();
        chunk.tokenCount = estimateTokenCount(piece);
        chunk.content = std::move(piece);
        chunks.push_back(std::move(chunk));
    }
    return chunks;
}

std::vector<std::string> RecursiveTextSplitter::recursiveSplit(const std::string& text,
                                                               size_t separatorIndex) const {
    std::vector<std::string> results;
    if (text.empty()) {
        return results;
    }

    // First separator present in the text; the empty separator always matches
    size_t idx = separatorIndex;
    while (idx + 1 < config_.separators.size() &&
           text.find(config_.separators[idx]) == std::string::npos) {
        ++idx;
    }
    const std::string& separator = config_.separators[idx];

    std::vector<std::string> small;
    for (auto& piece : splitOnSeparator(text, separator)) {
        if (piece.size() <= chunkChars_) {
            small.push_back(std::move(piece));
            continue;
        }
        if (!small.empty()) {
            auto merged = mergeSplits(small, separator);
            results.insert(results.end(), merged.begin(), merged.end());
            small.clear();
        }
        auto nested = recursiveSplit(piece, idx + 1);
        results.insert(results.end(), nested.begin(), nested.end());
    }
    if (!small.empty()) {
        auto merged = mergeSplits(small, separator);
        results.insert(results.end(), merged.begin(), merged.end());
    }
    return results;
}

std::vector<std::string> RecursiveTextSplitter::mergeSplits(const std::vector<std::string>& splits,
                                                            const std::string& separator) const {
    std::vector<std::string> docs;
    std::deque<std::string> current;
    size_t total = 0;
    const size_t sepLen = separator.size();

    auto joinedSize = [&](size_t add) { return total + add + (current.empty() ? 0 : sepLen); };

    for (const auto& piece : splits) {
        if (joinedSize(piece.size()) > chunkChars_ && !current.empty()) {
            docs.push_back(join(current, separator));
            // Drop from the front until only the overlap remains and the next piece fits
            while (!current.empty() &&
                   (total > overlapChars_ || joinedSize(piece.size()) > chunkChars_)) {
                total -= current.front().size() + (current.size() > 1 ? sepLen : 0);
                current.pop_front();
            }
        }
        total = joinedSize(piece.size());
        current.push_back(piece);
    }
    if (!current.empty()) {
        docs.push_back(join(current, separator));
    }
    return docs;
}

} // namespace verity::text
