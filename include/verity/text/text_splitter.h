#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

namespace verity::text {

struct SplitterConfig {
    size_t chunkTokens = 600;  // Target chunk size in (estimated) tokens
    size_t overlapTokens = 50; // Trailing context repeated at the start of the next chunk
    std::vector<std::string> separators = {"\n\n", "\n", ". ", " ", ""};
};

struct TextChunk {
    size_t index = 0;
    std::string content;
    size_t tokenCount = 0;
};

// Four characters per token on average
inline size_t estimateTokenCount(const std::string& text) {
    return text.empty() ? 0 : std::max<size_t>(1, text.size() / 4);
}

/**
 * Recursive character splitter. Text is split on the first separator that occurs in it; pieces
 * that are still too large are split again with the remaining separators, and adjacent small
 * pieces are merged back up to the target size with the configured overlap carried between
 * consecutive chunks. The empty separator splits between UTF-8
 * code points, so no chunk ends inside a multi-byte character.
 */
class RecursiveTextSplitter {
public:
    explicit RecursiveTextSplitter(SplitterConfig config = {});

    std::vector<TextChunk> split(const std::string& text) const;

    size_t chunkChars() const { return chunkChars_; }
    size_t overlapChars() const { return overlapChars_; }

private:
    std::vector<std::string> recursiveSplit(const std::string& text, size_t separatorIndex) const;
    std::vector<std::string> mergeSplits(const std::vector<std::string>& splits,
                                         const std::string& separator) const;

    SplitterConfig config_;
    size_t chunkChars_;
    size_t overlapChars_;
};

} // namespace verity::text
