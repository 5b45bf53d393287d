#pragma once

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace verity::text {

// Runs of word characters: ASCII alphanumerics (lower-cased) and non-ASCII letters, kept as
// UTF-8. ASCII punctuation, whitespace, Unicode punctuation and malformed bytes separate tokens.
std::vector<std::string> tokenizeWords(std::string_view text);

std::unordered_set<std::string> termSet(std::string_view text);

// Jaccard similarity of the two texts' term sets; 0 when either side has no terms
double jaccard(std::string_view a, std::string_view b);

// Whitespace-delimited word count
size_t countWords(std::string_view text);

} // namespace verity::text
