#include <verity/text/utf8.h>
#include <verity/text/word_tokenizer.h>

#include <cctype>

namespace verity::text {

namespace {

// Non-ASCII code points that separate words: Latin-1 punctuation and symbols, general
// punctuation (dashes, curly quotes), CJK punctuation and the byte order mark
bool isUnicodeSeparator(char32_t cp) {
    return (cp >= 0x80 && cp <= 0xBF) || cp == 0xD7 || cp == 0xF7 ||
           (cp >= 0x2000 && cp <= 0x206F) || (cp >= 0x3000 && cp <= 0x303F) || cp == 0xFEFF;
}

} // namespace

std::vector<std::string> tokenizeWords(std::string_view text) {
    std::vector<std::string> tokens;
    std::string current;
    auto flush = [&]() {
        if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    };

    for (size_t i = 0; i < text.size();) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (c < 0x80) {
            if (std::isalnum(c)) {
                current.push_back(static_cast<char>(std::tolower(c)));
            } else {
                flush();
            }
            ++i;
            continue;
        }

        const size_t len = utf8SequenceLength(text, i);
        if (len == 0) {
            flush();
            ++i;
            continue;
        }
        if (isUnicodeSeparator(decodeUtf8(text, i, len))) {
            flush();
        } else {
            current.append(text.substr(i, len));
        }
        i += len;
    }
    flush();
    return tokens;
}

std::unordered_set<std::string> termSet(std::string_view text) {
    auto tokens = tokenizeWords(text);
    return {std::make_move_iterator(tokens.begin()), std::make_move_iterator(tokens.end())};
}

double jaccard(std::string_view a, std::string_view b) {
    auto as = termSet(a);
    auto bs = termSet(b);
    if (as.empty() || bs.empty()) {
        return 0.0;
    }
    const auto& small = as.size() <= bs.size() ? as : bs;
    const auto& large = as.size() <= bs.size() ? bs : as;
    size_t inter = 0;
    for (const auto& t : small) {
        if (large.count(t)) {
            ++inter;
        }
    }
    size_t uni = as.size() + bs.size() - inter;
    return static_cast<double>(inter) / static_cast<double>(uni);
}

size_t countWords(std::string_view text) {
    size_t count = 0;
    bool inWord = false;
    for (char ch : text) {
        if (std::isspace(static_cast<unsigned char>(ch))) {
            inWord = false;
        } else if (!inWord) {
            inWord = true;
            ++count;
        }
    }
    return count;
}

} // namespace verity::text
