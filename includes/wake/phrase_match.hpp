#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace wakescribe {

// Normalizes text (lowercase, strip punctuation except apostrophes, collapse spaces)
std::string normalize_text(const std::string& in);

std::vector<std::string> tokenize(const std::string& s);

// Character-level edit distance (insert/delete/substitute).
int levenshtein(const std::string& a, const std::string& b);

// Where a keyword sits in a tokenized hypothesis. Tokens [begin, end).
// Keywords shorter than this only match as a substring.
constexpr std::size_t kFuzzyMinKeywordLength = 8;

struct KeywordMatch {
    std::size_t begin = 0;
    std::size_t end = 0;
    float confidence = 0.0f;
};

// Locates `keyword` in `normalized_text`; both must already be normalized.
//
// Approach:
// - Plain substring containment scores 1.0; the match covers every token the
//   substring touches ("listen" matches inside "listening").
// - Otherwise, for keywords of at least kFuzzyMinKeywordLength characters,
//   slide a window of the keyword's token count over the text and score
//   1 - levenshtein / max(length) on the space-joined window. Windows more than
//   one edit per keyword token away are skipped.
// - The earliest best-scoring window wins; nullopt below `min_confidence`.
std::optional<KeywordMatch> find_keyword(const std::string& normalized_text,
                                         const std::string& keyword,
                                         float min_confidence);

} // namespace wakescribe
