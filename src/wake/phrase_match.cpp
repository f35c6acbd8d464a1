#include "wake/phrase_match.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace wakescribe {

// ASCII punctuation is dropped, apostrophes survive ("don't").
static bool drops(unsigned char c) {
    return c < 128 && std::ispunct(c) && c != '\'';
}

std::string normalize_text(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    bool pendingSpace = false;
    for (unsigned char c : in) {
        if (std::isspace(c)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (drops(c)) continue;
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

std::vector<std::string> tokenize(const std::string& s) {
    std::vector<std::string> tokens;
    std::istringstream iss(s);
    for (std::string word; iss >> word;) tokens.push_back(std::move(word));
    return tokens;
}

int levenshtein(const std::string& a, const std::string& b) {
    // Single row: row[j] is the distance between the current prefix of a and b[0, j).
    std::vector<int> row(b.size() + 1);
    for (std::size_t j = 0; j < row.size(); ++j) row[j] = static_cast<int>(j);

    for (std::size_t i = 1; i <= a.size(); ++i) {
        int diagonal = row[0];
        row[0] = static_cast<int>(i);
        for (std::size_t j = 1; j <= b.size(); ++j) {
            const int above = row[j];
            const int substitute = diagonal + (a[i - 1] == b[j - 1] ? 0 : 1);
            row[j] = std::min({above + 1, row[j - 1] + 1, substitute});
            diagonal = above;
        }
    }
    return row[b.size()];
}

// Index of the token containing character `pos` of a single-space-joined string.
static std::size_t token_at(const std::string& text, std::size_t pos) {
    return static_cast<std::size_t>(std::count(text.begin(), text.begin() + pos, ' '));
}

static std::string join(const std::vector<std::string>& toks, std::size_t from, std::size_t to) {
    std::string out;
    for (std::size_t i = from; i < to; ++i) {
        if (i > from) out.push_back(' ');
        out += toks[i];
    }
    return out;
}

std::optional<KeywordMatch> find_keyword(const std::string& normalized_text,
                                         const std::string& keyword,
                                         float min_confidence) {
    if (keyword.empty() || normalized_text.empty()) return std::nullopt;

    auto pos = normalized_text.find(keyword);
    if (pos != std::string::npos) {
        KeywordMatch m;
        m.begin = token_at(normalized_text, pos);
        m.end = token_at(normalized_text, pos + keyword.size() - 1) + 1;
        m.confidence = 1.0f;
        return m;
    }

    // One edit in a short keyword is another common word ("start" / "smart").
    if (keyword.size() < kFuzzyMinKeywordLength) return std::nullopt;

    const auto text_tokens = tokenize(normalized_text);
    const std::size_t L = tokenize(keyword).size();
    if (L == 0 || text_tokens.size() < L) return std::nullopt;

    std::optional<KeywordMatch> best;
    for (std::size_t i = 0; i + L <= text_tokens.size(); ++i) {
        const std::string window = join(text_tokens, i, i + L);
        const int d = levenshtein(window, keyword);
        if (static_cast<std::size_t>(d) > L) continue;
        const float longest = static_cast<float>(std::max(window.size(), keyword.size()));
        const float score = 1.0f - static_cast<float>(d) / longest;
        if (!best || score > best->confidence) {
            best = KeywordMatch{i, i + L, score};
        }
    }
    if (best && best->confidence >= min_confidence) return best;
    return std::nullopt;
}

} // namespace wakescribe
