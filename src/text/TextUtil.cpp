#include "text/TextUtil.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace textutil {

static bool is_term_char(unsigned char c) {
    return std::isalnum(c) != 0 || c == '+' || c == '#';
}

std::string normalize(const std::string& s) {
    std::string result;
    result.reserve(s.size());

    for (const char ch : s) {
        const unsigned char c = static_cast<unsigned char>(ch);
        if (c < 0x80 && is_term_char(c)) {
            result += static_cast<char>(std::tolower(c));
        } else if (!result.empty() && result.back() != ' ') {
            result += ' ';
        }
    }

    while (!result.empty() && result.back() == ' ') result.pop_back();
    return result;
}

std::vector<std::string> tokenize(const std::string& normalized) {
    std::vector<std::string> words;
    size_t pos = 0;
    while (pos < normalized.size()) {
        const size_t stop = std::min(normalized.find(' ', pos), normalized.size());
        std::string word = normalized.substr(pos, stop - pos);
        if (word.size() > 1) words.push_back(std::move(word));
        pos = stop + 1;
    }
    return words;
}

bool is_stopword(const std::string& token) {
    static const std::unordered_set<std::string> stop = {
        "a", "an", "the", "and", "or", "but", "if", "then", "else", "so",
        "in", "on", "at", "to", "for", "of", "with", "by", "from", "into", "onto",
        "as", "is", "are", "was", "were", "be", "been", "being", "am",
        "have", "has", "had", "do", "does", "did", "done",
        "this", "that", "these", "those", "it", "its", "they", "them", "their",
        "we", "our", "us", "you", "your", "he", "she", "his", "her", "him", "my", "me", "i",
        "who", "whom", "which", "what", "when", "where", "why", "how",
        "all", "any", "each", "every", "some", "such", "no", "not", "nor", "only",
        "own", "same", "than", "too", "very", "can", "will", "just", "should", "would",
        "could", "may", "might", "must", "shall", "about", "above", "below", "over",
        "under", "up", "down", "out", "off", "again", "further", "once", "here", "there",
        "also", "more", "most", "other", "both", "few", "between", "through", "during",
        "before", "after", "while", "because", "until", "against", "within", "without",
        "via", "per", "etc"
    };
    return stop.find(token) != stop.end();
}

static bool ends_with(const std::string& s, const char* suffix) {
    const std::string suf(suffix);
    return s.size() >= suf.size() && s.compare(s.size() - suf.size(), suf.size(), suf) == 0;
}

std::string stem(const std::string& token) {
    if (token.size() <= 3) return token;

    if (ends_with(token, "ies") && token.size() > 4) {
        return token.substr(0, token.size() - 3) + "y";
    }
    if (ends_with(token, "sses") || ends_with(token, "xes") ||
        ends_with(token, "ches") || ends_with(token, "shes")) {
        return token.substr(0, token.size() - 2);
    }
    if (ends_with(token, "ss") || ends_with(token, "us") || ends_with(token, "is")) {
        return token;
    }
    if (token.back() == 's') return token.substr(0, token.size() - 1);
    return token;
}

static bool all_digits(const std::string& t) {
    for (char c : t) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return !t.empty();
}

std::vector<std::string> content_terms(const std::string& text) {
    auto toks = tokenize(normalize(text));

    std::vector<std::string> out;
    out.reserve(toks.size());
    for (const auto& t : toks) {
        if (is_stopword(t) || all_digits(t)) continue;
        out.push_back(stem(t));
    }
    return out;
}

std::vector<std::string> phrase_terms(const std::vector<std::string>& terms) {
    std::vector<std::string> out;
    if (terms.size() < 2) return out;

    out.reserve(terms.size() - 1);
    for (size_t i = 0; i + 1 < terms.size(); ++i) {
        out.push_back(terms[i] + " " + terms[i + 1]);
    }
    return out;
}

std::vector<std::string> vocabulary(const std::string& text) {
    std::vector<std::string> terms = content_terms(text);
    std::vector<std::string> phrases = phrase_terms(terms);
    terms.insert(terms.end(), phrases.begin(), phrases.end());

    std::sort(terms.begin(), terms.end());
    terms.erase(std::unique(terms.begin(), terms.end()), terms.end());
    return terms;
}

size_t word_count(const std::string& text) {
    size_t n = 0;
    bool in_word = false;
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            ++n;
        }
    }
    return n;
}

std::string trim(const std::string& s) {
    size_t a = 0;
    while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a]))) ++a;

    size_t b = s.size();
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;

    return s.substr(a, b - a);
}

std::string utf8_prefix(const std::string& s, size_t max_bytes) {
    if (s.size() <= max_bytes) return s;
    size_t cut = max_bytes;
    // continuation bytes look like 10xxxxxx
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) --cut;
    return s.substr(0, cut);
}

}
