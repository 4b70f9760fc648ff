#pragma once
#include <string>
#include <vector>

namespace textutil {

// lowercase, keep letters/digits/+/#, turn everything else into spaces, collapse spaces
std::string normalize(const std::string& s);

// split normalized text on spaces, drop single-character tokens
std::vector<std::string> tokenize(const std::string& normalized);

bool is_stopword(const std::string& token);

// light plural folding: "days" -> "day", "activities" -> "activity"
std::string stem(const std::string& token);

// normalize + tokenize + drop stopwords/numbers + stem, in text order
std::vector<std::string> content_terms(const std::string& text);

// adjacent term bigrams joined by a space ("college friend")
std::vector<std::string> phrase_terms(const std::vector<std::string>& terms);

// sorted unique content terms plus phrase terms
std::vector<std::string> vocabulary(const std::string& text);

size_t word_count(const std::string& text);

std::string trim(const std::string& s);

// at most max_bytes of s, never splitting a UTF-8 sequence
std::string utf8_prefix(const std::string& s, size_t max_bytes);

}
