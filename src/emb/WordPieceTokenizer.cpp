#include "emb/WordPieceTokenizer.hpp"
#include <cctype>
#include <fstream>

namespace {

const char* const kUnknown = "[UNK]";

}  // namespace

bool WordPieceTokenizer::load_vocab(const std::string& vocab_path) {
    std::ifstream file(vocab_path);
    if (!file.is_open()) return false;

    std::unordered_map<std::string, int64_t> vocab;
    int64_t next_id = 0;
    for (std::string piece; std::getline(file, piece); ++next_id) {
        while (!piece.empty() && (piece.back() == '\r' || piece.back() == '\n')) piece.pop_back();
        // duplicates keep their first id
        vocab.insert({piece, next_id});
    }
    if (next_id == 0) return false;

    m_vocab.swap(vocab);
    return true;
}

int64_t WordPieceTokenizer::lookup(const std::string& piece, int64_t fallback) const {
    const auto hit = m_vocab.find(piece);
    if (hit != m_vocab.end()) return hit->second;
    return fallback;
}

WordPieceTokenizer::CharClass WordPieceTokenizer::classify(unsigned char c) {
    if (std::isspace(c)) return CharClass::Space;
    if (c < 0x20 || c == 0x7f) return CharClass::Control;
    if (c < 0x80 && std::ispunct(c)) return CharClass::Punct;
    return CharClass::Word;
}

std::vector<std::string> WordPieceTokenizer::split_words(const std::string& text) const {
    std::vector<std::string> words;
    std::string word;

    for (const char ch : text) {
        const unsigned char c = static_cast<unsigned char>(ch);
        switch (classify(c)) {
        case CharClass::Control:
            break;
        case CharClass::Word:
            word += static_cast<char>(std::tolower(c));
            break;
        case CharClass::Punct:
            if (!word.empty()) words.push_back(std::move(word));
            word.clear();
            words.push_back(std::string(1, ch));
            break;
        case CharClass::Space:
            if (!word.empty()) words.push_back(std::move(word));
            word.clear();
            break;
        }
    }
    if (!word.empty()) words.push_back(std::move(word));
    return words;
}

void WordPieceTokenizer::append_pieces(const std::string& word, std::vector<std::string>& out) const {
    if (word.size() > kLongestWord) {
        out.emplace_back(kUnknown);
        return;
    }

    std::vector<std::string> found;
    for (size_t pos = 0; pos < word.size();) {
        const std::string prefix = pos == 0 ? "" : "##";
        size_t len = word.size() - pos;
        for (; len > 0; --len) {
            const std::string candidate = prefix + word.substr(pos, len);
            if (m_vocab.count(candidate) != 0) {
                found.push_back(candidate);
                break;
            }
        }
        // one unmatched span turns the whole word into [UNK]
        if (len == 0) {
            out.emplace_back(kUnknown);
            return;
        }
        pos += len;
    }
    out.insert(out.end(), found.begin(), found.end());
}

std::vector<std::string> WordPieceTokenizer::pieces(const std::string& text) const {
    std::vector<std::string> result;
    for (const std::string& word : split_words(text)) append_pieces(word, result);
    return result;
}

std::vector<int64_t> WordPieceTokenizer::encode(const std::string& text, size_t max_len) const {
    const std::vector<std::string> body = pieces(text);
    const size_t room = max_len > 2 ? max_len - 2 : 0;
    const size_t kept = body.size() < room ? body.size() : room;

    std::vector<int64_t> seq;
    seq.reserve(kept + 2);
    seq.push_back(cls_id());
    const int64_t unk = unk_id();
    for (size_t i = 0; i < kept; ++i) seq.push_back(lookup(body[i], unk));
    seq.push_back(sep_id());
    return seq;
}
