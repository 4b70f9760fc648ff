#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

// Uncased BERT WordPiece over a vocab.txt (one piece per line, line number = id).
class WordPieceTokenizer {
public:
    bool load_vocab(const std::string& vocab_path);

    // [CLS] pieces... [SEP], never longer than max_len ids
    std::vector<int64_t> encode(const std::string& text, size_t max_len) const;

    std::vector<std::string> pieces(const std::string& text) const;

    size_t vocab_size() const { return m_vocab.size(); }

    int64_t unk_id() const { return lookup("[UNK]", 100); }
    int64_t cls_id() const { return lookup("[CLS]", 101); }
    int64_t sep_id() const { return lookup("[SEP]", 102); }

private:
    enum class CharClass { Space, Control, Punct, Word };

    static constexpr size_t kLongestWord = 100;

    std::unordered_map<std::string, int64_t> m_vocab;

    static CharClass classify(unsigned char c);

    std::vector<std::string> split_words(const std::string& text) const;
    void append_pieces(const std::string& word, std::vector<std::string>& out) const;

    int64_t lookup(const std::string& piece, int64_t fallback) const;
};
