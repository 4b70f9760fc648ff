#include "docintel/SubsectionRefiner.hpp"

#include <algorithm>
#include <cctype>

#include "text/TextUtil.hpp"

namespace docintel {

static bool starts_numbered(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    if (i == 0 || i > 3 || i + 1 >= s.size()) return false;
    return (s[i] == '.' || s[i] == ')') && std::isspace(static_cast<unsigned char>(s[i + 1]));
}

static bool starts_bullet(const std::string& s) {
    if (s.rfind("\xE2\x80\xA2", 0) == 0) return true;   // U+2022
    if (s.rfind("\xC2\xB7", 0) == 0) return true;       // U+00B7
    if (s.size() >= 2 && (s[0] == '-' || s[0] == '*') && std::isspace(static_cast<unsigned char>(s[1]))) return true;
    return false;
}

static void append_text(std::string& out, const std::string& s) {
    if (s.empty()) return;
    if (!out.empty()) out.push_back(' ');
    out += s;
}

// Items open at blocks matching `opens`; continuation lines join the open item.
template <class Pred>
static std::vector<Passage> split_items(const std::vector<std::pair<std::string, int>>& lines, Pred opens) {
    std::vector<Passage> out;
    Passage cur;
    bool open = false;

    for (const auto& ln : lines) {
        if (opens(ln.first)) {
            if (open && !cur.text.empty()) out.push_back(cur);
            cur = Passage{};
            cur.page = ln.second;
            open = true;
        } else if (!open) {
            cur.page = ln.second;
            open = true;
        }
        append_text(cur.text, ln.first);
    }
    if (open && !cur.text.empty()) out.push_back(cur);
    return out;
}

struct Sentence {
    std::string text;
    size_t offset = 0;   // position of the first character in the joined body
};

static std::vector<Sentence> split_sentences(const std::string& text) {
    std::vector<Sentence> out;
    std::string cur;
    size_t start = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (cur.empty()) {
            if (std::isspace(static_cast<unsigned char>(c))) continue;
            start = i;
        }
        cur.push_back(c);
        const bool end = (c == '.' || c == '!' || c == '?') &&
                         (i + 1 == text.size() || std::isspace(static_cast<unsigned char>(text[i + 1])));
        if (end) {
            out.push_back(Sentence{textutil::trim(cur), start});
            cur.clear();
        }
    }
    const std::string t = textutil::trim(cur);
    if (!t.empty()) out.push_back(Sentence{t, start});
    return out;
}

// page of the line that contains `offset`; line_starts is ordered by offset
static int page_at(const std::vector<std::pair<size_t, int>>& line_starts, size_t offset) {
    int page = line_starts.front().second;
    for (const auto& ls : line_starts) {
        if (ls.first > offset) break;
        page = ls.second;
    }
    return page;
}

std::vector<Passage> split_passages(const Section& section, const RefinerConfig& cfg) {
    std::vector<std::pair<std::string, int>> lines;
    for (const auto& b : section.body) {
        const std::string t = textutil::trim(b.block.text);
        if (!t.empty()) lines.emplace_back(t, b.block.page);
    }
    if (lines.empty()) return {};

    auto count_if_lines = [&](bool (*pred)(const std::string&)) {
        size_t n = 0;
        for (const auto& ln : lines) {
            if (pred(ln.first)) ++n;
        }
        return n;
    };

    if (count_if_lines(starts_numbered) >= 2) return split_items(lines, starts_numbered);
    if (count_if_lines(starts_bullet) >= 2) return split_items(lines, starts_bullet);

    std::string body;
    std::vector<std::pair<size_t, int>> line_starts;
    for (const auto& ln : lines) {
        if (!body.empty()) body.push_back(' ');
        line_starts.emplace_back(body.size(), ln.second);
        body += ln.first;
    }

    if (body.size() <= 2 * cfg.group_chars) return {Passage{body, lines.front().second}};

    std::vector<Passage> out;
    Passage cur;
    for (const auto& s : split_sentences(body)) {
        if (cur.text.empty()) cur.page = page_at(line_starts, s.offset);
        append_text(cur.text, s.text);
        if (cur.text.size() > cfg.group_chars) {
            out.push_back(cur);
            cur = Passage{};
        }
    }
    if (!cur.text.empty()) out.push_back(cur);
    return out;
}

static double passage_score(const Passage& p, const SimilarityEngine& engine, const RefinerConfig& cfg) {
    std::vector<std::string> terms = textutil::content_terms(p.text);
    std::vector<std::string> phrases = textutil::phrase_terms(terms);
    terms.insert(terms.end(), phrases.begin(), phrases.end());

    const double len = std::min((double)p.text.size() / 500.0, 1.0);
    return engine.lexical(terms) + cfg.length_bonus * len;
}

std::vector<RefinedText> refine(
    const RankedOutput& ranked,
    const SimilarityEngine& engine,
    const RefinerConfig& cfg
) {
    std::vector<RefinedText> out;

    for (const auto& e : ranked.entries) {
        if (out.size() >= cfg.max_total) break;

        const Section& sec = e.scored.section;
        std::vector<Passage> passages = split_passages(sec, cfg);
        if (passages.empty()) continue;

        std::vector<Passage> kept;
        for (const auto& p : passages) {
            if (p.text.size() >= cfg.min_chars) kept.push_back(p);
        }
        if (kept.empty()) {
            auto longest = std::max_element(passages.begin(), passages.end(),
                [](const Passage& a, const Passage& b) { return a.text.size() < b.text.size(); });
            kept.push_back(*longest);
        }

        std::vector<RefinedText> local;
        local.reserve(kept.size());
        for (const auto& p : kept) {
            RefinedText r;
            r.doc_id = sec.doc_id;
            r.text = p.text;
            r.page = p.page;
            r.score = passage_score(p, engine, cfg);
            r.rank = e.rank;
            local.push_back(std::move(r));
        }

        // stable: equal scores keep reading order
        std::stable_sort(local.begin(), local.end(),
            [](const RefinedText& a, const RefinedText& b) { return a.score > b.score; });

        for (size_t i = 0; i < local.size() && i < cfg.max_per_section && out.size() < cfg.max_total; ++i) {
            out.push_back(local[i]);
        }
    }

    return out;
}

std::vector<RefinedText> refine(
    const RankedOutput& ranked,
    const PersonaProfile& profile,
    const RefinerConfig& cfg
) {
    const SimilarityEngine engine(profile, nullptr, nullptr);
    return refine(ranked, engine, cfg);
}

}  // namespace docintel
