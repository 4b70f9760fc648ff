#include "docintel/LayoutClassifier.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <set>
#include <tuple>
#include <unordered_set>

#include "text/TextUtil.hpp"

namespace docintel {

static double clamp01(double x) {
    if (x < 0.0) return 0.0;
    if (x > 1.0) return 1.0;
    return x;
}

// linear interpolation between closest ranks; v must be sorted
static double percentile(const std::vector<double>& v, double q) {
    if (v.empty()) return 0.0;
    const double pos = q * static_cast<double>(v.size() - 1);
    const size_t lo = static_cast<size_t>(std::floor(pos));
    const size_t hi = std::min(lo + 1, v.size() - 1);
    const double frac = pos - static_cast<double>(lo);
    return v[lo] + (v[hi] - v[lo]) * frac;
}

static std::string to_lower_copy(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

FontStats compute_font_stats(const std::vector<TextBlock>& blocks) {
    FontStats st;
    if (blocks.empty()) return st;

    std::vector<double> sizes;
    sizes.reserve(blocks.size());
    for (const auto& b : blocks) sizes.push_back(b.font_size);
    std::sort(sizes.begin(), sizes.end());

    st.count = sizes.size();
    st.min = sizes.front();
    st.max = sizes.back();
    st.median = percentile(sizes, 0.50);
    st.p75 = percentile(sizes, 0.75);
    st.p90 = percentile(sizes, 0.90);
    return st;
}

std::vector<TextBlock> dedupe_blocks(const std::vector<TextBlock>& blocks) {
    std::set<std::tuple<std::string, int, long>> seen;

    std::vector<TextBlock> out;
    out.reserve(blocks.size());

    for (const auto& b : blocks) {
        std::string text = textutil::trim(b.text);
        if (text.empty()) continue;

        const long y_key = std::lround(b.y * 10.0);
        if (!seen.emplace(to_lower_copy(text), b.page, y_key).second) continue;

        TextBlock kept = b;
        kept.text = std::move(text);
        out.push_back(std::move(kept));
    }
    return out;
}

// ---------- pattern features ----------

static std::vector<std::string> split_words(const std::string& s) {
    std::vector<std::string> words;
    std::string cur;
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!cur.empty()) {
                words.push_back(cur);
                cur.clear();
            }
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) words.push_back(cur);
    return words;
}

// "1 Intro", "2. Scope", "3.1 Detail", "4.2.1. Deep"
static bool starts_with_numbering(const std::string& s) {
    size_t i = 0;
    bool any_digit = false;
    while (i < s.size()) {
        size_t j = i;
        while (j < s.size() && std::isdigit(static_cast<unsigned char>(s[j]))) ++j;
        if (j == i) break;
        any_digit = true;
        i = j;
        if (i < s.size() && s[i] == '.') {
            ++i;
            continue;
        }
        break;
    }
    if (!any_digit || i >= s.size() || s[i] != ' ') return false;
    while (i < s.size() && s[i] == ' ') ++i;
    return i < s.size() && std::isalpha(static_cast<unsigned char>(s[i]));
}

// "A. Overview"
static bool starts_with_letter_numbering(const std::string& s) {
    return s.size() >= 4 && std::isupper(static_cast<unsigned char>(s[0])) && s[1] == '.' &&
           s[2] == ' ' && std::isalpha(static_cast<unsigned char>(s[3]));
}

// "IV. Results"
static bool starts_with_roman(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && (s[i] == 'I' || s[i] == 'V' || s[i] == 'X')) ++i;
    if (i == 0 || i + 1 >= s.size()) return false;
    return s[i] == '.' && s[i + 1] == ' ';
}

static bool starts_with_heading_keyword(const std::vector<std::string>& words) {
    static const std::unordered_set<std::string> kw = {
        "chapter", "section", "part", "appendix", "introduction", "conclusion",
        "conclusions", "summary", "abstract", "overview", "background", "references",
        "acknowledgements", "acknowledgments", "methodology", "results", "discussion",
        "bibliography", "glossary", "preface"
    };
    if (words.empty()) return false;
    std::string w = to_lower_copy(words.front());
    while (!w.empty() && !std::isalpha(static_cast<unsigned char>(w.back()))) w.pop_back();
    return kw.find(w) != kw.end();
}

static bool is_all_caps(const std::string& s) {
    int letters = 0;
    for (unsigned char c : s) {
        if (std::islower(c)) return false;
        if (std::isupper(c)) ++letters;
    }
    return letters >= 2;
}

static bool is_title_case(const std::vector<std::string>& words) {
    if (words.empty()) return false;
    if (!std::isupper(static_cast<unsigned char>(words.front()[0]))) return false;

    int non_stop = 0;
    int capitalized = 0;
    for (size_t i = 1; i < words.size(); ++i) {
        const std::string lw = to_lower_copy(words[i]);
        if (textutil::is_stopword(lw)) continue;
        ++non_stop;
        if (std::isupper(static_cast<unsigned char>(words[i][0]))) ++capitalized;
    }
    return non_stop == 0 || static_cast<double>(capitalized) / non_stop > 0.7;
}

double pattern_score(const std::string& raw) {
    const std::string text = textutil::trim(raw);
    if (text.empty()) return 0.0;

    const auto words = split_words(text);
    if (text.back() == '.' && words.size() > 3) return 0.0;

    double s = 0.0;
    if (starts_with_numbering(text)) s = std::max(s, 1.0);
    if (starts_with_heading_keyword(words)) s = std::max(s, 1.0);
    if (starts_with_roman(text)) s = std::max(s, 0.8);
    if (is_all_caps(text)) s = std::max(s, 0.7);
    if (starts_with_letter_numbering(text)) s = std::max(s, 0.6);
    if (is_title_case(words)) s = std::max(s, 0.5);
    return s;
}

// ---------- composite score ----------

std::vector<HeadingFeatures> extract_features(
    const std::vector<TextBlock>& blocks,
    const FontStats& stats,
    const ClassifierConfig& cfg
) {
    std::vector<HeadingFeatures> out(blocks.size());
    if (blocks.empty()) return out;

    std::vector<double> sizes;
    sizes.reserve(blocks.size());
    for (const auto& b : blocks) sizes.push_back(b.font_size);
    std::sort(sizes.begin(), sizes.end());

    // page extents for relative y
    std::map<int, std::pair<double, double>> page_y;
    for (const auto& b : blocks) {
        auto it = page_y.find(b.page);
        if (it == page_y.end()) {
            page_y.emplace(b.page, std::make_pair(b.y, b.y));
        } else {
            it->second.first = std::min(it->second.first, b.y);
            it->second.second = std::max(it->second.second, b.y);
        }
    }

    const double n = static_cast<double>(blocks.size());
    const double spread = stats.max - stats.median;

    for (size_t i = 0; i < blocks.size(); ++i) {
        const TextBlock& b = blocks[i];
        HeadingFeatures& f = out[i];

        // (a) font size rank
        const size_t smaller = static_cast<size_t>(
            std::lower_bound(sizes.begin(), sizes.end(), b.font_size) - sizes.begin());
        const double pct = static_cast<double>(smaller) / n;
        const double rel = spread > 0.0 ? clamp01((b.font_size - stats.median) / spread) : 0.0;
        f.font = 0.5 * pct + 0.5 * rel;
        if (spread > 0.0 && b.font_size > stats.median && b.font_size >= stats.p90) {
            f.font = std::max(f.font, 0.75);
        }

        // (b) bold
        f.bold = b.is_bold ? 1.0 : 0.0;

        // (c) short length
        const size_t wc = textutil::word_count(b.text);
        if (wc >= 1 && wc <= 8) f.short_len = 1.0;
        else if (wc >= 1 && static_cast<int>(wc) <= cfg.short_words) f.short_len = 0.5;
        else f.short_len = 0.0;

        // (d) top of page / isolated line
        const bool first_on_page = (i == 0) || (blocks[i - 1].page != b.page);
        const auto& ext = page_y[b.page];
        const double range = ext.second - ext.first;
        const double rel_y = range > 0.0 ? (b.y - ext.first) / range : 0.0;
        const bool top = first_on_page || rel_y < cfg.top_of_page;

        bool isolated = first_on_page;
        if (!first_on_page) {
            const TextBlock& prev = blocks[i - 1];
            const double gap = b.y - prev.y;
            isolated = gap > cfg.isolation_gap * std::max(prev.font_size, 1.0);
        }
        f.position = 0.5 * (top ? 1.0 : 0.0) + 0.5 * (isolated ? 1.0 : 0.0);

        // (e) numbering / keyword / capitalization patterns
        f.pattern = pattern_score(b.text);
    }

    return out;
}

LevelThresholds compute_thresholds(const std::vector<double>& scores, const ClassifierConfig& cfg) {
    LevelThresholds t;
    if (scores.empty()) return t;

    std::vector<double> sorted = scores;
    std::sort(sorted.begin(), sorted.end());

    const double median = percentile(sorted, 0.50);
    const double top = sorted.back();
    const double spread = top - median;

    if (spread < cfg.min_spread || top < cfg.min_heading_score) return t;

    auto at = [&](double frac) { return std::max(median + frac * spread, cfg.min_heading_score); };

    t.any_headings = true;
    t.title = at(cfg.f_title);
    t.h1 = at(cfg.f_h1);
    t.h2 = at(cfg.f_h2);
    t.h3 = at(cfg.f_h3);
    t.h4 = at(cfg.f_h4);
    return t;
}

static HeadingLevel level_for(double s, const LevelThresholds& t) {
    if (!t.any_headings) return HeadingLevel::Body;
    if (s >= t.h1) return HeadingLevel::H1;   // title candidates included; the pick happens later
    if (s >= t.h2) return HeadingLevel::H2;
    if (s >= t.h3) return HeadingLevel::H3;
    if (s >= t.h4) return HeadingLevel::H4;
    return HeadingLevel::Body;
}

std::vector<LabeledBlock> classify(
    const std::vector<TextBlock>& blocks,
    const FontStats& stats,
    const ClassifierConfig& cfg
) {
    std::vector<LabeledBlock> out;
    if (blocks.empty()) return out;

    double wsum = cfg.w_font + cfg.w_bold + cfg.w_short + cfg.w_position + cfg.w_pattern;
    if (wsum <= 0.0) wsum = 1.0;

    const auto feats = extract_features(blocks, stats, cfg);

    std::vector<double> scores;
    scores.reserve(blocks.size());
    for (const auto& f : feats) {
        const double s = (cfg.w_font * f.font + cfg.w_bold * f.bold + cfg.w_short * f.short_len +
                          cfg.w_position * f.position + cfg.w_pattern * f.pattern) / wsum;
        scores.push_back(clamp01(s));
    }

    const LevelThresholds t = compute_thresholds(scores, cfg);

    out.reserve(blocks.size());
    for (size_t i = 0; i < blocks.size(); ++i) {
        LabeledBlock lb;
        lb.block = blocks[i];
        lb.score = scores[i];
        lb.level = level_for(scores[i], t);
        out.push_back(std::move(lb));
    }

    // Exactly one TITLE: best score above the title cutoff, larger font on ties, then earlier.
    if (t.any_headings) {
        int best = -1;
        for (int i = 0; i < static_cast<int>(out.size()); ++i) {
            if (out[i].score < t.title) continue;
            if (best < 0) {
                best = i;
                continue;
            }
            const auto& a = out[i];
            const auto& b = out[best];
            if (a.score > b.score || (a.score == b.score && a.block.font_size > b.block.font_size)) {
                best = i;
            }
        }
        if (best >= 0) out[best].level = HeadingLevel::Title;
    }

    return out;
}

std::string clean_title(const std::string& text) {
    std::string t = textutil::trim(text);

    static const char* prefixes[] = {
        "RFP:", "Request for Proposal:", "Document:", "Report:", "Title:"
    };
    for (const char* p : prefixes) {
        const std::string pre = to_lower_copy(p);
        if (to_lower_copy(t.substr(0, pre.size())) == pre) {
            t = textutil::trim(t.substr(pre.size()));
        }
    }

    // leading "1. " / "2 " / "A. "
    size_t i = 0;
    while (i < t.size() && std::isdigit(static_cast<unsigned char>(t[i]))) ++i;
    if (i > 0) {
        size_t j = i;
        if (j < t.size() && t[j] == '.') ++j;
        if (j < t.size() && t[j] == ' ') t = textutil::trim(t.substr(j));
    } else if (starts_with_letter_numbering(t)) {
        t = textutil::trim(t.substr(2));
    }

    if (t.size() < 3) return "";

    bool any_alnum = false;
    for (unsigned char c : t) {
        if (std::isalnum(c)) {
            any_alnum = true;
            break;
        }
    }
    if (!any_alnum) return "";

    if (t.size() > 100) t = textutil::utf8_prefix(t, 97) + "...";
    return t;
}

DocumentOutline build_outline(const std::vector<LabeledBlock>& labeled) {
    DocumentOutline o;

    for (const auto& lb : labeled) {
        if (lb.level == HeadingLevel::Title) {
            o.title = clean_title(lb.block.text);
            continue;
        }
        if (lb.level == HeadingLevel::Body) continue;

        OutlineEntry e;
        e.level = lb.level;
        e.text = textutil::trim(lb.block.text);
        e.page = lb.block.page;
        o.entries.push_back(std::move(e));
    }

    return o;
}

}  // namespace docintel
