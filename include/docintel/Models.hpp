#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

namespace docintel {

struct TextBlock {
    std::string text;
    int page = 0;             // >= 0, as reported by the extractor
    double font_size = 0.0;
    bool is_bold = false;
    double x = 0.0;
    double y = 0.0;           // top of the line, grows downwards
    int block_index = 0;      // position in the document's block stream
};

// Declared in order of significance: TITLE is the most significant.
enum class HeadingLevel {
    Title,
    H1,
    H2,
    H3,
    H4,
    Body
};

inline int level_rank(HeadingLevel l) { return static_cast<int>(l); }

const char* level_name(HeadingLevel l);

struct LabeledBlock {
    TextBlock block;
    HeadingLevel level = HeadingLevel::Body;
    double score = 0.0;       // headingness in [0,1]
};

struct FontStats {
    double min = 0.0;
    double median = 0.0;
    double p75 = 0.0;
    double p90 = 0.0;
    double max = 0.0;
    size_t count = 0;
};

struct Section {
    std::string doc_id;
    LabeledBlock heading;              // level != Body
    std::vector<LabeledBlock> body;    // Body blocks owned by this heading, in order
    int page_start = 0;
    int page_end = 0;
    int parent = -1;                   // index of enclosing section in the same document

    std::string body_text() const;
    size_t body_word_count() const;
};

struct Requirements {
    int group_size = 0;                    // 0 when not stated
    std::string duration;                  // "4 days", "" when not stated
    std::vector<std::string> special_needs;
};

struct PersonaProfile {
    std::string persona;
    std::string job;

    std::set<std::string> role_keywords;
    std::set<std::string> task_keywords;

    // Sums to 1.0 unless both texts are empty.
    std::map<std::string, double> weighted_terms;

    std::string persona_type;
    Requirements requirements;
};

struct ComponentScores {
    double semantic = 0.0;
    double lexical = 0.0;
    double structural = 0.0;
    bool semantic_available = true;
};

struct ScoredSection {
    Section section;
    double relevance_score = 0.0;
    ComponentScores components;
    std::vector<std::string> vocabulary;        // sorted unique terms of heading + body
    std::vector<std::string> body_vocabulary;   // sorted unique terms of the body alone
    std::string parent_heading;                 // heading of section.parent, "" at top level
};

struct RankedEntry {
    int rank = 0;                  // 1-based
    ScoredSection scored;
    double marginal_score = 0.0;   // relevance minus diversity penalty when picked
    double redundancy = 0.0;       // overlap with the earlier picks
};

struct SelectionDecision {
    std::string doc_id;
    std::string heading;
    int page = 0;
    bool accepted = false;
    std::string reason;            // selected | below_floor | near_duplicate | not_reached
};

struct RankedOutput {
    std::vector<RankedEntry> entries;
    double floor = 0.0;
    std::vector<SelectionDecision> decisions;
};

struct OutlineEntry {
    HeadingLevel level = HeadingLevel::H1;
    std::string text;
    int page = 0;
};

struct DocumentOutline {
    std::string title;
    std::vector<OutlineEntry> entries;
};

}  // namespace docintel
