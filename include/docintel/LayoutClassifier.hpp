#pragma once

#include <string>
#include <vector>

#include "docintel/Models.hpp"

namespace docintel {

struct ClassifierConfig {
    // composite score weights (renormalized to sum to 1)
    double w_font = 0.35;
    double w_bold = 0.20;
    double w_short = 0.15;
    double w_position = 0.10;
    double w_pattern = 0.20;

    int short_words = 12;           // N: lines longer than this get no length bonus
    double top_of_page = 0.10;      // relative y below which a line counts as top of page
    double isolation_gap = 1.8;     // gap above, in multiples of the previous line's font size

    // level thresholds as fractions of (max - median) above the median score
    double f_title = 0.90;
    double f_h1 = 0.75;
    double f_h2 = 0.60;
    double f_h3 = 0.45;
    double f_h4 = 0.30;

    double min_heading_score = 0.45;   // absolute floor for any heading
    double min_spread = 0.15;          // flat documents get no headings
};

// Per-document cutoffs, computed once from the document's own score distribution.
struct LevelThresholds {
    bool any_headings = false;
    double title = 1.0;
    double h1 = 1.0;
    double h2 = 1.0;
    double h3 = 1.0;
    double h4 = 1.0;
};

struct HeadingFeatures {
    double font = 0.0;
    double bold = 0.0;
    double short_len = 0.0;
    double position = 0.0;
    double pattern = 0.0;
};

FontStats compute_font_stats(const std::vector<TextBlock>& blocks);

// Drops empty blocks and repeats of the same text at the same spot on the same page.
std::vector<TextBlock> dedupe_blocks(const std::vector<TextBlock>& blocks);

// numbering, chapter keywords, all caps, title case; 0 for sentence-like lines
double pattern_score(const std::string& text);

std::vector<HeadingFeatures> extract_features(
    const std::vector<TextBlock>& blocks,
    const FontStats& stats,
    const ClassifierConfig& cfg = {}
);

LevelThresholds compute_thresholds(const std::vector<double>& scores, const ClassifierConfig& cfg = {});

std::vector<LabeledBlock> classify(
    const std::vector<TextBlock>& blocks,
    const FontStats& stats,
    const ClassifierConfig& cfg = {}
);

std::string clean_title(const std::string& text);

DocumentOutline build_outline(const std::vector<LabeledBlock>& labeled);

}  // namespace docintel
