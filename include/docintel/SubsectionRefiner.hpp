#pragma once

#include <string>
#include <vector>

#include "docintel/Models.hpp"
#include "docintel/SimilarityEngine.hpp"

namespace docintel {

struct RefinerConfig {
    size_t min_chars = 100;        // shorter passages are dropped
    size_t group_chars = 200;      // sentence groups close once they pass this length
    size_t max_per_section = 3;
    size_t max_total = 5;
    double length_bonus = 0.1;     // scaled by min(chars / 500, 1)
};

struct RefinedText {
    std::string doc_id;
    std::string text;
    int page = 0;
    double score = 0.0;
    int rank = 0;                  // rank of the section it came from
};

struct Passage {
    std::string text;
    int page = 0;
};

// numbered items, else bullet items, else sentence groups, else the whole body
std::vector<Passage> split_passages(const Section& section, const RefinerConfig& cfg = {});

std::vector<RefinedText> refine(
    const RankedOutput& ranked,
    const SimilarityEngine& engine,
    const RefinerConfig& cfg = {}
);

// lexical-only engine over the profile
std::vector<RefinedText> refine(
    const RankedOutput& ranked,
    const PersonaProfile& profile,
    const RefinerConfig& cfg = {}
);

}  // namespace docintel
