#pragma once

#include <string>
#include <vector>

#include "docintel/Models.hpp"

namespace docintel {

struct RankerConfig {
    int k = 5;
    double min_relevance = 0.0;
    double lambda = 0.3;                 // diversity penalty
    double floor_stddev_factor = 0.5;    // floor = max(min_relevance, mean - f * stddev)
    double duplicate_threshold = 0.9;    // vocabulary Jaccard with one pick that drops a candidate
};

// max(min_relevance, mean - f * stddev) over the collection's relevance scores
double adaptive_floor(const std::vector<ScoredSection>& scored, const RankerConfig& cfg);

// |a ∩ b| / |a ∪ b| on sorted unique term lists
double jaccard(const std::vector<std::string>& a, const std::vector<std::string>& b);

// Greedy maximal-marginal-relevance selection. Pure function of its inputs.
RankedOutput rank(const std::vector<ScoredSection>& scored, const RankerConfig& cfg = {});

}  // namespace docintel
