#include "docintel/DiversityRanker.hpp"

#include <algorithm>
#include <cmath>
#include <set>

namespace docintel {

double adaptive_floor(const std::vector<ScoredSection>& scored, const RankerConfig& cfg) {
    if (scored.empty()) return cfg.min_relevance;

    double sum = 0.0;
    for (const auto& s : scored) sum += s.relevance_score;
    const double mean = sum / (double)scored.size();

    double var = 0.0;
    for (const auto& s : scored) {
        const double d = s.relevance_score - mean;
        var += d * d;
    }
    const double stddev = std::sqrt(var / (double)scored.size());

    return std::max(cfg.min_relevance, mean - cfg.floor_stddev_factor * stddev);
}

double jaccard(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    if (a.empty() && b.empty()) return 0.0;

    size_t i = 0, j = 0, inter = 0;
    while (i < a.size() && j < b.size()) {
        if (a[i] == b[j]) {
            ++inter;
            ++i;
            ++j;
        } else if (a[i] < b[j]) {
            ++i;
        } else {
            ++j;
        }
    }
    const size_t uni = a.size() + b.size() - inter;
    return uni == 0 ? 0.0 : (double)inter / (double)uni;
}

// share of the candidate's vocabulary already covered by the picks
static double containment(const std::vector<std::string>& v, const std::set<std::string>& covered) {
    if (v.empty()) return 0.0;
    size_t hit = 0;
    for (const auto& t : v) {
        if (covered.count(t)) ++hit;
    }
    return (double)hit / (double)v.size();
}

// body terms decide when both sides have a body; heading-only sections fall back
// to the full vocabulary
static bool near_duplicate(const ScoredSection& a, const ScoredSection& b, double threshold) {
    if (!a.body_vocabulary.empty() && !b.body_vocabulary.empty()) {
        return jaccard(a.body_vocabulary, b.body_vocabulary) >= threshold;
    }
    return jaccard(a.vocabulary, b.vocabulary) >= threshold;
}

static bool earlier(const ScoredSection& a, const ScoredSection& b) {
    if (a.section.page_start != b.section.page_start) return a.section.page_start < b.section.page_start;
    if (a.section.doc_id != b.section.doc_id) return a.section.doc_id < b.section.doc_id;
    return a.section.heading.block.block_index < b.section.heading.block.block_index;
}

RankedOutput rank(const std::vector<ScoredSection>& scored, const RankerConfig& cfg) {
    RankedOutput res;
    res.floor = adaptive_floor(scored, cfg);

    std::vector<SelectionDecision> decisions(scored.size());
    for (size_t i = 0; i < scored.size(); ++i) {
        decisions[i].doc_id = scored[i].section.doc_id;
        decisions[i].heading = scored[i].section.heading.block.text;
        decisions[i].page = scored[i].section.page_start;
    }

    std::vector<size_t> pool;
    pool.reserve(scored.size());
    for (size_t i = 0; i < scored.size(); ++i) {
        if (scored[i].relevance_score < res.floor) {
            decisions[i].reason = "below_floor";
            continue;
        }
        pool.push_back(i);
    }

    std::vector<size_t> picked;
    std::set<std::string> covered;

    while ((int)picked.size() < cfg.k && !pool.empty()) {
        int best = -1;
        double best_marginal = 0.0;
        double best_overlap = 0.0;

        std::vector<size_t> keep;
        keep.reserve(pool.size());

        for (size_t idx : pool) {
            const ScoredSection& c = scored[idx];

            bool dup = false;
            for (size_t p : picked) {
                if (near_duplicate(c, scored[p], cfg.duplicate_threshold)) {
                    dup = true;
                    break;
                }
            }
            if (dup) {
                decisions[idx].reason = "near_duplicate";
                continue;
            }
            keep.push_back(idx);

            const double overlap = containment(c.vocabulary, covered);
            const double marginal = c.relevance_score - cfg.lambda * overlap;

            bool better = best < 0 || marginal > best_marginal;
            if (!better && marginal == best_marginal) better = earlier(c, scored[(size_t)best]);

            if (better) {
                best = (int)idx;
                best_marginal = marginal;
                best_overlap = overlap;
            }
        }

        pool.swap(keep);
        if (best < 0) break;

        const size_t b = (size_t)best;
        picked.push_back(b);
        covered.insert(scored[b].vocabulary.begin(), scored[b].vocabulary.end());
        pool.erase(std::find(pool.begin(), pool.end(), b));

        RankedEntry e;
        e.rank = (int)picked.size();
        e.scored = scored[b];
        e.marginal_score = best_marginal;
        e.redundancy = best_overlap;
        res.entries.push_back(std::move(e));

        decisions[b].accepted = true;
        decisions[b].reason = "selected";
    }

    for (size_t idx : pool) decisions[idx].reason = "not_reached";

    res.decisions = std::move(decisions);
    return res;
}

}  // namespace docintel
