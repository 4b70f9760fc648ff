#pragma once

#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "docintel/Embedder.hpp"
#include "docintel/IdfTable.hpp"
#include "docintel/Models.hpp"

namespace docintel {

struct ScoreConfig {
    // convex combination; renormalized to sum to 1
    double w_semantic = 0.5;
    double w_lexical = 0.35;
    double w_structural = 0.15;

    // "who is asking" vs "what they need" inside the lexical component
    double role_weight = 0.4;
    double task_weight = 0.6;

    size_t embed_body_words = 64;    // heading + first N body words go to the encoder
    size_t min_body_words = 20;      // thinner bodies get a length penalty
    size_t max_body_words = 800;     // longer bodies get a milder one
};

// Throws std::invalid_argument for negative or all-zero weights.
ScoreConfig normalized(const ScoreConfig& cfg);

// Read-only after construction; score() may run on several threads at once.
class SimilarityEngine {
public:
    SimilarityEngine(
        PersonaProfile profile,
        const Embedder* embedder,
        const IdfTable* idf,
        const ScoreConfig& cfg = {}
    );

    ScoredSection score(const Section& section) const;

    double semantic(const std::string& text, bool* available = nullptr) const;
    double lexical(const std::vector<std::string>& terms) const;
    double structural(const Section& section) const;

    // weighted sum of the components, clamped to [0,1]
    double combine(const ComponentScores& c) const;

    // drops the semantic part and recomputes relevance from the rest
    void make_lexical_only(ScoredSection& scored) const;

    // false when the encoder produced no vector for the profile
    bool semantic_ready() const { return !m_profile_vec.empty(); }

    const PersonaProfile& profile() const { return m_profile; }
    const ScoreConfig& config() const { return m_cfg; }

private:
    PersonaProfile m_profile;
    const Embedder* m_emb = nullptr;
    const IdfTable* m_idf = nullptr;
    ScoreConfig m_cfg;

    std::vector<float> m_profile_vec;

    double idf(const std::string& term) const;
    double side_cosine(
        const std::unordered_map<std::string, double>& section_vec,
        double section_norm,
        const std::set<std::string>& keywords
    ) const;
};

// One-shot scoring without a shared engine (no collection IDF).
ScoredSection score_section(
    const Section& section,
    const PersonaProfile& profile,
    const Embedder* embedder,
    const ScoreConfig& cfg = {}
);

// heading text followed by the first n body words
std::string section_embedding_text(const Section& section, size_t n_body_words);

// content terms + phrases of heading and body, in text order (duplicates kept)
std::vector<std::string> section_terms(const Section& section);

}  // namespace docintel
