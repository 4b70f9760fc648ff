#include "docintel/SimilarityEngine.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

#include "docintel/PersonaProfiler.hpp"
#include "text/TextUtil.hpp"

namespace docintel {

static double clamp01(double x) {
    if (x < 0.0) return 0.0;
    if (x > 1.0) return 1.0;
    return x;
}

ScoreConfig normalized(const ScoreConfig& cfg) {
    if (cfg.w_semantic < 0.0 || cfg.w_lexical < 0.0 || cfg.w_structural < 0.0) {
        throw std::invalid_argument("score weights must be non-negative");
    }
    if (cfg.role_weight < 0.0 || cfg.task_weight < 0.0) {
        throw std::invalid_argument("role/task weights must be non-negative");
    }

    const double sum = cfg.w_semantic + cfg.w_lexical + cfg.w_structural;
    if (sum <= 0.0) throw std::invalid_argument("score weights sum to zero");

    ScoreConfig out = cfg;
    out.w_semantic /= sum;
    out.w_lexical /= sum;
    out.w_structural /= sum;

    const double rt = cfg.role_weight + cfg.task_weight;
    if (rt <= 0.0) throw std::invalid_argument("role/task weights sum to zero");
    out.role_weight /= rt;
    out.task_weight /= rt;

    return out;
}

std::string section_embedding_text(const Section& section, size_t n_body_words) {
    std::string out = textutil::trim(section.heading.block.text);

    size_t taken = 0;
    for (const auto& b : section.body) {
        std::istringstream ss(b.block.text);
        std::string w;
        while (taken < n_body_words && ss >> w) {
            out.push_back(' ');
            out += w;
            ++taken;
        }
        if (taken >= n_body_words) break;
    }
    return out;
}

std::vector<std::string> section_terms(const Section& section) {
    std::vector<std::string> terms = textutil::content_terms(section.heading.block.text);
    std::vector<std::string> body = textutil::content_terms(section.body_text());
    terms.insert(terms.end(), body.begin(), body.end());

    std::vector<std::string> phrases = textutil::phrase_terms(terms);
    terms.insert(terms.end(), phrases.begin(), phrases.end());
    return terms;
}

SimilarityEngine::SimilarityEngine(
    PersonaProfile profile,
    const Embedder* embedder,
    const IdfTable* idf,
    const ScoreConfig& cfg
)
    : m_profile(std::move(profile)), m_emb(embedder), m_idf(idf), m_cfg(normalized(cfg)) {
    if (m_emb) {
        const std::string q = embedding_query(m_profile);
        if (!q.empty()) m_profile_vec = m_emb->embed(q);
    }
}

double SimilarityEngine::idf(const std::string& term) const {
    return m_idf ? m_idf->idf(term) : 1.0;
}

double SimilarityEngine::semantic(const std::string& text, bool* available) const {
    if (available) *available = false;
    if (!m_emb || m_profile_vec.empty()) return 0.0;

    const std::vector<float> v = m_emb->embed(text);
    if (v.empty() || v.size() != m_profile_vec.size()) return 0.0;

    if (available) *available = true;
    return clamp01((double)cosine(v, m_profile_vec));
}

double SimilarityEngine::side_cosine(
    const std::unordered_map<std::string, double>& section_vec,
    double section_norm,
    const std::set<std::string>& keywords
) const {
    double dot = 0.0;
    double pnorm2 = 0.0;

    for (const auto& k : keywords) {
        auto wit = m_profile.weighted_terms.find(k);
        if (wit == m_profile.weighted_terms.end()) continue;

        const double pw = wit->second * idf(k);
        pnorm2 += pw * pw;

        auto sit = section_vec.find(k);
        if (sit != section_vec.end()) dot += pw * sit->second;
    }

    if (pnorm2 <= 0.0 || section_norm <= 0.0) return -1.0;   // side unavailable
    return clamp01(dot / (std::sqrt(pnorm2) * section_norm));
}

double SimilarityEngine::lexical(const std::vector<std::string>& terms) const {
    std::unordered_map<std::string, uint32_t> tf;
    tf.reserve(terms.size());
    for (const auto& t : terms) tf[t] += 1;

    std::unordered_map<std::string, double> vec;
    vec.reserve(tf.size());
    double norm2 = 0.0;
    for (const auto& kv : tf) {
        // log TF
        const double w = (1.0 + std::log((double)kv.second)) * idf(kv.first);
        vec.emplace(kv.first, w);
        norm2 += w * w;
    }
    const double norm = std::sqrt(norm2);

    const double role = side_cosine(vec, norm, m_profile.role_keywords);
    const double task = side_cosine(vec, norm, m_profile.task_keywords);

    double wsum = 0.0;
    double acc = 0.0;
    if (role >= 0.0) {
        acc += m_cfg.role_weight * role;
        wsum += m_cfg.role_weight;
    }
    if (task >= 0.0) {
        acc += m_cfg.task_weight * task;
        wsum += m_cfg.task_weight;
    }
    if (wsum <= 0.0) return 0.0;
    return clamp01(acc / wsum);
}

static double level_score(HeadingLevel l) {
    switch (l) {
        case HeadingLevel::Title: return 0.9;
        case HeadingLevel::H1: return 1.0;
        case HeadingLevel::H2: return 0.8;
        case HeadingLevel::H3: return 0.65;
        case HeadingLevel::H4: return 0.5;
        default: return 0.3;
    }
}

double SimilarityEngine::structural(const Section& section) const {
    const size_t words = section.body_word_count();

    double length = 1.0;
    if (words == 0) length = 0.2;
    else if (words < m_cfg.min_body_words) length = 0.5;
    else if (words > m_cfg.max_body_words) length = 0.6;

    return clamp01(0.6 * level_score(section.heading.level) + 0.4 * length);
}

ScoredSection SimilarityEngine::score(const Section& section) const {
    ScoredSection out;
    out.section = section;

    const std::vector<std::string> terms = section_terms(section);

    bool available = false;
    out.components.semantic = semantic(section_embedding_text(section, m_cfg.embed_body_words), &available);
    out.components.semantic_available = available;
    out.components.lexical = lexical(terms);
    out.components.structural = structural(section);

    out.relevance_score = combine(out.components);

    out.vocabulary = terms;
    std::sort(out.vocabulary.begin(), out.vocabulary.end());
    out.vocabulary.erase(std::unique(out.vocabulary.begin(), out.vocabulary.end()), out.vocabulary.end());
    out.body_vocabulary = textutil::vocabulary(section.body_text());

    return out;
}

double SimilarityEngine::combine(const ComponentScores& c) const {
    return clamp01(
        m_cfg.w_semantic * c.semantic +
        m_cfg.w_lexical * c.lexical +
        m_cfg.w_structural * c.structural
    );
}

void SimilarityEngine::make_lexical_only(ScoredSection& scored) const {
    scored.components.semantic = 0.0;
    scored.components.semantic_available = false;
    scored.relevance_score = combine(scored.components);
}

ScoredSection score_section(
    const Section& section,
    const PersonaProfile& profile,
    const Embedder* embedder,
    const ScoreConfig& cfg
) {
    const SimilarityEngine engine(profile, embedder, nullptr, cfg);
    return engine.score(section);
}

}  // namespace docintel
