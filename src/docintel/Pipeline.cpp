#include "docintel/Pipeline.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <thread>

#include "docintel/IdfTable.hpp"
#include "docintel/SectionAssembler.hpp"

namespace docintel {

using Clock = std::chrono::steady_clock;

const char* status_name(DocStatus s) {
    switch (s) {
        case DocStatus::Ok: return "ok";
        case DocStatus::MalformedInput: return "malformed_input";
        case DocStatus::ThresholdMiss: return "threshold_miss";
        case DocStatus::ModelUnavailable: return "model_unavailable";
        case DocStatus::BudgetExceeded: return "budget_exceeded";
        default: return "unknown";
    }
}

static double ms_since(Clock::time_point t0) {
    return std::chrono::duration<double, std::milli>(Clock::now() - t0).count();
}

unsigned worker_count(unsigned requested, size_t jobs) {
    unsigned n = requested;
    if (n == 0) n = std::thread::hardware_concurrency();
    if (n == 0) n = 1;
    if (jobs > 0 && n > jobs) n = (unsigned)jobs;
    return n;
}

// Workers pull indices from a shared counter until the range is drained.
template <class Fn>
static void parallel_for(size_t n, unsigned threads, Fn fn) {
    if (n == 0) return;

    const unsigned nw = worker_count(threads, n);
    if (nw == 1) {
        for (size_t i = 0; i < n; ++i) fn(i);
        return;
    }

    std::atomic<size_t> next{0};
    std::vector<std::thread> workers;
    workers.reserve(nw);
    for (unsigned w = 0; w < nw; ++w) {
        workers.emplace_back([&]() {
            for (;;) {
                const size_t i = next.fetch_add(1);
                if (i >= n) break;
                fn(i);
            }
        });
    }
    for (auto& t : workers) t.join();
}

DocumentAnalysis analyze_document(
    const std::string& doc_id,
    const std::vector<TextBlock>& blocks,
    const ClassifierConfig& cfg
) {
    DocumentAnalysis a;

    const std::vector<TextBlock> clean = dedupe_blocks(blocks);
    if (clean.empty()) return a;

    const FontStats stats = compute_font_stats(clean);
    a.labeled = classify(clean, stats, cfg);
    a.outline = build_outline(a.labeled);
    a.sections = assemble(doc_id, a.labeled);
    a.orphan_body = count_orphan_body(a.labeled);
    return a;
}

DocumentOutline extract_outline(const std::vector<TextBlock>& blocks, const ClassifierConfig& cfg) {
    return analyze_document("", blocks, cfg).outline;
}

static bool over_budget(double spent_ms, int64_t budget_ms) {
    return budget_ms > 0 && spent_ms > (double)budget_ms;
}

CollectionResult process_collection(
    const std::vector<DocumentInput>& docs,
    const std::string& persona,
    const std::string& job,
    const Embedder* embedder,
    const PipelineConfig& cfg
) {
    const ScoreConfig score_cfg = normalized(cfg.score);

    CollectionResult res;
    res.profile = build_profile(persona, job, cfg.profile);
    res.reports.resize(docs.size());

    std::vector<std::vector<Section>> sections(docs.size());
    std::vector<char> excluded(docs.size(), 0);   // not vector<bool>: written from several workers

    // ---------- stage A: layout ----------
    parallel_for(docs.size(), cfg.threads, [&](size_t i) {
        const DocumentInput& in = docs[i];
        DocumentReport& rep = res.reports[i];
        rep.doc_id = in.doc_id;

        const auto t0 = Clock::now();
        try {
            if (!in.load_error.empty()) {
                rep.status = DocStatus::MalformedInput;
                rep.message = in.load_error;
                excluded[i] = 1;
                return;
            }

            DocumentAnalysis a = analyze_document(in.doc_id, in.blocks, cfg.classifier);
            rep.elapsed_ms = ms_since(t0);
            rep.outline = std::move(a.outline);
            rep.orphan_body = a.orphan_body;
            rep.sections = a.sections.size();

            if (a.labeled.empty()) {
                rep.status = DocStatus::MalformedInput;
                rep.message = "no non-empty text blocks";
                excluded[i] = 1;
            } else if (a.sections.empty()) {
                rep.status = DocStatus::ThresholdMiss;
                rep.message = "no heading cleared the document thresholds";
                excluded[i] = 1;
            } else if (over_budget(rep.elapsed_ms, cfg.budget_ms)) {
                rep.status = DocStatus::BudgetExceeded;
                rep.message = "layout stage over budget";
                excluded[i] = 1;
            } else {
                sections[i] = std::move(a.sections);
            }
        } catch (const std::exception& e) {
            rep.status = DocStatus::MalformedInput;
            rep.message = e.what();
            rep.elapsed_ms = ms_since(t0);
            excluded[i] = 1;
        }
    });

    // ---------- collection IDF (read-only from here on) ----------
    std::vector<std::vector<std::string>> term_lists;
    for (size_t i = 0; i < docs.size(); ++i) {
        for (const auto& s : sections[i]) term_lists.push_back(section_terms(s));
    }
    const IdfTable idf(term_lists);

    const SimilarityEngine engine(res.profile, embedder, &idf, score_cfg);
    res.semantic_enabled = embedder != nullptr;

    // ---------- stage B: scoring ----------
    std::vector<std::vector<ScoredSection>> scored(docs.size());

    parallel_for(docs.size(), cfg.threads, [&](size_t i) {
        if (excluded[i]) return;

        DocumentReport& rep = res.reports[i];
        const auto t0 = Clock::now();
        const double spent = rep.elapsed_ms;

        try {
            bool degraded = false;
            std::vector<ScoredSection> out;
            out.reserve(sections[i].size());

            const std::vector<Section>& doc_sections = sections[i];
            for (const auto& s : doc_sections) {
                if (over_budget(spent + ms_since(t0), cfg.budget_ms)) {
                    rep.status = DocStatus::BudgetExceeded;
                    rep.message = "scoring stopped after " + std::to_string(out.size()) + " of " +
                                  std::to_string(sections[i].size()) + " sections";
                    rep.elapsed_ms = spent + ms_since(t0);
                    return;
                }
                ScoredSection sc = engine.score(s);
                if (s.parent >= 0 && (size_t)s.parent < doc_sections.size()) {
                    sc.parent_heading = doc_sections[(size_t)s.parent].heading.block.text;
                }
                if (embedder && !sc.components.semantic_available) degraded = true;
                out.push_back(std::move(sc));
            }

            rep.elapsed_ms = spent + ms_since(t0);
            if (degraded) {
                for (auto& sc : out) engine.make_lexical_only(sc);
                rep.status = DocStatus::ModelUnavailable;
                rep.message = engine.semantic_ready() ? "encoder failed on some sections; lexical-only"
                                                      : "encoder produced no profile vector; lexical-only";
            }
            scored[i] = std::move(out);
        } catch (const std::exception& e) {
            rep.status = DocStatus::MalformedInput;
            rep.message = e.what();
            rep.elapsed_ms = spent + ms_since(t0);
        }
    });

    // ---------- late join ----------
    std::vector<ScoredSection> candidates;
    for (auto& v : scored) {
        for (auto& s : v) candidates.push_back(std::move(s));
    }
    res.candidates = candidates.size();

    res.ranked = rank(candidates, cfg.ranker);
    res.refined = refine(res.ranked, engine, cfg.refiner);
    return res;
}

}  // namespace docintel
