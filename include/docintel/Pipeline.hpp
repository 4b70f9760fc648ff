#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "docintel/DiversityRanker.hpp"
#include "docintel/Embedder.hpp"
#include "docintel/LayoutClassifier.hpp"
#include "docintel/Models.hpp"
#include "docintel/PersonaProfiler.hpp"
#include "docintel/SimilarityEngine.hpp"
#include "docintel/SubsectionRefiner.hpp"

namespace docintel {

enum class DocStatus {
    Ok,
    MalformedInput,     // no usable text blocks
    ThresholdMiss,      // nothing cleared the heading thresholds
    ModelUnavailable,   // scored lexical-only
    BudgetExceeded      // left out of the ranking
};

const char* status_name(DocStatus s);

struct DocumentInput {
    std::string doc_id;
    std::vector<TextBlock> blocks;
    std::string load_error;     // set by the loader when the block file was unusable
};

struct DocumentReport {
    std::string doc_id;
    DocStatus status = DocStatus::Ok;
    std::string message;
    size_t sections = 0;
    size_t orphan_body = 0;
    DocumentOutline outline;
    double elapsed_ms = 0.0;
};

struct PipelineConfig {
    ClassifierConfig classifier;
    ProfileConfig profile;
    ScoreConfig score;
    RankerConfig ranker;
    RefinerConfig refiner;

    unsigned threads = 0;       // 0 = hardware_concurrency
    int64_t budget_ms = 0;      // per document, 0 = unlimited
};

struct DocumentAnalysis {
    std::vector<LabeledBlock> labeled;
    std::vector<Section> sections;
    DocumentOutline outline;
    size_t orphan_body = 0;
};

struct CollectionResult {
    PersonaProfile profile;
    std::vector<DocumentReport> reports;    // input order
    size_t candidates = 0;
    bool semantic_enabled = false;
    RankedOutput ranked;
    std::vector<RefinedText> refined;
};

// dedupe -> font stats -> classify -> assemble
DocumentAnalysis analyze_document(
    const std::string& doc_id,
    const std::vector<TextBlock>& blocks,
    const ClassifierConfig& cfg = {}
);

DocumentOutline extract_outline(const std::vector<TextBlock>& blocks, const ClassifierConfig& cfg = {});

// Never throws for per-document problems; they end up in the reports.
// Throws std::invalid_argument for an invalid ScoreConfig.
CollectionResult process_collection(
    const std::vector<DocumentInput>& docs,
    const std::string& persona,
    const std::string& job,
    const Embedder* embedder,
    const PipelineConfig& cfg = {}
);

// clamped to [1, jobs]
unsigned worker_count(unsigned requested, size_t jobs);

}  // namespace docintel
