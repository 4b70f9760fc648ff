#include "docintel/RankingArtifact.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace docintel {

std::string iso_timestamp_now() {
    const std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

static nlohmann::json section_to_json(const RankedEntry& e) {
    const Section& s = e.scored.section;

    nlohmann::json j;
    j["document"] = s.doc_id;
    j["section_title"] = s.heading.block.text;
    j["importance_rank"] = e.rank;
    j["page_number"] = s.page_start;
    j["page_range"] = {s.page_start, s.page_end};
    j["heading_level"] = level_name(s.heading.level);
    if (e.scored.parent_heading.empty()) j["parent_section"] = nullptr;
    else j["parent_section"] = e.scored.parent_heading;
    j["relevance_score"] = e.scored.relevance_score;
    j["marginal_score"] = e.marginal_score;
    j["redundancy"] = e.redundancy;

    const ComponentScores& c = e.scored.components;
    j["component_scores"] = {
        {"semantic", c.semantic},
        {"lexical", c.lexical},
        {"structural", c.structural},
        {"semantic_available", c.semantic_available},
    };
    return j;
}

nlohmann::json RankingArtifact::to_json() const {
    nlohmann::json j;

    j["metadata"] = {
        {"input_documents", input_documents},
        {"persona", persona},
        {"job_to_be_done", job},
        {"processing_timestamp", processing_timestamp},
        {"persona_type", persona_type},
        {"requirements", {
            {"group_size", requirements.group_size},
            {"duration", requirements.duration},
            {"special_needs", requirements.special_needs},
        }},
        {"semantic", semantic_enabled},
    };

    nlohmann::json sections = nlohmann::json::array();
    for (const auto& e : ranked.entries) sections.push_back(section_to_json(e));
    j["extracted_sections"] = sections;

    nlohmann::json subs = nlohmann::json::array();
    for (const auto& r : refined) {
        subs.push_back({
            {"document", r.doc_id},
            {"refined_text", r.text},
            {"page_number", r.page},
            {"importance_rank", r.rank},
            {"score", r.score}
        });
    }
    j["subsection_analysis"] = subs;

    nlohmann::json status = nlohmann::json::array();
    for (const auto& r : reports) {
        status.push_back({
            {"document", r.doc_id},
            {"status", status_name(r.status)},
            {"message", r.message},
            {"sections", r.sections},
            {"orphan_body_blocks", r.orphan_body},
            {"elapsed_ms", r.elapsed_ms}
        });
    }
    j["document_status"] = status;

    nlohmann::json decisions = nlohmann::json::array();
    for (const auto& d : ranked.decisions) {
        decisions.push_back({
            {"document", d.doc_id},
            {"section_title", d.heading},
            {"page_number", d.page},
            {"accepted", d.accepted},
            {"reason", d.reason}
        });
    }

    j["ranking"] = {
        {"floor", ranked.floor},
        {"config", {
            {"k", ranker_cfg.k},
            {"lambda", ranker_cfg.lambda},
            {"min_relevance", ranker_cfg.min_relevance},
            {"duplicate_threshold", ranker_cfg.duplicate_threshold},
            {"w_semantic", score_cfg.w_semantic},
            {"w_lexical", score_cfg.w_lexical},
            {"w_structural", score_cfg.w_structural},
            {"role_weight", score_cfg.role_weight},
            {"task_weight", score_cfg.task_weight},
        }},
        {"decisions", decisions},
    };

    return j;
}

void RankingArtifact::write_to(const std::filesystem::path& out_path) const {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    // extractor text is not guaranteed to be valid UTF-8
    out << to_json().dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
}

}  // namespace docintel
