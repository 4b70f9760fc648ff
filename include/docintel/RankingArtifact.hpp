#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "docintel/Pipeline.hpp"

namespace docintel {

struct RankingArtifact {
    std::vector<std::string> input_documents;
    std::string persona;
    std::string job;
    std::string persona_type;
    Requirements requirements;
    std::string processing_timestamp;

    ScoreConfig score_cfg;
    RankerConfig ranker_cfg;
    bool semantic_enabled = false;

    RankedOutput ranked;
    std::vector<RefinedText> refined;
    std::vector<DocumentReport> reports;

    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

// local time, "2026-10-19T14:03:07"
std::string iso_timestamp_now();

}  // namespace docintel
