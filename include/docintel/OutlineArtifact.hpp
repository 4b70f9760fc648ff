#pragma once

#include <filesystem>
#include <string>

#include "nlohmann/json.hpp"
#include "docintel/Models.hpp"

namespace docintel {

struct OutlineArtifact {
    DocumentOutline outline;

    // {"title": ..., "outline": [{"level", "text", "page"}]}
    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

}  // namespace docintel
