#include "docintel/OutlineArtifact.hpp"

#include <fstream>
#include <stdexcept>

namespace docintel {

nlohmann::json OutlineArtifact::to_json() const {
    nlohmann::json j;
    j["title"] = outline.title;

    nlohmann::json arr = nlohmann::json::array();
    for (const auto& e : outline.entries) {
        arr.push_back({
            {"level", level_name(e.level)},
            {"text", e.text},
            {"page", e.page}
        });
    }
    j["outline"] = arr;

    return j;
}

void OutlineArtifact::write_to(const std::filesystem::path& out_path) const {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    // extractor text is not guaranteed to be valid UTF-8
    out << to_json().dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
}

}  // namespace docintel
