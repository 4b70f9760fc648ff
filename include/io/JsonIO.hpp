#pragma once

#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "docintel/Models.hpp"

struct InputDocument {
    std::string filename;
    std::string title;
};

struct CollectionInput {
    std::string description;
    std::string persona;
    std::string job;
    std::vector<InputDocument> documents;
};

// {"blocks": [...]} or a bare array; block_index is the array position.
// Throws std::runtime_error with the offending path ("root.blocks[3].page").
std::vector<docintel::TextBlock> parseTextBlocks(const nlohmann::json& j);
std::vector<docintel::TextBlock> loadTextBlocks(const std::string& path);

CollectionInput parseCollectionInput(const nlohmann::json& j);
CollectionInput loadCollectionInput(const std::string& path);
