#include "io/JsonIO.hpp"

#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static void require_array(const json& j, const std::string& where) {
    if (!j.is_array()) {
        throw std::runtime_error(where + " must be an array");
    }
}

static const json& require_field(const json& j, const char* key, const std::string& where) {
    const auto it = j.find(key);
    if (it == j.end()) {
        throw std::runtime_error(where + ": missing field '" + key + "'");
    }
    return *it;
}

static std::string require_string(const json& j, const char* key, const std::string& where) {
    const json& v = require_field(j, key, where);
    if (!v.is_string()) throw std::runtime_error(where + "." + key + " must be a string");
    return v.get<std::string>();
}

static double require_number(const json& j, const char* key, const std::string& where) {
    const json& v = require_field(j, key, where);
    if (!v.is_number()) throw std::runtime_error(where + "." + key + " must be a number");
    return v.get<double>();
}

static double optional_number(const json& j, const char* key, double def, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return def;
    if (!j.at(key).is_number()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a number");
    }
    return j.at(key).get<double>();
}

static json read_json(const std::string& path, const char* what) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error(std::string("failed to open ") + what + ": " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to parse JSON: ") + path + ": " + e.what());
    }
    return j;
}

static docintel::TextBlock parseBlock(const json& j, int index, const std::string& where) {
    require_object(j, where);

    docintel::TextBlock b;
    b.text = require_string(j, "text", where);

    const double page = require_number(j, "page", where);
    if (page < 0) throw std::runtime_error(where + ".page must be >= 0");
    if (page != std::floor(page) || page > (double)std::numeric_limits<int>::max()) {
        throw std::runtime_error(where + ".page must be a whole number in int range");
    }
    b.page = (int)page;

    b.font_size = require_number(j, "font_size", where);

    if (j.contains("is_bold") && !j.at("is_bold").is_null()) {
        if (!j.at("is_bold").is_boolean()) {
            throw std::runtime_error(where + ".is_bold must be a boolean");
        }
        b.is_bold = j.at("is_bold").get<bool>();
    }

    b.x = optional_number(j, "x", 0.0, where);
    b.y = optional_number(j, "y", 0.0, where);
    b.block_index = index;
    return b;
}

std::vector<docintel::TextBlock> parseTextBlocks(const json& j) {
    const json* arr = &j;
    std::string where = "root";

    if (j.is_object()) {
        arr = &require_field(j, "blocks", where);
        where = "root.blocks";
    }
    require_array(*arr, where);

    std::vector<docintel::TextBlock> out;
    out.reserve(arr->size());
    for (size_t i = 0; i < arr->size(); ++i) {
        std::ostringstream oss;
        oss << where << "[" << i << "]";
        out.push_back(parseBlock(arr->at(i), (int)i, oss.str()));
    }
    return out;
}

std::vector<docintel::TextBlock> loadTextBlocks(const std::string& path) {
    return parseTextBlocks(read_json(path, "blocks file"));
}

// "persona": {"role": "..."} or a plain string; same for "job_to_be_done": {"task": "..."}
static std::string string_or_field(const json& j, const char* key, const char* field, const std::string& where) {
    const json& v = require_field(j, key, where);
    if (v.is_string()) return v.get<std::string>();
    require_object(v, where + "." + key);
    return require_string(v, field, where + "." + key);
}

CollectionInput parseCollectionInput(const json& j) {
    require_object(j, "root");

    CollectionInput ci;
    ci.persona = string_or_field(j, "persona", "role", "root");
    ci.job = string_or_field(j, "job_to_be_done", "task", "root");

    if (j.contains("challenge_info") && j.at("challenge_info").is_object()) {
        ci.description = j.at("challenge_info").value("description", "");
    }

    const json& docs = require_field(j, "documents", "root");
    require_array(docs, "root.documents");

    for (size_t i = 0; i < docs.size(); ++i) {
        std::ostringstream oss;
        oss << "root.documents[" << i << "]";
        const std::string where = oss.str();

        require_object(docs.at(i), where);
        InputDocument d;
        d.filename = require_string(docs.at(i), "filename", where);
        d.title = docs.at(i).value("title", "");
        ci.documents.push_back(std::move(d));
    }

    return ci;
}

CollectionInput loadCollectionInput(const std::string& path) {
    return parseCollectionInput(read_json(path, "collection input"));
}
