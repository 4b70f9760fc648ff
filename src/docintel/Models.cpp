#include "docintel/Models.hpp"

#include "text/TextUtil.hpp"

namespace docintel {

const char* level_name(HeadingLevel l) {
    switch (l) {
        case HeadingLevel::Title: return "title";
        case HeadingLevel::H1: return "H1";
        case HeadingLevel::H2: return "H2";
        case HeadingLevel::H3: return "H3";
        case HeadingLevel::H4: return "H4";
        case HeadingLevel::Body: return "body";
        default: return "unknown";
    }
}

std::string Section::body_text() const {
    std::string out;
    for (const auto& b : body) {
        if (!out.empty()) out.push_back('\n');
        out += b.block.text;
    }
    return out;
}

size_t Section::body_word_count() const {
    size_t n = 0;
    for (const auto& b : body) n += textutil::word_count(b.block.text);
    return n;
}

}  // namespace docintel
