#include "docintel/SectionAssembler.hpp"

#include <algorithm>

namespace docintel {

std::vector<Section> assemble(const std::string& doc_id, const std::vector<LabeledBlock>& labeled) {
    std::vector<Section> sections;
    std::vector<int> open;   // indices into sections, least significant on top

    for (const auto& lb : labeled) {
        if (lb.level == HeadingLevel::Body) {
            if (sections.empty()) continue;   // preamble

            Section& cur = sections.back();
            cur.body.push_back(lb);
            cur.page_start = std::min(cur.page_start, lb.block.page);
            cur.page_end = std::max(cur.page_end, lb.block.page);
            continue;
        }

        while (!open.empty() && level_rank(sections[open.back()].heading.level) >= level_rank(lb.level)) {
            open.pop_back();
        }

        Section s;
        s.doc_id = doc_id;
        s.heading = lb;
        s.page_start = lb.block.page;
        s.page_end = lb.block.page;
        s.parent = open.empty() ? -1 : open.back();

        sections.push_back(std::move(s));
        open.push_back(static_cast<int>(sections.size()) - 1);
    }

    return sections;
}

size_t count_orphan_body(const std::vector<LabeledBlock>& labeled) {
    size_t n = 0;
    for (const auto& lb : labeled) {
        if (lb.level != HeadingLevel::Body) break;
        ++n;
    }
    return n;
}

}  // namespace docintel
