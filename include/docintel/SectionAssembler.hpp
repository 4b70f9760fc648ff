#pragma once

#include <string>
#include <vector>

#include "docintel/Models.hpp"

namespace docintel {

// Each heading opens a section that owns the Body blocks after it, up to the next heading.
// A heading closes every open section of equal or less significant level; the nearest
// remaining one becomes its parent.
std::vector<Section> assemble(const std::string& doc_id, const std::vector<LabeledBlock>& labeled);

// Body blocks that precede the first heading and therefore belong to no section.
size_t count_orphan_body(const std::vector<LabeledBlock>& labeled);

}  // namespace docintel
