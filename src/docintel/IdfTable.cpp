#include "docintel/IdfTable.hpp"

#include <cmath>
#include <unordered_set>

namespace docintel {

IdfTable::IdfTable(const std::vector<std::vector<std::string>>& documents) {
    m_n = (uint32_t)documents.size();

    for (const auto& terms : documents) {
        // unique terms in this doc for DF
        std::unordered_set<std::string> seen;
        seen.reserve(terms.size());
        for (const auto& t : terms) {
            if (seen.insert(t).second) m_df[t] += 1;
        }
    }
}

uint32_t IdfTable::df(const std::string& term) const {
    auto it = m_df.find(term);
    return it == m_df.end() ? 0u : it->second;
}

double IdfTable::idf(const std::string& term) const {
    if (m_n == 0) return 1.0;
    const double d = (double)df(term);
    return std::log(((double)m_n + 1.0) / (d + 1.0)) + 1.0;
}

}  // namespace docintel
