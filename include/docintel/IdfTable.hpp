#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace docintel {

// Document frequencies over a frozen collection of term lists (one list per section).
class IdfTable {
public:
    IdfTable() = default;
    explicit IdfTable(const std::vector<std::vector<std::string>>& documents);

    // smooth: idf = log((N + 1)/(df + 1)) + 1; 1.0 for an empty table
    double idf(const std::string& term) const;

    uint32_t df(const std::string& term) const;
    uint32_t document_count() const { return m_n; }
    size_t size() const { return m_df.size(); }

private:
    uint32_t m_n = 0;
    std::unordered_map<std::string, uint32_t> m_df;
};

}  // namespace docintel
