#pragma once
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace moviesim {

// token -> column index, indices assigned in lexicographic order of the tokens
class Vocabulary {
public:
    Vocabulary() = default;
    explicit Vocabulary(const std::set<std::string>& terms);

    std::optional<uint32_t> index_of(const std::string& term) const;
    const std::string& term(uint32_t index) const;

    size_t size() const { return m_terms.size(); }
    const std::vector<std::string>& terms() const { return m_terms; }

    bool operator==(const Vocabulary& other) const { return m_terms == other.m_terms; }

private:
    std::vector<std::string> m_terms;                     // index -> term
    std::unordered_map<std::string, uint32_t> m_term_to_id;
};

}  // namespace moviesim
