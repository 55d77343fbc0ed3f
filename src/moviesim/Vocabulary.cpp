#include "moviesim/Vocabulary.hpp"
#include "moviesim/Errors.hpp"

namespace moviesim {

Vocabulary::Vocabulary(const std::set<std::string>& terms) {
    m_terms.reserve(terms.size());
    m_term_to_id.reserve(terms.size());
    for (const auto& t : terms) {
        m_term_to_id.emplace(t, (uint32_t)m_terms.size());
        m_terms.push_back(t);
    }
}

std::optional<uint32_t> Vocabulary::index_of(const std::string& term) const {
    auto it = m_term_to_id.find(term);
    if (it == m_term_to_id.end()) return std::nullopt;
    return it->second;
}

const std::string& Vocabulary::term(uint32_t index) const {
    if (index >= m_terms.size()) {
        throw InvalidArgumentError("vocabulary index out of range: " + std::to_string(index));
    }
    return m_terms[index];
}

}  // namespace moviesim
