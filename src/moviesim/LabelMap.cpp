#include "moviesim/LabelMap.hpp"
#include "moviesim/Errors.hpp"

namespace moviesim {

LabelMap::LabelMap(std::vector<std::string> labels) : m_labels(std::move(labels)) {
    m_last_id.reserve(m_labels.size());
    for (size_t id = 0; id < m_labels.size(); ++id) {
        m_last_id[m_labels[id]] = id;  // later duplicates overwrite earlier ones
    }
}

std::optional<size_t> LabelMap::resolve(const std::string& label) const {
    auto it = m_last_id.find(label);
    if (it == m_last_id.end()) return std::nullopt;
    return it->second;
}

const std::string& LabelMap::label_of(size_t id) const {
    if (id >= m_labels.size()) {
        throw InvalidArgumentError("document id out of range: " + std::to_string(id));
    }
    return m_labels[id];
}

}  // namespace moviesim
