#pragma once
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace moviesim {

// document id <-> label. Labels may repeat; resolve() returns the last id with that label.
class LabelMap {
public:
    LabelMap() = default;
    explicit LabelMap(std::vector<std::string> labels);

    std::optional<size_t> resolve(const std::string& label) const;
    const std::string& label_of(size_t id) const;

    size_t size() const { return m_labels.size(); }
    const std::vector<std::string>& labels() const { return m_labels; }

private:
    std::vector<std::string> m_labels;                   // id -> label
    std::unordered_map<std::string, size_t> m_last_id;   // label -> last id
};

}  // namespace moviesim
