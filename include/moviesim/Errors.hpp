#pragma once
#include <stdexcept>
#include <string>

namespace moviesim {

// labels/rows mismatch, or a row that does not fit the vocabulary
class ShapeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class UnknownLabelError : public std::runtime_error {
public:
    explicit UnknownLabelError(const std::string& label)
        : std::runtime_error("unknown label: " + label), m_label(label) {}

    const std::string& label() const { return m_label; }

private:
    std::string m_label;
};

class InvalidArgumentError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// zero documents handed to fit() or build()
class EmptyCorpusError : public InvalidArgumentError {
public:
    using InvalidArgumentError::InvalidArgumentError;
};

}  // namespace moviesim
