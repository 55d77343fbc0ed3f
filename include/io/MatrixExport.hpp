// include/io/MatrixExport.hpp
#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "moviesim/Vectorizer.hpp"

namespace moviesim {

struct MatrixExport {
    Weighting mode = Weighting::Tfidf;
    bool normalized = false;
    size_t dim = 0;
    std::vector<std::string> terms;   // column -> token
    std::vector<std::string> labels;  // row -> label
    std::vector<SparseVector> rows;

    static MatrixExport from_fit(const FitResult& fit, std::vector<std::string> labels);

    // { weighting, normalized, dim, vocabulary: {token: index}, labels, rows: [[[i, w], ...], ...] }
    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

}  // namespace moviesim
