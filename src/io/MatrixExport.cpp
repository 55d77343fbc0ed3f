#include "io/MatrixExport.hpp"

#include <fstream>
#include <stdexcept>

namespace moviesim {

MatrixExport MatrixExport::from_fit(const FitResult& fit, std::vector<std::string> labels) {
    MatrixExport ex;
    ex.mode = fit.mode;
    ex.normalized = fit.matrix.normalized;
    ex.dim = fit.matrix.dim;
    ex.terms = fit.vocabulary.terms();
    ex.labels = std::move(labels);
    ex.rows = fit.matrix.rows;
    return ex;
}

nlohmann::json MatrixExport::to_json() const {
    nlohmann::json j;
    j["weighting"] = weighting_name(mode);
    j["normalized"] = normalized;
    j["dim"] = dim;

    nlohmann::json vocab = nlohmann::json::object();
    for (size_t i = 0; i < terms.size(); ++i) vocab[terms[i]] = i;
    j["vocabulary"] = vocab;

    j["labels"] = labels;

    nlohmann::json arr = nlohmann::json::array();
    for (const auto& row : rows) {
        nlohmann::json r = nlohmann::json::array();
        for (const auto& kv : row) r.push_back({kv.first, kv.second});
        arr.push_back(r);
    }
    j["rows"] = arr;

    return j;
}

void MatrixExport::write_to(const std::filesystem::path& out_path) const {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << to_json().dump(2) << "\n";
}

}  // namespace moviesim
