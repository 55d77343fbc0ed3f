#include "moviesim/SimilarityIndex.hpp"
#include "moviesim/Errors.hpp"

#include <algorithm>

namespace moviesim {

SimilarityIndex::SimilarityIndex(CorpusMatrix matrix, LabelMap labels)
    : m_matrix(std::move(matrix)), m_labels(std::move(labels)) {
    m_norms.reserve(m_matrix.rows.size());
    for (const auto& row : m_matrix.rows) m_norms.push_back(sparse::l2_norm(row));
}

SimilarityIndex SimilarityIndex::build(CorpusMatrix matrix, std::vector<std::string> labels) {
    const size_t n = matrix.rows.size();
    if (n == 0) throw EmptyCorpusError("cannot build a similarity index with zero documents");

    if (labels.size() != n) {
        throw ShapeError("label count " + std::to_string(labels.size()) +
                         " does not match corpus size " + std::to_string(n));
    }

    for (size_t i = 0; i < n; ++i) {
        for (const auto& kv : matrix.rows[i]) {
            if (kv.first >= matrix.dim) {
                throw ShapeError("row " + std::to_string(i) + " has column " +
                                 std::to_string(kv.first) + " outside dim " +
                                 std::to_string(matrix.dim));
            }
        }
    }

    return SimilarityIndex(std::move(matrix), LabelMap(std::move(labels)));
}

double SimilarityIndex::kernel(const SparseVector& a, double norm_a, size_t row) const {
    double d = sparse::dot(a, m_matrix.rows[row]);
    if (m_matrix.normalized) return d;

    double nb = m_norms[row];
    if (norm_a == 0.0 || nb == 0.0) return 0.0;
    return d / (norm_a * nb);
}

double SimilarityIndex::similarity(size_t a, size_t b) const {
    if (a >= size() || b >= size()) {
        throw InvalidArgumentError("document id out of range");
    }
    return kernel(m_matrix.rows[a], m_norms[a], b);
}

std::vector<Neighbor> SimilarityIndex::rank(
    const SparseVector& v, double norm_v, size_t k, const size_t* exclude
) const {
    std::vector<std::pair<size_t, double>> scores;
    scores.reserve(size());
    for (size_t i = 0; i < size(); ++i) {
        scores.push_back({i, kernel(v, norm_v, i)});
    }

    std::sort(scores.begin(), scores.end(), [](const auto& a, const auto& b){
        if (a.second != b.second) return a.second > b.second;
        return a.first < b.first;
    });

    std::vector<Neighbor> hits;
    hits.reserve(std::min(k, scores.size()));
    bool excluded = false;
    for (const auto& s : scores) {
        if (hits.size() >= k) break;
        if (exclude && !excluded && s.first == *exclude) {
            excluded = true;
            continue;
        }
        hits.push_back({s.first, m_labels.label_of(s.first), s.second});
    }
    return hits;
}

std::vector<Neighbor> SimilarityIndex::query(const std::string& label, int k) const {
    if (k <= 0) throw InvalidArgumentError("k must be positive, got " + std::to_string(k));

    auto id = m_labels.resolve(label);
    if (!id) throw UnknownLabelError(label);

    const size_t ref = *id;
    return rank(m_matrix.rows[ref], m_norms[ref], (size_t)k, &ref);
}

std::vector<Neighbor> SimilarityIndex::query_vector(const SparseVector& v, int k) const {
    if (k <= 0) throw InvalidArgumentError("k must be positive, got " + std::to_string(k));

    for (const auto& kv : v) {
        if (kv.first >= dim()) throw ShapeError("query vector column outside dim");
    }
    return rank(v, sparse::l2_norm(v), (size_t)k, nullptr);
}

}  // namespace moviesim
