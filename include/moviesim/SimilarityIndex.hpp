#pragma once
#include "moviesim/LabelMap.hpp"
#include "moviesim/SparseVector.hpp"
#include "moviesim/Vectorizer.hpp"

#include <string>
#include <vector>

namespace moviesim {

struct Neighbor {
    size_t id = 0;
    std::string label;
    double score = 0.0;
};

// Immutable after build(); all queries are const and allocate their own scratch,
// so one index can be shared between reader threads.
class SimilarityIndex {
public:
    // throws EmptyCorpusError (no rows) or ShapeError (labels/rows mismatch,
    // column outside dim)
    static SimilarityIndex build(CorpusMatrix matrix, std::vector<std::string> labels);

    // top-k neighbors of the document carrying `label`, itself excluded.
    // Order: score descending, ties by ascending id.
    std::vector<Neighbor> query(const std::string& label, int k) const;

    // top-k documents for an arbitrary vector in the same space (nothing excluded)
    std::vector<Neighbor> query_vector(const SparseVector& v, int k) const;

    double similarity(size_t a, size_t b) const;

    size_t size() const { return m_matrix.rows.size(); }
    size_t dim() const { return m_matrix.dim; }
    bool normalized() const { return m_matrix.normalized; }
    const LabelMap& labels() const { return m_labels; }

private:
    SimilarityIndex(CorpusMatrix matrix, LabelMap labels);

    // dot for normalized rows, cosine otherwise
    double kernel(const SparseVector& a, double norm_a, size_t row) const;

    std::vector<Neighbor> rank(const SparseVector& v, double norm_v, size_t k,
                               const size_t* exclude) const;

    CorpusMatrix m_matrix;
    LabelMap m_labels;
    std::vector<double> m_norms;  // row -> L2 norm
};

}  // namespace moviesim
