#pragma once
#include "moviesim/SparseVector.hpp"
#include "moviesim/Vocabulary.hpp"

#include <string>
#include <unordered_set>
#include <vector>

namespace moviesim {

enum class Weighting {
    RawCount,
    Tfidf
};

const char* weighting_name(Weighting w);

struct VectorizerConfig {
    Weighting mode = Weighting::Tfidf;
    std::unordered_set<std::string> stopwords;
    bool fold_plurals = false;  // free-text path only
};

// One row per document, aligned by document id.
struct CorpusMatrix {
    size_t dim = 0;                 // == vocabulary size
    std::vector<SparseVector> rows;
    bool normalized = false;        // rows are L2-normalized (TFIDF)
};

struct FitResult {
    Weighting mode = Weighting::Tfidf;
    Vocabulary vocabulary;
    CorpusMatrix matrix;

    std::vector<double> idf;        // column -> idf, empty for RawCount
    std::unordered_set<std::string> stopwords;
    bool fold_plurals = false;

    // Vectorize unseen text in the fitted space. Unknown tokens are ignored.
    SparseVector transform(const std::string& text) const;
};

class Vectorizer {
public:
    // free text: lowercase, split on non-alphanumerics, drop stopwords.
    // throws EmptyCorpusError if texts is empty.
    static FitResult fit(const std::vector<std::string>& texts, const VectorizerConfig& cfg);

    static FitResult fit(
        const std::vector<std::string>& texts,
        Weighting mode,
        const std::unordered_set<std::string>& stopwords
    );

    // pre-normalized tokens (metadata soup); only empty tokens and stopwords are dropped
    static FitResult fit_tokens(
        const std::vector<std::vector<std::string>>& docs,
        const VectorizerConfig& cfg
    );
};

}  // namespace moviesim
