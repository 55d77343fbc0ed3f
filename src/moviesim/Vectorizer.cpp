#include "moviesim/Vectorizer.hpp"
#include "moviesim/Errors.hpp"
#include "text/TextUtil.hpp"

#include <cmath>
#include <map>
#include <set>
#include <unordered_map>

namespace moviesim {

const char* weighting_name(Weighting w) {
    switch (w) {
        case Weighting::RawCount: return "raw_count";
        case Weighting::Tfidf: return "tfidf";
        default: return "unknown";
    }
}

// counts -> weighted row. idf is ignored for RawCount.
static SparseVector weigh(
    const std::map<uint32_t, uint32_t>& tf,
    Weighting mode,
    const std::vector<double>& idf
) {
    SparseVector row;
    row.reserve(tf.size());

    if (mode == Weighting::RawCount) {
        for (const auto& kv : tf) row.push_back({kv.first, (float)kv.second});
        return row;
    }

    for (const auto& kv : tf) {
        row.push_back({kv.first, (float)((double)kv.second * idf[kv.first])});
    }
    sparse::l2_normalize(row);
    return row;
}

static std::map<uint32_t, uint32_t> term_counts(
    const std::vector<std::string>& toks,
    const Vocabulary& vocab
) {
    std::map<uint32_t, uint32_t> tf;
    for (const auto& t : toks) {
        auto id = vocab.index_of(t);
        if (!id) continue;
        tf[*id] += 1;
    }
    return tf;
}

static FitResult fit_analyzed(
    const std::vector<std::vector<std::string>>& doc_tokens,
    const VectorizerConfig& cfg
) {
    if (doc_tokens.empty()) {
        throw EmptyCorpusError("cannot fit a vectorizer on an empty corpus");
    }

    FitResult out;
    out.mode = cfg.mode;
    out.stopwords = cfg.stopwords;
    out.fold_plurals = cfg.fold_plurals;

    // Pass 1: freeze vocab (std::set gives lexicographic order)
    std::set<std::string> terms;
    for (const auto& toks : doc_tokens) terms.insert(toks.begin(), toks.end());
    out.vocabulary = Vocabulary(terms);

    std::vector<std::map<uint32_t, uint32_t>> counts;
    counts.reserve(doc_tokens.size());
    for (const auto& toks : doc_tokens) counts.push_back(term_counts(toks, out.vocabulary));

    // IDF: smooth, idf = log((N + 1)/(df + 1)) + 1
    if (cfg.mode == Weighting::Tfidf) {
        std::vector<uint32_t> df(out.vocabulary.size(), 0);
        for (const auto& tf : counts) {
            for (const auto& kv : tf) df[kv.first] += 1;
        }

        const double N = (double)doc_tokens.size();
        out.idf.resize(df.size());
        for (size_t term_id = 0; term_id < df.size(); ++term_id) {
            out.idf[term_id] = std::log((N + 1.0) / ((double)df[term_id] + 1.0)) + 1.0;
        }
    }

    // Pass 2: rows
    out.matrix.dim = out.vocabulary.size();
    out.matrix.normalized = (cfg.mode == Weighting::Tfidf);
    out.matrix.rows.reserve(counts.size());
    for (const auto& tf : counts) {
        out.matrix.rows.push_back(weigh(tf, cfg.mode, out.idf));
    }

    return out;
}

FitResult Vectorizer::fit(const std::vector<std::string>& texts, const VectorizerConfig& cfg) {
    std::vector<std::vector<std::string>> doc_tokens;
    doc_tokens.reserve(texts.size());
    for (const auto& t : texts) {
        doc_tokens.push_back(textutil::analyze(t, cfg.stopwords, cfg.fold_plurals));
    }
    return fit_analyzed(doc_tokens, cfg);
}

FitResult Vectorizer::fit(
    const std::vector<std::string>& texts,
    Weighting mode,
    const std::unordered_set<std::string>& stopwords
) {
    VectorizerConfig cfg;
    cfg.mode = mode;
    cfg.stopwords = stopwords;
    return fit(texts, cfg);
}

FitResult Vectorizer::fit_tokens(
    const std::vector<std::vector<std::string>>& docs,
    const VectorizerConfig& cfg
) {
    std::vector<std::vector<std::string>> doc_tokens;
    doc_tokens.reserve(docs.size());
    for (const auto& d : docs) {
        std::vector<std::string> kept;
        kept.reserve(d.size());
        for (const auto& t : d) {
            if (t.empty() || cfg.stopwords.count(t)) continue;
            kept.push_back(t);
        }
        doc_tokens.push_back(std::move(kept));
    }

    VectorizerConfig soup_cfg = cfg;
    soup_cfg.fold_plurals = false;
    return fit_analyzed(doc_tokens, soup_cfg);
}

SparseVector FitResult::transform(const std::string& text) const {
    auto toks = textutil::analyze(text, stopwords, fold_plurals);
    return weigh(term_counts(toks, vocabulary), mode, idf);
}

}  // namespace moviesim
