#include "commands/common.hpp"
#include "movies/Soup.hpp"
#include "text/Stopwords.hpp"

#include <stdexcept>

bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

int get_arg_int(int argc, char** argv, const std::string& key, int def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        throw std::runtime_error(key + " expects an integer, got: " + s);
    }
}

std::unordered_set<std::string> resolve_stopwords(const std::string& choice) {
    if (choice == "english") return textutil::english_stopwords();
    if (choice == "none" || choice.empty()) return {};
    return textutil::load_stopwords(choice);
}

moviesim::FitResult fit_corpus(
    const movies::MovieCorpus& corpus,
    const std::string& mode,
    const std::unordered_set<std::string>& stopwords,
    bool fold_plurals
) {
    moviesim::VectorizerConfig cfg;
    cfg.stopwords = stopwords;

    if (mode == "overview") {
        cfg.mode = moviesim::Weighting::Tfidf;
        cfg.fold_plurals = fold_plurals;
        return moviesim::Vectorizer::fit(corpus.overviews(), cfg);
    }
    if (mode == "soup") {
        cfg.mode = moviesim::Weighting::RawCount;
        std::vector<std::vector<std::string>> docs;
        docs.reserve(corpus.size());
        for (const auto& m : corpus.movies()) docs.push_back(movies::soup_tokens(m));
        return moviesim::Vectorizer::fit_tokens(docs, cfg);
    }
    throw std::runtime_error("unknown --mode: " + mode + " (expected overview|soup)");
}
