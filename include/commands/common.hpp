#pragma once
#include "movies/MovieCorpus.hpp"
#include "moviesim/Vectorizer.hpp"

#include <string>
#include <unordered_set>

bool has_flag(int argc, char** argv, const std::string& key);
std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def);
int get_arg_int(int argc, char** argv, const std::string& key, int def);

// "english" | "none" | <path to word list>
std::unordered_set<std::string> resolve_stopwords(const std::string& choice);

// "overview" -> TFIDF over overviews, "soup" -> raw counts over metadata soup
moviesim::FitResult fit_corpus(
    const movies::MovieCorpus& corpus,
    const std::string& mode,
    const std::unordered_set<std::string>& stopwords,
    bool fold_plurals
);
