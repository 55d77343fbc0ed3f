#include "commands/similar.hpp"
#include "commands/common.hpp"
#include "moviesim/Errors.hpp"
#include "moviesim/SimilarityIndex.hpp"

#include <iomanip>
#include <iostream>
#include <string>

int cmd_similar(int argc, char** argv) {
    const std::string corpus_path = get_arg(argc, argv, "--corpus", "data/movies.json");
    const std::string title       = get_arg(argc, argv, "--title", "");
    const std::string mode        = get_arg(argc, argv, "--mode", "overview");
    const std::string stop_choice   = get_arg(argc, argv, "--stopwords", "english");
    const bool fold               = has_flag(argc, argv, "--fold_plurals");

    if (title.empty()) {
        std::cerr << "error: --title is required\n";
        return 1;
    }

    try {
        const int topk = get_arg_int(argc, argv, "--topk", 10);

        auto corpus = movies::MovieCorpus::load_json(corpus_path);
        std::cout << "loaded " << corpus.size() << " movies from " << corpus_path << "\n";

        auto fit = fit_corpus(corpus, mode, resolve_stopwords(stop_choice), fold);
        std::cout << "vocabulary: " << fit.vocabulary.size() << " terms ("
                  << moviesim::weighting_name(fit.mode) << ")\n";

        auto index = moviesim::SimilarityIndex::build(std::move(fit.matrix), corpus.titles());
        auto hits = index.query(title, topk);

        std::cout << "\nmovies similar to \"" << title << "\":\n";
        for (const auto& h : hits) {
            std::cout << "  " << std::fixed << std::setprecision(4) << h.score << "  " << h.label << "\n";
        }
        return 0;
    } catch (const moviesim::UnknownLabelError& e) {
        std::cerr << "error: movie not found: " << e.label() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
