#include "commands/describe.hpp"
#include "commands/common.hpp"
#include "moviesim/SimilarityIndex.hpp"

#include <iomanip>
#include <iostream>
#include <string>

int cmd_describe(int argc, char** argv) {
    const std::string corpus_path = get_arg(argc, argv, "--corpus", "data/movies.json");
    const std::string text        = get_arg(argc, argv, "--text", "");
    const std::string stop_choice   = get_arg(argc, argv, "--stopwords", "english");
    const bool fold               = has_flag(argc, argv, "--fold_plurals");

    if (text.empty()) {
        std::cerr << "error: --text is required\n";
        return 1;
    }

    try {
        const int topk = get_arg_int(argc, argv, "--topk", 10);

        auto corpus = movies::MovieCorpus::load_json(corpus_path);
        auto fit = fit_corpus(corpus, "overview", resolve_stopwords(stop_choice), fold);

        auto qvec = fit.transform(text);
        if (qvec.empty()) {
            std::cerr << "warning: no known terms in --text\n";
        }

        auto index = moviesim::SimilarityIndex::build(std::move(fit.matrix), corpus.titles());
        auto hits = index.query_vector(qvec, topk);

        for (const auto& h : hits) {
            std::cout << "  " << std::fixed << std::setprecision(4) << h.score << "  " << h.label << "\n";
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
