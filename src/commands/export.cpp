#include "commands/export.hpp"
#include "commands/common.hpp"
#include "io/MatrixExport.hpp"

#include <iostream>
#include <string>

int cmd_export(int argc, char** argv) {
    const std::string corpus_path = get_arg(argc, argv, "--corpus", "data/movies.json");
    const std::string outp        = get_arg(argc, argv, "--out", "out/matrix.json");
    const std::string mode        = get_arg(argc, argv, "--mode", "overview");
    const std::string stop_choice   = get_arg(argc, argv, "--stopwords", "english");
    const bool fold               = has_flag(argc, argv, "--fold_plurals");

    try {
        auto corpus = movies::MovieCorpus::load_json(corpus_path);
        auto fit = fit_corpus(corpus, mode, resolve_stopwords(stop_choice), fold);

        auto ex = moviesim::MatrixExport::from_fit(fit, corpus.titles());
        ex.write_to(outp);

        std::cout << "saved: " << outp << " (n=" << fit.matrix.rows.size()
                  << ", dim=" << fit.matrix.dim << ")\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
