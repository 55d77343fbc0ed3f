#include "commands/describe.hpp"
#include "commands/export.hpp"
#include "commands/similar.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  moviesim similar [args]\n"
        << "  moviesim describe [args]\n"
        << "  moviesim export [args]\n"
        << "  moviesim help\n";
    return 1;
}

static int print_similar_help() {
    std::cerr
        << "usage:\n"
        << "  moviesim similar --title \"<movie title>\" [options]\n"
        << "\n"
        << "options:\n"
        << "  --title <str>                (required)\n"
        << "  --corpus <path>              default: data/movies.json\n"
        << "  --topk <n>                   default: 10\n"
        << "  --mode <overview|soup>       default: overview\n"
        << "                               overview: tf-idf over plot overviews\n"
        << "                               soup: raw counts over keywords/cast/director/genres\n"
        << "  --stopwords <english|none|path>  default: english\n"
        << "  --fold_plurals               strip plural endings (overview mode)\n";
    return 0;
}

static int print_describe_help() {
    std::cerr
        << "usage:\n"
        << "  moviesim describe --text \"<free text>\" [options]\n"
        << "\n"
        << "options:\n"
        << "  --text <str>                 (required)\n"
        << "  --corpus <path>              default: data/movies.json\n"
        << "  --topk <n>                   default: 10\n"
        << "  --stopwords <english|none|path>  default: english\n"
        << "  --fold_plurals               strip plural endings\n";
    return 0;
}

static int print_export_help() {
    std::cerr
        << "usage:\n"
        << "  moviesim export [options]\n"
        << "\n"
        << "options:\n"
        << "  --corpus <path>              default: data/movies.json\n"
        << "  --out <path>                 default: out/matrix.json\n"
        << "  --mode <overview|soup>       default: overview\n"
        << "  --stopwords <english|none|path>  default: english\n"
        << "  --fold_plurals               strip plural endings (overview mode)\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help") {
        return print_usage();
    }

    // subcommand help
    const bool help = (argc >= 3 && std::string(argv[2]) == "--help");
    if (cmd == "similar"  && help) return print_similar_help();
    if (cmd == "describe" && help) return print_describe_help();
    if (cmd == "export"   && help) return print_export_help();

    if (cmd == "similar")  return cmd_similar(argc - 1, argv + 1);
    if (cmd == "describe") return cmd_describe(argc - 1, argv + 1);
    if (cmd == "export")   return cmd_export(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
