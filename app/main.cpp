#include "commands/outline.hpp"
#include "commands/rank.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  docintel outline [args]\n"
        << "  docintel rank [args]\n"
        << "  docintel help\n";
    return 1;
}

static int print_outline_help() {
    std::cerr
        << "usage:\n"
        << "  docintel outline [options]\n"
        << "\n"
        << "options:\n"
        << "  --blocks <dir>               default: input/blocks (one <name>.json per document)\n"
        << "  --outdir <dir>               default: out\n";
    return 0;
}

static int print_rank_help() {
    std::cerr
        << "usage:\n"
        << "  docintel rank --input <collection.json> [options]\n"
        << "\n"
        << "inputs/outputs:\n"
        << "  --input <path>               (required)\n"
        << "  --blocks <dir>               default: <input dir>/blocks\n"
        << "  --out <path>                 default: out/ranking.json\n"
        << "\n"
        << "ranking:\n"
        << "  --topk <n>                   default: 5\n"
        << "  --lambda <f>                 default: 0.3\n"
        << "  --min_relevance <f>          default: 0.0\n"
        << "  --w_sem <f>                  default: 0.5\n"
        << "  --w_lex <f>                  default: 0.35\n"
        << "  --w_struct <f>               default: 0.15\n"
        << "  --role_weight <f>            default: 0.4\n"
        << "  --task_weight <f>            default: 0.6\n"
        << "\n"
        << "runtime:\n"
        << "  --budget_ms <n>              per document, default: 0 (unlimited)\n"
        << "  --threads <n>                default: 0 (hardware concurrency)\n"
        << "\n"
        << "semantic scoring (lexical-only when neither is given):\n"
        << "  --emb_model <path>           ONNX sentence encoder\n"
        << "  --emb_vocab <path>           WordPiece vocab.txt\n"
        << "  --hash_embed                 feature-hashing encoder, no model needed\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help") {
        return print_usage();
    }

    // subcommand help
    if (cmd == "outline" && (argc >= 3 && std::string(argv[2]) == "--help")) return print_outline_help();
    if (cmd == "rank"    && (argc >= 3 && std::string(argv[2]) == "--help")) return print_rank_help();

    if (cmd == "outline") return cmd_outline(argc - 1, argv + 1);
    if (cmd == "rank")    return cmd_rank(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
