#include "commands/batch.hpp"
#include "commands/info.hpp"
#include "commands/outline.hpp"
#include "commands/persona.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  docpersona outline [args]\n"
        << "  docpersona batch [args]\n"
        << "  docpersona persona [args]\n"
        << "  docpersona info [args]\n"
        << "  docpersona help\n";
    return 1;
}

static int print_outline_help() {
    std::cerr
        << "usage:\n"
        << "  docpersona outline --pdf <file> [options]\n"
        << "\n"
        << "options:\n"
        << "  --pdf <path>                 (required)\n"
        << "  --out <path>                 optional: write outline JSON\n"
        << "  --explain                    list headings with level and matching rule\n";
    return 0;
}

static int print_batch_help() {
    std::cerr
        << "usage:\n"
        << "  docpersona batch [options]\n"
        << "\n"
        << "options:\n"
        << "  --in <dir>                   default: input\n"
        << "  --outdir <dir>               default: out  (writes <stem>.outline.json)\n";
    return 0;
}

static int print_persona_help() {
    std::cerr
        << "usage:\n"
        << "  docpersona persona --docs <dir> --persona \"<str>\" --job \"<str>\" [options]\n"
        << "\n"
        << "inputs/outputs:\n"
        << "  --docs <dir>                 (required) 3..10 PDFs\n"
        << "  --persona <str>              (required) persona description\n"
        << "  --job <str>                  (required) job to be done\n"
        << "  --out <path>                 default: out/persona_analysis.json\n"
        << "\n"
        << "embedding:\n"
        << "  --model <path>               default: models/emb/model.onnx\n"
        << "  --vocab <path>               default: models/emb/vocab.txt\n"
        << "  --max_len <n>                default: 256\n"
        << "  --serial                     extract outlines one document at a time\n"
        << "\n"
        << "exit codes: 0 ok, 1 internal error, 2 invalid input, 3 unreadable document\n";
    return 0;
}

static int print_info_help() {
    std::cerr
        << "usage:\n"
        << "  docpersona info [options]\n"
        << "\n"
        << "options:\n"
        << "  --model <path>               default: models/emb/model.onnx\n"
        << "  --vocab <path>               default: models/emb/vocab.txt\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help") {
        return print_usage();
    }

    const bool help = argc >= 3 && std::string(argv[2]) == "--help";
    if (cmd == "outline" && help) return print_outline_help();
    if (cmd == "batch"   && help) return print_batch_help();
    if (cmd == "persona" && help) return print_persona_help();
    if (cmd == "info"    && help) return print_info_help();

    if (cmd == "outline") return cmd_outline(argc - 1, argv + 1);
    if (cmd == "batch")   return cmd_batch(argc - 1, argv + 1);
    if (cmd == "persona") return cmd_persona(argc - 1, argv + 1);
    if (cmd == "info")    return cmd_info(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
