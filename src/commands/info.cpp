#include "commands/info.hpp"
#include "commands/exit_codes.hpp"

#include "emb/MiniLmEmbedder.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static double file_size_mb(const std::string& path) {
    std::error_code ec;
    const auto bytes = fs::file_size(path, ec);
    if (ec) return 0.0;
    return static_cast<double>(bytes) / 1024.0 / 1024.0;
}

int cmd_info(int argc, char** argv) {
    const std::string model = get_arg(argc, argv, "--model", "models/emb/model.onnx");
    const std::string vocab = get_arg(argc, argv, "--vocab", "models/emb/vocab.txt");

    std::cout << "EMB_MODEL: " << model << "\n";
    std::cout << "EMB_MODEL_MB: " << file_size_mb(model) << "\n";
    std::cout << "EMB_VOCAB: " << vocab << "\n";

    emb::MiniLmEmbedder embedder;
    if (!embedder.init(model, vocab)) {
        std::cerr << "error: failed to init MiniLmEmbedder\n";
        return kExitInternalError;
    }

    std::cout << "VOCAB_SIZE: " << embedder.vocab_size() << "\n";
    std::cout << "MAX_LEN: " << embedder.max_len() << "\n";
    std::cout << "EMB_DIM: " << embedder.embed("dimension check").size() << "\n";
    return kExitOk;
}
