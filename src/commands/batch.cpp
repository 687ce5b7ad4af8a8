#include "commands/batch.hpp"
#include "commands/exit_codes.hpp"

#include "io/OutlineJson.hpp"
#include "outline/Errors.hpp"
#include "outline/OutlineBuilder.hpp"
#include "pdf/PdfDirectory.hpp"

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

int cmd_batch(int argc, char** argv) {
    const std::string in_dir = get_arg(argc, argv, "--in", "input");
    const fs::path outdir = get_arg(argc, argv, "--outdir", "out");

    if (!fs::is_directory(in_dir)) {
        std::cerr << "error: input directory does not exist: " << in_dir << "\n";
        return kExitInputError;
    }

    try {
        const std::vector<std::string> pdfs = pdf::list_pdfs(in_dir);
        if (pdfs.empty()) {
            std::cerr << "error: no PDF files found in: " << in_dir << "\n";
            return kExitInputError;
        }
        std::cout << "FOUND: " << pdfs.size() << " PDF files\n";

        size_t processed = 0;
        for (const auto& path : pdfs) {
            const fs::path out_path = outdir / (fs::path(path).stem().string() + ".outline.json");
            try {
                outline::Outline o;
                try {
                    o = outline::extract_outline_file(path);
                } catch (const outline::DocumentEmptyError& e) {
                    std::cerr << "warning: " << e.what() << "\n";
                    o = e.outline();
                }
                io::write_outline(out_path, o, {{"input_file", path}});
                ++processed;
                std::cout << "ok " << path << " -> " << out_path.string()
                          << " (" << o.headings.size() << " sections)\n";
            } catch (const std::exception& e) {
                std::cerr << "warning: " << path << ": " << e.what() << "\n";
            }
        }

        std::cout << "PROCESSED: " << processed << "/" << pdfs.size() << "\n";
        return kExitOk;
    } catch (const std::exception& e) {
        std::cerr << "batch failed: " << e.what() << "\n";
        return kExitInternalError;
    }
}
