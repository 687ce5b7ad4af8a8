#include "commands/persona.hpp"
#include "commands/exit_codes.hpp"

#include "emb/MiniLmEmbedder.hpp"
#include "outline/Errors.hpp"
#include "pdf/PdfDirectory.hpp"
#include "persona/AnalysisArtifact.hpp"
#include "persona/PersonaAnalyzer.hpp"

#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static int get_arg_int(int argc, char** argv, const std::string& key, int def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    try { return std::stoi(s); } catch (const std::exception&) { return def; }
}

static void print_top(const persona::PersonaAnalysis& a, size_t n) {
    std::cout << "\nTop " << std::min(n, a.sections.size()) << " recommended sections:\n";
    for (size_t i = 0; i < a.sections.size() && i < n; ++i) {
        const auto& s = a.sections[i];
        std::cout << "  " << (i + 1) << ". " << s.section_title << " (p." << s.page << ") - rank: "
                  << std::fixed << std::setprecision(2) << s.importance << "\n";
    }
}

int cmd_persona(int argc, char** argv) {
    const std::string docs_dir = get_arg(argc, argv, "--docs", "");
    const std::string persona_desc = get_arg(argc, argv, "--persona", "");
    const std::string job = get_arg(argc, argv, "--job", "");
    const fs::path out_path = get_arg(argc, argv, "--out", "out/persona_analysis.json");
    const std::string model = get_arg(argc, argv, "--model", "models/emb/model.onnx");
    const std::string vocab = get_arg(argc, argv, "--vocab", "models/emb/vocab.txt");
    const int max_len = get_arg_int(argc, argv, "--max_len", 256);
    const bool serial = has_flag(argc, argv, "--serial");

    if (docs_dir.empty() || persona_desc.empty() || job.empty()) {
        std::cerr << "error: --docs, --persona and --job are required\n";
        return kExitInputError;
    }

    try {
        if (!fs::is_directory(docs_dir)) {
            throw outline::InvalidInputError("input directory does not exist: " + docs_dir);
        }
        const std::vector<std::string> pdfs = pdf::list_pdfs(docs_dir);
        persona::require_document_count(pdfs.size());

        std::cout << "DOCUMENTS: " << pdfs.size() << "\n";
        std::cout << "PERSONA: " << persona_desc << "\n";
        std::cout << "JOB: " << job << "\n";

        emb::MiniLmEmbedder embedder(max_len > 2 ? static_cast<size_t>(max_len) : 256u);
        if (!embedder.init(model, vocab)) {
            std::cerr << "error: failed to init MiniLmEmbedder (check --model/--vocab)\n";
            return kExitInternalError;
        }

        persona::AnalyzerOptions opts;
        opts.parallel = !serial;

        const persona::PersonaAnalysis a =
            persona::analyze_persona(pdfs, persona_desc, job, embedder, opts);
        persona::write_analysis(out_path, a);

        std::cout << "OUT: " << out_path.string() << "\n";
        std::cout << "ELAPSED_S: " << a.metadata.processing_time << "\n";
        std::cout << "SECTIONS: " << a.sections.size() << "\n";
        std::cout << "INSIGHTS: " << a.insights.size() << "\n";
        std::cout << "WARNINGS: " << a.metadata.warnings.size() << "\n";
        print_top(a, 3);
        return kExitOk;
    } catch (const outline::InvalidInputError& e) {
        std::cerr << "persona failed: " << e.what() << "\n";
        return kExitInputError;
    } catch (const outline::DocumentReadError& e) {
        std::cerr << "persona failed: " << e.what() << "\n";
        return kExitProcessingError;
    } catch (const std::exception& e) {
        std::cerr << "persona failed: " << e.what() << "\n";
        return kExitInternalError;
    }
}
