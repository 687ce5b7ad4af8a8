#include "commands/outline.hpp"
#include "commands/exit_codes.hpp"

#include "io/OutlineJson.hpp"
#include "outline/Errors.hpp"
#include "outline/HeadingDetector.hpp"
#include "outline/OutlineBuilder.hpp"

#include <chrono>
#include <iostream>
#include <string>

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

static void print_outline(const outline::Outline& o, bool explain) {
    std::cout << "TITLE: " << o.title << "\n";
    std::cout << "SECTIONS: " << o.headings.size() << "\n";
    if (!explain) return;

    for (const auto& h : o.headings) {
        std::cout << "  [" << outline::to_string(h.level) << "] p." << h.page << " "
                  << h.text << "  (" << outline::matching_rule(h.text) << ")\n";
    }
}

int cmd_outline(int argc, char** argv) {
    const std::string pdf_path = get_arg(argc, argv, "--pdf", "");
    const std::string out_path = get_arg(argc, argv, "--out", "");
    const bool explain = has_flag(argc, argv, "--explain");

    if (pdf_path.empty()) {
        std::cerr << "error: --pdf is required\n";
        return kExitInputError;
    }

    std::cout << "PROCESSING: " << pdf_path << "\n";
    const auto t0 = std::chrono::steady_clock::now();

    auto finish = [&](const outline::Outline& o) {
        const double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
        if (!out_path.empty()) {
            io::write_outline(out_path, o, {{"processing_time", secs}, {"input_file", pdf_path}});
            std::cout << "OUT: " << out_path << "\n";
        }
        std::cout << "ELAPSED_S: " << secs << "\n";
        print_outline(o, explain);
    };

    try {
        try {
            finish(outline::extract_outline_file(pdf_path));
            return kExitOk;
        } catch (const outline::DocumentEmptyError& e) {
            // still a usable outline: fallback title, no headings
            std::cerr << "warning: " << e.what() << "\n";
            finish(e.outline());
            return kExitProcessingError;
        }
    } catch (const outline::DocumentReadError& e) {
        std::cerr << "outline failed: " << e.what() << "\n";
        return kExitProcessingError;
    } catch (const std::exception& e) {
        std::cerr << "outline failed: " << e.what() << "\n";
        return kExitInternalError;
    }
}
