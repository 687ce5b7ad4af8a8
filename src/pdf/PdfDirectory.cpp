#include "pdf/PdfDirectory.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace pdf {

static bool has_pdf_extension(const fs::path& p) {
    std::string ext = p.extension().string();
    for (char& c : ext) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return ext == ".pdf";
}

std::vector<std::string> list_pdfs(const std::string& dir) {
    fs::path root(dir);
    if (!fs::is_directory(root)) throw std::runtime_error("dir not found: " + dir);

    std::vector<std::string> out;
    for (auto& entry : fs::directory_iterator(root)) {
        if (!entry.is_regular_file()) continue;
        if (!has_pdf_extension(entry.path())) continue;
        out.push_back(entry.path().string());
    }

    // directory_iterator order is unspecified; input order drives tie-breaks
    std::sort(out.begin(), out.end());
    return out;
}

}  // namespace pdf
