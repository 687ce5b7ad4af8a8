#include "outline/OutlineBuilder.hpp"

#include "outline/Errors.hpp"
#include "outline/HeadingDetector.hpp"
#include "outline/HeadingLevelClassifier.hpp"
#include "outline/TextUtil.hpp"
#include "pdf/PopplerPdfSource.hpp"

#include <iterator>

namespace outline {

static constexpr size_t kTitleScanLines = 10;

static bool looks_like_title(const std::string& line) {
    const size_t len = textutil::char_length(line);
    if (len <= 3 || len >= 200) return false;

    return textutil::is_upper_text(line) ||
           (textutil::starts_upper(line) && textutil::count_spaces(line) <= 10) ||
           textutil::is_title_case_phrase(line);
}

std::string extract_title(const std::string& full_text) {
    size_t seen = 0;
    for (const auto& raw : textutil::split_lines(full_text)) {
        const std::string line = textutil::trim(raw);
        if (line.empty()) continue;
        if (seen++ >= kTitleScanLines) break;

        if (looks_like_title(line)) return line;
    }
    return kUntitledDocument;
}

Outline build_outline(const std::string& document_id,
                      const std::string& full_text,
                      const std::vector<pdf::Page>& pages) {
    Outline o;
    o.document_id = document_id;
    o.title = extract_title(full_text);

    for (const auto& page : pages) {
        auto headings = classify_candidates(detect_candidates(page));
        o.headings.insert(o.headings.end(),
                          std::make_move_iterator(headings.begin()),
                          std::make_move_iterator(headings.end()));
    }
    return o;
}

Outline extract_outline(const pdf::PdfSource& src) {
    const std::string full = src.full_text();
    const std::vector<pdf::Page> pages = pdf::read_pages(src);

    Outline o = build_outline(src.id(), full, pages);
    if (pages.empty() || o.headings.empty()) {
        throw DocumentEmptyError(std::move(o));
    }
    return o;
}

Outline extract_outline_file(const std::string& path) {
    pdf::PopplerPdfSource src(path);
    return extract_outline(src);
}

}  // namespace outline
