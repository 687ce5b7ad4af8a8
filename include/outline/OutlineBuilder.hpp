#pragma once
#include <string>
#include <vector>

#include "outline/Models.hpp"
#include "pdf/PdfSource.hpp"

namespace outline {

// First of the first 10 non-empty lines that looks like a title, or
// kUntitledDocument.
std::string extract_title(const std::string& full_text);

// Title from the layout text, headings from the per-page text. The two
// extractions are independent.
Outline build_outline(const std::string& document_id,
                      const std::string& full_text,
                      const std::vector<pdf::Page>& pages);

// Throws DocumentReadError (from the source) or DocumentEmptyError when the
// document has no pages or no heading candidates.
Outline extract_outline(const pdf::PdfSource& src);

// Opens the file with poppler and calls extract_outline.
Outline extract_outline_file(const std::string& path);

}  // namespace outline
