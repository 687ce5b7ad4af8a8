#include "pdf/PdfSource.hpp"

namespace pdf {

std::vector<Page> read_pages(const PdfSource& src) {
    const int n = src.page_count();

    std::vector<Page> pages;
    pages.reserve(n > 0 ? static_cast<size_t>(n) : 0u);
    for (int i = 0; i < n; ++i) {
        pages.push_back(Page{i + 1, src.page_text(i)});
    }
    return pages;
}

}  // namespace pdf
