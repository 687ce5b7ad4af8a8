#pragma once
#include <memory>
#include <string>
#include <vector>

namespace pdf {

struct Page {
    int number = 0;     // 1-based
    std::string text;
};

// Read-only view of a PDF. Implementations throw outline::DocumentReadError
// when the underlying document cannot be read.
class PdfSource {
public:
    virtual ~PdfSource() = default;

    virtual const std::string& id() const = 0;
    virtual int page_count() const = 0;

    // plain text of page i (0-based)
    virtual std::string page_text(int i) const = 0;

    // layout-preserving text of the whole document
    virtual std::string full_text() const = 0;
};

std::vector<Page> read_pages(const PdfSource& src);

}  // namespace pdf
