#pragma once
#include "pdf/PdfSource.hpp"

#include <memory>
#include <string>

namespace poppler {
class document;
}

namespace pdf {

class PopplerPdfSource final : public PdfSource {
public:
    // Throws outline::DocumentReadError if the file cannot be loaded or is locked.
    explicit PopplerPdfSource(const std::string& path);
    ~PopplerPdfSource() override;

    PopplerPdfSource(const PopplerPdfSource&) = delete;
    PopplerPdfSource& operator=(const PopplerPdfSource&) = delete;

    const std::string& id() const override { return m_path; }
    int page_count() const override;
    std::string page_text(int i) const override;
    std::string full_text() const override;

private:
    std::string m_path;
    std::unique_ptr<poppler::document> m_doc;
};

}  // namespace pdf
