#include "pdf/PopplerPdfSource.hpp"
#include "outline/Errors.hpp"

#include <poppler/cpp/poppler-document.h>
#include <poppler/cpp/poppler-global.h>
#include <poppler/cpp/poppler-page.h>

#include <filesystem>
#include <system_error>

namespace pdf {

static std::string to_utf8(const poppler::ustring& s) {
    poppler::byte_array bytes = s.to_utf8();
    return std::string(bytes.begin(), bytes.end());
}

PopplerPdfSource::PopplerPdfSource(const std::string& path) : m_path(path) {
    std::error_code ec;
    const std::filesystem::file_status st = std::filesystem::status(path, ec);
    if (st.type() == std::filesystem::file_type::not_found) {
        throw outline::DocumentReadError(path, "file not found");
    }
    if (ec) {
        throw outline::DocumentReadError(path, "cannot stat file: " + ec.message());
    }
    if (!std::filesystem::is_regular_file(st)) {
        throw outline::DocumentReadError(path, "not a regular file");
    }

    m_doc.reset(poppler::document::load_from_file(path));
    if (!m_doc) {
        throw outline::DocumentReadError(path, "failed to load PDF");
    }
    if (m_doc->is_locked()) {
        throw outline::DocumentReadError(path, "PDF is password protected");
    }
}

PopplerPdfSource::~PopplerPdfSource() = default;

int PopplerPdfSource::page_count() const {
    return m_doc->pages();
}

std::string PopplerPdfSource::page_text(int i) const {
    std::unique_ptr<poppler::page> page(m_doc->create_page(i));
    if (!page) {
        throw outline::DocumentReadError(m_path, "failed to read page", i);
    }
    return to_utf8(page->text(poppler::rectf(), poppler::page::raw_order_layout));
}

std::string PopplerPdfSource::full_text() const {
    std::string out;
    const int n = m_doc->pages();
    for (int i = 0; i < n; ++i) {
        std::unique_ptr<poppler::page> page(m_doc->create_page(i));
        if (!page) {
            throw outline::DocumentReadError(m_path, "failed to read page", i);
        }
        out += to_utf8(page->text(poppler::rectf(), poppler::page::physical_layout));
        out += "\n";
    }
    return out;
}

}  // namespace pdf
