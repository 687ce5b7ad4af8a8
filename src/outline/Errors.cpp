#include "outline/Errors.hpp"

namespace outline {

static std::string read_error_message(const std::string& document, const std::string& reason,
                                      std::optional<int> page_index) {
    std::string msg = document + ": " + reason;
    if (page_index) msg += " (page index " + std::to_string(*page_index) + ")";
    return msg;
}

DocumentReadError::DocumentReadError(std::string document, const std::string& reason, std::optional<int> page_index)
    : std::runtime_error(read_error_message(document, reason, page_index)),
      m_document(std::move(document)),
      m_page_index(page_index) {}

DocumentEmptyError::DocumentEmptyError(Outline minimal)
    : std::runtime_error(minimal.document_id + ": no extractable headings"),
      m_outline(std::move(minimal)) {}

}  // namespace outline
