#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "outline/Models.hpp"

namespace outline {

// Source could not be opened or parsed. page_index is the 0-based page being
// read when the failure happened, if any.
class DocumentReadError : public std::runtime_error {
public:
    DocumentReadError(std::string document, const std::string& reason, std::optional<int> page_index = std::nullopt);

    const std::string& document() const { return m_document; }
    std::optional<int> page_index() const { return m_page_index; }

private:
    std::string m_document;
    std::optional<int> m_page_index;
};

// No pages or no heading candidates. Carries the minimal outline that was
// still produced (title or fallback title, no headings).
class DocumentEmptyError : public std::runtime_error {
public:
    explicit DocumentEmptyError(Outline minimal);

    const Outline& outline() const { return m_outline; }

private:
    Outline m_outline;
};

class InvalidInputError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace outline
