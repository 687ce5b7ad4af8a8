#include "outline/Models.hpp"

#include <stdexcept>

namespace outline {

const char* to_string(HeadingLevel level) {
    switch (level) {
        case HeadingLevel::H1: return "H1";
        case HeadingLevel::H2: return "H2";
        case HeadingLevel::H3: return "H3";
    }
    return "H3";
}

HeadingLevel parse_level(const std::string& s) {
    if (s == "H1") return HeadingLevel::H1;
    if (s == "H2") return HeadingLevel::H2;
    if (s == "H3") return HeadingLevel::H3;
    throw std::runtime_error("unknown heading level: " + s);
}

bool operator==(const Heading& a, const Heading& b) {
    return a.level == b.level && a.text == b.text && a.page == b.page;
}

bool operator==(const Outline& a, const Outline& b) {
    return a.document_id == b.document_id && a.title == b.title && a.headings == b.headings;
}

}  // namespace outline
