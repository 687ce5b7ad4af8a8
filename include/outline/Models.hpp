#pragma once
#include <string>
#include <vector>

namespace outline {

inline constexpr const char* kUntitledDocument = "Untitled Document";

enum class HeadingLevel {
    H1,
    H2,
    H3
};

const char* to_string(HeadingLevel level);

// Throws std::runtime_error on anything but "H1", "H2", "H3".
HeadingLevel parse_level(const std::string& s);

struct HeadingCandidate {
    std::string text;
    int page = 0;   // 1-based
};

struct Heading {
    HeadingLevel level = HeadingLevel::H3;
    std::string text;
    int page = 0;   // 1-based
};

struct Outline {
    std::string document_id;            // path or name the outline came from
    std::string title = kUntitledDocument;
    std::vector<Heading> headings;      // page order, then line order
};

bool operator==(const Heading& a, const Heading& b);
bool operator==(const Outline& a, const Outline& b);

}  // namespace outline
