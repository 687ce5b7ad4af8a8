#include "outline/HeadingDetector.hpp"
#include "outline/TextUtil.hpp"

namespace outline {

namespace {

struct DetectionRule {
    const char* name;
    bool (*matches)(const std::string&);
};

bool is_upper_ascii(char c) { return c >= 'A' && c <= 'Z'; }
bool is_digit_ascii(char c) { return c >= '0' && c <= '9'; }

// "." followed by at least one whitespace and an uppercase letter, starting at pos
bool dot_space_capital(const std::string& s, size_t pos) {
    if (pos >= s.size() || s[pos] != '.') return false;
    size_t i = pos + 1;
    size_t ws_start = i;
    while (i < s.size() && textutil::is_space(s[i])) ++i;
    if (i == ws_start) return false;
    return i < s.size() && is_upper_ascii(s[i]);
}

// [A-Z][A-Z\s]{2,} spanning the whole line
bool all_caps_run(const std::string& s) {
    if (s.size() < 3 || !is_upper_ascii(s[0])) return false;
    for (size_t i = 1; i < s.size(); ++i) {
        if (!is_upper_ascii(s[i]) && !textutil::is_space(s[i])) return false;
    }
    return true;
}

bool short_capitalized(const std::string& s) {
    if (textutil::char_length(s) >= 100) return false;
    if (textutil::is_upper_text(s)) return true;
    return textutil::starts_upper(s) && textutil::count_spaces(s) <= 8;
}

const DetectionRule kRules[] = {
    {"all_caps", all_caps_run},
    {"numbered", has_numbered_prefix},
    {"title_case", textutil::is_title_case_phrase},
    {"roman", has_roman_prefix},
    {"short_capitalized", short_capitalized},
};

}  // namespace

bool has_numbered_prefix(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && is_digit_ascii(s[i])) ++i;
    if (i == 0) return false;
    return dot_space_capital(s, i);
}

bool has_roman_prefix(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && (s[i] == 'I' || s[i] == 'V' || s[i] == 'X')) ++i;
    if (i == 0) return false;
    return dot_space_capital(s, i);
}

std::string matching_rule(const std::string& line) {
    if (textutil::char_length(line) < 3) return "";

    for (const auto& rule : kRules) {
        if (rule.matches(line)) return rule.name;
    }
    return "";
}

bool is_heading_candidate(const std::string& line) {
    return !matching_rule(line).empty();
}

std::vector<HeadingCandidate> detect_candidates(const pdf::Page& page) {
    std::vector<HeadingCandidate> out;
    for (const auto& raw : textutil::split_lines(page.text)) {
        std::string line = textutil::trim(raw);
        if (is_heading_candidate(line)) {
            out.push_back(HeadingCandidate{std::move(line), page.number});
        }
    }
    return out;
}

}  // namespace outline
