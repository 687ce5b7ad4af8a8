#include "outline/HeadingLevelClassifier.hpp"
#include "outline/HeadingDetector.hpp"
#include "outline/TextUtil.hpp"

namespace outline {

namespace {

struct LevelRule {
    HeadingLevel level;
    bool (*matches)(const std::string&);
};

bool top_level(const std::string& s) {
    return has_numbered_prefix(s) ||
           has_roman_prefix(s) ||
           (textutil::is_upper_text(s) && textutil::char_length(s) > 5);
}

bool mid_level(const std::string& s) {
    const size_t len = textutil::char_length(s);
    return textutil::is_title_case_phrase(s) && len > 10 && len < 50;
}

const LevelRule kLevelRules[] = {
    {HeadingLevel::H1, top_level},
    {HeadingLevel::H2, mid_level},
};

}  // namespace

HeadingLevel classify_level(const std::string& text) {
    for (const auto& rule : kLevelRules) {
        if (rule.matches(text)) return rule.level;
    }
    return HeadingLevel::H3;
}

std::vector<Heading> classify_candidates(const std::vector<HeadingCandidate>& candidates) {
    std::vector<Heading> out;
    out.reserve(candidates.size());
    for (const auto& c : candidates) {
        out.push_back(Heading{classify_level(c.text), c.text, c.page});
    }
    return out;
}

}  // namespace outline
