#pragma once
#include <string>
#include <vector>

#include "outline/Models.hpp"
#include "pdf/PdfSource.hpp"

namespace outline {

// Line-level heading test. Only the line itself is looked at, no context.
// Rules are tried in order; lines under 3 characters never qualify.
bool is_heading_candidate(const std::string& line);

// Name of the rule that accepted the line ("all_caps", "numbered",
// "title_case", "roman", "short_capitalized"), or "" when rejected.
std::string matching_rule(const std::string& line);

// Trimmed lines of the page that pass is_heading_candidate, in line order.
std::vector<HeadingCandidate> detect_candidates(const pdf::Page& page);

// shared with HeadingLevelClassifier
bool has_numbered_prefix(const std::string& s);
bool has_roman_prefix(const std::string& s);

}  // namespace outline
