#pragma once
#include <string>
#include <vector>

#include "outline/Models.hpp"

namespace outline {

// First matching rule wins:
//   H1  "1. Title", "IV. Title", or fully uppercase and longer than 5 chars
//   H2  Title-Case phrase, 10 < length < 50
//   H3  everything else
// Each candidate is classified on its own; the resulting outline may skip
// levels (an H2 with no H1 before it).
HeadingLevel classify_level(const std::string& text);

std::vector<Heading> classify_candidates(const std::vector<HeadingCandidate>& candidates);

}  // namespace outline
