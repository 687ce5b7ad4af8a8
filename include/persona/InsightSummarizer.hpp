#pragma once

#include <string>
#include <vector>

#include "persona/SectionRanker.hpp"

namespace persona {

inline constexpr size_t kInsightCount = 10;

struct Insight {
    RankedSection section;
    std::string relevance_explanation;
    std::string refined_text;
};

std::string explain_relevance(const RankedSection& section);
std::string refine_text(const RankedSection& section);

// insights for the first kInsightCount ranked sections
std::vector<Insight> summarize_top(const std::vector<RankedSection>& ranked);

}  // namespace persona
