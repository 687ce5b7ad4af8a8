#include "persona/InsightSummarizer.hpp"

#include <algorithm>

namespace persona {

std::string explain_relevance(const RankedSection& section) {
    const std::string quoted = "'" + section.section_title + "'";
    const double s = section.similarity;

    if (s > 0.8) return quoted + " directly addresses your primary objectives with high relevance.";
    if (s > 0.6) return quoted + " provides valuable context and supporting information for your goals.";
    return quoted + " offers background information that may be useful for your research.";
}

static const char* relevance_band(double similarity) {
    if (similarity > 0.7) return "highly relevant";
    if (similarity > 0.5) return "moderately relevant";
    return "somewhat relevant";
}

std::string refine_text(const RankedSection& section) {
    std::string out = "This section on '" + section.section_title + "' is " +
                      relevance_band(section.similarity) + " to your needs. ";
    out += "It appears on page " + std::to_string(section.page) + " and addresses key aspects ";
    out += "related to your persona and objectives.";
    return out;
}

std::vector<Insight> summarize_top(const std::vector<RankedSection>& ranked) {
    const size_t n = std::min(kInsightCount, ranked.size());

    std::vector<Insight> out;
    out.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        out.push_back(Insight{ranked[i], explain_relevance(ranked[i]), refine_text(ranked[i])});
    }
    return out;
}

}  // namespace persona
