#pragma once

#include <string>
#include <vector>

#include "emb/Embedder.hpp"
#include "outline/Models.hpp"
#include "persona/PersonaEmbedder.hpp"

namespace persona {

struct RankedSection {
    std::string document;
    int page = 0;
    std::string section_title;
    outline::HeadingLevel level = outline::HeadingLevel::H3;
    double similarity = 0.0;   // raw cosine against the persona vector
    double importance = 0.0;   // similarity * level_multiplier(level), clamped to [0,1]
};

// H1 1.2, H2 1.0, H3 0.8
double level_multiplier(outline::HeadingLevel level);

double importance_score(double similarity, outline::HeadingLevel level);

// 0 when either vector has zero norm. Throws std::runtime_error on size mismatch.
double cosine(const std::vector<float>& a, const std::vector<float>& b);

// Every heading of every outline, scored against the persona and sorted by
// importance descending. Ties keep outline order, then heading order.
std::vector<RankedSection> rank_sections(const std::vector<outline::Outline>& outlines,
                                         const PersonaVector& persona,
                                         const emb::Embedder& embedder);

}  // namespace persona
