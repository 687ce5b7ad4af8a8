#include "persona/SectionRanker.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace persona {

static double clamp01(double x) {
    if (x < 0.0) return 0.0;
    if (x > 1.0) return 1.0;
    return x;
}

double level_multiplier(outline::HeadingLevel level) {
    switch (level) {
        case outline::HeadingLevel::H1: return 1.2;
        case outline::HeadingLevel::H2: return 1.0;
        case outline::HeadingLevel::H3: return 0.8;
    }
    return 1.0;
}

double importance_score(double similarity, outline::HeadingLevel level) {
    return clamp01(similarity * level_multiplier(level));
}

double cosine(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size()) {
        throw std::runtime_error("cosine: dimension mismatch (" + std::to_string(a.size()) +
                                 " vs " + std::to_string(b.size()) + ")");
    }

    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        const double x = a[i], y = b[i];
        dot += x * y;
        na += x * x;
        nb += y * y;
    }
    if (na == 0.0 || nb == 0.0) return 0.0;
    return dot / (std::sqrt(na) * std::sqrt(nb));
}

std::vector<RankedSection> rank_sections(const std::vector<outline::Outline>& outlines,
                                         const PersonaVector& persona,
                                         const emb::Embedder& embedder) {
    std::vector<RankedSection> out;

    size_t total = 0;
    for (const auto& o : outlines) total += o.headings.size();
    out.reserve(total);

    for (const auto& o : outlines) {
        for (const auto& h : o.headings) {
            const std::vector<float> v = embedder.embed(h.text);
            if (v.empty()) {
                throw std::runtime_error("empty embedding for section: " + h.text);
            }

            RankedSection rs;
            rs.document = o.document_id;
            rs.page = h.page;
            rs.section_title = h.text;
            rs.level = h.level;
            rs.similarity = cosine(v, persona.values);
            rs.importance = importance_score(rs.similarity, h.level);
            out.push_back(std::move(rs));
        }
    }

    std::stable_sort(out.begin(), out.end(), [](const RankedSection& a, const RankedSection& b) {
        return a.importance > b.importance;
    });
    return out;
}

}  // namespace persona
