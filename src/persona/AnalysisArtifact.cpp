#include "persona/AnalysisArtifact.hpp"

#include <fstream>
#include <stdexcept>

namespace persona {

static nlohmann::json section_to_json(const RankedSection& s) {
    return {
        {"document", s.document},
        {"page", s.page},
        {"section_title", s.section_title},
        {"importance_rank", s.importance},
        {"similarity_score", s.similarity},
        {"level", outline::to_string(s.level)}
    };
}

static nlohmann::json insight_to_json(const Insight& in) {
    return {
        {"document", in.section.document},
        {"refined_text", in.refined_text},
        {"page", in.section.page},
        {"original_title", in.section.section_title},
        {"relevance_explanation", in.relevance_explanation}
    };
}

nlohmann::json analysis_to_json(const PersonaAnalysis& a) {
    nlohmann::json j;

    nlohmann::json docs = nlohmann::json::array();
    for (const auto& d : a.documents) {
        nlohmann::json dj = {
            {"document", d.document},
            {"status", to_string(d.status)}
        };
        if (!d.reason.empty()) dj["reason"] = d.reason;
        docs.push_back(dj);
    }

    j["metadata"] = {
        {"documents", a.metadata.documents},
        {"persona_description", a.metadata.persona_description},
        {"job_to_be_done", a.metadata.job_to_be_done},
        {"timestamp", a.metadata.timestamp},
        {"processing_time", a.metadata.processing_time},
        {"document_status", docs},
        {"warnings", a.metadata.warnings}
    };

    nlohmann::json sections = nlohmann::json::array();
    for (const auto& s : a.sections) sections.push_back(section_to_json(s));
    j["extracted_sections"] = sections;

    nlohmann::json insights = nlohmann::json::array();
    for (const auto& in : a.insights) insights.push_back(insight_to_json(in));
    j["sub_section_analyses"] = insights;

    return j;
}

void write_analysis(const std::filesystem::path& out_path, const PersonaAnalysis& a) {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << analysis_to_json(a).dump(2) << "\n";
}

}  // namespace persona
