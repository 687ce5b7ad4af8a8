#pragma once

#include <filesystem>

#include "nlohmann/json.hpp"
#include "persona/PersonaAnalyzer.hpp"

namespace persona {

// { metadata, extracted_sections, sub_section_analyses }
nlohmann::json analysis_to_json(const PersonaAnalysis& a);

void write_analysis(const std::filesystem::path& out_path, const PersonaAnalysis& a);

}  // namespace persona
