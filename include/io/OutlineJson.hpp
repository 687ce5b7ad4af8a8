#pragma once

#include <filesystem>
#include <string>

#include "nlohmann/json.hpp"
#include "outline/Models.hpp"

namespace io {

// { "title": ..., "outline": [ { "level", "text", "page" } ] }
nlohmann::json outline_to_json(const outline::Outline& o);

// Throws std::runtime_error naming the offending field on malformed input.
outline::Outline outline_from_json(const nlohmann::json& j, const std::string& document_id = "");

outline::Outline load_outline(const std::filesystem::path& path);

// extra keys (processing_time, input_file, ...) are merged into the root object
void write_outline(const std::filesystem::path& out_path,
                   const outline::Outline& o,
                   const nlohmann::json& extra = nlohmann::json::object());

}  // namespace io
