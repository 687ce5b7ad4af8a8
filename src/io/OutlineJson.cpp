#include "io/OutlineJson.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace io {

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static std::string require_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

static int require_int(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_number_integer()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be an integer");
    }
    return j.at(key).get<int>();
}

json outline_to_json(const outline::Outline& o) {
    json j;
    j["title"] = o.title;

    json arr = json::array();
    for (const auto& h : o.headings) {
        arr.push_back({
            {"level", outline::to_string(h.level)},
            {"text", h.text},
            {"page", h.page}
        });
    }
    j["outline"] = arr;
    return j;
}

outline::Outline outline_from_json(const json& j, const std::string& document_id) {
    require_object(j, "root");

    outline::Outline o;
    o.document_id = document_id;
    o.title = require_string(j, "title", "root");

    if (!j.contains("outline")) {
        throw std::runtime_error("root missing required field: outline");
    }
    const json& arr = j.at("outline");
    if (!arr.is_array()) {
        throw std::runtime_error("root.outline must be an array");
    }

    for (size_t i = 0; i < arr.size(); ++i) {
        std::ostringstream oss;
        oss << "root.outline[" << i << "]";
        const std::string where = oss.str();

        const json& hj = arr.at(i);
        require_object(hj, where);

        outline::Heading h;
        try {
            h.level = outline::parse_level(require_string(hj, "level", where));
        } catch (const std::runtime_error& e) {
            throw std::runtime_error(where + ".level: " + e.what());
        }
        h.text = require_string(hj, "text", where);
        h.page = require_int(hj, "page", where);
        o.headings.push_back(std::move(h));
    }

    return o;
}

outline::Outline load_outline(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open outline file: " + path.string());
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to parse JSON: ") + e.what());
    }
    return outline_from_json(j, path.string());
}

void write_outline(const std::filesystem::path& out_path, const outline::Outline& o, const json& extra) {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    json j = outline_to_json(o);
    if (extra.is_object()) {
        for (auto it = extra.begin(); it != extra.end(); ++it) j[it.key()] = it.value();
    }
    out << j.dump(2) << "\n";
}

}  // namespace io
