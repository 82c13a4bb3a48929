#include <diagram_loaders/json_loader.hpp>
#include <nlohmann/json.hpp>
#include <diagram_model/logger.hpp>
#include <fstream>
#include <limits>
#include <memory>

namespace diagram_loaders {

namespace {

std::shared_ptr<spdlog::logger> loaders_logger() {
    static std::shared_ptr<spdlog::logger> logger = diagram_model::component_logger("loaders");
    return logger;
}

std::string string_or(const nlohmann::json& j, const char* key, const std::string& fallback = "") {
    return j.contains(key) && j[key].is_string() ? j[key].get<std::string>() : fallback;
}

double number_or(const nlohmann::json& j, const char* key, double fallback = 0) {
    return j.contains(key) && j[key].is_number() ? j[key].get<double>() : fallback;
}

// Values outside the int range are treated as missing.
int int_or(const nlohmann::json& j, const char* key, int fallback = 0) {
    if (!j.contains(key) || !j[key].is_number()) return fallback;
    const double v = j[key].get<double>();
    if (!(v >= std::numeric_limits<int>::min() && v <= std::numeric_limits<int>::max())) return fallback;
    return static_cast<int>(v);
}

diagram_model::BBox parse_bbox(const nlohmann::json& j) {
    diagram_model::BBox box;
    if (!j.is_array() || j.size() != 4) return box;
    for (const auto& v : j)
        if (!v.is_number()) return box;
    box.x0 = j[0].get<double>();
    box.y0 = j[1].get<double>();
    box.x1 = j[2].get<double>();
    box.y1 = j[3].get<double>();
    return box;
}

diagram_model::TaxiwayLabel parse_label(const nlohmann::json& l) {
    diagram_model::TaxiwayLabel label;
    label.designator = string_or(l, "designator");
    label.x = number_or(l, "x");
    label.y = number_or(l, "y");
    if (l.contains("bbox")) label.bbox = parse_bbox(l["bbox"]);
    return label;
}

diagram_model::RunwayRecord parse_runway(const nlohmann::json& r) {
    diagram_model::RunwayRecord rwy;
    rwy.designator = string_or(r, "designator");
    rwy.length_ft = int_or(r, "length_ft");
    rwy.width_ft = int_or(r, "width_ft");
    rwy.x = number_or(r, "x");
    rwy.y = number_or(r, "y");
    rwy.surface = string_or(r, "surface");
    rwy.raw_text = string_or(r, "raw_text");
    return rwy;
}

diagram_model::PathSegment parse_path(const nlohmann::json& p) {
    // "width" is null for fill-only paths in older extractions.
    return { number_or(p, "x0"), number_or(p, "y0"), number_or(p, "x1"), number_or(p, "y1"),
             number_or(p, "width") };
}

std::optional<diagram_model::DiagramSnapshot> parse_snapshot_json(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;

    diagram_model::DiagramSnapshot s;
    s.airport_code = string_or(j, "airport_code", "UNKNOWN");
    s.cycle = string_or(j, "cycle", "UNKNOWN");
    s.source_file = string_or(j, "source_file");
    s.page_width = number_or(j, "page_width");
    s.page_height = number_or(j, "page_height");

    if (j.contains("taxiway_labels") && j["taxiway_labels"].is_array()) {
        for (const auto& l : j["taxiway_labels"])
            if (l.is_object()) s.taxiway_labels.push_back(parse_label(l));
    }
    if (j.contains("runway_info") && j["runway_info"].is_array()) {
        for (const auto& r : j["runway_info"])
            if (r.is_object()) s.runway_info.push_back(parse_runway(r));
    }
    if (j.contains("paths") && j["paths"].is_array()) {
        for (const auto& p : j["paths"])
            if (p.is_object()) s.paths.push_back(parse_path(p));
    }
    if (j.contains("raw_runway_text") && j["raw_runway_text"].is_array()) {
        for (const auto& t : j["raw_runway_text"])
            if (t.is_string()) s.raw_runway_text.push_back(t.get<std::string>());
    }
    return s;
}

} // namespace

std::optional<diagram_model::DiagramSnapshot> load_snapshot_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_snapshot_json(j);
    } catch (const nlohmann::json::exception& e) {
        loaders_logger()->warn("Invalid snapshot JSON: {}", e.what());
        return std::nullopt;
    }
}

std::optional<diagram_model::DiagramSnapshot> load_snapshot_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return std::nullopt;
    return load_snapshot_from_json(f);
}

} // namespace diagram_loaders
