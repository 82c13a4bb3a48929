#include <diagram_loaders/json_loader.hpp>
#include <diagram_compare/aggregator.hpp>
#include <diagram_model/logger.hpp>
#include <nlohmann/json.hpp>
#include <array>
#include <fstream>
#include <memory>
#include <utility>

namespace diagram_loaders {

namespace {

std::shared_ptr<spdlog::logger> loaders_logger() {
    static std::shared_ptr<spdlog::logger> logger = diagram_model::component_logger("loaders");
    return logger;
}

nlohmann::json bbox_json(const diagram_model::BBox& b) {
    return nlohmann::json::array({ b.x0, b.y0, b.x1, b.y1 });
}

nlohmann::json rect_json(const std::array<double, 4>& r) {
    return nlohmann::json::array({ r[0], r[1], r[2], r[3] });
}

nlohmann::json snapshot_json(const diagram_model::DiagramSnapshot& s) {
    nlohmann::json labels = nlohmann::json::array();
    for (const auto& l : s.taxiway_labels)
        labels.push_back({ {"designator", l.designator}, {"x", l.x}, {"y", l.y}, {"bbox", bbox_json(l.bbox)} });

    nlohmann::json runways = nlohmann::json::array();
    for (const auto& r : s.runway_info) {
        runways.push_back({
            {"designator", r.designator},
            {"length_ft", r.length_ft},
            {"width_ft", r.width_ft},
            {"x", r.x},
            {"y", r.y},
            {"surface", r.surface},
            {"raw_text", r.raw_text},
        });
    }

    nlohmann::json paths = nlohmann::json::array();
    for (const auto& p : s.paths)
        paths.push_back({ {"x0", p.x0}, {"y0", p.y0}, {"x1", p.x1}, {"y1", p.y1}, {"width", p.width} });

    return {
        {"airport_code", s.airport_code},
        {"cycle", s.cycle},
        {"source_file", s.source_file},
        {"page_width", s.page_width},
        {"page_height", s.page_height},
        {"taxiway_labels", std::move(labels)},
        {"runway_info", std::move(runways)},
        {"paths", std::move(paths)},
        {"raw_runway_text", s.raw_runway_text},
    };
}

nlohmann::json summary_json(const diagram_model::ComparisonSummary& s) {
    return {
        {"total_changes", s.total_changes},
        {"taxiways_added", s.taxiways_added},
        {"taxiways_removed", s.taxiways_removed},
        {"taxiways_renamed", s.taxiways_renamed},
        {"runway_changes", s.runway_changes},
        {"runway_length_changes", s.runway_length_changes},
        {"runway_width_changes", s.runway_width_changes},
        {"geometry_changes", s.geometry_changes},
        {"old_label_count", s.old_label_count},
        {"new_label_count", s.new_label_count},
        {"old_unique_designators", s.old_unique_designators},
        {"new_unique_designators", s.new_unique_designators},
        {"old_runway_count", s.old_runway_count},
        {"new_runway_count", s.new_runway_count},
    };
}

nlohmann::json comparison_json(const diagram_model::ComparisonResult& result) {
    nlohmann::json taxiway = nlohmann::json::array();
    for (const auto& c : result.taxiway_changes) {
        taxiway.push_back({
            {"change_type", diagram_model::to_string(c.kind)},
            {"designator", c.designator},
            {"old_designator", c.old_designator},
            {"x", c.x},
            {"y", c.y},
            {"description", c.description},
        });
    }

    nlohmann::json runway = nlohmann::json::array();
    for (const auto& c : result.runway_changes) {
        runway.push_back({
            {"change_type", diagram_model::to_string(c.kind)},
            {"designator", c.designator},
            {"old_length", c.old_length},
            {"new_length", c.new_length},
            {"old_width", c.old_width},
            {"new_width", c.new_width},
            {"old_x", c.old_x},
            {"old_y", c.old_y},
            {"new_x", c.new_x},
            {"new_y", c.new_y},
            {"description", c.description},
        });
    }

    nlohmann::json geometry = nlohmann::json::array();
    for (const auto& c : result.geometry_changes) {
        geometry.push_back({
            {"change_type", diagram_model::to_string(c.kind)},
            {"magnitude", c.magnitude},
            {"x", c.x},
            {"y", c.y},
            {"description", c.description},
        });
    }

    nlohmann::json flat = nlohmann::json::array();
    for (const auto& f : diagram_compare::flatten_changes(result)) {
        flat.push_back({
            {"change_type", f.change_type},
            {"category", f.category},
            {"old_text", f.old_text},
            {"new_text", f.new_text},
            {"old_position", rect_json(f.old_position)},
            {"new_position", rect_json(f.new_position)},
            {"description", f.description},
        });
    }

    return {
        {"airport_code", result.airport_code},
        {"old_cycle", result.old_cycle},
        {"new_cycle", result.new_cycle},
        {"taxiway_changes", std::move(taxiway)},
        {"runway_changes", std::move(runway)},
        {"geometry_changes", std::move(geometry)},
        {"summary", summary_json(result.summary)},
        {"changes", std::move(flat)},
    };
}

void dump(std::ostream& out, const nlohmann::json& j) {
    // Text pulled from PDFs is not guaranteed to be valid UTF-8.
    out << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
}

bool save(const nlohmann::json& j, const std::string& path) {
    std::ofstream f(path);
    if (!f) {
        loaders_logger()->error("Cannot write {}", path);
        return false;
    }
    dump(f, j);
    return static_cast<bool>(f);
}

} // namespace

void write_snapshot_json(std::ostream& out, const diagram_model::DiagramSnapshot& snapshot) {
    dump(out, snapshot_json(snapshot));
}

bool save_snapshot_to_json_file(const diagram_model::DiagramSnapshot& snapshot, const std::string& path) {
    return save(snapshot_json(snapshot), path);
}

void write_comparison_json(std::ostream& out, const diagram_model::ComparisonResult& result) {
    dump(out, comparison_json(result));
}

bool save_comparison_to_json_file(const diagram_model::ComparisonResult& result, const std::string& path) {
    return save(comparison_json(result), path);
}

} // namespace diagram_loaders
