#pragma once

#include <diagram_model/snapshot.hpp>
#include <diagram_model/types.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace diagram_extract {

// Sub-rectangle of the page holding the surface diagram itself. Legends, notes and
// title blocks sit in the margins outside it.
struct DiagramBounds {
    double x_min = 0;
    double y_min = 0;
    double x_max = 0;
    double y_max = 0;

    bool contains(double x, double y) const {
        return x_min < x && x < x_max && y_min < y && y < y_max;
    }
};

DiagramBounds diagram_bounds(double page_width, double page_height);

bool is_taxiway_designator(std::string_view text);

std::vector<diagram_model::TaxiwayLabel> classify_taxiway_labels(
    const diagram_model::PageContent& page, const DiagramBounds& bounds);

// Which fallback produced the runway records, in decreasing order of confidence.
enum class RunwayTier {
    Combined,        // "4L-22R 12000 X 150" on one line
    Positional,      // "RWY" designator list zipped with the dimension list
    DimensionOnly,   // bare dimensions, designator "Unknown"
    None
};

const char* to_string(RunwayTier tier);

struct RunwayExtraction {
    RunwayTier tier = RunwayTier::None;
    std::vector<diagram_model::RunwayRecord> records;
    std::vector<std::string> raw_text;
};

RunwayExtraction classify_runways(const diagram_model::PageContent& page);

std::vector<diagram_model::PathSegment> classify_paths(
    const diagram_model::PageContent& page, const DiagramBounds& bounds);

} // namespace diagram_extract
