#pragma once

#include <diagram_model/types.hpp>
#include <string>
#include <vector>

namespace diagram_model {

struct TaxiwayLabel {
    std::string designator;
    double x = 0;   // bbox center
    double y = 0;
    BBox bbox;
};

struct RunwayRecord {
    // "4L/22R" style, or "Unknown" when no designator could be paired.
    std::string designator;
    int length_ft = 0;
    int width_ft = 0;
    // Center of the dimension text ("7200 X 150"); (0,0) when not located.
    double x = 0;
    double y = 0;
    std::string surface;
    std::string raw_text;
};

struct PathSegment {
    double x0 = 0;
    double y0 = 0;
    double x1 = 0;
    double y1 = 0;
    double width = 0;
};

// One extracted version of an airport diagram, keyed by (airport_code, cycle).
struct DiagramSnapshot {
    std::string airport_code;
    std::string cycle;
    std::string source_file;
    double page_width = 0;
    double page_height = 0;
    std::vector<TaxiwayLabel> taxiway_labels;
    std::vector<RunwayRecord> runway_info;
    std::vector<PathSegment> paths;
    std::vector<std::string> raw_runway_text;
};

inline constexpr const char* unknown_runway_designator = "Unknown";

} // namespace diagram_model
