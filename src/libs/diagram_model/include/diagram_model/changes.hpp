#pragma once

#include <array>
#include <string>
#include <variant>
#include <vector>

namespace diagram_model {

enum class TaxiwayChangeKind { Added, Removed, Renamed };

enum class RunwayChangeKind { RunwayAdded, RunwayRemoved, LengthChanged, WidthChanged };

enum class GeometryChangeKind { GeometryAdded, GeometryRemoved };

struct TaxiwayChange {
    TaxiwayChangeKind kind = TaxiwayChangeKind::Added;
    std::string designator;
    // Empty for Added; the removed designator for Removed; the previous name for Renamed.
    std::string old_designator;
    double x = 0;
    double y = 0;
    std::string description;
};

struct RunwayChange {
    RunwayChangeKind kind = RunwayChangeKind::RunwayAdded;
    std::string designator;   // normalized, e.g. "4L/22R"
    int old_length = 0;
    int new_length = 0;
    int old_width = 0;
    int new_width = 0;
    double old_x = 0;
    double old_y = 0;
    double new_x = 0;
    double new_y = 0;
    std::string description;
};

struct GeometryChange {
    GeometryChangeKind kind = GeometryChangeKind::GeometryAdded;
    int magnitude = 0;   // absolute difference in segment count
    double x = 0;
    double y = 0;
    std::string description;
};

using AnyChange = std::variant<TaxiwayChange, RunwayChange, GeometryChange>;

struct ComparisonSummary {
    int total_changes = 0;
    int taxiways_added = 0;
    int taxiways_removed = 0;
    int taxiways_renamed = 0;
    int runway_changes = 0;
    int runway_length_changes = 0;
    int runway_width_changes = 0;
    int geometry_changes = 0;
    int old_label_count = 0;
    int new_label_count = 0;
    int old_unique_designators = 0;
    int new_unique_designators = 0;
    int old_runway_count = 0;
    int new_runway_count = 0;
};

struct ComparisonResult {
    std::string airport_code;
    std::string old_cycle;
    std::string new_cycle;
    std::vector<TaxiwayChange> taxiway_changes;
    std::vector<RunwayChange> runway_changes;
    std::vector<GeometryChange> geometry_changes;
    ComparisonSummary summary;
};

// Uniform shape for consumers that predate the typed change records.
// Rectangles are (x0, y0, x1, y1).
struct FlatChange {
    std::string change_type;
    std::string category;   // "taxiway", "runway" or "geometry"
    std::string old_text;
    std::string new_text;
    std::array<double, 4> old_position{};
    std::array<double, 4> new_position{};
    std::string description;
};

inline const char* to_string(TaxiwayChangeKind kind) {
    switch (kind) {
    case TaxiwayChangeKind::Added: return "ADDED";
    case TaxiwayChangeKind::Removed: return "REMOVED";
    case TaxiwayChangeKind::Renamed: return "RENAMED";
    }
    return "";
}

inline const char* to_string(RunwayChangeKind kind) {
    switch (kind) {
    case RunwayChangeKind::RunwayAdded: return "RUNWAY_ADDED";
    case RunwayChangeKind::RunwayRemoved: return "RUNWAY_REMOVED";
    case RunwayChangeKind::LengthChanged: return "LENGTH_CHANGED";
    case RunwayChangeKind::WidthChanged: return "WIDTH_CHANGED";
    }
    return "";
}

inline const char* to_string(GeometryChangeKind kind) {
    switch (kind) {
    case GeometryChangeKind::GeometryAdded: return "GEOMETRY_ADDED";
    case GeometryChangeKind::GeometryRemoved: return "GEOMETRY_REMOVED";
    }
    return "";
}

} // namespace diagram_model
