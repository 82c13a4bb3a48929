#pragma once

#include <diagram_model/changes.hpp>
#include <diagram_model/snapshot.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace diagram_compare {

// Two labels closer than this (page units) mark the same spot on the diagram.
constexpr double location_threshold = 15.0;

// Path-count difference must exceed this to report a geometry change.
constexpr int geometry_count_threshold = 50;

// ADDED/REMOVED per designator present on only one side, plus RENAMED for every
// (old, new) label pair within location_threshold whose designators each exist on
// one side only. RENAMED is not a one-to-one match: several nearby labels yield
// several records for one physical rename.
std::vector<diagram_model::TaxiwayChange> compare_taxiway_labels(
    const std::vector<diagram_model::TaxiwayLabel>& old_labels,
    const std::vector<diagram_model::TaxiwayLabel>& new_labels);

// "22R-4L" -> "4L/22R". Strings that do not split into two ends are only uppercased.
std::string normalize_runway_designator(std::string_view designator);

// Dimensions are compared only when both sides are positive; 0 means unknown.
std::vector<diagram_model::RunwayChange> compare_runway_dimensions(
    const std::vector<diagram_model::RunwayRecord>& old_runways,
    const std::vector<diagram_model::RunwayRecord>& new_runways);

std::vector<diagram_model::GeometryChange> compare_geometry(
    const std::vector<diagram_model::PathSegment>& old_paths,
    const std::vector<diagram_model::PathSegment>& new_paths);

} // namespace diagram_compare
