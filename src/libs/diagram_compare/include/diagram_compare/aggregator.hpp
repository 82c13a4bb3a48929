#pragma once

#include <diagram_model/changes.hpp>
#include <diagram_model/snapshot.hpp>
#include <string>
#include <vector>

namespace diagram_compare {

// Runs all three detectors and fills the summary. The airport code comes from the
// newer snapshot.
diagram_model::ComparisonResult compare_snapshots(const diagram_model::DiagramSnapshot& old_snapshot,
    const diagram_model::DiagramSnapshot& new_snapshot);

// All changes of a result as one list: taxiway, then runway, then geometry.
std::vector<diagram_model::AnyChange> all_changes(const diagram_model::ComparisonResult& result);

diagram_model::FlatChange flatten(const diagram_model::AnyChange& change);
std::vector<diagram_model::FlatChange> flatten_changes(const diagram_model::ComparisonResult& result);

// True when the result has a taxiway or runway change. Geometry counts alone are
// too coarse to call a diagram changed.
bool has_significant_changes(const diagram_model::ComparisonResult& result);

} // namespace diagram_compare
