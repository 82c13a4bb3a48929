#include <diagram_compare/aggregator.hpp>
#include <diagram_compare/detector.hpp>
#include <algorithm>
#include <set>
#include <type_traits>
#include <utility>

namespace diagram_compare {

namespace {

using diagram_model::FlatChange;

// Taxiway changes are drawn as a small marker box anchored at the label center.
const double marker_size = 10.0;

template <class Change, class Kind>
int count_kind(const std::vector<Change>& changes, Kind kind) {
    return static_cast<int>(std::count_if(changes.begin(), changes.end(),
        [kind](const Change& c) { return c.kind == kind; }));
}

int unique_designators(const std::vector<diagram_model::TaxiwayLabel>& labels) {
    std::set<std::string> out;
    for (const auto& label : labels)
        out.insert(label.designator);
    return static_cast<int>(out.size());
}

FlatChange flatten_taxiway(const diagram_model::TaxiwayChange& c) {
    FlatChange f;
    f.change_type = diagram_model::to_string(c.kind);
    f.category = "taxiway";
    f.old_text = c.old_designator;
    f.new_text = c.designator;
    const std::array<double, 4> marker{ c.x, c.y, c.x + marker_size, c.y + marker_size };
    if (c.kind == diagram_model::TaxiwayChangeKind::Removed)
        f.old_position = marker;
    else
        f.new_position = marker;
    f.description = c.description;
    return f;
}

FlatChange flatten_runway(const diagram_model::RunwayChange& c) {
    FlatChange f;
    f.change_type = diagram_model::to_string(c.kind);
    f.category = "runway";
    f.old_text = std::to_string(c.old_length) + " x " + std::to_string(c.old_width);
    f.new_text = std::to_string(c.new_length) + " x " + std::to_string(c.new_width);
    f.description = c.description;
    return f;
}

FlatChange flatten_geometry(const diagram_model::GeometryChange& c) {
    FlatChange f;
    f.change_type = diagram_model::to_string(c.kind);
    f.category = "geometry";
    f.description = c.description;
    return f;
}

} // namespace

diagram_model::ComparisonResult compare_snapshots(const diagram_model::DiagramSnapshot& old_snapshot,
    const diagram_model::DiagramSnapshot& new_snapshot)
{
    using diagram_model::RunwayChangeKind;
    using diagram_model::TaxiwayChangeKind;

    diagram_model::ComparisonResult out;
    out.airport_code = new_snapshot.airport_code;
    out.old_cycle = old_snapshot.cycle;
    out.new_cycle = new_snapshot.cycle;
    out.taxiway_changes = compare_taxiway_labels(old_snapshot.taxiway_labels, new_snapshot.taxiway_labels);
    out.runway_changes = compare_runway_dimensions(old_snapshot.runway_info, new_snapshot.runway_info);
    out.geometry_changes = compare_geometry(old_snapshot.paths, new_snapshot.paths);

    diagram_model::ComparisonSummary& s = out.summary;
    s.total_changes = static_cast<int>(out.taxiway_changes.size() + out.runway_changes.size()
        + out.geometry_changes.size());
    s.taxiways_added = count_kind(out.taxiway_changes, TaxiwayChangeKind::Added);
    s.taxiways_removed = count_kind(out.taxiway_changes, TaxiwayChangeKind::Removed);
    s.taxiways_renamed = count_kind(out.taxiway_changes, TaxiwayChangeKind::Renamed);
    s.runway_changes = static_cast<int>(out.runway_changes.size());
    s.runway_length_changes = count_kind(out.runway_changes, RunwayChangeKind::LengthChanged);
    s.runway_width_changes = count_kind(out.runway_changes, RunwayChangeKind::WidthChanged);
    s.geometry_changes = static_cast<int>(out.geometry_changes.size());
    s.old_label_count = static_cast<int>(old_snapshot.taxiway_labels.size());
    s.new_label_count = static_cast<int>(new_snapshot.taxiway_labels.size());
    s.old_unique_designators = unique_designators(old_snapshot.taxiway_labels);
    s.new_unique_designators = unique_designators(new_snapshot.taxiway_labels);
    s.old_runway_count = static_cast<int>(old_snapshot.runway_info.size());
    s.new_runway_count = static_cast<int>(new_snapshot.runway_info.size());
    return out;
}

std::vector<diagram_model::AnyChange> all_changes(const diagram_model::ComparisonResult& result) {
    std::vector<diagram_model::AnyChange> out;
    out.reserve(result.taxiway_changes.size() + result.runway_changes.size() + result.geometry_changes.size());
    out.insert(out.end(), result.taxiway_changes.begin(), result.taxiway_changes.end());
    out.insert(out.end(), result.runway_changes.begin(), result.runway_changes.end());
    out.insert(out.end(), result.geometry_changes.begin(), result.geometry_changes.end());
    return out;
}

FlatChange flatten(const diagram_model::AnyChange& change) {
    return std::visit([](const auto& c) -> FlatChange {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, diagram_model::TaxiwayChange>)
            return flatten_taxiway(c);
        else if constexpr (std::is_same_v<T, diagram_model::RunwayChange>)
            return flatten_runway(c);
        else
            return flatten_geometry(c);
    }, change);
}

std::vector<FlatChange> flatten_changes(const diagram_model::ComparisonResult& result) {
    std::vector<FlatChange> out;
    for (const auto& change : all_changes(result))
        out.push_back(flatten(change));
    return out;
}

bool has_significant_changes(const diagram_model::ComparisonResult& result) {
    const auto& s = result.summary;
    return s.taxiways_added > 0 || s.taxiways_removed > 0 || s.taxiways_renamed > 0 || s.runway_changes > 0;
}

} // namespace diagram_compare
