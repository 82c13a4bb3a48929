#pragma once

#include <diagram_catalog/airport_registry.hpp>
#include <diagram_model/changes.hpp>
#include <diagram_model/snapshot.hpp>
#include <optional>
#include <istream>
#include <ostream>
#include <string>

namespace diagram_loaders {

// Fields missing from older snapshot files fall back to 0, "" or an empty list.
// Only unparsable input or a non-object root yields std::nullopt.
std::optional<diagram_model::DiagramSnapshot> load_snapshot_from_json(std::istream& in);
std::optional<diagram_model::DiagramSnapshot> load_snapshot_from_json_file(const std::string& path);

void write_snapshot_json(std::ostream& out, const diagram_model::DiagramSnapshot& snapshot);
bool save_snapshot_to_json_file(const diagram_model::DiagramSnapshot& snapshot, const std::string& path);

// Includes the flattened "changes" list for consumers of the older result format.
void write_comparison_json(std::ostream& out, const diagram_model::ComparisonResult& result);
bool save_comparison_to_json_file(const diagram_model::ComparisonResult& result, const std::string& path);

// {"base_url": "...", "airports": {"JFK": "00610", ...}}. A missing base_url keeps the default.
std::optional<diagram_catalog::AirportRegistry> load_airport_registry_from_json(std::istream& in);
std::optional<diagram_catalog::AirportRegistry> load_airport_registry_from_json_file(const std::string& path);

} // namespace diagram_loaders
