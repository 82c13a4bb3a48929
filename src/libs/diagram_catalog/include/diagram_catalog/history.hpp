#pragma once

#include <diagram_catalog/airac.hpp>
#include <diagram_model/changes.hpp>
#include <diagram_model/snapshot.hpp>
#include <functional>
#include <optional>
#include <string>

namespace diagram_catalog {

// Supplies the snapshot of (airport_code, cycle), or std::nullopt if none is available.
using SnapshotSource = std::function<std::optional<diagram_model::DiagramSnapshot>(
    const std::string& airport_code, const std::string& cycle)>;

struct LastChange {
    std::string current_cycle;
    // Newest older cycle whose diagram differs from the current one.
    std::optional<std::string> last_change_cycle;
    int cycles_searched = 0;
    // Comparison of last_change_cycle against the current cycle.
    std::optional<diagram_model::ComparisonResult> comparison;
    // Set when the current snapshot itself is unavailable.
    std::string error;
};

// Walks back from `current`, comparing each older snapshot with the current one, and
// stops at the first taxiway or runway difference or at the first missing snapshot.
LastChange find_last_change(const SnapshotSource& source, const std::string& airport_code,
    const AiracCycle& current, int max_cycles = cycles_per_year);

} // namespace diagram_catalog
