#include <diagram_compare/report.hpp>
#include <spdlog/fmt/fmt.h>
#include <iterator>
#include <string>

namespace diagram_compare {

namespace {

const std::string rule(60, '=');
const std::string thin_rule(60, '-');

} // namespace

std::string format_report(const diagram_model::ComparisonResult& result) {
    std::string out;
    auto it = std::back_inserter(out);
    const auto& s = result.summary;

    fmt::format_to(it, "\n{}\nAIRPORT DIAGRAM CHANGE REPORT\n{}\n", rule, rule);
    fmt::format_to(it, "Airport:        {}\n", result.airport_code);
    fmt::format_to(it, "Old Cycle:      {}\n", result.old_cycle);
    fmt::format_to(it, "New Cycle:      {}\n", result.new_cycle);
    fmt::format_to(it, "{}\n", rule);

    out += "\nSummary:\n";
    fmt::format_to(it, "  Old diagram: {} unique taxiway designators\n", s.old_unique_designators);
    fmt::format_to(it, "  New diagram: {} unique taxiway designators\n", s.new_unique_designators);
    fmt::format_to(it, "  Taxiways added:   {}\n", s.taxiways_added);
    fmt::format_to(it, "  Taxiways removed: {}\n", s.taxiways_removed);
    fmt::format_to(it, "  Taxiways renamed: {}\n", s.taxiways_renamed);
    fmt::format_to(it, "  Runway changes:   {}\n", s.runway_changes);
    fmt::format_to(it, "  Geometry changes: {}\n", s.geometry_changes);

    if (!result.taxiway_changes.empty()) {
        fmt::format_to(it, "\nTaxiway Changes:\n{}\n", thin_rule);
        for (const auto& c : result.taxiway_changes) {
            fmt::format_to(it, "  [{:<8}] {}\n", diagram_model::to_string(c.kind), c.description);
            fmt::format_to(it, "             Location: ({:.0f}, {:.0f})\n", c.x, c.y);
        }
    }

    if (!result.runway_changes.empty()) {
        fmt::format_to(it, "\nRunway Changes:\n{}\n", thin_rule);
        for (const auto& c : result.runway_changes)
            fmt::format_to(it, "  [{:<15}] {}\n", diagram_model::to_string(c.kind), c.description);
    }

    if (!result.geometry_changes.empty()) {
        fmt::format_to(it, "\nGeometry Changes:\n{}\n", thin_rule);
        for (const auto& c : result.geometry_changes)
            fmt::format_to(it, "  [{}] {}\n", diagram_model::to_string(c.kind), c.description);
    }

    if (result.taxiway_changes.empty() && result.runway_changes.empty() && result.geometry_changes.empty())
        out += "\n  No significant changes detected between cycles.\n";

    fmt::format_to(it, "{}\n", rule);
    return out;
}

} // namespace diagram_compare
