#include <diagram_catalog/history.hpp>
#include <diagram_compare/aggregator.hpp>
#include <diagram_model/logger.hpp>
#include <memory>
#include <utility>

namespace diagram_catalog {

namespace {

std::shared_ptr<spdlog::logger> catalog_logger() {
    static std::shared_ptr<spdlog::logger> logger = diagram_model::component_logger("catalog");
    return logger;
}

} // namespace

LastChange find_last_change(const SnapshotSource& source, const std::string& airport_code,
    const AiracCycle& current, int max_cycles)
{
    LastChange out;
    out.current_cycle = current.to_string();

    std::optional<diagram_model::DiagramSnapshot> current_snapshot = source(airport_code, out.current_cycle);
    if (!current_snapshot) {
        out.error = "Could not load current diagram " + airport_code + " " + out.current_cycle;
        return out;
    }

    for (const AiracCycle& cycle : previous_cycles(current, max_cycles)) {
        ++out.cycles_searched;
        const std::string code = cycle.to_string();
        std::optional<diagram_model::DiagramSnapshot> old_snapshot = source(airport_code, code);
        if (!old_snapshot) {
            catalog_logger()->info("{} cycle {} not available, stopping search", airport_code, code);
            break;
        }

        diagram_model::ComparisonResult result = diagram_compare::compare_snapshots(*old_snapshot, *current_snapshot);
        if (diagram_compare::has_significant_changes(result)) {
            out.last_change_cycle = code;
            out.comparison = std::move(result);
            return out;
        }
    }
    return out;
}

} // namespace diagram_catalog
