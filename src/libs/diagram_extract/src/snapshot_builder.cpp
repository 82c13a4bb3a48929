#include <diagram_extract/snapshot_builder.hpp>
#include <utility>

namespace diagram_extract {

diagram_model::DiagramSnapshot build_snapshot(const SnapshotHeader& header,
    std::vector<diagram_model::TaxiwayLabel> taxiway_labels,
    std::vector<diagram_model::RunwayRecord> runway_info,
    std::vector<diagram_model::PathSegment> paths,
    std::vector<std::string> raw_runway_text)
{
    diagram_model::DiagramSnapshot out;
    out.airport_code = header.airport_code;
    out.cycle = header.cycle;
    out.source_file = header.source_file;
    out.page_width = header.page_width;
    out.page_height = header.page_height;
    out.taxiway_labels = std::move(taxiway_labels);
    out.runway_info = std::move(runway_info);
    out.paths = std::move(paths);
    out.raw_runway_text = std::move(raw_runway_text);
    return out;
}

} // namespace diagram_extract
