#pragma once

#include <diagram_model/snapshot.hpp>
#include <string>
#include <vector>

namespace diagram_extract {

struct SnapshotHeader {
    std::string airport_code;
    std::string cycle;
    std::string source_file;
    double page_width = 0;
    double page_height = 0;
};

diagram_model::DiagramSnapshot build_snapshot(const SnapshotHeader& header,
    std::vector<diagram_model::TaxiwayLabel> taxiway_labels,
    std::vector<diagram_model::RunwayRecord> runway_info,
    std::vector<diagram_model::PathSegment> paths,
    std::vector<std::string> raw_runway_text = {});

} // namespace diagram_extract
