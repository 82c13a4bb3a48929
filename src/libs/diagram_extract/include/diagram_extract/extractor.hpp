#pragma once

#include <diagram_model/snapshot.hpp>
#include <diagram_model/types.hpp>
#include <diagram_scan/page_scanner.hpp>
#include <optional>
#include <string>

namespace diagram_extract {

struct ArtifactName {
    std::string airport_code;
    std::string cycle;
};

// "JFK_2602.pdf" -> {"JFK", "2602"}. Missing parts become "UNKNOWN".
ArtifactName parse_artifact_name(const std::string& path);

// Classifies one scanned page. Pure: no I/O, no logging.
diagram_model::DiagramSnapshot snapshot_from_page(const diagram_model::PageContent& page,
    const std::string& airport_code, const std::string& cycle, const std::string& source_file);

// Scans `path` and classifies its first page. Empty airport_code/cycle are taken from
// the file name. Returns std::nullopt when the document is missing or unreadable.
std::optional<diagram_model::DiagramSnapshot> extract_snapshot(diagram_scan::PageScanner& scanner,
    const std::string& path,
    const std::string& airport_code = {},
    const std::string& cycle = {},
    diagram_scan::ScanError* error = nullptr);

} // namespace diagram_extract
