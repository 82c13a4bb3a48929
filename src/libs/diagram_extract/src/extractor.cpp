#include <diagram_extract/extractor.hpp>
#include <diagram_extract/classifier.hpp>
#include <diagram_extract/snapshot_builder.hpp>
#include <diagram_model/logger.hpp>
#include <filesystem>
#include <memory>
#include <set>
#include <utility>

namespace diagram_extract {

namespace {

std::shared_ptr<spdlog::logger> extract_logger() {
    static std::shared_ptr<spdlog::logger> logger = diagram_model::component_logger("extract");
    return logger;
}

} // namespace

ArtifactName parse_artifact_name(const std::string& path) {
    const std::string stem = std::filesystem::path(path).stem().string();
    ArtifactName out{ "UNKNOWN", "UNKNOWN" };
    const std::size_t sep = stem.find('_');
    if (!stem.empty())
        out.airport_code = stem.substr(0, sep);
    if (sep != std::string::npos) {
        const std::size_t next = stem.find('_', sep + 1);
        out.cycle = stem.substr(sep + 1, next == std::string::npos ? std::string::npos : next - sep - 1);
    }
    return out;
}

diagram_model::DiagramSnapshot snapshot_from_page(const diagram_model::PageContent& page,
    const std::string& airport_code, const std::string& cycle, const std::string& source_file)
{
    const DiagramBounds bounds = diagram_bounds(page.width, page.height);
    RunwayExtraction runways = classify_runways(page);

    SnapshotHeader header;
    header.airport_code = airport_code;
    header.cycle = cycle;
    header.source_file = source_file;
    header.page_width = page.width;
    header.page_height = page.height;
    return build_snapshot(header,
        classify_taxiway_labels(page, bounds),
        std::move(runways.records),
        classify_paths(page, bounds),
        std::move(runways.raw_text));
}

std::optional<diagram_model::DiagramSnapshot> extract_snapshot(diagram_scan::PageScanner& scanner,
    const std::string& path,
    const std::string& airport_code,
    const std::string& cycle,
    diagram_scan::ScanError* error)
{
    std::optional<diagram_model::PageContent> page = scanner.scan(path, error);
    if (!page) {
        extract_logger()->warn("No snapshot for {}", path);
        return std::nullopt;
    }

    const ArtifactName name = parse_artifact_name(path);
    diagram_model::DiagramSnapshot snapshot = snapshot_from_page(*page,
        airport_code.empty() ? name.airport_code : airport_code,
        cycle.empty() ? name.cycle : cycle,
        path);

    std::set<std::string> designators;
    for (const auto& label : snapshot.taxiway_labels)
        designators.insert(label.designator);
    extract_logger()->info("{} {}: page {:.0f} x {:.0f}, {} taxiway labels ({} unique), {} runways, {} paths",
        snapshot.airport_code, snapshot.cycle, snapshot.page_width, snapshot.page_height,
        snapshot.taxiway_labels.size(), designators.size(), snapshot.runway_info.size(), snapshot.paths.size());
    return snapshot;
}

} // namespace diagram_extract
