#include <diagram_compare/detector.hpp>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <map>
#include <set>
#include <utility>

namespace diagram_compare {

namespace {

using diagram_model::GeometryChange;
using diagram_model::GeometryChangeKind;
using diagram_model::RunwayChange;
using diagram_model::RunwayChangeKind;
using diagram_model::RunwayRecord;
using diagram_model::TaxiwayChange;
using diagram_model::TaxiwayChangeKind;
using diagram_model::TaxiwayLabel;

std::set<std::string> designators_of(const std::vector<TaxiwayLabel>& labels) {
    std::set<std::string> out;
    for (const auto& label : labels)
        out.insert(label.designator);
    return out;
}

const TaxiwayLabel* first_with(const std::vector<TaxiwayLabel>& labels, const std::string& designator) {
    for (const auto& label : labels)
        if (label.designator == designator) return &label;
    return nullptr;
}

double distance(double x1, double y1, double x2, double y2) {
    return std::hypot(x2 - x1, y2 - y1);
}

std::string to_upper(std::string s) {
    for (char& c : s)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

// Leading heading digits of a runway end ("22R" -> 22); 0 when there are none.
long heading_of(const std::string& end) {
    long value = 0;
    for (std::size_t i = 0; i < end.size() && std::isdigit(static_cast<unsigned char>(end[i])); ++i) {
        if (value > 100000) break;
        value = value * 10 + (end[i] - '0');
    }
    return value;
}

// Normalized designator -> record. Later duplicates replace earlier ones.
std::map<std::string, const RunwayRecord*> index_runways(const std::vector<RunwayRecord>& runways) {
    std::map<std::string, const RunwayRecord*> out;
    for (const auto& rwy : runways) {
        std::string norm = normalize_runway_designator(rwy.designator);
        if (norm.empty() || norm == "UNKNOWN") continue;
        out[std::move(norm)] = &rwy;
    }
    return out;
}

std::string dims(int length, int width) {
    return std::to_string(length) + " x " + std::to_string(width) + " ft";
}

RunwayChange pair_change(RunwayChangeKind kind, const std::string& designator,
    const RunwayRecord& old_rwy, const RunwayRecord& new_rwy)
{
    RunwayChange c;
    c.kind = kind;
    c.designator = designator;
    c.old_length = old_rwy.length_ft;
    c.new_length = new_rwy.length_ft;
    c.old_width = old_rwy.width_ft;
    c.new_width = new_rwy.width_ft;
    c.old_x = old_rwy.x;
    c.old_y = old_rwy.y;
    c.new_x = new_rwy.x;
    c.new_y = new_rwy.y;
    return c;
}

} // namespace

std::vector<TaxiwayChange> compare_taxiway_labels(
    const std::vector<TaxiwayLabel>& old_labels,
    const std::vector<TaxiwayLabel>& new_labels)
{
    std::vector<TaxiwayChange> changes;
    const std::set<std::string> old_designators = designators_of(old_labels);
    const std::set<std::string> new_designators = designators_of(new_labels);

    for (const auto& designator : new_designators) {
        if (old_designators.count(designator)) continue;
        const TaxiwayLabel* label = first_with(new_labels, designator);
        TaxiwayChange c;
        c.kind = TaxiwayChangeKind::Added;
        c.designator = designator;
        c.x = label->x;
        c.y = label->y;
        c.description = "New taxiway '" + designator + "' added";
        changes.push_back(std::move(c));
    }

    for (const auto& designator : old_designators) {
        if (new_designators.count(designator)) continue;
        const TaxiwayLabel* label = first_with(old_labels, designator);
        TaxiwayChange c;
        c.kind = TaxiwayChangeKind::Removed;
        c.designator = designator;
        c.old_designator = designator;
        c.x = label->x;
        c.y = label->y;
        c.description = "Taxiway '" + designator + "' removed";
        changes.push_back(std::move(c));
    }

    for (const auto& old_label : old_labels) {
        if (new_designators.count(old_label.designator)) continue;
        for (const auto& new_label : new_labels) {
            if (distance(old_label.x, old_label.y, new_label.x, new_label.y) >= location_threshold) continue;
            if (old_label.designator == new_label.designator) continue;
            if (old_designators.count(new_label.designator)) continue;

            TaxiwayChange c;
            c.kind = TaxiwayChangeKind::Renamed;
            c.designator = new_label.designator;
            c.old_designator = old_label.designator;
            c.x = new_label.x;
            c.y = new_label.y;
            c.description = "Taxiway renamed from '" + old_label.designator
                + "' to '" + new_label.designator + "'";
            changes.push_back(std::move(c));
        }
    }

    return changes;
}

std::string normalize_runway_designator(std::string_view designator) {
    std::string s(designator);
    for (char& c : s)
        if (c == '-') c = '/';

    const std::size_t slash = s.find('/');
    if (slash == std::string::npos || s.find('/', slash + 1) != std::string::npos)
        return to_upper(s);

    std::string first = s.substr(0, slash);
    std::string second = s.substr(slash + 1);
    if (heading_of(first) > heading_of(second))
        std::swap(first, second);
    return to_upper(first) + "/" + to_upper(second);
}

std::vector<RunwayChange> compare_runway_dimensions(
    const std::vector<RunwayRecord>& old_runways,
    const std::vector<RunwayRecord>& new_runways)
{
    std::vector<RunwayChange> changes;
    const auto old_by_designator = index_runways(old_runways);
    const auto new_by_designator = index_runways(new_runways);
    const RunwayRecord none{};

    for (const auto& [designator, rwy] : new_by_designator) {
        if (old_by_designator.count(designator)) continue;
        RunwayChange c = pair_change(RunwayChangeKind::RunwayAdded, designator, none, *rwy);
        c.description = "New runway " + designator + ": " + dims(rwy->length_ft, rwy->width_ft);
        changes.push_back(std::move(c));
    }

    for (const auto& [designator, rwy] : old_by_designator) {
        if (new_by_designator.count(designator)) continue;
        RunwayChange c = pair_change(RunwayChangeKind::RunwayRemoved, designator, *rwy, none);
        c.description = "Runway " + designator + " removed (was " + dims(rwy->length_ft, rwy->width_ft) + ")";
        changes.push_back(std::move(c));
    }

    for (const auto& [designator, new_rwy] : new_by_designator) {
        auto it = old_by_designator.find(designator);
        if (it == old_by_designator.end()) continue;
        const RunwayRecord& old_rwy = *it->second;

        const int old_length = old_rwy.length_ft;
        const int new_length = new_rwy->length_ft;
        if (old_length > 0 && new_length > 0 && old_length != new_length) {
            const int diff = new_length - old_length;
            RunwayChange c = pair_change(RunwayChangeKind::LengthChanged, designator, old_rwy, *new_rwy);
            c.description = "Runway " + designator + (diff > 0 ? " extended" : " shortened")
                + " by " + std::to_string(std::abs(diff)) + " ft ("
                + std::to_string(old_length) + " → " + std::to_string(new_length) + " ft)";
            changes.push_back(std::move(c));
        }

        const int old_width = old_rwy.width_ft;
        const int new_width = new_rwy->width_ft;
        if (old_width > 0 && new_width > 0 && old_width != new_width) {
            const int diff = new_width - old_width;
            RunwayChange c = pair_change(RunwayChangeKind::WidthChanged, designator, old_rwy, *new_rwy);
            c.description = "Runway " + designator + (diff > 0 ? " widened" : " narrowed")
                + " by " + std::to_string(std::abs(diff)) + " ft ("
                + std::to_string(old_width) + " → " + std::to_string(new_width) + " ft wide)";
            changes.push_back(std::move(c));
        }
    }

    return changes;
}

std::vector<GeometryChange> compare_geometry(
    const std::vector<diagram_model::PathSegment>& old_paths,
    const std::vector<diagram_model::PathSegment>& new_paths)
{
    std::vector<GeometryChange> changes;
    const long diff = static_cast<long>(new_paths.size()) - static_cast<long>(old_paths.size());
    if (std::labs(diff) <= geometry_count_threshold) return changes;

    GeometryChange c;
    if (diff > 0) {
        c.kind = GeometryChangeKind::GeometryAdded;
        c.magnitude = static_cast<int>(diff);
        c.description = "Approximately " + std::to_string(diff)
            + " new path segments added (possible new taxiway geometry)";
    } else {
        c.kind = GeometryChangeKind::GeometryRemoved;
        c.magnitude = static_cast<int>(-diff);
        c.description = "Approximately " + std::to_string(-diff)
            + " path segments removed (possible taxiway removal)";
    }
    changes.push_back(std::move(c));
    return changes;
}

} // namespace diagram_compare
