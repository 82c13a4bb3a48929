#include <gtest/gtest.h>
#include <diagram_compare/aggregator.hpp>
#include <diagram_compare/report.hpp>
#include <string>
#include <variant>
#include <vector>

using diagram_model::DiagramSnapshot;
using diagram_model::TaxiwayLabel;

namespace {

TaxiwayLabel label(const std::string& designator, double x, double y) {
    TaxiwayLabel l;
    l.designator = designator;
    l.x = x;
    l.y = y;
    return l;
}

diagram_model::RunwayRecord runway(const std::string& designator, int length, int width) {
    diagram_model::RunwayRecord r;
    r.designator = designator;
    r.length_ft = length;
    r.width_ft = width;
    return r;
}

DiagramSnapshot snapshot(const std::string& cycle) {
    DiagramSnapshot s;
    s.airport_code = "JFK";
    s.cycle = cycle;
    s.page_width = 612;
    s.page_height = 792;
    s.taxiway_labels = { label("A", 100, 100), label("A", 300, 300), label("B", 200, 200) };
    s.runway_info = { runway("4L/22R", 12079, 200), runway("13R/31L", 14511, 200) };
    s.paths.assign(120, { 100, 100, 110, 110, 1 });
    return s;
}

} // namespace

TEST(CompareSnapshotsTest, SelfComparisonIsEmpty) {
    const DiagramSnapshot s = snapshot("2601");
    const auto result = diagram_compare::compare_snapshots(s, s);

    EXPECT_TRUE(result.taxiway_changes.empty());
    EXPECT_TRUE(result.runway_changes.empty());
    EXPECT_TRUE(result.geometry_changes.empty());
    EXPECT_EQ(result.summary.total_changes, 0);
    EXPECT_EQ(result.summary.old_label_count, 3);
    EXPECT_EQ(result.summary.old_unique_designators, 2);
    EXPECT_EQ(result.summary.new_runway_count, 2);
    EXPECT_FALSE(diagram_compare::has_significant_changes(result));
}

TEST(CompareSnapshotsTest, SummaryCountsEveryKind) {
    const DiagramSnapshot old_snapshot = snapshot("2601");
    DiagramSnapshot new_snapshot = snapshot("2602");
    new_snapshot.airport_code = "KJFK";
    new_snapshot.taxiway_labels = { label("A", 100, 100), label("C", 201, 200), label("D", 500, 500) };
    new_snapshot.runway_info = { runway("22R-4L", 12079, 150), runway("13R/31L", 15000, 200) };
    new_snapshot.paths.resize(40);

    const auto result = diagram_compare::compare_snapshots(old_snapshot, new_snapshot);
    const auto& s = result.summary;

    EXPECT_EQ(result.airport_code, "KJFK");
    EXPECT_EQ(result.old_cycle, "2601");
    EXPECT_EQ(result.new_cycle, "2602");
    EXPECT_EQ(s.taxiways_added, 2);
    EXPECT_EQ(s.taxiways_removed, 1);
    EXPECT_EQ(s.taxiways_renamed, 1);
    EXPECT_EQ(s.runway_changes, 2);
    EXPECT_EQ(s.runway_length_changes, 1);
    EXPECT_EQ(s.runway_width_changes, 1);
    EXPECT_EQ(s.geometry_changes, 1);
    EXPECT_EQ(s.total_changes, 7);
    EXPECT_EQ(s.new_label_count, 3);
    EXPECT_EQ(s.new_unique_designators, 3);
    EXPECT_TRUE(diagram_compare::has_significant_changes(result));
}

TEST(CompareSnapshotsTest, GeometryAloneIsNotSignificant) {
    const DiagramSnapshot old_snapshot = snapshot("2601");
    DiagramSnapshot new_snapshot = snapshot("2602");
    new_snapshot.paths.resize(10);

    const auto result = diagram_compare::compare_snapshots(old_snapshot, new_snapshot);
    EXPECT_EQ(result.summary.geometry_changes, 1);
    EXPECT_FALSE(diagram_compare::has_significant_changes(result));
}

TEST(FlattenTest, ChangesInCategoryOrder) {
    const DiagramSnapshot old_snapshot = snapshot("2601");
    DiagramSnapshot new_snapshot = snapshot("2602");
    new_snapshot.taxiway_labels.push_back(label("K", 400, 450));
    new_snapshot.runway_info[0].length_ft = 13000;
    new_snapshot.paths.resize(300);

    const auto result = diagram_compare::compare_snapshots(old_snapshot, new_snapshot);
    const auto all = diagram_compare::all_changes(result);
    ASSERT_EQ(all.size(), 3u);
    EXPECT_TRUE(std::holds_alternative<diagram_model::TaxiwayChange>(all[0]));
    EXPECT_TRUE(std::holds_alternative<diagram_model::RunwayChange>(all[1]));
    EXPECT_TRUE(std::holds_alternative<diagram_model::GeometryChange>(all[2]));

    const auto flat = diagram_compare::flatten_changes(result);
    ASSERT_EQ(flat.size(), 3u);

    EXPECT_EQ(flat[0].change_type, "ADDED");
    EXPECT_EQ(flat[0].category, "taxiway");
    EXPECT_EQ(flat[0].new_text, "K");
    EXPECT_EQ(flat[0].old_text, "");
    EXPECT_DOUBLE_EQ(flat[0].new_position[0], 400);
    EXPECT_DOUBLE_EQ(flat[0].new_position[3], 460);
    EXPECT_DOUBLE_EQ(flat[0].old_position[2], 0);

    EXPECT_EQ(flat[1].change_type, "LENGTH_CHANGED");
    EXPECT_EQ(flat[1].category, "runway");
    EXPECT_EQ(flat[1].old_text, "12079 x 200");
    EXPECT_EQ(flat[1].new_text, "13000 x 200");

    EXPECT_EQ(flat[2].change_type, "GEOMETRY_ADDED");
    EXPECT_EQ(flat[2].category, "geometry");
    EXPECT_EQ(flat[2].description, result.geometry_changes[0].description);
}

TEST(FlattenTest, RemovedTaxiwayMarksOldPosition) {
    diagram_model::TaxiwayChange c;
    c.kind = diagram_model::TaxiwayChangeKind::Removed;
    c.designator = "Z";
    c.old_designator = "Z";
    c.x = 50;
    c.y = 60;

    const auto f = diagram_compare::flatten(c);
    EXPECT_EQ(f.change_type, "REMOVED");
    EXPECT_EQ(f.old_text, "Z");
    EXPECT_DOUBLE_EQ(f.old_position[0], 50);
    EXPECT_DOUBLE_EQ(f.old_position[2], 60);
    EXPECT_DOUBLE_EQ(f.new_position[0], 0);
}

TEST(ReportTest, ListsChangesByCategory) {
    const DiagramSnapshot old_snapshot = snapshot("2601");
    DiagramSnapshot new_snapshot = snapshot("2602");
    new_snapshot.runway_info[1].width_ft = 150;

    const std::string report = diagram_compare::format_report(
        diagram_compare::compare_snapshots(old_snapshot, new_snapshot));
    EXPECT_NE(report.find("AIRPORT DIAGRAM CHANGE REPORT"), std::string::npos);
    EXPECT_NE(report.find("Old Cycle:      2601"), std::string::npos);
    EXPECT_NE(report.find("Runway Changes:"), std::string::npos);
    EXPECT_NE(report.find("Runway 13R/31L narrowed by 50 ft (200 → 150 ft wide)"), std::string::npos);
    EXPECT_EQ(report.find("Taxiway Changes:"), std::string::npos);
}

TEST(ReportTest, NoChanges) {
    const DiagramSnapshot s = snapshot("2601");
    const std::string report = diagram_compare::format_report(diagram_compare::compare_snapshots(s, s));
    EXPECT_NE(report.find("No significant changes detected"), std::string::npos);
}
