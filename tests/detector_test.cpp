#include <gtest/gtest.h>
#include <diagram_compare/detector.hpp>
#include <algorithm>
#include <iterator>
#include <set>
#include <string>
#include <vector>

using diagram_model::GeometryChangeKind;
using diagram_model::PathSegment;
using diagram_model::RunwayChangeKind;
using diagram_model::RunwayRecord;
using diagram_model::TaxiwayChange;
using diagram_model::TaxiwayChangeKind;
using diagram_model::TaxiwayLabel;

namespace {

TaxiwayLabel label(const std::string& designator, double x, double y) {
    TaxiwayLabel l;
    l.designator = designator;
    l.x = x;
    l.y = y;
    l.bbox = { x - 3, y - 4, x + 3, y + 4 };
    return l;
}

RunwayRecord runway(const std::string& designator, int length, int width) {
    RunwayRecord r;
    r.designator = designator;
    r.length_ft = length;
    r.width_ft = width;
    return r;
}

std::vector<PathSegment> segments(int count) {
    std::vector<PathSegment> out;
    for (int i = 0; i < count; ++i)
        out.push_back({ 100.0 + i, 200, 110.0 + i, 200, 1.0 });
    return out;
}

std::vector<TaxiwayChange> of_kind(const std::vector<TaxiwayChange>& changes, TaxiwayChangeKind kind) {
    std::vector<TaxiwayChange> out;
    std::copy_if(changes.begin(), changes.end(), std::back_inserter(out),
        [kind](const TaxiwayChange& c) { return c.kind == kind; });
    return out;
}

} // namespace

TEST(RunwayDesignatorTest, NormalizationIsOrderIndependent) {
    EXPECT_EQ(diagram_compare::normalize_runway_designator("22R-4L"), "4L/22R");
    EXPECT_EQ(diagram_compare::normalize_runway_designator("4L-22R"), "4L/22R");
    EXPECT_EQ(diagram_compare::normalize_runway_designator("4l/22r"), "4L/22R");
}

TEST(RunwayDesignatorTest, NormalizationIsIdempotent) {
    const std::string once = diagram_compare::normalize_runway_designator("31L-13R");
    EXPECT_EQ(once, "13R/31L");
    EXPECT_EQ(diagram_compare::normalize_runway_designator(once), once);
}

TEST(RunwayDesignatorTest, SingleEndIsOnlyUppercased) {
    EXPECT_EQ(diagram_compare::normalize_runway_designator("Unknown"), "UNKNOWN");
    EXPECT_EQ(diagram_compare::normalize_runway_designator("9l"), "9L");
    EXPECT_EQ(diagram_compare::normalize_runway_designator("1/2/3"), "1/2/3");
}

TEST(TaxiwayDiffTest, IdenticalLabelsYieldNoChanges) {
    const std::vector<TaxiwayLabel> labels = { label("A", 100, 100), label("B", 200, 100), label("A", 300, 300) };
    EXPECT_TRUE(diagram_compare::compare_taxiway_labels(labels, labels).empty());
}

TEST(TaxiwayDiffTest, NewDesignatorIsAddedAtItsPosition) {
    const std::vector<TaxiwayLabel> old_labels = { label("A", 400, 400) };
    const std::vector<TaxiwayLabel> new_labels = { label("A", 400, 400), label("Y", 100, 200) };

    const auto changes = diagram_compare::compare_taxiway_labels(old_labels, new_labels);
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].kind, TaxiwayChangeKind::Added);
    EXPECT_EQ(changes[0].designator, "Y");
    EXPECT_DOUBLE_EQ(changes[0].x, 100);
    EXPECT_DOUBLE_EQ(changes[0].y, 200);
    EXPECT_EQ(changes[0].description, "New taxiway 'Y' added");
}

TEST(TaxiwayDiffTest, RemovedDesignatorWithoutNearbyReplacement) {
    const std::vector<TaxiwayLabel> old_labels = { label("Z", 50, 50), label("A", 300, 300) };
    const std::vector<TaxiwayLabel> new_labels = { label("A", 300, 300), label("K", 50, 80) };

    const auto changes = diagram_compare::compare_taxiway_labels(old_labels, new_labels);
    const auto removed = of_kind(changes, TaxiwayChangeKind::Removed);
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed[0].designator, "Z");
    EXPECT_EQ(removed[0].old_designator, "Z");
    EXPECT_DOUBLE_EQ(removed[0].x, 50);
    EXPECT_DOUBLE_EQ(removed[0].y, 50);
    EXPECT_TRUE(of_kind(changes, TaxiwayChangeKind::Renamed).empty());
}

TEST(TaxiwayDiffTest, AddedAndRemovedUseFirstOccurrence) {
    const std::vector<TaxiwayLabel> old_labels = { label("Q", 10, 10), label("Q", 500, 500) };
    const std::vector<TaxiwayLabel> new_labels = { label("P", 300, 300), label("P", 600, 600) };

    const auto changes = diagram_compare::compare_taxiway_labels(old_labels, new_labels);
    const auto added = of_kind(changes, TaxiwayChangeKind::Added);
    const auto removed = of_kind(changes, TaxiwayChangeKind::Removed);
    ASSERT_EQ(added.size(), 1u);
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_DOUBLE_EQ(added[0].x, 300);
    EXPECT_DOUBLE_EQ(removed[0].x, 10);
}

TEST(TaxiwayDiffTest, AddedAndRemovedPartitionDesignators) {
    const std::vector<TaxiwayLabel> old_labels = {
        label("A", 100, 100), label("B", 200, 100), label("C", 300, 100), label("C", 300, 400) };
    const std::vector<TaxiwayLabel> new_labels = {
        label("B", 200, 100), label("D", 400, 600), label("E", 500, 600), label("E", 520, 600) };

    const auto changes = diagram_compare::compare_taxiway_labels(old_labels, new_labels);
    std::multiset<std::string> added, removed;
    for (const auto& c : of_kind(changes, TaxiwayChangeKind::Added)) added.insert(c.designator);
    for (const auto& c : of_kind(changes, TaxiwayChangeKind::Removed)) removed.insert(c.designator);

    EXPECT_EQ(added, (std::multiset<std::string>{ "D", "E" }));
    EXPECT_EQ(removed, (std::multiset<std::string>{ "A", "C" }));
}

TEST(TaxiwayDiffTest, RenameAtSameSpot) {
    const std::vector<TaxiwayLabel> old_labels = { label("F", 100, 100) };
    const std::vector<TaxiwayLabel> new_labels = { label("G", 105, 103) };

    const auto renamed = of_kind(diagram_compare::compare_taxiway_labels(old_labels, new_labels),
        TaxiwayChangeKind::Renamed);
    ASSERT_EQ(renamed.size(), 1u);
    EXPECT_EQ(renamed[0].old_designator, "F");
    EXPECT_EQ(renamed[0].designator, "G");
    EXPECT_DOUBLE_EQ(renamed[0].x, 105);
    EXPECT_DOUBLE_EQ(renamed[0].y, 103);
    EXPECT_EQ(renamed[0].description, "Taxiway renamed from 'F' to 'G'");
}

TEST(TaxiwayDiffTest, RenameDistanceIsStrict) {
    const std::vector<TaxiwayLabel> old_labels = { label("F", 100, 100) };
    const std::vector<TaxiwayLabel> new_labels = { label("G", 115, 100) };

    EXPECT_TRUE(of_kind(diagram_compare::compare_taxiway_labels(old_labels, new_labels),
        TaxiwayChangeKind::Renamed).empty());
}

TEST(TaxiwayDiffTest, RenameIgnoresDesignatorsPresentOnBothSides) {
    const std::vector<TaxiwayLabel> old_labels = { label("F", 100, 100), label("H", 400, 400) };
    const std::vector<TaxiwayLabel> new_labels = { label("H", 102, 100), label("H", 400, 400) };

    EXPECT_TRUE(of_kind(diagram_compare::compare_taxiway_labels(old_labels, new_labels),
        TaxiwayChangeKind::Renamed).empty());
}

// Each nearby (old, new) pair yields its own record; renames are not matched one-to-one.
TEST(TaxiwayDiffTest, RepeatedLabelsYieldDuplicateRenames) {
    const std::vector<TaxiwayLabel> old_labels = { label("F", 100, 100), label("F", 106, 100) };
    const std::vector<TaxiwayLabel> new_labels = { label("G", 103, 100) };

    const auto renamed = of_kind(diagram_compare::compare_taxiway_labels(old_labels, new_labels),
        TaxiwayChangeKind::Renamed);
    ASSERT_EQ(renamed.size(), 2u);
    for (const auto& c : renamed) {
        EXPECT_EQ(c.old_designator, "F");
        EXPECT_EQ(c.designator, "G");
    }
}

TEST(RunwayDiffTest, IdenticalRunwaysYieldNoChanges) {
    const std::vector<RunwayRecord> runways = { runway("4L/22R", 12079, 200), runway("13R/31L", 14511, 200) };
    EXPECT_TRUE(diagram_compare::compare_runway_dimensions(runways, runways).empty());
}

TEST(RunwayDiffTest, LengthIncreaseIsExtension) {
    const auto changes = diagram_compare::compare_runway_dimensions(
        { runway("10/28", 7200, 150) }, { runway("10/28", 7499, 150) });
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].kind, RunwayChangeKind::LengthChanged);
    EXPECT_EQ(changes[0].designator, "10/28");
    EXPECT_EQ(changes[0].old_length, 7200);
    EXPECT_EQ(changes[0].new_length, 7499);
    EXPECT_NE(changes[0].description.find("extended by 299 ft (7200 → 7499 ft)"), std::string::npos);
}

TEST(RunwayDiffTest, ShortenedAndNarrowed) {
    const auto changes = diagram_compare::compare_runway_dimensions(
        { runway("4-22", 8000, 150) }, { runway("22-4", 7000, 100) });
    ASSERT_EQ(changes.size(), 2u);
    EXPECT_EQ(changes[0].kind, RunwayChangeKind::LengthChanged);
    EXPECT_EQ(changes[0].description, "Runway 4/22 shortened by 1000 ft (8000 → 7000 ft)");
    EXPECT_EQ(changes[1].kind, RunwayChangeKind::WidthChanged);
    EXPECT_EQ(changes[1].description, "Runway 4/22 narrowed by 50 ft (150 → 100 ft wide)");
}

TEST(RunwayDiffTest, UnknownDimensionIsSkipped) {
    const auto changes = diagram_compare::compare_runway_dimensions(
        { runway("10/28", 0, 0) }, { runway("10/28", 7200, 150) });
    EXPECT_TRUE(changes.empty());
}

TEST(RunwayDiffTest, AddedAndRemovedRunways) {
    const auto changes = diagram_compare::compare_runway_dimensions(
        { runway("4/22", 7000, 150) }, { runway("9/27", 6000, 100) });
    ASSERT_EQ(changes.size(), 2u);
    EXPECT_EQ(changes[0].kind, RunwayChangeKind::RunwayAdded);
    EXPECT_EQ(changes[0].designator, "9/27");
    EXPECT_EQ(changes[0].description, "New runway 9/27: 6000 x 100 ft");
    EXPECT_EQ(changes[1].kind, RunwayChangeKind::RunwayRemoved);
    EXPECT_EQ(changes[1].designator, "4/22");
    EXPECT_EQ(changes[1].description, "Runway 4/22 removed (was 7000 x 150 ft)");
}

TEST(RunwayDiffTest, UnknownDesignatorsAreNotMatched) {
    const auto changes = diagram_compare::compare_runway_dimensions(
        { runway(diagram_model::unknown_runway_designator, 7000, 150) },
        { runway(diagram_model::unknown_runway_designator, 9000, 150), runway("", 5000, 75) });
    EXPECT_TRUE(changes.empty());
}

TEST(GeometryDiffTest, DifferenceAtThresholdIsIgnored) {
    EXPECT_TRUE(diagram_compare::compare_geometry(segments(100), segments(150)).empty());
    EXPECT_TRUE(diagram_compare::compare_geometry(segments(150), segments(100)).empty());
}

TEST(GeometryDiffTest, DifferenceAboveThreshold) {
    const auto added = diagram_compare::compare_geometry(segments(100), segments(151));
    ASSERT_EQ(added.size(), 1u);
    EXPECT_EQ(added[0].kind, GeometryChangeKind::GeometryAdded);
    EXPECT_EQ(added[0].magnitude, 51);

    const auto removed = diagram_compare::compare_geometry(segments(200), segments(100));
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed[0].kind, GeometryChangeKind::GeometryRemoved);
    EXPECT_EQ(removed[0].magnitude, 100);
}
