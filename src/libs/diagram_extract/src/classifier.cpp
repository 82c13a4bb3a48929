#include <diagram_extract/classifier.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <regex>
#include <set>
#include <utility>

namespace diagram_extract {

namespace {

const double side_margin_ratio = 0.12;
const double top_margin_ratio = 0.10;
const double bottom_margin_ratio = 0.08;

const double min_label_font_size = 4.0;
const double max_label_font_size = 10.0;

// Shorter dimensions are holding pads, ramps and the like.
const int min_runway_length_ft = 2000;

const std::size_t raw_text_limit = 1500;

// Tokens that fit the designator shape but are abbreviations, month codes or
// airport identifiers printed inside the diagram.
const std::set<std::string, std::less<>> excluded_tokens = {
    "TWY", "RWY", "TWR", "GND", "DEL", "APP", "DEP",
    "NOT", "FOR", "USE", "THE", "AND", "FEB", "JAN",
    "MAR", "APR", "MAY", "JUN", "JUL", "AUG", "SEP",
    "OCT", "NOV", "DEC", "FAA", "USA", "NYC", "LAX",
};

const std::regex dimension_pattern(R"((\d{4,5})\s*[Xx]\s*(\d{2,3}))");
const std::regex combined_pattern(
    R"((\d{1,2}[LCR]?)\s*[-/]\s*(\d{1,2}[LCR]?)\s+(\d{4,5})\s*[Xx]\s*(\d{2,3}))");
const std::regex designator_list_pattern(
    R"(RWYS?\s+(\d{1,2}[LCR]?[-/]\d{1,2}[LCR]?(?:\s*,\s*\d{1,2}[LCR]?[-/]\d{1,2}[LCR]?)*))");
const std::regex designator_pair_pattern(R"((\d{1,2}[LCR]?)[-/](\d{1,2}[LCR]?))");

std::string trim_upper(std::string_view text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    std::string out(text.substr(begin, end - begin));
    for (char& c : out)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return out;
}

bool is_designator_letter(char c) {
    return c >= 'A' && c <= 'Z' && c != 'I' && c != 'O';
}

using diagram_model::BBox;

struct TextLine {
    std::string text;
    BBox bounds;
    bool has_bounds = false;
};

// Rebuilds rendered text lines from spans, in order of first appearance.
std::vector<TextLine> collect_lines(const diagram_model::PageContent& page) {
    std::vector<TextLine> lines;
    std::map<int, std::size_t> index_of_line;
    for (const auto& span : page.texts) {
        auto [it, inserted] = index_of_line.try_emplace(span.line_index, lines.size());
        if (inserted) lines.emplace_back();
        TextLine& line = lines[it->second];
        if (!line.text.empty()) line.text += ' ';
        line.text += span.text;
        if (!line.has_bounds) {
            line.bounds = span.bbox;
            line.has_bounds = true;
        } else {
            line.bounds.x0 = std::min(line.bounds.x0, span.bbox.x0);
            line.bounds.y0 = std::min(line.bounds.y0, span.bbox.y0);
            line.bounds.x1 = std::max(line.bounds.x1, span.bbox.x1);
            line.bounds.y1 = std::max(line.bounds.y1, span.bbox.y1);
        }
    }
    return lines;
}

std::string join_lines(const std::vector<TextLine>& lines) {
    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += '\n';
        out += lines[i].text;
    }
    return out;
}

using DimensionKey = std::pair<int, int>;
using DimensionPositions = std::map<DimensionKey, std::pair<double, double>>;

// Where each (length, width) pair is printed. First occurrence on the page wins.
DimensionPositions locate_dimensions(const std::vector<TextLine>& lines) {
    DimensionPositions positions;
    for (const auto& line : lines) {
        if (!line.has_bounds) continue;
        auto begin = std::sregex_iterator(line.text.begin(), line.text.end(), dimension_pattern);
        for (auto it = begin; it != std::sregex_iterator(); ++it) {
            const int length = std::stoi((*it)[1].str());
            const int width = std::stoi((*it)[2].str());
            if (length < min_runway_length_ft) continue;
            positions.try_emplace(DimensionKey{length, width},
                line.bounds.center_x(), line.bounds.center_y());
        }
    }
    return positions;
}

std::pair<double, double> position_of(const DimensionPositions& positions, int length, int width) {
    auto it = positions.find(DimensionKey{length, width});
    if (it == positions.end()) return {0.0, 0.0};
    return it->second;
}

diagram_model::RunwayRecord make_runway(std::string designator, int length, int width,
    const DimensionPositions& positions, std::string raw_text)
{
    diagram_model::RunwayRecord rwy;
    rwy.designator = std::move(designator);
    rwy.length_ft = length;
    rwy.width_ft = width;
    auto [x, y] = position_of(positions, length, width);
    rwy.x = x;
    rwy.y = y;
    rwy.raw_text = std::move(raw_text);
    return rwy;
}

struct Dimension {
    int length = 0;
    int width = 0;
    std::string text;
};

std::vector<Dimension> runway_sized_dimensions(const std::string& full_text) {
    std::vector<Dimension> out;
    auto begin = std::sregex_iterator(full_text.begin(), full_text.end(), dimension_pattern);
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        Dimension d;
        d.length = std::stoi((*it)[1].str());
        d.width = std::stoi((*it)[2].str());
        d.text = it->str();
        if (d.length >= min_runway_length_ft) out.push_back(std::move(d));
    }
    return out;
}

std::vector<diagram_model::RunwayRecord> match_combined(const std::string& full_text,
    const DimensionPositions& positions)
{
    std::vector<diagram_model::RunwayRecord> out;
    auto begin = std::sregex_iterator(full_text.begin(), full_text.end(), combined_pattern);
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        const auto& m = *it;
        out.push_back(make_runway(m[1].str() + "/" + m[2].str(),
            std::stoi(m[3].str()), std::stoi(m[4].str()), positions, m.str()));
    }
    return out;
}

std::vector<diagram_model::RunwayRecord> match_positional(const std::string& full_text,
    const DimensionPositions& positions)
{
    std::vector<std::string> designators;
    auto begin = std::sregex_iterator(full_text.begin(), full_text.end(), designator_list_pattern);
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        const std::string list = (*it)[1].str();
        auto pair_begin = std::sregex_iterator(list.begin(), list.end(), designator_pair_pattern);
        for (auto p = pair_begin; p != std::sregex_iterator(); ++p) {
            std::string designator = (*p)[1].str() + "/" + (*p)[2].str();
            if (std::find(designators.begin(), designators.end(), designator) == designators.end())
                designators.push_back(std::move(designator));
        }
    }
    // Without any designator this is the dimension-only case.
    if (designators.empty()) return {};

    const std::vector<Dimension> dimensions = runway_sized_dimensions(full_text);

    // The data block lists designators and dimensions in corresponding order.
    std::vector<diagram_model::RunwayRecord> out;
    for (std::size_t i = 0; i < designators.size() && i < dimensions.size(); ++i) {
        const Dimension& d = dimensions[i];
        out.push_back(make_runway(designators[i], d.length, d.width, positions,
            designators[i] + ": " + std::to_string(d.length) + " x " + std::to_string(d.width)));
    }
    for (std::size_t i = designators.size(); i < dimensions.size(); ++i) {
        const Dimension& d = dimensions[i];
        out.push_back(make_runway(diagram_model::unknown_runway_designator, d.length, d.width, positions,
            std::string(diagram_model::unknown_runway_designator) + ": "
                + std::to_string(d.length) + " x " + std::to_string(d.width)));
    }
    return out;
}

std::vector<diagram_model::RunwayRecord> match_dimensions_only(const std::string& full_text,
    const DimensionPositions& positions)
{
    std::vector<diagram_model::RunwayRecord> out;
    for (auto& d : runway_sized_dimensions(full_text))
        out.push_back(make_runway(diagram_model::unknown_runway_designator, d.length, d.width,
            positions, std::move(d.text)));
    return out;
}

// Cuts at most `limit` bytes without splitting a UTF-8 sequence.
std::string utf8_prefix(const std::string& s, std::size_t limit) {
    if (s.size() <= limit) return s;
    std::size_t cut = limit;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) --cut;
    return s.substr(0, cut);
}

} // namespace

DiagramBounds diagram_bounds(double page_width, double page_height) {
    const double margin_x = page_width * side_margin_ratio;
    DiagramBounds b;
    b.x_min = margin_x;
    b.y_min = page_height * top_margin_ratio;
    b.x_max = page_width - margin_x;
    b.y_max = page_height - page_height * bottom_margin_ratio;
    return b;
}

bool is_taxiway_designator(std::string_view text) {
    const std::string token = trim_upper(text);
    if (token.empty() || token.size() > 3) return false;
    if (!std::all_of(token.begin(), token.end(), is_designator_letter)) return false;
    return excluded_tokens.find(token) == excluded_tokens.end();
}

std::vector<diagram_model::TaxiwayLabel> classify_taxiway_labels(
    const diagram_model::PageContent& page, const DiagramBounds& bounds)
{
    std::vector<diagram_model::TaxiwayLabel> labels;
    // Renderers often emit the same label twice (outline + fill).
    std::set<std::pair<double, double>> seen_positions;

    for (const auto& span : page.texts) {
        const double cx = span.bbox.center_x();
        const double cy = span.bbox.center_y();
        if (!bounds.contains(cx, cy)) continue;
        if (span.font_size < min_label_font_size || span.font_size > max_label_font_size) continue;
        if (!is_taxiway_designator(span.text)) continue;

        const std::pair<double, double> key{ std::nearbyint(cx), std::nearbyint(cy) };
        if (!seen_positions.insert(key).second) continue;

        diagram_model::TaxiwayLabel label;
        label.designator = trim_upper(span.text);
        label.x = cx;
        label.y = cy;
        label.bbox = span.bbox;
        labels.push_back(std::move(label));
    }
    return labels;
}

const char* to_string(RunwayTier tier) {
    switch (tier) {
    case RunwayTier::Combined: return "combined";
    case RunwayTier::Positional: return "positional";
    case RunwayTier::DimensionOnly: return "dimension-only";
    case RunwayTier::None: return "none";
    }
    return "";
}

RunwayExtraction classify_runways(const diagram_model::PageContent& page) {
    const std::vector<TextLine> lines = collect_lines(page);
    const std::string full_text = join_lines(lines);
    const DimensionPositions positions = locate_dimensions(lines);

    RunwayExtraction out;
    out.raw_text.push_back(utf8_prefix(full_text, raw_text_limit));

    out.records = match_combined(full_text, positions);
    if (!out.records.empty()) {
        out.tier = RunwayTier::Combined;
        return out;
    }
    out.records = match_positional(full_text, positions);
    if (!out.records.empty()) {
        out.tier = RunwayTier::Positional;
        return out;
    }
    out.records = match_dimensions_only(full_text, positions);
    out.tier = out.records.empty() ? RunwayTier::None : RunwayTier::DimensionOnly;
    return out;
}

std::vector<diagram_model::PathSegment> classify_paths(
    const diagram_model::PageContent& page, const DiagramBounds& bounds)
{
    std::vector<diagram_model::PathSegment> paths;
    for (const auto& line : page.lines) {
        if (!bounds.contains(line.x0, line.y0) || !bounds.contains(line.x1, line.y1)) continue;
        paths.push_back({ line.x0, line.y0, line.x1, line.y1, line.stroke_width });
    }
    return paths;
}

} // namespace diagram_extract
