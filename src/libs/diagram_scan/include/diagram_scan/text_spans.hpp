#pragma once

#include <diagram_model/types.hpp>
#include <string>
#include <vector>

namespace diagram_scan {

// One character of page text as laid out by the renderer.
struct Glyph {
    std::string text;   // a single UTF-8 character, "\n" at line ends
    diagram_model::BBox box;
    std::string font_name;
    double font_size = 0;
};

// Groups glyphs into spans. A span ends at a line break, at a font change, or where
// whitespace is followed by a gap wider than the font size (separate labels that
// happen to share a baseline).
std::vector<diagram_model::TextPrimitive> group_glyphs(const std::vector<Glyph>& glyphs);

} // namespace diagram_scan
