#pragma once

#include <string>
#include <vector>

namespace diagram_model {

// Page coordinates: origin top-left, y grows downward, units are PDF points.
struct BBox {
    double x0 = 0;
    double y0 = 0;
    double x1 = 0;
    double y1 = 0;

    double center_x() const { return (x0 + x1) * 0.5; }
    double center_y() const { return (y0 + y1) * 0.5; }
};

struct TextPrimitive {
    std::string text;
    BBox bbox;
    double font_size = 0;
    // Spans sharing a line_index belong to the same rendered text line.
    int line_index = 0;
};

struct LinePrimitive {
    double x0 = 0;
    double y0 = 0;
    double x1 = 0;
    double y1 = 0;
    double stroke_width = 0;
};

// Everything the scanner reports for one page. Converted once at the document
// boundary; nothing past the scanner sees parser-specific structures.
struct PageContent {
    double width = 0;
    double height = 0;
    std::vector<TextPrimitive> texts;
    std::vector<LinePrimitive> lines;
};

} // namespace diagram_model
