#pragma once

#include <diagram_model/types.hpp>
#include <string>
#include <vector>

namespace diagram_scan {

// PDF transformation matrix [a b c d e f]; maps (x, y) to (a*x + c*y + e, b*x + d*y + f).
struct Matrix {
    double a = 1, b = 0, c = 0, d = 1, e = 0, f = 0;

    void apply(double x, double y, double& out_x, double& out_y) const;
    // Returns `m` followed by this matrix, i.e. the CTM after a "cm m" operator.
    Matrix premultiply(const Matrix& m) const;
    // Average linear scale, used to bring line widths into page units.
    double scale() const;
};

// Maps default user space to page space: origin at the top-left of the crop box as the
// page is displayed after its /Rotate, y growing downward. `crop_box` is in PDF units
// (x0, y0 lower-left). Rotations that are not a multiple of 90 count as 0.
Matrix page_space_matrix(const diagram_model::BBox& crop_box, int rotate);

// Interprets the graphics-state and path-construction operators of a content stream
// and keeps every straight segment of each painted path. Output coordinates are in the
// page space given at construction.
class PathCollector {
public:
    explicit PathCollector(const Matrix& page_space);

    void operate(const std::string& op, const std::vector<double>& operands);

    // Bracket a form XObject: its matrix applies on top of the current CTM.
    void begin_form(const Matrix& form_matrix);
    void end_form();

    const std::vector<diagram_model::LinePrimitive>& lines() const { return lines_; }
    std::vector<diagram_model::LinePrimitive> take_lines();

private:
    struct GraphicsState {
        Matrix ctm;
        double line_width = 1.0;
    };

    struct Segment {
        double x0, y0, x1, y1;
    };

    void paint(bool stroked);
    void to_page(double x, double y, double& px, double& py) const;

    Matrix page_space_;
    GraphicsState state_;
    std::vector<GraphicsState> saved_;
    std::vector<Segment> path_;
    double current_x_ = 0;
    double current_y_ = 0;
    double subpath_x_ = 0;
    double subpath_y_ = 0;
    std::vector<diagram_model::LinePrimitive> lines_;
};

} // namespace diagram_scan
