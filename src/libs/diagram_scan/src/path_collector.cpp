#include <diagram_scan/path_collector.hpp>
#include <cmath>
#include <utility>

namespace diagram_scan {

void Matrix::apply(double x, double y, double& out_x, double& out_y) const {
    out_x = a * x + c * y + e;
    out_y = b * x + d * y + f;
}

Matrix Matrix::premultiply(const Matrix& m) const {
    Matrix r;
    r.a = m.a * a + m.b * c;
    r.b = m.a * b + m.b * d;
    r.c = m.c * a + m.d * c;
    r.d = m.c * b + m.d * d;
    r.e = m.e * a + m.f * c + e;
    r.f = m.e * b + m.f * d + f;
    return r;
}

double Matrix::scale() const {
    return std::sqrt(std::abs(a * d - b * c));
}

Matrix page_space_matrix(const diagram_model::BBox& crop_box, int rotate) {
    const double x0 = crop_box.x0, y0 = crop_box.y0, x1 = crop_box.x1, y1 = crop_box.y1;
    switch (((rotate % 360) + 360) % 360) {
    case 90:  return { 0, 1, 1, 0, -y0, -x0 };
    case 180: return { -1, 0, 0, 1, x1, -y0 };
    case 270: return { 0, -1, -1, 0, y1, x1 };
    default:  return { 1, 0, 0, -1, -x0, y1 };
    }
}

PathCollector::PathCollector(const Matrix& page_space)
    : page_space_(page_space)
{
}

void PathCollector::to_page(double x, double y, double& px, double& py) const {
    double dx = 0, dy = 0;
    state_.ctm.apply(x, y, dx, dy);
    page_space_.apply(dx, dy, px, py);
}

void PathCollector::operate(const std::string& op, const std::vector<double>& operands) {
    const std::size_t n = operands.size();

    if (op == "q") {
        saved_.push_back(state_);
    } else if (op == "Q") {
        if (!saved_.empty()) {
            state_ = saved_.back();
            saved_.pop_back();
        }
    } else if (op == "cm") {
        if (n < 6) return;
        Matrix m{ operands[n - 6], operands[n - 5], operands[n - 4],
                  operands[n - 3], operands[n - 2], operands[n - 1] };
        state_.ctm = state_.ctm.premultiply(m);
    } else if (op == "w") {
        if (n < 1) return;
        state_.line_width = operands[n - 1];
    } else if (op == "m") {
        if (n < 2) return;
        current_x_ = subpath_x_ = operands[n - 2];
        current_y_ = subpath_y_ = operands[n - 1];
    } else if (op == "l") {
        if (n < 2) return;
        Segment s{};
        to_page(current_x_, current_y_, s.x0, s.y0);
        to_page(operands[n - 2], operands[n - 1], s.x1, s.y1);
        path_.push_back(s);
        current_x_ = operands[n - 2];
        current_y_ = operands[n - 1];
    } else if (op == "c") {
        if (n < 6) return;
        current_x_ = operands[n - 2];
        current_y_ = operands[n - 1];
    } else if (op == "v" || op == "y") {
        if (n < 4) return;
        current_x_ = operands[n - 2];
        current_y_ = operands[n - 1];
    } else if (op == "re") {
        // Rectangles are their own drawing item, not line segments.
        if (n < 4) return;
        current_x_ = subpath_x_ = operands[n - 4];
        current_y_ = subpath_y_ = operands[n - 3];
    } else if (op == "h") {
        current_x_ = subpath_x_;
        current_y_ = subpath_y_;
    } else if (op == "S" || op == "s" || op == "B" || op == "B*" || op == "b" || op == "b*") {
        paint(true);
    } else if (op == "f" || op == "F" || op == "f*") {
        paint(false);
    } else if (op == "n") {
        path_.clear();
    }
}

void PathCollector::paint(bool stroked) {
    const double width = stroked ? state_.line_width * state_.ctm.scale() : 0.0;
    for (const auto& s : path_)
        lines_.push_back({ s.x0, s.y0, s.x1, s.y1, width });
    path_.clear();
}

void PathCollector::begin_form(const Matrix& form_matrix) {
    saved_.push_back(state_);
    state_.ctm = state_.ctm.premultiply(form_matrix);
}

void PathCollector::end_form() {
    if (saved_.empty()) return;
    state_ = saved_.back();
    saved_.pop_back();
    path_.clear();
}

std::vector<diagram_model::LinePrimitive> PathCollector::take_lines() {
    return std::exchange(lines_, {});
}

} // namespace diagram_scan
