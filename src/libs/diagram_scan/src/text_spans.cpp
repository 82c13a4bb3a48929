#include <diagram_scan/text_spans.hpp>
#include <algorithm>
#include <utility>

namespace diagram_scan {

namespace {

bool is_blank(const std::string& s) {
    return s == " " || s == "\t" || s == "\r" || s == "\xC2\xA0";
}

class SpanBuilder {
public:
    explicit SpanBuilder(std::vector<diagram_model::TextPrimitive>& out) : out_(out) {}

    bool empty() const { return text_.empty(); }
    double right() const { return box_.x1; }
    const std::string& font_name() const { return font_name_; }
    double font_size() const { return font_size_; }

    void add(const Glyph& g, bool space_before) {
        if (text_.empty()) {
            box_ = g.box;
            font_name_ = g.font_name;
            font_size_ = g.font_size;
        } else {
            if (space_before) text_ += ' ';
            box_.x0 = std::min(box_.x0, g.box.x0);
            box_.y0 = std::min(box_.y0, g.box.y0);
            box_.x1 = std::max(box_.x1, g.box.x1);
            box_.y1 = std::max(box_.y1, g.box.y1);
        }
        text_ += g.text;
    }

    void flush(int line_index) {
        if (text_.empty()) return;
        diagram_model::TextPrimitive span;
        span.text = std::move(text_);
        span.bbox = box_;
        span.font_size = font_size_;
        span.line_index = line_index;
        out_.push_back(std::move(span));
        text_.clear();
    }

private:
    std::vector<diagram_model::TextPrimitive>& out_;
    std::string text_;
    diagram_model::BBox box_;
    std::string font_name_;
    double font_size_ = 0;
};

} // namespace

std::vector<diagram_model::TextPrimitive> group_glyphs(const std::vector<Glyph>& glyphs) {
    std::vector<diagram_model::TextPrimitive> spans;
    SpanBuilder span(spans);
    int line_index = 0;
    bool pending_space = false;

    for (const auto& g : glyphs) {
        if (g.text == "\n") {
            span.flush(line_index);
            ++line_index;
            pending_space = false;
            continue;
        }
        if (is_blank(g.text)) {
            pending_space = !span.empty();
            continue;
        }

        if (!span.empty()) {
            const bool font_changed = g.font_name != span.font_name() || g.font_size != span.font_size();
            const double gap = g.box.x0 - span.right();
            const double limit = std::max(span.font_size(), g.font_size);
            const bool detached = pending_space && gap > limit;
            // Text flow jumped back left: a new column on the same line.
            const bool backwards = gap < -limit;
            if (font_changed || detached || backwards) {
                span.flush(line_index);
                pending_space = false;
            }
        }
        span.add(g, pending_space);
        pending_space = false;
    }
    span.flush(line_index);
    return spans;
}

} // namespace diagram_scan
