#include <diagram_scan/pdf_page_scanner.hpp>
#include <diagram_scan/path_collector.hpp>
#include <diagram_scan/text_spans.hpp>
#include <diagram_model/logger.hpp>
#include <glib.h>
#include <poppler.h>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <algorithm>
#include <exception>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace diagram_scan {

namespace {

// Nested form XObjects deeper than this are not followed.
const int max_form_depth = 8;

std::shared_ptr<spdlog::logger> scan_logger() {
    static std::shared_ptr<spdlog::logger> logger = diagram_model::component_logger("scan");
    return logger;
}

struct GObjectDeleter {
    void operator()(gpointer p) const { g_object_unref(p); }
};
struct GFreeDeleter {
    void operator()(gpointer p) const { g_free(p); }
};
struct TextAttributesDeleter {
    void operator()(GList* list) const { poppler_page_free_text_attributes(list); }
};

using DocumentPtr = std::unique_ptr<PopplerDocument, GObjectDeleter>;
using PagePtr = std::unique_ptr<PopplerPage, GObjectDeleter>;
using TextPtr = std::unique_ptr<gchar, GFreeDeleter>;
using RectsPtr = std::unique_ptr<PopplerRectangle, GFreeDeleter>;
using AttributesPtr = std::unique_ptr<GList, TextAttributesDeleter>;

void set_error(ScanError* error, ScanError value) {
    if (error) *error = value;
}

DocumentPtr open_document(const std::string& path) {
    std::error_code ec;
    const std::string absolute = std::filesystem::absolute(path, ec).string();
    if (ec) return nullptr;

    GError* err = nullptr;
    TextPtr uri(g_filename_to_uri(absolute.c_str(), nullptr, &err));
    if (!uri) {
        scan_logger()->warn("Error converting {} to URI: {}", path, err->message);
        g_error_free(err);
        return nullptr;
    }
    DocumentPtr doc(poppler_document_new_from_file(uri.get(), nullptr, &err));
    if (!doc) {
        scan_logger()->warn("Error opening {}: {}", path, err->message);
        g_error_free(err);
        return nullptr;
    }
    return doc;
}

const PopplerTextAttributes* attributes_at(GList*& cursor, int index) {
    while (cursor) {
        auto* attr = static_cast<PopplerTextAttributes*>(cursor->data);
        if (index <= attr->end_index) return index >= attr->start_index ? attr : nullptr;
        cursor = cursor->next;
    }
    return nullptr;
}

// Pairs every character of the page text with its layout rectangle and font.
std::vector<Glyph> read_glyphs(PopplerPage* page) {
    std::vector<Glyph> glyphs;
    TextPtr text(poppler_page_get_text(page));
    if (!text) return glyphs;

    PopplerRectangle* raw_rects = nullptr;
    guint n_rects = 0;
    if (!poppler_page_get_text_layout(page, &raw_rects, &n_rects)) return glyphs;
    RectsPtr rects(raw_rects);
    AttributesPtr attributes(poppler_page_get_text_attributes(page));

    GList* cursor = attributes.get();
    const gchar* p = text.get();
    for (guint i = 0; i < n_rects && *p; ++i) {
        const gchar* next = g_utf8_next_char(p);
        Glyph g;
        g.text.assign(p, next);
        const PopplerRectangle& r = rects.get()[i];
        g.box = { r.x1, r.y1, r.x2, r.y2 };
        if (const PopplerTextAttributes* attr = attributes_at(cursor, static_cast<int>(i))) {
            g.font_name = attr->font_name ? attr->font_name : "";
            g.font_size = attr->font_size;
        }
        glyphs.push_back(std::move(g));
        p = next;
    }
    return glyphs;
}

class ContentCallbacks : public QPDFObjectHandle::ParserCallbacks {
public:
    ContentCallbacks(PathCollector& collector, QPDFObjectHandle resources, int depth)
        : collector_(collector), resources_(std::move(resources)), depth_(depth)
    {
    }

    void handleObject(QPDFObjectHandle obj) override {
        if (obj.isOperator()) {
            const std::string op = obj.getOperatorValue();
            if (op == "Do")
                invoke_xobject();
            else
                collector_.operate(op, numbers_);
            numbers_.clear();
            last_name_.clear();
        } else if (obj.isNumber()) {
            numbers_.push_back(obj.getNumericValue());
        } else if (obj.isName()) {
            last_name_ = obj.getName();
        }
    }

    void handleEOF() override {}

private:
    void invoke_xobject() {
        if (depth_ >= max_form_depth || last_name_.empty() || !resources_.isDictionary()) return;
        QPDFObjectHandle xobjects = resources_.getKey("/XObject");
        if (!xobjects.isDictionary()) return;
        QPDFObjectHandle form = xobjects.getKey(last_name_);
        if (!form.isStream()) return;
        QPDFObjectHandle dict = form.getDict();
        QPDFObjectHandle subtype = dict.getKey("/Subtype");
        if (!subtype.isName() || subtype.getName() != "/Form") return;

        Matrix m;
        QPDFObjectHandle matrix = dict.getKey("/Matrix");
        if (matrix.isArray() && matrix.getArrayNItems() == 6) {
            const QPDFObjectHandle::Matrix qm = matrix.getArrayAsMatrix();
            m = { qm.a, qm.b, qm.c, qm.d, qm.e, qm.f };
        }
        QPDFObjectHandle form_resources = dict.getKey("/Resources");
        if (!form_resources.isDictionary()) form_resources = resources_;

        collector_.begin_form(m);
        ContentCallbacks nested(collector_, form_resources, depth_ + 1);
        form.parseAsContents(&nested);
        collector_.end_form();
    }

    PathCollector& collector_;
    QPDFObjectHandle resources_;
    int depth_;
    std::vector<double> numbers_;
    std::string last_name_;
};

diagram_model::BBox normalized(const QPDFObjectHandle::Rectangle& r) {
    return { std::min(r.llx, r.urx), std::min(r.lly, r.ury), std::max(r.llx, r.urx), std::max(r.lly, r.ury) };
}

// The visible area as poppler reports it: the crop box clipped to the media box.
diagram_model::BBox visible_box(QPDFPageObjectHelper& page) {
    const diagram_model::BBox media = normalized(page.getMediaBox().getArrayAsRectangle());
    const diagram_model::BBox crop = normalized(page.getCropBox().getArrayAsRectangle());
    diagram_model::BBox out{ std::max(crop.x0, media.x0), std::max(crop.y0, media.y0),
                             std::min(crop.x1, media.x1), std::min(crop.y1, media.y1) };
    if (out.x1 <= out.x0 || out.y1 <= out.y0) return media;
    return out;
}

int page_rotation(QPDFPageObjectHelper& page) {
    QPDFObjectHandle rotate = page.getAttribute("/Rotate", false);
    return rotate.isInteger() ? static_cast<int>(rotate.getIntValue()) : 0;
}

std::vector<diagram_model::LinePrimitive> read_lines(const std::string& path) {
    QPDF pdf;
    pdf.processFile(path.c_str());
    std::vector<QPDFPageObjectHelper> pages = QPDFPageDocumentHelper(pdf).getAllPages();
    if (pages.empty()) return {};

    QPDFPageObjectHelper& page = pages.front();
    PathCollector collector(page_space_matrix(visible_box(page), page_rotation(page)));
    ContentCallbacks callbacks(collector, page.getAttribute("/Resources", false), 0);
    page.parseContents(&callbacks);
    return collector.take_lines();
}

} // namespace

const char* to_string(ScanError error) {
    switch (error) {
    case ScanError::None: return "none";
    case ScanError::DocumentNotFound: return "document not found";
    case ScanError::DocumentParseFailure: return "document parse failure";
    }
    return "";
}

std::optional<diagram_model::PageContent> PdfPageScanner::scan(const std::string& path, ScanError* error) {
    set_error(error, ScanError::None);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        scan_logger()->warn("File not found: {}", path);
        set_error(error, ScanError::DocumentNotFound);
        return std::nullopt;
    }

    DocumentPtr doc = open_document(path);
    if (!doc || poppler_document_get_n_pages(doc.get()) < 1) {
        set_error(error, ScanError::DocumentParseFailure);
        return std::nullopt;
    }
    PagePtr page(poppler_document_get_page(doc.get(), 0));
    if (!page) {
        scan_logger()->warn("{}: first page has no content", path);
        set_error(error, ScanError::DocumentParseFailure);
        return std::nullopt;
    }

    diagram_model::PageContent content;
    poppler_page_get_size(page.get(), &content.width, &content.height);
    content.texts = group_glyphs(read_glyphs(page.get()));

    try {
        content.lines = read_lines(path);
    } catch (const std::exception& e) {
        scan_logger()->warn("Error reading content stream of {}: {}", path, e.what());
        set_error(error, ScanError::DocumentParseFailure);
        return std::nullopt;
    }

    return content;
}

} // namespace diagram_scan
