#pragma once

#include <diagram_scan/page_scanner.hpp>

namespace diagram_scan {

// Text spans and page size come from poppler-glib; line primitives come from
// parsing the page content stream with qpdf.
class PdfPageScanner : public PageScanner {
public:
    std::optional<diagram_model::PageContent> scan(const std::string& path,
        ScanError* error = nullptr) override;
};

} // namespace diagram_scan
