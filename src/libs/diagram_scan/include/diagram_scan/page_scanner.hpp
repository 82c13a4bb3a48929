#pragma once

#include <diagram_model/types.hpp>
#include <optional>
#include <string>

namespace diagram_scan {

enum class ScanError { None, DocumentNotFound, DocumentParseFailure };

const char* to_string(ScanError error);

// Produces the raw primitives of the first page of a document. No filtering and no
// semantic judgment. On failure returns std::nullopt and, if `error` is non-null,
// stores the reason; a partially read page is never returned.
class PageScanner {
public:
    virtual ~PageScanner() = default;
    virtual std::optional<diagram_model::PageContent> scan(const std::string& path,
        ScanError* error = nullptr) = 0;
};

} // namespace diagram_scan
