#pragma once

#include <diagram_model/changes.hpp>
#include <string>

namespace diagram_compare {

// Human-readable change report, one block per change category.
std::string format_report(const diagram_model::ComparisonResult& result);

} // namespace diagram_compare
