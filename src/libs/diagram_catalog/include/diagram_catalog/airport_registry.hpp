#pragma once

#include <map>
#include <optional>
#include <string>

namespace diagram_catalog {

// Airport code -> FAA airport diagram number, plus where diagrams are published.
// Passed explicitly wherever it is needed; there is no process-wide registry.
struct AirportRegistry {
    std::string base_url;
    std::map<std::string, std::string> airports;

    std::optional<std::string> lookup(const std::string& airport_code) const;
};

AirportRegistry default_airport_registry();

// "{base_url}/{cycle}/{diagram number}AD.PDF", or std::nullopt for an unknown airport.
std::optional<std::string> diagram_url(const AirportRegistry& registry,
    const std::string& airport_code, const std::string& cycle);

} // namespace diagram_catalog
