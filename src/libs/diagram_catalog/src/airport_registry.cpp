#include <diagram_catalog/airport_registry.hpp>

namespace diagram_catalog {

std::optional<std::string> AirportRegistry::lookup(const std::string& airport_code) const {
    auto it = airports.find(airport_code);
    if (it == airports.end()) return std::nullopt;
    return it->second;
}

AirportRegistry default_airport_registry() {
    AirportRegistry out;
    out.base_url = "https://aeronav.faa.gov/d-tpp";
    out.airports = {
        { "JFK", "00610" },   // John F. Kennedy International
        { "LGA", "00289" },   // LaGuardia
        { "EWR", "00285" },   // Newark Liberty International
        { "TEB", "00890" },   // Teterboro
        { "SWF", "00450" },   // Stewart International
        { "SYR", "00411" },   // Syracuse Hancock International
        { "YIP", "00467" },   // Willow Run
    };
    return out;
}

std::optional<std::string> diagram_url(const AirportRegistry& registry,
    const std::string& airport_code, const std::string& cycle)
{
    std::optional<std::string> number = registry.lookup(airport_code);
    if (!number) return std::nullopt;
    return registry.base_url + "/" + cycle + "/" + *number + "AD.PDF";
}

} // namespace diagram_catalog
